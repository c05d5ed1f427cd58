#include <gtest/gtest.h>

#include <sstream>

#include "infrastructure/logger.hpp"

TEST(LoggerTest, LevelTags) {
  std::ostringstream out;
  StreamLogger logger(out);
  logger.debug("recomputing coordinates");
  logger.warn("symmetric section");
  logger.error("write rejected");
  EXPECT_EQ("[debug] recomputing coordinates\n"
            "[warn] symmetric section\n"
            "[error] write rejected\n",
            out.str());
}

TEST(LoggerTest, NullLoggerDiscards) {
  NullLogger logger;
  EXPECT_NO_THROW(logger.debug("dropped"));
}

int main() {
    testing::InitGoogleTest();
    return RUN_ALL_TESTS();
}
