#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/errors.hpp"
#include "domain/parsec/simplified_parsec_airfoil.hpp"

namespace {
SimplifiedParsecParameters section(double camber, double crest_x, double thickness) {
  SimplifiedParsecParameters params;
  params.camber = camber;
  params.crest_x = crest_x;
  params.thickness = thickness;
  return params;
}
} // namespace

TEST(SimplifiedParameterMapperTest, ProjectsOntoCrests) {
  const std::vector<ParameterWrite> writes =
      SimplifiedParameterMapper::map(section(2.0 / 3.0, 0.3, 0.12));
  ASSERT_EQ(4u, writes.size());
  ParsecParameters mapped;
  for (const ParameterWrite& write : writes) {
    EXPECT_TRUE(SimplifiedParameterMapper::isDerived(write.first));
    mapped.assign(write.first, write.second);
  }
  EXPECT_DOUBLE_EQ(0.3, mapped.upper_x);
  EXPECT_DOUBLE_EQ(0.3, mapped.lower_x);
  EXPECT_NEAR(0.06 + 0.02 / 3.0, mapped.upper_z, 1e-15);
  EXPECT_NEAR(-0.06 + 0.02 / 3.0, mapped.lower_z, 1e-15);
}

TEST(SimplifiedParameterMapperTest, ValidatesRanges) {
  EXPECT_NO_THROW(SimplifiedParameterMapper::validate(SimplifiedParameter::Thickness, 0.30));
  EXPECT_THROW(SimplifiedParameterMapper::validate(SimplifiedParameter::Thickness, 0.31),
               ValidationError);
  EXPECT_THROW(SimplifiedParameterMapper::validate(SimplifiedParameter::Thickness, 0.0),
               ValidationError);
  EXPECT_THROW(SimplifiedParameterMapper::validate(SimplifiedParameter::CrestX, 1.0),
               ValidationError);
  EXPECT_THROW(SimplifiedParameterMapper::validate(SimplifiedParameter::Camber, -1.5),
               ValidationError);
  EXPECT_FALSE(SimplifiedParameterMapper::isDerived(ParsecParameter::UpperC));
}

TEST(SimplifiedParsecAirfoilTest, MatchesEquivalentParsecAirfoil) {
  SimplifiedParsecAirfoil simplified(section(0.0, 0.3, 0.12));

  EXPECT_DOUBLE_EQ(0.06, simplified.get(ParsecParameter::UpperZ));
  EXPECT_DOUBLE_EQ(-0.06, simplified.get(ParsecParameter::LowerZ));
  EXPECT_DOUBLE_EQ(0.3, simplified.get(ParsecParameter::UpperX));
  EXPECT_DOUBLE_EQ(0.3, simplified.get(ParsecParameter::LowerX));

  ParsecParameters params;
  params.upper_x = 0.3;
  params.lower_x = 0.3;
  params.upper_z = 0.06;
  params.lower_z = -0.06;
  ParsecAirfoil plain(params);

  EXPECT_TRUE(plain.upperCoefficients() == simplified.upperCoefficients());
  EXPECT_TRUE(plain.lowerCoefficients() == simplified.lowerCoefficients());
  EXPECT_TRUE(plain.coordinates() == simplified.coordinates());
}

TEST(SimplifiedParsecAirfoilTest, UsesOneShotUpdatePath) {
  SimplifiedParsecAirfoil foil;
  EXPECT_EQ(UpdatePath::OneShot, foil.updatePath());
  EXPECT_DOUBLE_EQ(0.075, foil.get(ParsecParameter::UpperZ));
  EXPECT_DOUBLE_EQ(-0.075, foil.get(ParsecParameter::LowerZ));
  EXPECT_DOUBLE_EQ(0.99, foil.bound(ParsecParameter::UpperX).max);
}

TEST(SimplifiedParsecAirfoilTest, SimplifiedWriteRemapsCrests) {
  SimplifiedParsecAirfoil foil;
  foil.setThickness(0.2);
  foil.setCamber(1.0);
  foil.setCrestX(0.25);

  EXPECT_NEAR(0.11, foil.get(ParsecParameter::UpperZ), 1e-15);
  EXPECT_NEAR(-0.09, foil.get(ParsecParameter::LowerZ), 1e-15);
  EXPECT_DOUBLE_EQ(0.25, foil.get(ParsecParameter::UpperX));
  EXPECT_DOUBLE_EQ(0.25, foil.get(ParsecParameter::LowerX));
  EXPECT_NEAR(0.11, ParsecSolver::evaluate(foil.upperCoefficients(), 0.25), 1e-10);
  EXPECT_NEAR(-0.09, ParsecSolver::evaluate(foil.lowerCoefficients(), 0.25), 1e-10);
}

TEST(SimplifiedParsecAirfoilTest, WriteByName) {
  SimplifiedParsecAirfoil foil;
  foil.set("crest_x", 0.35);
  foil.set("le_radius", 0.02);
  EXPECT_DOUBLE_EQ(0.35, foil.get("crest_x"));
  EXPECT_DOUBLE_EQ(0.35, foil.get("upper_x"));
  EXPECT_DOUBLE_EQ(0.02, foil.get("le_radius"));
  EXPECT_THROW(foil.set("upper_x", 0.5), ValidationError);
  EXPECT_THROW(foil.set("warp", 0.5), ValidationError);
}

TEST(SimplifiedParsecAirfoilTest, DerivedCrestsAreNotWritable) {
  SimplifiedParsecAirfoil foil;
  EXPECT_THROW(foil.set(ParsecParameter::UpperZ, 0.1), ValidationError);
  EXPECT_THROW(foil.set({{ParsecParameter::TeZ, 0.01}, {ParsecParameter::LowerX, 0.5}}),
               ValidationError);
  EXPECT_DOUBLE_EQ(0.0, foil.get(ParsecParameter::TeZ));
}

TEST(SimplifiedParsecAirfoilTest, SharedWriteKeepsMapping) {
  SimplifiedParsecAirfoil foil(section(0.5, 0.3, 0.1));
  foil.set(ParsecParameter::NumPoints, 80);
  foil.set(ParsecParameter::TeBeta, 0.3);

  EXPECT_EQ(160, foil.coordinates().cols());
  EXPECT_NEAR(0.055, foil.get(ParsecParameter::UpperZ), 1e-15);
  EXPECT_NEAR(0.055, ParsecSolver::evaluate(foil.upperCoefficients(), 0.3), 1e-10);
}

TEST(SimplifiedParsecAirfoilTest, RejectedWriteKeepsState) {
  SimplifiedParsecAirfoil foil;
  const Eigen::Matrix2Xd before = foil.coordinates();

  EXPECT_THROW(foil.setThickness(0.5), ValidationError);
  EXPECT_THROW(foil.setCrestX(0.995), ValidationError);

  EXPECT_DOUBLE_EQ(0.15, foil.get(SimplifiedParameter::Thickness));
  EXPECT_DOUBLE_EQ(0.4, foil.get(SimplifiedParameter::CrestX));
  EXPECT_TRUE(before == foil.coordinates());
}

TEST(SimplifiedParsecAirfoilTest, ListenerSeesSimplifiedAndDerivedChanges) {
  SimplifiedParsecAirfoil foil;
  std::vector<std::string> names;
  foil.addChangeListener([&](const ParameterChange& change) { names.push_back(change.name); });

  foil.setCrestX(0.3);

  const std::vector<std::string> expected{"crest_x", "upper_x", "lower_x"};
  EXPECT_EQ(expected, names);
}

TEST(SimplifiedParsecAirfoilTest, Description) {
  SimplifiedParsecAirfoil foil(section(0.0, 0.3, 0.12));
  EXPECT_NE(std::string::npos, foil.description().find("thickness 0.12"));
  EXPECT_EQ("Simplified PARSEC", foil.name());
}

int main() {
  testing::InitGoogleTest();
  return RUN_ALL_TESTS();
}
