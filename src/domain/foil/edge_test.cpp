#include <gtest/gtest.h>

#include <cmath>

#include "domain/foil/edge.hpp"
#include "domain/naca/naca_four_digit_airfoil.hpp"
#include "domain/parsec/parsec_airfoil.hpp"

TEST(EdgeTest, SharpParsecTrailingEdge) {
  ParsecAirfoil foil;
  const Edge edge(foil.surfacePoints());

  EXPECT_NEAR(0.0, edge.point_le.x(), 1e-15);
  EXPECT_NEAR(0.0, edge.point_le.y(), 1e-15);
  EXPECT_DOUBLE_EQ(1.0, edge.point_te.upper.x());
  EXPECT_NEAR(1.0, edge.chord, 1e-10);
  EXPECT_NEAR(0.0, edge.te_gap, 1e-10);
  EXPECT_TRUE(edge.sharp);
  EXPECT_GT(edge.te_angle, 0.0);
}

TEST(EdgeTest, BluntParsecTrailingEdge) {
  ParsecParameters params;
  params.te_thickness = 1.0;
  ParsecAirfoil foil(params);
  const Edge edge(foil.surfacePoints());

  EXPECT_NEAR(0.01, edge.te_gap, 1e-10);
  EXPECT_NEAR(0.005, edge.point_te.upper.y(), 1e-10);
  EXPECT_NEAR(-0.005, edge.point_te.lower.y(), 1e-10);
  EXPECT_FALSE(edge.sharp);
}

TEST(EdgeTest, NacaFiniteTrailingEdge) {
  NacaFourDigitParameters params;
  params.finite_te = true;
  NacaFourDigitAirfoil foil(params);
  const Edge edge(foil.surfacePoints());

  EXPECT_NEAR(0.00252, edge.te_gap, 1e-12);
  EXPECT_NEAR(0.0, edge.te_midpoint.y(), 1e-15);
  EXPECT_FALSE(edge.sharp);
}

TEST(EdgeTest, RejectsDegenerateSurfaces) {
  SidePair<Eigen::Matrix2Xd> surfaces{Eigen::Matrix2Xd::Zero(2, 1), Eigen::Matrix2Xd::Zero(2, 1)};
  EXPECT_THROW(Edge{surfaces}, std::invalid_argument);
}

int main() {
  testing::InitGoogleTest();
  return RUN_ALL_TESTS();
}
