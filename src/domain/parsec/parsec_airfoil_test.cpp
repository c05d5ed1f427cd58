#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "core/errors.hpp"
#include "domain/parsec/parsec_airfoil.hpp"

class ParsecAirfoilTest : public ::testing::Test {
 protected:
  ParsecAirfoil foil;
};

TEST_F(ParsecAirfoilTest, DefaultConstructionPublishesGeometry) {
  const Eigen::Matrix2Xd points = foil.coordinates();
  ASSERT_EQ(400, points.cols());
  EXPECT_NEAR(0.0, points(0, 0), 1e-15);
  EXPECT_EQ("PARSEC", foil.name());
  EXPECT_EQ(UpdatePath::DependencyGraph, foil.updatePath());
  EXPECT_NE(std::string::npos, foil.description().find("upper crest (0.4, 0.075)"));
}

TEST_F(ParsecAirfoilTest, CoordinatesMatchSolverAfterWrite) {
  foil.set(ParsecParameter::UpperZ, 0.1);
  const ParsecParameters p = foil.parameters();
  const SidePair<SurfaceCoefficients> k{ParsecSolver::solve(p, Side::Upper),
                                        ParsecSolver::solve(p, Side::Lower)};
  EXPECT_TRUE(foil.coordinates().isApprox(ParsecSolver::outline(k, p.num_points)));
  EXPECT_NEAR(0.1, ParsecSolver::evaluate(foil.upperCoefficients(), p.upper_x), 1e-10);
}

TEST_F(ParsecAirfoilTest, UpperWriteLeavesLowerCoefficients) {
  const SurfaceCoefficients lower = foil.lowerCoefficients();
  const SurfaceCoefficients upper = foil.upperCoefficients();
  foil.set(ParsecParameter::UpperC, -0.3);
  EXPECT_TRUE(lower == foil.lowerCoefficients());
  EXPECT_FALSE(upper == foil.upperCoefficients());
}

TEST_F(ParsecAirfoilTest, NumPointsOnlyResamples) {
  const SurfaceCoefficients upper = foil.upperCoefficients();
  const SurfaceCoefficients lower = foil.lowerCoefficients();

  foil.set(ParsecParameter::NumPoints, 75);

  EXPECT_TRUE(upper == foil.upperCoefficients());
  EXPECT_TRUE(lower == foil.lowerCoefficients());
  EXPECT_EQ(150, foil.coordinates().cols());
}

TEST_F(ParsecAirfoilTest, WriteByName) {
  foil.set("te_thickness", 0.5);
  EXPECT_DOUBLE_EQ(0.5, foil.get("te_thickness"));
  EXPECT_DOUBLE_EQ(0.5, foil.get(ParsecParameter::TeThickness));
  EXPECT_THROW(foil.set("blending", 0.5), ValidationError);
  EXPECT_THROW(foil.get("camber"), ValidationError);
}

TEST_F(ParsecAirfoilTest, TrailingEdgeSplitsAroundTeZ) {
  foil.set({{ParsecParameter::TeZ, 0.02}, {ParsecParameter::TeThickness, 0.0}});
  const Eigen::Matrix2Xd closed = foil.coordinates();
  const int n = foil.parameters().num_points;
  EXPECT_NEAR(0.02, closed(1, n - 1), 1e-10);
  EXPECT_NEAR(0.02, closed(1, n), 1e-10);

  foil.set(ParsecParameter::TeThickness, 1.0);
  const Eigen::Matrix2Xd blunt = foil.coordinates();
  EXPECT_NEAR(0.025, blunt(1, n - 1), 1e-10);
  EXPECT_NEAR(0.015, blunt(1, n), 1e-10);
}

TEST_F(ParsecAirfoilTest, RejectedWriteKeepsState) {
  const Eigen::Matrix2Xd before = foil.coordinates();
  const SurfaceCoefficients upper = foil.upperCoefficients();

  EXPECT_THROW(foil.set(ParsecParameter::LeRadius, 1.5), ValidationError);
  EXPECT_THROW(foil.set({{ParsecParameter::UpperZ, 0.2}, {ParsecParameter::LowerZ, -3.0}}),
               ValidationError);

  EXPECT_DOUBLE_EQ(0.01, foil.get(ParsecParameter::LeRadius));
  EXPECT_DOUBLE_EQ(0.075, foil.get(ParsecParameter::UpperZ));
  EXPECT_TRUE(upper == foil.upperCoefficients());
  EXPECT_TRUE(before == foil.coordinates());
}

TEST_F(ParsecAirfoilTest, SingularSystemRollsBackWrite) {
  const Eigen::Matrix2Xd before = foil.coordinates();
  const SurfaceCoefficients upper = foil.upperCoefficients();

  EXPECT_THROW(foil.set(ParsecParameter::UpperX, 1.0), NumericalError);

  EXPECT_DOUBLE_EQ(0.4, foil.get(ParsecParameter::UpperX));
  EXPECT_TRUE(upper == foil.upperCoefficients());
  EXPECT_TRUE(before == foil.coordinates());

  //---- still usable afterwards
  foil.set(ParsecParameter::UpperX, 0.5);
  EXPECT_DOUBLE_EQ(0.5, foil.get(ParsecParameter::UpperX));
}

TEST(ParsecAirfoilConstruction, SingularDefaultsThrow) {
  ParsecParameters params;
  params.lower_x = 1.0;
  EXPECT_THROW(ParsecAirfoil{params}, NumericalError);
  params.lower_x = 1.5;
  EXPECT_THROW(ParsecAirfoil{params}, ValidationError);
}

TEST_F(ParsecAirfoilTest, ListenersSeeCommittedChanges) {
  std::vector<ParameterChange> seen;
  foil.addChangeListener([&](const ParameterChange& change) {
    seen.push_back(change);
    //---- geometry is already consistent when listeners run
    EXPECT_DOUBLE_EQ(change.new_value, foil.get(change.name));
  });

  foil.set({{ParsecParameter::UpperC, -0.2}, {ParsecParameter::LowerC, 0.2}});
  foil.set(ParsecParameter::UpperC, -0.2);
  EXPECT_THROW(foil.set(ParsecParameter::UpperC, 5.0), ValidationError);

  ASSERT_EQ(2u, seen.size());
  EXPECT_EQ("upper_c", seen[0].name);
  EXPECT_DOUBLE_EQ(-0.1, seen[0].old_value);
  EXPECT_DOUBLE_EQ(-0.2, seen[0].new_value);
  EXPECT_EQ("lower_c", seen[1].name);
}

TEST_F(ParsecAirfoilTest, ConcurrentWritersKeepGeometryConsistent) {
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; t++) {
    writers.emplace_back([this, t]() {
      for (int i = 0; i < 20; i++) {
        foil.set(ParsecParameter::NumPoints, 50 + 10 * t + i);
      }
    });
  }
  for (std::thread& writer : writers) {
    writer.join();
  }
  EXPECT_EQ(2 * foil.parameters().num_points, foil.coordinates().cols());
}

TEST_F(ParsecAirfoilTest, SurfacePointsRunLeadingToTrailingEdge) {
  const SidePair<Eigen::Matrix2Xd> surfaces = foil.surfacePoints();
  ASSERT_EQ(200, surfaces.upper.cols());
  ASSERT_EQ(200, surfaces.lower.cols());
  EXPECT_NEAR(0.0, surfaces.lower(0, 0), 1e-15);
  EXPECT_DOUBLE_EQ(1.0, surfaces.lower(0, 199));
  EXPECT_NEAR(surfaces.upper(1, 100), -surfaces.lower(1, 100), 1e-12);
}

int main() {
  testing::InitGoogleTest();
  return RUN_ALL_TESTS();
}
