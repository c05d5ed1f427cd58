#pragma once

#include <Eigen/Core>

#include "core/side_pair.hpp"
#include "domain/parsec/parsec_parameters.hpp"
#include "infrastructure/airfoilgen_params.h"

using SurfaceCoefficients = Eigen::Matrix<double, PARSEC_COEFFICIENT_COUNT, 1>;
using ParsecMatrix =
    Eigen::Matrix<double, PARSEC_COEFFICIENT_COUNT, PARSEC_COEFFICIENT_COUNT>;

/**
 * @brief Solves the PARSEC boundary-condition system for one surface.
 *
 * A surface is y(x) = sum_i k_i * x^(i + 1/2). The six coefficients k are
 * fixed by A k = B, where A depends only on the crest position of that side
 * and B carries the trailing edge, crest and leading edge conditions.
 */
class ParsecSolver {
 public:
  static ParsecMatrix buildMatrix(double crest_x);
  static SurfaceCoefficients buildRhs(const ParsecParameters& params, Side side);

  /** Throws NumericalError when the system is singular. */
  static SurfaceCoefficients solve(const ParsecParameters& params, Side side);

  /** Value (derivative = 0) or first/second derivative of the surface at x. */
  static double evaluate(const SurfaceCoefficients& k, double x, int derivative = 0);
  static Eigen::VectorXd evaluateSurface(const SurfaceCoefficients& k,
                                         const Eigen::VectorXd& x);

  /**
   * Closed clockwise outline: the upper surface from the leading edge to the
   * trailing edge, then the lower surface back from the trailing edge to the
   * leading edge, both sampled at the same full-cosine stations.
   */
  static Eigen::Matrix2Xd outline(const SidePair<SurfaceCoefficients>& coefficients,
                                  int num_points);
};
