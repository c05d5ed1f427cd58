#include "domain/parsec/parsec_solver.hpp"

#include <cmath>
#include <stdexcept>

#include "core/errors.hpp"
#include "core/math_util.hpp"

using Eigen::Matrix2Xd;
using Eigen::VectorXd;

ParsecMatrix ParsecSolver::buildMatrix(double crest_x) {
  ParsecMatrix A;
  for (int i = 0; i < PARSEC_COEFFICIENT_COUNT; i++) {
    const double e = 0.5 + i;
    //---- y(1), y(x), y'(1), y'(x), y''(x) and the leading edge term
    A(0, i) = 1.0;
    A(1, i) = std::pow(crest_x, e);
    A(2, i) = e;
    A(3, i) = e * std::pow(crest_x, e - 1.0);
    A(4, i) = e * (e - 1.0) * std::pow(crest_x, e - 2.0);
    A(5, i) = i == 0 ? 1.0 : 0.0;
  }
  return A;
}

SurfaceCoefficients ParsecSolver::buildRhs(const ParsecParameters& params, Side side) {
  const double sign = sideSign(side);
  const bool upper = side == Side::Upper;

  SurfaceCoefficients B;
  B << params.te_z + PARSEC_TE_THICKNESS_SCALE * sign * params.te_thickness,
      upper ? params.upper_z : params.lower_z,
      std::tan(params.te_alpha - sign * 0.5 * params.te_beta),
      0.0,
      upper ? params.upper_c : params.lower_c,
      sign * std::sqrt(2.0 * params.le_radius);
  return B;
}

SurfaceCoefficients ParsecSolver::solve(const ParsecParameters& params, Side side) {
  const double crest_x = side == Side::Upper ? params.upper_x : params.lower_x;
  const ParsecMatrix A = buildMatrix(crest_x);
  const SurfaceCoefficients B = buildRhs(params, side);

  try {
    return MathUtil::solveDense(A, B, PARSEC_SINGULAR_THRESHOLD);
  } catch (const NumericalError& e) {
    throw NumericalError(std::string("PARSEC ") + sideName(side) +
                         " surface with crest x = " + std::to_string(crest_x) +
                         ": " + e.what());
  }
}

double ParsecSolver::evaluate(const SurfaceCoefficients& k, double x, int derivative) {
  double sum = 0.0;
  for (int i = 0; i < PARSEC_COEFFICIENT_COUNT; i++) {
    const double e = 0.5 + i;
    switch (derivative) {
      case 0:
        sum += k[i] * std::pow(x, e);
        break;
      case 1:
        sum += k[i] * e * std::pow(x, e - 1.0);
        break;
      case 2:
        sum += k[i] * e * (e - 1.0) * std::pow(x, e - 2.0);
        break;
      default:
        throw std::invalid_argument("derivative order must be 0, 1 or 2");
    }
  }
  return sum;
}

VectorXd ParsecSolver::evaluateSurface(const SurfaceCoefficients& k, const VectorXd& x) {
  VectorXd y = VectorXd::Zero(x.size());
  for (int i = 0; i < PARSEC_COEFFICIENT_COUNT; i++) {
    y += k[i] * x.array().pow(0.5 + i).matrix();
  }
  return y;
}

Matrix2Xd ParsecSolver::outline(const SidePair<SurfaceCoefficients>& coefficients,
                                int num_points) {
  const VectorXd x = MathUtil::fullCosineSpacing(num_points);
  const VectorXd y_upper = evaluateSurface(coefficients.upper, x);
  const VectorXd y_lower = evaluateSurface(coefficients.lower, x);

  Matrix2Xd points(2, 2 * num_points);
  points.block(0, 0, 1, num_points) = x.transpose();
  points.block(1, 0, 1, num_points) = y_upper.transpose();
  points.block(0, num_points, 1, num_points) = x.reverse().transpose();
  points.block(1, num_points, 1, num_points) = y_lower.reverse().transpose();
  return points;
}
