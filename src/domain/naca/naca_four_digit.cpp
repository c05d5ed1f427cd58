#include "domain/naca/naca_four_digit.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include "core/errors.hpp"
#include "core/math_util.hpp"

using Eigen::Matrix2Xd;
using Eigen::VectorXd;

namespace {
// thickness polynomial of the four-digit family
constexpr double kA0 = 0.2969;
constexpr double kA1 = -0.1260;
constexpr double kA2 = -0.3516;
constexpr double kA3 = 0.2843;
constexpr double kA4FiniteTe = -0.1015;
constexpr double kA4SharpTe = -0.1036;

int digit(char c) {
  return c - '0';
}
} // namespace

NacaDesignation NacaDesignation::parse(const std::string& name) {
  const bool digits_only = std::all_of(name.begin(), name.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
  if (name.size() != 4 || !digits_only) {
    throw ValidationError("'" + name + "' is not a NACA four-digit designation");
  }

  NacaDesignation designation;
  designation.name = name;
  designation.camber_max = digit(name[0]) / 100.0;
  designation.camber_pos = digit(name[1]) / 10.0;
  designation.thickness = (10 * digit(name[2]) + digit(name[3])) / 100.0;
  return designation;
}

NacaFourDigitGenerator::NacaFourDigitGenerator(const NacaDesignation& designation, bool finite_te)
    : designation_(designation), a4_(finite_te ? kA4FiniteTe : kA4SharpTe) {}

double NacaFourDigitGenerator::thickness(double x) const {
  const double x2 = x * x;
  return 5.0 * designation_.thickness *
         (kA0 * std::sqrt(x) + kA1 * x + kA2 * x2 + kA3 * x2 * x + a4_ * x2 * x2);
}

double NacaFourDigitGenerator::camber(double x) const {
  if (symmetric()) {
    return 0.0;
  }
  const double m = designation_.camber_max;
  const double p = designation_.camber_pos;
  if (x < p) {
    return m / (p * p) * (2.0 * p * x - x * x);
  }
  return m / ((1.0 - p) * (1.0 - p)) * ((1.0 - 2.0 * p) + 2.0 * p * x - x * x);
}

double NacaFourDigitGenerator::camberSlope(double x) const {
  if (symmetric()) {
    return 0.0;
  }
  const double m = designation_.camber_max;
  const double p = designation_.camber_pos;
  if (x < p) {
    return 2.0 * m / (p * p) * (p - x);
  }
  return 2.0 * m / ((1.0 - p) * (1.0 - p)) * (p - x);
}

NacaSurfaces NacaFourDigitGenerator::generate(int num_points) const {
  NacaSurfaces result;
  result.stations = MathUtil::halfCosineSpacing(num_points);
  result.mean_camber = VectorXd::Zero(num_points);
  result.half_thickness = VectorXd::Zero(num_points);
  result.surfaces.upper = Matrix2Xd::Zero(2, num_points);
  result.surfaces.lower = Matrix2Xd::Zero(2, num_points);

  for (int i = 0; i < num_points; i++) {
    const double x = result.stations[i];
    const double yc = camber(x);
    const double t = thickness(x);
    const double theta = std::atan(camberSlope(x));

    result.mean_camber[i] = yc;
    result.half_thickness[i] = t;
    result.surfaces.upper.col(i) << x - t * std::sin(theta), yc + t * std::cos(theta);
    result.surfaces.lower.col(i) << x + t * std::sin(theta), yc - t * std::cos(theta);
  }
  return result;
}

Matrix2Xd NacaFourDigitGenerator::outline(const NacaSurfaces& surfaces) {
  const Matrix2Xd& upper = surfaces.surfaces.upper;
  const Matrix2Xd& lower = surfaces.surfaces.lower;
  const int n = static_cast<int>(upper.cols());

  Matrix2Xd points(2, 2 * n - 1);
  points.leftCols(n) = upper.rowwise().reverse();
  points.rightCols(n - 1) = lower.rightCols(n - 1);
  return points;
}
