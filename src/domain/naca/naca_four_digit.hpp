#pragma once

#include <string>

#include <Eigen/Core>

#include "core/side_pair.hpp"

/**
 * @brief Parsed MPTT designation of a NACA four-digit section.
 */
struct NacaDesignation {
  std::string name;
  double camber_max = 0.0; // M / 100
  double camber_pos = 0.0; // P / 10
  double thickness = 0.0;  // TT / 100

  /** Throws ValidationError unless name is exactly four decimal digits. */
  static NacaDesignation parse(const std::string& name);
};

struct NacaSurfaces {
  Eigen::VectorXd stations;      // half-cosine spaced chord stations
  Eigen::VectorXd mean_camber;   // yc at each station
  Eigen::VectorXd half_thickness;  // t at each station
  SidePair<Eigen::Matrix2Xd> surfaces; // leading edge to trailing edge
};

class NacaFourDigitGenerator {
 public:
  explicit NacaFourDigitGenerator(const NacaDesignation& designation, bool finite_te = false);

  // A zero camber position is generated as a symmetric section.
  bool symmetric() const { return designation_.camber_pos == 0.0; }

  double thickness(double x) const;
  double camber(double x) const;
  double camberSlope(double x) const;

  NacaSurfaces generate(int num_points) const;

  /**
   * Upper surface from the trailing edge to the leading edge, then the lower
   * surface without its leading edge point: 2 * num_points - 1 columns.
   */
  static Eigen::Matrix2Xd outline(const NacaSurfaces& surfaces);

 private:
  NacaDesignation designation_;
  double a4_;
};
