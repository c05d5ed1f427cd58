#pragma once

#include <string>

#include <Eigen/Core>

#include "domain/foil/airfoil.hpp"
#include "domain/naca/naca_four_digit.hpp"

struct NacaFourDigitParameters {
  std::string name = "0012";
  int num_points = 100;
  bool finite_te = false; // blunt trailing edge when true
};

/**
 * @brief NACA four-digit section named by its MPTT designation.
 *
 * Renaming, resampling or switching the trailing edge type regenerates the
 * outline before the call returns.
 */
class NacaFourDigitAirfoil : public Airfoil {
 public:
  explicit NacaFourDigitAirfoil(const NacaFourDigitParameters& params = {});

  std::string name() const override;
  std::string description() const override;
  Eigen::Matrix2Xd coordinates() const override;

  // Throws ValidationError for anything but four decimal digits.
  void setName(const std::string& name);
  void setNumPoints(int num_points);
  void setFiniteTrailingEdge(bool finite_te);

  NacaDesignation designation() const;
  int numPoints() const;
  bool finiteTrailingEdge() const;
  NacaSurfaces distribution() const;
  SidePair<Eigen::Matrix2Xd> surfacePoints() const override;

 private:
  static void validateNumPoints(int num_points);
  void regenerateLocked(const NacaDesignation& designation, int num_points, bool finite_te);

  NacaDesignation designation_;
  int num_points_ = 0;
  bool finite_te_ = false;
  NacaSurfaces surfaces_;
  Eigen::Matrix2Xd coordinates_;
};
