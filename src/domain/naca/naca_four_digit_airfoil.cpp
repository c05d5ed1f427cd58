#include "domain/naca/naca_four_digit_airfoil.hpp"

#include <sstream>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "infrastructure/airfoilgen_params.h"
#include "infrastructure/logger.hpp"

NacaFourDigitAirfoil::NacaFourDigitAirfoil(const NacaFourDigitParameters& params) {
  validateNumPoints(params.num_points);
  regenerateLocked(NacaDesignation::parse(params.name), params.num_points, params.finite_te);
}

std::string NacaFourDigitAirfoil::name() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return designation_.name;
}

std::string NacaFourDigitAirfoil::description() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ostringstream ss;
  ss << "NACA " << designation_.name << ": " << designation_.camber_max * 100
     << "% camber at " << designation_.camber_pos * 100 << "% chord, "
     << designation_.thickness * 100 << "% thickness, "
     << (finite_te_ ? "finite" : "sharp") << " trailing edge";
  return ss.str();
}

Eigen::Matrix2Xd NacaFourDigitAirfoil::coordinates() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return coordinates_;
}

void NacaFourDigitAirfoil::setName(const std::string& name) {
  const NacaDesignation designation = NacaDesignation::parse(name);
  std::lock_guard<std::mutex> lock(mutex_);
  regenerateLocked(designation, num_points_, finite_te_);
}

void NacaFourDigitAirfoil::setNumPoints(int num_points) {
  validateNumPoints(num_points);
  std::vector<ParameterChange> changes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (num_points == num_points_) {
      return;
    }
    changes.push_back({"num_points", static_cast<double>(num_points_),
                       static_cast<double>(num_points)});
    regenerateLocked(designation_, num_points, finite_te_);
  }
  notify(changes);
}

void NacaFourDigitAirfoil::setFiniteTrailingEdge(bool finite_te) {
  std::vector<ParameterChange> changes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finite_te == finite_te_) {
      return;
    }
    changes.push_back({"finite_te", finite_te_ ? 1.0 : 0.0, finite_te ? 1.0 : 0.0});
    regenerateLocked(designation_, num_points_, finite_te);
  }
  notify(changes);
}

NacaDesignation NacaFourDigitAirfoil::designation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return designation_;
}

int NacaFourDigitAirfoil::numPoints() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return num_points_;
}

bool NacaFourDigitAirfoil::finiteTrailingEdge() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return finite_te_;
}

NacaSurfaces NacaFourDigitAirfoil::distribution() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return surfaces_;
}

SidePair<Eigen::Matrix2Xd> NacaFourDigitAirfoil::surfacePoints() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return surfaces_.surfaces;
}

void NacaFourDigitAirfoil::validateNumPoints(int num_points) {
  if (num_points < AIRFOILGEN_MIN_POINTS || num_points > AIRFOILGEN_MAX_POINTS) {
    std::ostringstream ss;
    ss << "'num_points' = " << num_points << " is outside [" << AIRFOILGEN_MIN_POINTS
       << ", " << AIRFOILGEN_MAX_POINTS << "]";
    throw ValidationError(ss.str());
  }
}

void NacaFourDigitAirfoil::regenerateLocked(const NacaDesignation& designation, int num_points,
                                            bool finite_te) {
  const NacaFourDigitGenerator generator(designation, finite_te);
  if (generator.symmetric() && designation.camber_max != 0.0) {
    Logger::instance().warn("NACA " + designation.name +
                            ": zero camber position, generating a symmetric section");
  }

  NacaSurfaces surfaces = generator.generate(num_points);
  coordinates_ = NacaFourDigitGenerator::outline(surfaces);
  surfaces_ = std::move(surfaces);
  designation_ = designation;
  num_points_ = num_points;
  finite_te_ = finite_te;
}
