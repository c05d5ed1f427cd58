#include "domain/parsec/parsec_airfoil.hpp"

#include <sstream>

#include "core/errors.hpp"
#include "infrastructure/logger.hpp"

using Eigen::Matrix2Xd;

ParsecAirfoil::ParsecAirfoil(const ParsecParameters& params, std::string name)
    : ParsecAirfoil(params, std::move(name), PARSEC_MAX_CREST_X, UpdatePath::DependencyGraph) {}

ParsecAirfoil::ParsecAirfoil(const ParsecParameters& params, std::string name,
                             double max_crest_x, UpdatePath path)
    : name_(std::move(name)), update_path_(path), store_(max_crest_x) {
  store_.assign(params);
  const std::vector<ParsecParameter> every(kAllParsecParameters.begin(),
                                           kAllParsecParameters.end());
  geometry_ = recompute(store_, every);
}

std::string ParsecAirfoil::name() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return name_;
}

void ParsecAirfoil::setName(std::string name) {
  std::lock_guard<std::mutex> lock(mutex_);
  name_ = std::move(name);
}

std::string ParsecAirfoil::description() const {
  std::lock_guard<std::mutex> lock(mutex_);
  const ParsecParameters& p = store_.values();
  std::ostringstream ss;
  ss << "PARSEC airfoil, upper crest (" << p.upper_x << ", " << p.upper_z
     << ") curvature " << p.upper_c << ", lower crest (" << p.lower_x << ", "
     << p.lower_z << ") curvature " << p.lower_c << ", leading edge radius "
     << p.le_radius;
  return ss.str();
}

Matrix2Xd ParsecAirfoil::coordinates() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return geometry_.coordinates;
}

SidePair<Matrix2Xd> ParsecAirfoil::surfacePoints() const {
  std::lock_guard<std::mutex> lock(mutex_);
  const Eigen::Index n = geometry_.coordinates.cols() / 2;
  SidePair<Matrix2Xd> surfaces;
  surfaces.upper = geometry_.coordinates.leftCols(n);
  surfaces.lower = geometry_.coordinates.rightCols(n).rowwise().reverse();
  return surfaces;
}

double ParsecAirfoil::get(ParsecParameter parameter) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.get(parameter);
}

double ParsecAirfoil::get(const std::string& name) const {
  return get(parameterFromName(name));
}

ParsecParameters ParsecAirfoil::parameters() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.values();
}

ParameterBound ParsecAirfoil::bound(ParsecParameter parameter) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.bound(parameter);
}

void ParsecAirfoil::set(ParsecParameter parameter, double value) {
  set(std::vector<ParameterWrite>{{parameter, value}});
}

void ParsecAirfoil::set(const std::string& name, double value) {
  set(parameterFromName(name), value);
}

void ParsecAirfoil::set(const std::vector<ParameterWrite>& writes) {
  for (const ParameterWrite& write : writes) {
    checkWritable(write.first);
  }

  std::vector<ParameterChange> changes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    changes = commitLocked(writes);
  }
  notify(changes);
}

SurfaceCoefficients ParsecAirfoil::coefficients(Side side) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return geometry_.coefficients.get(side);
}

void ParsecAirfoil::checkWritable(ParsecParameter parameter) const {
  (void)parameter;
}

std::vector<ParameterChange> ParsecAirfoil::commitLocked(const std::vector<ParameterWrite>& writes) {
  //---- validate every write on a staged copy before touching the store
  ParameterStore staged = store_;
  for (const ParameterWrite& write : writes) {
    staged.set(write.first, write.second);
  }

  std::vector<ParsecParameter> changed;
  std::vector<ParameterChange> changes;
  for (ParsecParameter parameter : kAllParsecParameters) {
    const double old_value = store_.get(parameter);
    const double new_value = staged.get(parameter);
    if (old_value != new_value) {
      changed.push_back(parameter);
      changes.push_back({parameterName(parameter), old_value, new_value});
    }
  }
  if (changed.empty()) {
    return changes;
  }

  ParsecGeometry next;
  try {
    next = recompute(staged, changed);
  } catch (const NumericalError& e) {
    Logger::instance().error(name_ + ": write rejected, " + e.what());
    throw;
  }

  store_ = staged;
  geometry_ = std::move(next);
  return changes;
}

ParsecGeometry ParsecAirfoil::recompute(const ParameterStore& staged,
                                        const std::vector<ParsecParameter>& changed) const {
  const ParsecParameters& params = staged.values();
  ParsecGeometry next = geometry_;

  if (update_path_ == UpdatePath::OneShot) {
    Logger::instance().debug(name_ + ": recomputing all derived quantities");
    next.coefficients.upper = ParsecSolver::solve(params, Side::Upper);
    next.coefficients.lower = ParsecSolver::solve(params, Side::Lower);
    next.coordinates = ParsecSolver::outline(next.coefficients, params.num_points);
    return next;
  }

  const std::vector<DerivedQuantity> stale = graph_.affectedBy(changed);
  std::string stale_names;
  for (DerivedQuantity quantity : stale) {
    stale_names += stale_names.empty() ? "" : ", ";
    stale_names += derivedName(quantity);
  }
  Logger::instance().debug(name_ + ": recomputing " + stale_names);

  for (DerivedQuantity quantity : stale) {
    switch (quantity) {
      case DerivedQuantity::UpperCoefficients:
        next.coefficients.upper = ParsecSolver::solve(params, Side::Upper);
        break;
      case DerivedQuantity::LowerCoefficients:
        next.coefficients.lower = ParsecSolver::solve(params, Side::Lower);
        break;
      case DerivedQuantity::Coordinates:
        next.coordinates = ParsecSolver::outline(next.coefficients, params.num_points);
        break;
    }
  }
  return next;
}
