#include "domain/parsec/simplified_parsec_airfoil.hpp"

#include <sstream>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "infrastructure/airfoilgen_params.h"

SimplifiedParsecAirfoil::SimplifiedParsecAirfoil(const SimplifiedParsecParameters& simplified,
                                                 const ParsecParameters& shared,
                                                 std::string name)
    : ParsecAirfoil(project(simplified, shared), std::move(name),
                    SIMPLIFIED_PARSEC_MAX_CREST_X, UpdatePath::OneShot),
      simplified_(simplified) {}

ParsecParameters SimplifiedParsecAirfoil::project(const SimplifiedParsecParameters& simplified,
                                                  ParsecParameters shared) {
  SimplifiedParameterMapper::validate(simplified);
  for (const ParameterWrite& write : SimplifiedParameterMapper::map(simplified)) {
    shared.assign(write.first, write.second);
  }
  return shared;
}

std::string SimplifiedParsecAirfoil::description() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ostringstream ss;
  ss << "Simplified PARSEC airfoil, camber " << simplified_.camber << ", crest at x = "
     << simplified_.crest_x << ", thickness " << simplified_.thickness
     << ", leading edge radius " << storeLocked().values().le_radius;
  return ss.str();
}

double SimplifiedParsecAirfoil::get(SimplifiedParameter parameter) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return simplified_.value(parameter);
}

double SimplifiedParsecAirfoil::get(const std::string& name) const {
  if (isSimplifiedParameterName(name)) {
    return get(simplifiedParameterFromName(name));
  }
  return ParsecAirfoil::get(name);
}

SimplifiedParsecParameters SimplifiedParsecAirfoil::simplifiedParameters() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return simplified_;
}

void SimplifiedParsecAirfoil::set(SimplifiedParameter parameter, double value) {
  SimplifiedParameterMapper::validate(parameter, value);

  std::vector<ParameterChange> changes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const double old_value = simplified_.value(parameter);
    if (old_value == value) {
      return;
    }
    SimplifiedParsecParameters next = simplified_;
    next.assign(parameter, value);

    changes = commitLocked(SimplifiedParameterMapper::map(next));
    simplified_ = next;
    changes.insert(changes.begin(),
                   ParameterChange{simplifiedParameterName(parameter), old_value, value});
  }
  notify(changes);
}

void SimplifiedParsecAirfoil::set(const std::string& name, double value) {
  if (isSimplifiedParameterName(name)) {
    set(simplifiedParameterFromName(name), value);
    return;
  }
  ParsecAirfoil::set(name, value);
}

void SimplifiedParsecAirfoil::checkWritable(ParsecParameter parameter) const {
  if (SimplifiedParameterMapper::isDerived(parameter)) {
    throw ValidationError(std::string("'") + parameterName(parameter) +
                          "' is derived from camber, crest_x and thickness on a "
                          "simplified PARSEC airfoil");
  }
}
