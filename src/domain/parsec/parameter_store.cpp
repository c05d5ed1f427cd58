#include "domain/parsec/parameter_store.hpp"

#include <cmath>
#include <numbers>
#include <sstream>

#include "core/errors.hpp"

namespace {
constexpr double kPi = std::numbers::pi;

int indexOf(ParsecParameter parameter) {
  return static_cast<int>(parameter);
}
} // namespace

ParameterStore::ParameterStore(double max_crest_x) {
  bounds_[indexOf(ParsecParameter::UpperX)] = {PARSEC_MIN_CREST_X, max_crest_x};
  bounds_[indexOf(ParsecParameter::UpperZ)] = {-1.0, 1.0};
  bounds_[indexOf(ParsecParameter::UpperC)] = {-1.0, 1.0};
  bounds_[indexOf(ParsecParameter::LowerX)] = {PARSEC_MIN_CREST_X, max_crest_x};
  bounds_[indexOf(ParsecParameter::LowerZ)] = {-1.0, 1.0};
  bounds_[indexOf(ParsecParameter::LowerC)] = {-1.0, 1.0};
  bounds_[indexOf(ParsecParameter::LeRadius)] = {0.0, 1.0};
  bounds_[indexOf(ParsecParameter::TeZ)] = {0.0, 1.0};
  bounds_[indexOf(ParsecParameter::TeAlpha)] = {-kPi, kPi};
  bounds_[indexOf(ParsecParameter::TeBeta)] = {-kPi, kPi};
  bounds_[indexOf(ParsecParameter::TeThickness)] = {0.0, 1.0};
  bounds_[indexOf(ParsecParameter::NumPoints)] = {AIRFOILGEN_MIN_POINTS, AIRFOILGEN_MAX_POINTS, true};

  // Defaults must satisfy the bounds of this store.
  assign(ParsecParameters{});
}

const ParameterBound& ParameterStore::bound(ParsecParameter parameter) const {
  return bounds_[indexOf(parameter)];
}

void ParameterStore::validate(ParsecParameter parameter, double value) const {
  const ParameterBound& b = bound(parameter);
  std::ostringstream ss;
  if (!std::isfinite(value)) {
    ss << "'" << parameterName(parameter) << "' must be finite, got " << value;
    throw ValidationError(ss.str());
  }
  if (value < b.min || value > b.max) {
    ss << "'" << parameterName(parameter) << "' = " << value << " is outside ["
       << b.min << ", " << b.max << "]";
    throw ValidationError(ss.str());
  }
  if (b.integral && value != std::floor(value)) {
    ss << "'" << parameterName(parameter) << "' must be an integer, got " << value;
    throw ValidationError(ss.str());
  }
}

bool ParameterStore::set(ParsecParameter parameter, double value) {
  validate(parameter, value);
  if (values_.value(parameter) == value) {
    return false;
  }
  values_.assign(parameter, value);
  return true;
}

void ParameterStore::assign(const ParsecParameters& values) {
  for (ParsecParameter parameter : kAllParsecParameters) {
    validate(parameter, values.value(parameter));
  }
  values_ = values;
}
