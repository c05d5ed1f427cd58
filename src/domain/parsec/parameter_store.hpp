#pragma once

#include <array>

#include "domain/parsec/parsec_parameters.hpp"
#include "infrastructure/airfoilgen_params.h"

struct ParameterBound {
  double min = 0.0;
  double max = 0.0;
  bool integral = false;
};

/**
 * @brief Range-checked holder of PARSEC shape parameters.
 *
 * Every write is validated against the declared bounds before the stored
 * value changes, so a rejected write never leaves a partial update behind.
 */
class ParameterStore {
 public:
  explicit ParameterStore(double max_crest_x = PARSEC_MAX_CREST_X);

  const ParsecParameters& values() const { return values_; }
  double get(ParsecParameter parameter) const { return values_.value(parameter); }
  const ParameterBound& bound(ParsecParameter parameter) const;

  // Throws ValidationError when value is outside the bound of parameter.
  void validate(ParsecParameter parameter, double value) const;

  // Returns true when the stored value actually changed.
  bool set(ParsecParameter parameter, double value);

  // All-or-nothing replacement of every parameter.
  void assign(const ParsecParameters& values);

 private:
  std::array<ParameterBound, kParsecParameterCount> bounds_;
  ParsecParameters values_;
};
