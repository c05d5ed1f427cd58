#include "domain/parsec/simplified_parameter_mapper.hpp"

#include <cmath>
#include <sstream>

#include "core/errors.hpp"
#include "infrastructure/airfoilgen_params.h"

namespace {
struct Range {
  double min;
  double max;
};

Range rangeOf(SimplifiedParameter parameter) {
  switch (parameter) {
    case SimplifiedParameter::Camber:
      return {-1.0, 1.0};
    case SimplifiedParameter::CrestX:
      return {PARSEC_MIN_CREST_X, SIMPLIFIED_PARSEC_MAX_CREST_X};
    case SimplifiedParameter::Thickness:
      return {SIMPLIFIED_PARSEC_MIN_THICKNESS, SIMPLIFIED_PARSEC_MAX_THICKNESS};
  }
  throw std::invalid_argument("invalid simplified PARSEC parameter");
}

constexpr SimplifiedParameter kAllSimplified[] = {
    SimplifiedParameter::Camber, SimplifiedParameter::CrestX, SimplifiedParameter::Thickness};
} // namespace

double SimplifiedParsecParameters::value(SimplifiedParameter parameter) const {
  switch (parameter) {
    case SimplifiedParameter::Camber:
      return camber;
    case SimplifiedParameter::CrestX:
      return crest_x;
    case SimplifiedParameter::Thickness:
      return thickness;
  }
  throw std::invalid_argument("invalid simplified PARSEC parameter");
}

void SimplifiedParsecParameters::assign(SimplifiedParameter parameter, double value) {
  switch (parameter) {
    case SimplifiedParameter::Camber:
      camber = value;
      return;
    case SimplifiedParameter::CrestX:
      crest_x = value;
      return;
    case SimplifiedParameter::Thickness:
      thickness = value;
      return;
  }
  throw std::invalid_argument("invalid simplified PARSEC parameter");
}

const char* simplifiedParameterName(SimplifiedParameter parameter) {
  switch (parameter) {
    case SimplifiedParameter::Camber:
      return "camber";
    case SimplifiedParameter::CrestX:
      return "crest_x";
    case SimplifiedParameter::Thickness:
      return "thickness";
  }
  return "";
}

bool isSimplifiedParameterName(const std::string& name) {
  for (SimplifiedParameter parameter : kAllSimplified) {
    if (name == simplifiedParameterName(parameter)) {
      return true;
    }
  }
  return false;
}

SimplifiedParameter simplifiedParameterFromName(const std::string& name) {
  for (SimplifiedParameter parameter : kAllSimplified) {
    if (name == simplifiedParameterName(parameter)) {
      return parameter;
    }
  }
  throw ValidationError("unknown simplified PARSEC parameter '" + name + "'");
}

void SimplifiedParameterMapper::validate(SimplifiedParameter parameter, double value) {
  const Range range = rangeOf(parameter);
  if (!std::isfinite(value) || value < range.min || value > range.max) {
    std::ostringstream ss;
    ss << "'" << simplifiedParameterName(parameter) << "' = " << value
       << " is outside [" << range.min << ", " << range.max << "]";
    throw ValidationError(ss.str());
  }
}

void SimplifiedParameterMapper::validate(const SimplifiedParsecParameters& params) {
  for (SimplifiedParameter parameter : kAllSimplified) {
    validate(parameter, params.value(parameter));
  }
}

std::vector<ParameterWrite> SimplifiedParameterMapper::map(const SimplifiedParsecParameters& params) {
  const double offset = 0.01 * params.camber;
  return {
      {ParsecParameter::UpperX, params.crest_x},
      {ParsecParameter::LowerX, params.crest_x},
      {ParsecParameter::UpperZ, 0.5 * params.thickness + offset},
      {ParsecParameter::LowerZ, -0.5 * params.thickness + offset},
  };
}

bool SimplifiedParameterMapper::isDerived(ParsecParameter parameter) {
  return parameter == ParsecParameter::UpperX || parameter == ParsecParameter::LowerX ||
         parameter == ParsecParameter::UpperZ || parameter == ParsecParameter::LowerZ;
}
