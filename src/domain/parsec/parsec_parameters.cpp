#include "domain/parsec/parsec_parameters.hpp"

#include <cmath>

#include "core/errors.hpp"

double ParsecParameters::value(ParsecParameter parameter) const {
  switch (parameter) {
    case ParsecParameter::UpperX:
      return upper_x;
    case ParsecParameter::UpperZ:
      return upper_z;
    case ParsecParameter::UpperC:
      return upper_c;
    case ParsecParameter::LowerX:
      return lower_x;
    case ParsecParameter::LowerZ:
      return lower_z;
    case ParsecParameter::LowerC:
      return lower_c;
    case ParsecParameter::LeRadius:
      return le_radius;
    case ParsecParameter::TeZ:
      return te_z;
    case ParsecParameter::TeAlpha:
      return te_alpha;
    case ParsecParameter::TeBeta:
      return te_beta;
    case ParsecParameter::TeThickness:
      return te_thickness;
    case ParsecParameter::NumPoints:
      return static_cast<double>(num_points);
  }
  throw std::invalid_argument("invalid PARSEC parameter");
}

void ParsecParameters::assign(ParsecParameter parameter, double value) {
  switch (parameter) {
    case ParsecParameter::UpperX:
      upper_x = value;
      return;
    case ParsecParameter::UpperZ:
      upper_z = value;
      return;
    case ParsecParameter::UpperC:
      upper_c = value;
      return;
    case ParsecParameter::LowerX:
      lower_x = value;
      return;
    case ParsecParameter::LowerZ:
      lower_z = value;
      return;
    case ParsecParameter::LowerC:
      lower_c = value;
      return;
    case ParsecParameter::LeRadius:
      le_radius = value;
      return;
    case ParsecParameter::TeZ:
      te_z = value;
      return;
    case ParsecParameter::TeAlpha:
      te_alpha = value;
      return;
    case ParsecParameter::TeBeta:
      te_beta = value;
      return;
    case ParsecParameter::TeThickness:
      te_thickness = value;
      return;
    case ParsecParameter::NumPoints:
      num_points = static_cast<int>(std::lround(value));
      return;
  }
  throw std::invalid_argument("invalid PARSEC parameter");
}

const char* parameterName(ParsecParameter parameter) {
  switch (parameter) {
    case ParsecParameter::UpperX:
      return "upper_x";
    case ParsecParameter::UpperZ:
      return "upper_z";
    case ParsecParameter::UpperC:
      return "upper_c";
    case ParsecParameter::LowerX:
      return "lower_x";
    case ParsecParameter::LowerZ:
      return "lower_z";
    case ParsecParameter::LowerC:
      return "lower_c";
    case ParsecParameter::LeRadius:
      return "le_radius";
    case ParsecParameter::TeZ:
      return "te_z";
    case ParsecParameter::TeAlpha:
      return "te_alpha";
    case ParsecParameter::TeBeta:
      return "te_beta";
    case ParsecParameter::TeThickness:
      return "te_thickness";
    case ParsecParameter::NumPoints:
      return "num_points";
  }
  return "";
}

bool isParameterName(const std::string& name) {
  for (ParsecParameter parameter : kAllParsecParameters) {
    if (name == parameterName(parameter)) {
      return true;
    }
  }
  return false;
}

ParsecParameter parameterFromName(const std::string& name) {
  for (ParsecParameter parameter : kAllParsecParameters) {
    if (name == parameterName(parameter)) {
      return parameter;
    }
  }
  throw ValidationError("unknown PARSEC parameter '" + name + "'");
}
