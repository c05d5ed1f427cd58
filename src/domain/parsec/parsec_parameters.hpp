#pragma once

#include <array>
#include <numbers>
#include <string>

enum class ParsecParameter {
  UpperX,
  UpperZ,
  UpperC,
  LowerX,
  LowerZ,
  LowerC,
  LeRadius,
  TeZ,
  TeAlpha,
  TeBeta,
  TeThickness,
  NumPoints
};

inline constexpr int kParsecParameterCount = 12;

inline constexpr std::array<ParsecParameter, kParsecParameterCount> kAllParsecParameters{
    ParsecParameter::UpperX,   ParsecParameter::UpperZ,      ParsecParameter::UpperC,
    ParsecParameter::LowerX,   ParsecParameter::LowerZ,      ParsecParameter::LowerC,
    ParsecParameter::LeRadius, ParsecParameter::TeZ,         ParsecParameter::TeAlpha,
    ParsecParameter::TeBeta,   ParsecParameter::TeThickness, ParsecParameter::NumPoints};

/**
 * @brief Raw shape parameters of a PARSEC airfoil.
 *
 * Member initializers are the documented defaults: a symmetric section with
 * both crests at 40% chord, 15% thick, and a sharp trailing edge with a 20
 * degree wedge.
 */
struct ParsecParameters {
  double upper_x = 0.400;  // upper crest horizontal coordinate
  double upper_z = 0.075;  // upper crest vertical coordinate
  double upper_c = -0.100; // upper crest curvature
  double lower_x = 0.400;
  double lower_z = -0.075;
  double lower_c = 0.100;
  double le_radius = 0.01;
  double te_z = 0.0;
  double te_alpha = 0.0;                          // trailing edge direction angle [rad]
  double te_beta = 20.0 * std::numbers::pi / 180; // trailing edge wedge angle [rad]
  double te_thickness = 0.0;                      // 1.0 equates to 1% chord
  int num_points = 200;

  double value(ParsecParameter parameter) const;
  void assign(ParsecParameter parameter, double value);
};

const char* parameterName(ParsecParameter parameter);

/** Throws ValidationError for names that are not PARSEC parameters. */
ParsecParameter parameterFromName(const std::string& name);

bool isParameterName(const std::string& name);
