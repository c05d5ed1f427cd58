#pragma once

#include <string>
#include <vector>

#include "domain/parsec/parsec_airfoil.hpp"

enum class SimplifiedParameter { Camber, CrestX, Thickness };

struct SimplifiedParsecParameters {
  double camber = 0.0;     // shifts both crests vertically by 1% chord per unit
  double crest_x = 0.400;  // shared crest position of both surfaces
  double thickness = 0.15; // distance between the crests

  double value(SimplifiedParameter parameter) const;
  void assign(SimplifiedParameter parameter, double value);
};

const char* simplifiedParameterName(SimplifiedParameter parameter);
bool isSimplifiedParameterName(const std::string& name);
SimplifiedParameter simplifiedParameterFromName(const std::string& name);

/**
 * @brief Projects camber, crest position and thickness onto PARSEC crests.
 *
 *   upper_z =  0.5 * thickness + 0.01 * camber
 *   lower_z = -0.5 * thickness + 0.01 * camber
 *   upper_x = lower_x = crest_x
 */
class SimplifiedParameterMapper {
 public:
  // Throws ValidationError when value is outside its declared range.
  static void validate(SimplifiedParameter parameter, double value);
  static void validate(const SimplifiedParsecParameters& params);

  static std::vector<ParameterWrite> map(const SimplifiedParsecParameters& params);

  static bool isDerived(ParsecParameter parameter);
};
