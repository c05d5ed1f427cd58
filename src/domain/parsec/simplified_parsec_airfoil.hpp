#pragma once

#include <string>

#include "domain/parsec/parsec_airfoil.hpp"
#include "domain/parsec/simplified_parameter_mapper.hpp"

/**
 * @brief PARSEC airfoil driven by camber, crest position and thickness.
 *
 * The crest coordinates are owned by SimplifiedParameterMapper and cannot be
 * written directly. Every write, simplified or shared, goes through the
 * one-shot update path: both surfaces are solved and the outline resampled
 * in a single transactional step.
 */
class SimplifiedParsecAirfoil : public ParsecAirfoil {
 public:
  explicit SimplifiedParsecAirfoil(const SimplifiedParsecParameters& simplified = {},
                                   const ParsecParameters& shared = {},
                                   std::string name = "Simplified PARSEC");

  using ParsecAirfoil::get;
  using ParsecAirfoil::set;

  std::string description() const override;

  double get(SimplifiedParameter parameter) const;
  double get(const std::string& name) const override;
  SimplifiedParsecParameters simplifiedParameters() const;

  void set(SimplifiedParameter parameter, double value);
  void set(const std::string& name, double value) override;

  void setCamber(double value) { set(SimplifiedParameter::Camber, value); }
  void setCrestX(double value) { set(SimplifiedParameter::CrestX, value); }
  void setThickness(double value) { set(SimplifiedParameter::Thickness, value); }

 protected:
  void checkWritable(ParsecParameter parameter) const override;

 private:
  static ParsecParameters project(const SimplifiedParsecParameters& simplified,
                                  ParsecParameters shared);

  SimplifiedParsecParameters simplified_;
};
