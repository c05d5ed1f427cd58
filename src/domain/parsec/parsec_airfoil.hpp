#pragma once

#include <string>
#include <utility>
#include <vector>

#include <Eigen/Core>

#include "core/side_pair.hpp"
#include "domain/foil/airfoil.hpp"
#include "domain/parsec/parameter_store.hpp"
#include "domain/parsec/parsec_solver.hpp"
#include "domain/parsec/recompute_graph.hpp"

/**
 * @brief How a committed write reaches the derived geometry.
 *
 * DependencyGraph recomputes only what the RecomputeGraph marks stale.
 * OneShot solves both surfaces and resamples in a single step.
 */
enum class UpdatePath { DependencyGraph, OneShot };

struct ParsecGeometry {
  SidePair<SurfaceCoefficients> coefficients;
  Eigen::Matrix2Xd coordinates;
};

using ParameterWrite = std::pair<ParsecParameter, double>;

/**
 * @brief PARametric SECtion airfoil.
 *
 * Each surface is the solution of a six-condition linear system (see
 * ParsecSolver). Writes are validated, then the stale coefficients and the
 * outline are recomputed eagerly on a staged copy and swapped in together;
 * a NumericalError leaves parameters and geometry as they were.
 */
class ParsecAirfoil : public Airfoil {
 public:
  explicit ParsecAirfoil(const ParsecParameters& params = {}, std::string name = "PARSEC");

  std::string name() const override;
  void setName(std::string name);
  std::string description() const override;
  Eigen::Matrix2Xd coordinates() const override;
  SidePair<Eigen::Matrix2Xd> surfacePoints() const override;

  double get(ParsecParameter parameter) const;
  virtual double get(const std::string& name) const;
  ParsecParameters parameters() const;
  ParameterBound bound(ParsecParameter parameter) const;

  void set(ParsecParameter parameter, double value);
  virtual void set(const std::string& name, double value);
  void set(const std::vector<ParameterWrite>& writes);

  SurfaceCoefficients coefficients(Side side) const;
  SurfaceCoefficients upperCoefficients() const { return coefficients(Side::Upper); }
  SurfaceCoefficients lowerCoefficients() const { return coefficients(Side::Lower); }

  UpdatePath updatePath() const { return update_path_; }

 protected:
  ParsecAirfoil(const ParsecParameters& params, std::string name, double max_crest_x,
                UpdatePath path);

  // Throws ValidationError for parameters a variant derives itself.
  virtual void checkWritable(ParsecParameter parameter) const;

  // Validates, recomputes and commits writes; caller holds mutex_.
  std::vector<ParameterChange> commitLocked(const std::vector<ParameterWrite>& writes);

  const ParameterStore& storeLocked() const { return store_; }

 private:
  ParsecGeometry recompute(const ParameterStore& staged,
                           const std::vector<ParsecParameter>& changed) const;

  std::string name_;
  UpdatePath update_path_;
  RecomputeGraph graph_;
  ParameterStore store_;
  ParsecGeometry geometry_;
};
