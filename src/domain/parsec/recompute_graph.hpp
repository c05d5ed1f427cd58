#pragma once

#include <vector>

#include "domain/parsec/parsec_parameters.hpp"

enum class DerivedQuantity { UpperCoefficients, LowerCoefficients, Coordinates };

const char* derivedName(DerivedQuantity quantity);

/**
 * @brief Static dependency table of the PARSEC derived quantities.
 *
 * Each node lists the parameters and upstream nodes it is computed from.
 * Nodes are declared in topological order, so walking the table front to
 * back yields a valid recomputation order.
 */
class RecomputeGraph {
 public:
  struct Node {
    DerivedQuantity quantity;
    std::vector<ParsecParameter> parameters;
    std::vector<DerivedQuantity> upstream;
  };

  RecomputeGraph();

  const std::vector<Node>& nodes() const { return nodes_; }
  const Node& node(DerivedQuantity quantity) const;

  bool dependsOn(DerivedQuantity quantity, ParsecParameter parameter) const;

  /** Derived quantities made stale by the changed parameters, in recompute order. */
  std::vector<DerivedQuantity> affectedBy(const std::vector<ParsecParameter>& changed) const;

  /** Every derived quantity, in recompute order. */
  std::vector<DerivedQuantity> all() const;

 private:
  std::vector<Node> nodes_;
};
