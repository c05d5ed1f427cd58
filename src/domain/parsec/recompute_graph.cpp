#include "domain/parsec/recompute_graph.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace {
bool contains(const std::vector<DerivedQuantity>& list, DerivedQuantity quantity) {
  return std::find(list.begin(), list.end(), quantity) != list.end();
}
} // namespace

const char* derivedName(DerivedQuantity quantity) {
  switch (quantity) {
    case DerivedQuantity::UpperCoefficients:
      return "upper_coefficients";
    case DerivedQuantity::LowerCoefficients:
      return "lower_coefficients";
    case DerivedQuantity::Coordinates:
      return "coordinates";
  }
  return "";
}

RecomputeGraph::RecomputeGraph() {
  using P = ParsecParameter;
  nodes_ = {
      {DerivedQuantity::UpperCoefficients,
       {P::UpperX, P::UpperZ, P::UpperC, P::LeRadius, P::TeZ, P::TeAlpha, P::TeBeta,
        P::TeThickness},
       {}},
      {DerivedQuantity::LowerCoefficients,
       {P::LowerX, P::LowerZ, P::LowerC, P::LeRadius, P::TeZ, P::TeAlpha, P::TeBeta,
        P::TeThickness},
       {}},
      {DerivedQuantity::Coordinates,
       {P::NumPoints},
       {DerivedQuantity::UpperCoefficients, DerivedQuantity::LowerCoefficients}},
  };

  //---- every upstream node must be declared before its dependents
  std::vector<DerivedQuantity> declared;
  for (const Node& n : nodes_) {
    for (DerivedQuantity up : n.upstream) {
      if (!contains(declared, up)) {
        throw std::logic_error(std::string("recompute graph: ") + derivedName(n.quantity) +
                               " declared before its dependency " + derivedName(up));
      }
    }
    declared.push_back(n.quantity);
  }
}

const RecomputeGraph::Node& RecomputeGraph::node(DerivedQuantity quantity) const {
  for (const Node& n : nodes_) {
    if (n.quantity == quantity) {
      return n;
    }
  }
  throw std::invalid_argument("invalid derived quantity");
}

bool RecomputeGraph::dependsOn(DerivedQuantity quantity, ParsecParameter parameter) const {
  const Node& n = node(quantity);
  if (std::find(n.parameters.begin(), n.parameters.end(), parameter) != n.parameters.end()) {
    return true;
  }
  return std::any_of(n.upstream.begin(), n.upstream.end(),
                     [&](DerivedQuantity up) { return dependsOn(up, parameter); });
}

std::vector<DerivedQuantity> RecomputeGraph::affectedBy(
    const std::vector<ParsecParameter>& changed) const {
  std::vector<DerivedQuantity> stale;
  for (const Node& n : nodes_) {
    const bool direct = std::any_of(n.parameters.begin(), n.parameters.end(), [&](ParsecParameter p) {
      return std::find(changed.begin(), changed.end(), p) != changed.end();
    });
    const bool propagated = std::any_of(n.upstream.begin(), n.upstream.end(),
                                        [&](DerivedQuantity up) { return contains(stale, up); });
    if (direct || propagated) {
      stale.push_back(n.quantity);
    }
  }
  return stale;
}

std::vector<DerivedQuantity> RecomputeGraph::all() const {
  std::vector<DerivedQuantity> result;
  for (const Node& n : nodes_) {
    result.push_back(n.quantity);
  }
  return result;
}
