#include "domain/foil/edge.hpp"

#include <cmath>
#include <stdexcept>

namespace {
// 2D cross product (z-component)
inline double cross2(const Eigen::Vector2d& a, const Eigen::Vector2d& b) {
  return a[0] * b[1] - a[1] * b[0];
}

Eigen::Vector2d lastPanel(const Eigen::Matrix2Xd& surface) {
  const Eigen::Index n = surface.cols();
  return surface.col(n - 1) - surface.col(n - 2);
}
} // namespace

Edge::Edge()
    : point_le(Eigen::Vector2d::Zero()),
      point_te{Eigen::Vector2d::Zero(), Eigen::Vector2d::Zero()},
      te_midpoint(Eigen::Vector2d::Zero()),
      chord(0.0),
      te_gap(0.0),
      te_angle(0.0),
      sharp(false) {}

Edge::Edge(const SidePair<Eigen::Matrix2Xd>& surfaces) : Edge() {
  if (surfaces.upper.cols() < 2 || surfaces.lower.cols() < 2) {
    throw std::invalid_argument("Edge expects at least two points per surface");
  }

  point_le = 0.5 * (surfaces.upper.col(0) + surfaces.lower.col(0));
  point_te.upper = surfaces.upper.col(surfaces.upper.cols() - 1);
  point_te.lower = surfaces.lower.col(surfaces.lower.cols() - 1);
  te_midpoint = 0.5 * (point_te.upper + point_te.lower);
  chord = (te_midpoint - point_le).norm();

  te_gap = (point_te.upper - point_te.lower).norm();

  //---- included angle between the final upper and lower panels
  const Eigen::Vector2d upper = lastPanel(surfaces.upper);
  const Eigen::Vector2d lower = lastPanel(surfaces.lower);
  te_angle = std::fabs(std::atan2(cross2(lower, upper), lower.dot(upper)));

  sharp = te_gap < 0.0001 * chord;
}
