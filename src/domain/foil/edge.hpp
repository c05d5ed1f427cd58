#pragma once

#include <Eigen/Core>

#include "core/side_pair.hpp"

/**
 * @brief Leading and trailing edge summary of a generated airfoil.
 */
class Edge {
  public:
    Edge();
    explicit Edge(const SidePair<Eigen::Matrix2Xd>& surfaces);

    Eigen::Vector2d point_le;
    SidePair<Eigen::Vector2d> point_te; // trailing edge end of each surface
    Eigen::Vector2d te_midpoint;
    double chord;
    double te_gap;   // distance between the trailing edge points
    double te_angle; // included angle of the last panels [rad]
    bool sharp;
};
