#pragma once

#include <stdexcept>

enum class Side { Upper, Lower };

/**
 * @brief Sign convention of a surface: +1 for the upper side, -1 for the lower.
 */
inline double sideSign(Side side) {
  return side == Side::Upper ? 1.0 : -1.0;
}

inline const char* sideName(Side side) {
  return side == Side::Upper ? "upper" : "lower";
}

/**
 * @brief Convenience container for holding values on the airfoil's
 *        upper and lower surfaces.
 */
template <class T>
struct SidePair {
  T upper;
  T lower;

  T& get(Side side) {
    switch (side) {
      case Side::Upper:
        return upper;
      case Side::Lower:
        return lower;
    }
    throw std::invalid_argument("invalid side type");
  }

  const T& get(Side side) const {
    switch (side) {
      case Side::Upper:
        return upper;
      case Side::Lower:
        return lower;
    }
    throw std::invalid_argument("invalid side type");
  }
};
