#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief A written value, parameter name or designation was rejected.
 *
 * Thrown before any state is touched; the caller may retry with a corrected
 * value.
 */
class ValidationError : public std::invalid_argument {
 public:
  explicit ValidationError(const std::string& message)
      : std::invalid_argument(message) {}
};

/**
 * @brief A linear system could not be solved to a finite result.
 */
class NumericalError : public std::runtime_error {
 public:
  explicit NumericalError(const std::string& message)
      : std::runtime_error(message) {}
};
