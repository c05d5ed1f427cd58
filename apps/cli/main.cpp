#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>

#include "core/errors.hpp"
#include "domain/foil/edge.hpp"
#include "domain/naca/naca_four_digit_airfoil.hpp"
#include "domain/parsec/parsec_airfoil.hpp"
#include "domain/parsec/simplified_parsec_airfoil.hpp"

// Usage: airfoilgen_cli [naca=2412] [name=value ...]
// name=value pairs are PARSEC parameters (upper_x, te_beta, ...) or the
// simplified parameters camber, crest_x and thickness.
struct CommandLine {
  std::string naca = "2412";
  std::map<std::string, double> parsec;
  std::map<std::string, double> simplified;
};

bool parseArguments(int argc, char* argv[], CommandLine& command_line) {
  for (int i = 1; i < argc; i++) {
    const std::string argument(argv[i]);
    const std::size_t separator = argument.find('=');
    if (separator == std::string::npos) {
      std::cout << "Expected name=value, got '" << argument << "'" << std::endl;
      return false;
    }
    const std::string key = argument.substr(0, separator);
    const std::string value = argument.substr(separator + 1);
    if (key == "naca") {
      command_line.naca = value;
      continue;
    }

    char* end = nullptr;
    const double number = std::strtod(value.c_str(), &end);
    if (end == value.c_str() || *end != '\0') {
      std::cout << "'" << value << "' is not a number" << std::endl;
      return false;
    }
    if (isSimplifiedParameterName(key)) {
      command_line.simplified[key] = number;
    } else if (isParameterName(key)) {
      command_line.parsec[key] = number;
    } else {
      std::cout << "Unknown parameter '" << key << "'" << std::endl;
      return false;
    }
  }
  return true;
}

void report(const Airfoil& airfoil) {
  const Eigen::Matrix2Xd points = airfoil.coordinates();
  const Edge edge(airfoil.surfacePoints());

  std::cout << airfoil.name() << std::endl;
  std::cout << "  " << airfoil.description() << std::endl;
  std::cout << "  points : " << points.cols() << std::endl;
  std::cout << "  leading edge : (" << edge.point_le.x() << ", " << edge.point_le.y() << ")"
            << std::endl;
  std::cout << "  trailing edge : upper (" << edge.point_te.upper.x() << ", "
            << edge.point_te.upper.y() << "), lower (" << edge.point_te.lower.x() << ", "
            << edge.point_te.lower.y() << ")" << std::endl;
  std::cout << "  chord : " << edge.chord << ", gap : " << edge.te_gap
            << (edge.sharp ? " (sharp)" : " (blunt)") << std::endl;
}

void reportCoefficients(const ParsecAirfoil& airfoil) {
  const Eigen::IOFormat row(Eigen::StreamPrecision, Eigen::DontAlignCols, ", ", ", ");
  std::cout << "  upper coefficients : " << airfoil.upperCoefficients().transpose().format(row)
            << std::endl;
  std::cout << "  lower coefficients : " << airfoil.lowerCoefficients().transpose().format(row)
            << std::endl;
}

int main(int argc, char* argv[]) {
  CommandLine command_line;
  if (!parseArguments(argc, argv, command_line)) {
    return 1;
  }

  auto start = std::chrono::steady_clock::now();
  std::cout << std::setprecision(6);

  try {
    NacaFourDigitParameters naca_params;
    naca_params.name = command_line.naca;
    NacaFourDigitAirfoil naca(naca_params);
    report(naca);

    ParsecAirfoil parsec;
    for (const auto& [name, value] : command_line.parsec) {
      parsec.set(name, value);
    }
    report(parsec);
    reportCoefficients(parsec);

    SimplifiedParsecAirfoil simplified;
    for (const auto& [name, value] : command_line.simplified) {
      simplified.set(name, value);
    }
    report(simplified);
    reportCoefficients(simplified);
  } catch (const ValidationError& e) {
    std::cout << "Invalid parameter: " << e.what() << std::endl;
    return 1;
  } catch (const NumericalError& e) {
    std::cout << "Unsolvable geometry: " << e.what() << std::endl;
    return 2;
  }

  auto end = std::chrono::steady_clock::now();
  auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);

  std::cout << "Elapsed time: " << duration.count() << " microseconds." << std::endl;

  return 0;
}
