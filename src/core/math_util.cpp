#include "math_util.hpp"

#include <Eigen/LU>
#include <cmath>
#include <numbers>
#include <sstream>

#include "core/errors.hpp"

Eigen::VectorXd MathUtil::fullCosineSpacing(int n) {
    Eigen::VectorXd x(n);
    for (int i = 0; i < n; i++) {
        const double t = static_cast<double>(i) / (n - 1);
        x[i] = 0.5 * (1.0 + std::cos(std::numbers::pi * (1.0 - t)));
    }
    return x;
}

Eigen::VectorXd MathUtil::halfCosineSpacing(int n) {
    Eigen::VectorXd x(n);
    for (int i = 0; i < n; i++) {
        const double t = static_cast<double>(i) / (n - 1);
        x[i] = 0.5 * (1.0 - std::cos(std::numbers::pi * t));
    }
    return x;
}

Eigen::VectorXd MathUtil::solveDense(const Eigen::MatrixXd& A, const Eigen::VectorXd& b,
                                     double threshold) {
    Eigen::FullPivLU<Eigen::MatrixXd> lu(A);
    lu.setThreshold(threshold);
    if (!lu.isInvertible()) {
        std::ostringstream ss;
        ss << "singular " << A.rows() << "x" << A.cols() << " system (rank "
           << lu.rank() << ")";
        throw NumericalError(ss.str());
    }

    Eigen::VectorXd x = lu.solve(b);
    if (!x.allFinite()) {
        throw NumericalError("linear solve produced non-finite values");
    }
    return x;
}
