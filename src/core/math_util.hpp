#pragma once

#include <Eigen/Core>

class MathUtil {
    public:
    /** x_i = 0.5 * (1 + cos(pi * (1 - i / (n - 1)))), clustered at both ends of [0, 1]. */
    static Eigen::VectorXd fullCosineSpacing(int n);

    /** x_i = 0.5 * (1 - cos(pi * i / (n - 1))), clustered at the leading edge. */
    static Eigen::VectorXd halfCosineSpacing(int n);

    /**
     * Solves A x = b with full pivoting.
     * Throws NumericalError when A is rank deficient or the result is not finite.
     */
    static Eigen::VectorXd solveDense(const Eigen::MatrixXd& A, const Eigen::VectorXd& b,
                                      double threshold);
};
