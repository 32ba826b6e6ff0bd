/**
 * @file quadratic_problem.hpp
 * @brief Quadratic program description shared by the optimizer and solver
 *
 * Minimize:     (1/2) * x^T * P * x + q^T * x
 * Subject to:   A_eq * x = b_eq                       (equality constraints)
 *               b_lower <= A_ineq * x <= b_upper      (two-sided inequalities)
 *               l <= x <= u                           (box constraints)
 */

#pragma once

#include <Eigen/Dense>
#include <string>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @struct QuadraticProblem
         * @brief Quadratic programming problem description
         */
        struct QuadraticProblem
        {
            Eigen::MatrixXd P; ///< Quadratic term (N x N), symmetric PSD
            Eigen::VectorXd q; ///< Linear term (N x 1)

            Eigen::MatrixXd A_eq; ///< Equality constraint matrix
            Eigen::VectorXd b_eq; ///< Equality constraint values

            Eigen::MatrixXd A_ineq;       ///< Inequality constraint matrix
            Eigen::VectorXd b_ineq_lower; ///< Inequality lower bounds (for A_ineq * x)
            Eigen::VectorXd b_ineq_upper; ///< Inequality upper bounds (for A_ineq * x)

            Eigen::VectorXd lower_bounds; ///< Lower bounds
            Eigen::VectorXd upper_bounds; ///< Upper bounds

            /**
             * @brief Validate problem specification
             * @throws std::invalid_argument if problem is ill-formed
             */
            void validate() const;
        };

        /**
         * @struct SolverOptions
         * @brief Options for the quadratic solver
         */
        struct SolverOptions
        {
            int max_iterations = 10000; ///< Maximum iterations
            double tolerance = 1e-6;    ///< Absolute and relative convergence tolerance
            bool polish = true;         ///< Refine the solution on the active set
            bool verbose = false;       ///< Print solver progress

            /**
             * @throws std::invalid_argument if max_iterations or tolerance is not positive
             */
            void validate() const;
        };

        /**
         * @struct SolverResult
         * @brief Result from the quadratic solver
         */
        struct SolverResult
        {
            Eigen::VectorXd solution;     ///< Optimal solution; zeros of problem size when setup fails
            double objective_value = 0.0; ///< Final objective value
            bool success = false;         ///< Convergence achieved
            int iterations = 0;           ///< Number of iterations
            std::string message;          ///< Status message
        };

    } // namespace optimizer
} // namespace allocation
