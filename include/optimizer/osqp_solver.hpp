/**
 * @file osqp_solver.hpp
 * @brief OSQP-based quadratic programming solver
 *
 * Wraps the OSQP library (Operator Splitting Quadratic Program) for the
 * allocation problems built by MeanVarianceOptimizer.
 *
 * OSQP solves:
 *   minimize     (1/2) x^T P x + q^T x
 *   subject to   l <= A x <= u
 *
 * The wrapper stacks equality, two-sided inequality and box rows into A:
 *   A = [A_eq; A_ineq; I],  l = [b_eq; b_lower; lb],  u = [b_eq; b_upper; ub]
 */

#pragma once

#include "optimizer/quadratic_problem.hpp"
#include <Eigen/Dense>
#include <osqp/osqp.h>
#include <vector>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @class OSQPSolver
         * @brief Quadratic programming solver using the OSQP library
         *
         * Each call to solve() sets up, solves and releases its own OSQP
         * workspace, so one instance can be reused for a whole frontier sweep.
         *
         * Usage Example:
         * @code
         * SolverOptions options;
         * options.tolerance = 1e-8;
         * OSQPSolver solver(options);
         *
         * SolverResult result = solver.solve(problem);
         * if (result.success) {
         *     std::cout << "Converged in " << result.iterations << " iterations\n";
         * }
         * @endcode
         */
        class OSQPSolver
        {
        public:
            explicit OSQPSolver(const SolverOptions &options = SolverOptions());

            void set_options(const SolverOptions &options);
            const SolverOptions &get_options() const { return options_; }

            /**
             * @brief Solve quadratic programming problem
             * @param problem QP problem specification
             * @return Solution with status, iterations and objective value
             * @throws std::invalid_argument if the problem is ill-formed
             *
             * Solver non-convergence (infeasible, iteration limit) is reported
             * through SolverResult::success and message, not thrown.
             */
            SolverResult solve(const QuadraticProblem &problem) const;

        private:
            SolverOptions options_;

            /**
             * @brief Convert Eigen dense matrix to CSC arrays
             * @param upper_triangular_only Only store the upper triangle (required for P)
             */
            static void convert_to_csc(
                const Eigen::MatrixXd &dense,
                std::vector<OSQPFloat> &data,
                std::vector<OSQPInt> &indices,
                std::vector<OSQPInt> &indptr,
                bool upper_triangular_only);

            /**
             * @brief Build stacked constraint matrix and bounds
             * @return Number of constraint rows (m)
             */
            static OSQPInt build_constraint_matrix(
                const QuadraticProblem &problem,
                std::vector<OSQPFloat> &A_data,
                std::vector<OSQPInt> &A_indices,
                std::vector<OSQPInt> &A_indptr,
                std::vector<OSQPFloat> &l,
                std::vector<OSQPFloat> &u);
        };

    } // namespace optimizer
} // namespace allocation
