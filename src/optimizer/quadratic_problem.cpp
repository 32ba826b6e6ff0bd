/**
 * @file quadratic_problem.cpp
 * @brief Validation of quadratic program descriptions
 */

#include "optimizer/quadratic_problem.hpp"
#include <cmath>
#include <stdexcept>

namespace allocation
{
    namespace optimizer
    {

        void QuadraticProblem::validate() const
        {
            const int n = q.size();

            if (n == 0)
            {
                throw std::invalid_argument("Problem dimension is zero");
            }

            if (P.rows() != n || P.cols() != n)
            {
                throw std::invalid_argument("P matrix dimensions do not match q vector");
            }

            if (!P.allFinite() || !q.allFinite())
            {
                throw std::invalid_argument("Objective contains NaN or Inf");
            }

            if (A_eq.rows() > 0)
            {
                if (A_eq.cols() != n)
                {
                    throw std::invalid_argument("A_eq columns do not match problem dimension");
                }
                if (b_eq.size() != A_eq.rows())
                {
                    throw std::invalid_argument("b_eq size does not match A_eq rows");
                }
            }

            if (A_ineq.rows() > 0)
            {
                if (A_ineq.cols() != n)
                {
                    throw std::invalid_argument("A_ineq columns do not match problem dimension");
                }
                if (b_ineq_lower.size() != A_ineq.rows() || b_ineq_upper.size() != A_ineq.rows())
                {
                    throw std::invalid_argument("Inequality bound sizes do not match A_ineq rows");
                }
                for (int i = 0; i < A_ineq.rows(); ++i)
                {
                    if (b_ineq_lower(i) > b_ineq_upper(i))
                    {
                        throw std::invalid_argument(
                            "Inequality row " + std::to_string(i) + " has lower bound above upper bound");
                    }
                }
            }

            if (lower_bounds.size() != n || upper_bounds.size() != n)
            {
                throw std::invalid_argument("Bounds dimensions do not match problem dimension");
            }

            for (int i = 0; i < n; ++i)
            {
                if (lower_bounds(i) > upper_bounds(i))
                {
                    throw std::invalid_argument(
                        "Lower bound exceeds upper bound for variable " + std::to_string(i));
                }
            }
        }

        void SolverOptions::validate() const
        {
            if (max_iterations <= 0 || !(tolerance > 0.0) || !std::isfinite(tolerance))
            {
                throw std::invalid_argument("Solver max_iterations and tolerance must be positive");
            }
        }

    } // namespace optimizer
} // namespace allocation
