/**
 * @file osqp_solver.cpp
 * @brief Implementation of OSQP solver wrapper
 */

#include "optimizer/osqp_solver.hpp"
#include <cmath>
#include <memory>
#include <string>

namespace allocation
{
    namespace optimizer
    {

        namespace
        {
            constexpr double SPARSITY_THRESHOLD = 1e-14;

            struct WorkspaceDeleter
            {
                void operator()(::OSQPSolver *work) const
                {
                    if (work)
                    {
                        osqp_cleanup(work);
                    }
                }
            };

            using WorkspacePtr = std::unique_ptr<::OSQPSolver, WorkspaceDeleter>;

            OSQPFloat to_osqp_bound(double value)
            {
                if (value >= OSQP_INFTY)
                {
                    return OSQP_INFTY;
                }
                if (value <= -OSQP_INFTY)
                {
                    return -OSQP_INFTY;
                }
                return static_cast<OSQPFloat>(value);
            }
        } // namespace

        OSQPSolver::OSQPSolver(const SolverOptions &options) : options_(options)
        {
        }

        void OSQPSolver::set_options(const SolverOptions &options)
        {
            options_ = options;
        }

        void OSQPSolver::convert_to_csc(
            const Eigen::MatrixXd &dense,
            std::vector<OSQPFloat> &data,
            std::vector<OSQPInt> &indices,
            std::vector<OSQPInt> &indptr,
            bool upper_triangular_only)
        {
            const int rows = dense.rows();
            const int cols = dense.cols();

            data.clear();
            indices.clear();
            indptr.clear();
            indptr.reserve(cols + 1);
            indptr.push_back(0);

            for (int j = 0; j < cols; ++j)
            {
                const int row_limit = upper_triangular_only ? (j + 1) : rows;

                for (int i = 0; i < row_limit; ++i)
                {
                    const double val = dense(i, j);
                    if (std::abs(val) > SPARSITY_THRESHOLD)
                    {
                        data.push_back(static_cast<OSQPFloat>(val));
                        indices.push_back(static_cast<OSQPInt>(i));
                    }
                }
                indptr.push_back(static_cast<OSQPInt>(data.size()));
            }
        }

        OSQPInt OSQPSolver::build_constraint_matrix(
            const QuadraticProblem &problem,
            std::vector<OSQPFloat> &A_data,
            std::vector<OSQPInt> &A_indices,
            std::vector<OSQPInt> &A_indptr,
            std::vector<OSQPFloat> &l,
            std::vector<OSQPFloat> &u)
        {
            const int n = problem.q.size();
            const int n_eq = problem.A_eq.rows();
            const int n_ineq = problem.A_ineq.rows();
            const int m = n_eq + n_ineq + n;

            A_data.clear();
            A_indices.clear();
            A_indptr.clear();
            A_indptr.reserve(n + 1);
            l.resize(m);
            u.resize(m);

            A_indptr.push_back(0);

            for (int j = 0; j < n; ++j)
            {
                for (int i = 0; i < n_eq; ++i)
                {
                    const double val = problem.A_eq(i, j);
                    if (std::abs(val) > SPARSITY_THRESHOLD)
                    {
                        A_data.push_back(static_cast<OSQPFloat>(val));
                        A_indices.push_back(static_cast<OSQPInt>(i));
                    }
                }

                for (int i = 0; i < n_ineq; ++i)
                {
                    const double val = problem.A_ineq(i, j);
                    if (std::abs(val) > SPARSITY_THRESHOLD)
                    {
                        A_data.push_back(static_cast<OSQPFloat>(val));
                        A_indices.push_back(static_cast<OSQPInt>(n_eq + i));
                    }
                }

                // Box row for x_j: lb_j <= x_j <= ub_j
                A_data.push_back(1.0);
                A_indices.push_back(static_cast<OSQPInt>(n_eq + n_ineq + j));

                A_indptr.push_back(static_cast<OSQPInt>(A_data.size()));
            }

            for (int i = 0; i < n_eq; ++i)
            {
                l[i] = static_cast<OSQPFloat>(problem.b_eq(i));
                u[i] = static_cast<OSQPFloat>(problem.b_eq(i));
            }

            for (int i = 0; i < n_ineq; ++i)
            {
                l[n_eq + i] = to_osqp_bound(problem.b_ineq_lower(i));
                u[n_eq + i] = to_osqp_bound(problem.b_ineq_upper(i));
            }

            for (int i = 0; i < n; ++i)
            {
                l[n_eq + n_ineq + i] = to_osqp_bound(problem.lower_bounds(i));
                u[n_eq + n_ineq + i] = to_osqp_bound(problem.upper_bounds(i));
            }

            return static_cast<OSQPInt>(m);
        }

        SolverResult OSQPSolver::solve(const QuadraticProblem &problem) const
        {
            problem.validate();

            SolverResult result;
            const int n = problem.q.size();
            result.solution = Eigen::VectorXd::Zero(n);

            // P in upper-triangular CSC form
            std::vector<OSQPFloat> P_data;
            std::vector<OSQPInt> P_indices;
            std::vector<OSQPInt> P_indptr;
            Eigen::MatrixXd P_sym = 0.5 * (problem.P + problem.P.transpose());
            convert_to_csc(P_sym, P_data, P_indices, P_indptr, true);

            std::vector<OSQPFloat> q(n);
            for (int i = 0; i < n; ++i)
            {
                q[i] = static_cast<OSQPFloat>(problem.q(i));
            }

            std::vector<OSQPFloat> A_data;
            std::vector<OSQPInt> A_indices;
            std::vector<OSQPInt> A_indptr;
            std::vector<OSQPFloat> l;
            std::vector<OSQPFloat> u;
            const OSQPInt m = build_constraint_matrix(problem, A_data, A_indices, A_indptr, l, u);

            OSQPCscMatrix P_csc{};
            P_csc.m = static_cast<OSQPInt>(n);
            P_csc.n = static_cast<OSQPInt>(n);
            P_csc.p = P_indptr.data();
            P_csc.i = P_indices.data();
            P_csc.x = P_data.data();
            P_csc.nzmax = static_cast<OSQPInt>(P_data.size());
            P_csc.nz = -1; // CSC, not triplet

            OSQPCscMatrix A_csc{};
            A_csc.m = m;
            A_csc.n = static_cast<OSQPInt>(n);
            A_csc.p = A_indptr.data();
            A_csc.i = A_indices.data();
            A_csc.x = A_data.data();
            A_csc.nzmax = static_cast<OSQPInt>(A_data.size());
            A_csc.nz = -1;

            OSQPSettings settings;
            osqp_set_default_settings(&settings);
            settings.verbose = options_.verbose ? 1 : 0;
            settings.eps_abs = options_.tolerance;
            settings.eps_rel = options_.tolerance;
            settings.max_iter = options_.max_iterations;
            settings.polishing = options_.polish ? 1 : 0;

            ::OSQPSolver *raw_work = nullptr;
            const OSQPInt exit_flag = osqp_setup(&raw_work, &P_csc, q.data(), &A_csc,
                                                 l.data(), u.data(), m, static_cast<OSQPInt>(n), &settings);
            WorkspacePtr work(raw_work);

            if (exit_flag != 0 || !work)
            {
                result.success = false;
                result.message = "OSQP setup failed with code " + std::to_string(exit_flag);
                return result;
            }

            osqp_solve(work.get());

            if (work->solution && work->solution->x)
            {
                for (int i = 0; i < n; ++i)
                {
                    result.solution(i) = work->solution->x[i];
                }
            }

            result.iterations = static_cast<int>(work->info->iter);
            result.objective_value = work->info->obj_val;
            result.message = work->info->status;

            const OSQPInt status = work->info->status_val;
            result.success = (status == OSQP_SOLVED || status == OSQP_SOLVED_INACCURATE) &&
                             result.solution.allFinite();

            return result;
        }

    } // namespace optimizer
} // namespace allocation
