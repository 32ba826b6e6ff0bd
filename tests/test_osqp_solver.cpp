#include <catch2/catch_test_macros.hpp>
#include "optimizer/osqp_solver.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

using namespace allocation::optimizer;

TEST_CASE("OSQP inequality constraint support", "[OSQP][Critical]") {
    // 2 variables: x, y
    // Objective: min x^2 + y^2 - x - y
    // Constraint: x + y <= 0.5 (inequality)
    // Expected: x = y = 0.25 (on boundary)

    QuadraticProblem problem;
    problem.P = 2.0 * Eigen::MatrixXd::Identity(2, 2);
    problem.q = -Eigen::VectorXd::Ones(2);

    problem.A_ineq = Eigen::MatrixXd::Ones(1, 2);
    problem.b_ineq_lower = Eigen::VectorXd::Constant(1, -std::numeric_limits<double>::infinity());
    problem.b_ineq_upper = Eigen::VectorXd::Constant(1, 0.5);

    problem.lower_bounds = Eigen::VectorXd::Zero(2);
    problem.upper_bounds = Eigen::VectorXd::Constant(2, 1.0);

    OSQPSolver solver;
    auto result = solver.solve(problem);

    REQUIRE(result.success);
    REQUIRE(std::abs(result.solution.sum() - 0.5) < 1e-6);
    REQUIRE(std::abs(result.solution(0) - 0.25) < 1e-6);
}

TEST_CASE("OSQP equality constraint and bounds", "[OSQP]") {
    // min (1/2) x^T diag(2, 8) x subject to x0 + x1 = 1, 0 <= x <= 1
    // Stationarity: 2 x0 = 8 x1  =>  x = (0.8, 0.2)
    QuadraticProblem problem;
    problem.P = Eigen::Vector2d(2.0, 8.0).asDiagonal();
    problem.q = Eigen::VectorXd::Zero(2);
    problem.A_eq = Eigen::MatrixXd::Ones(1, 2);
    problem.b_eq = Eigen::VectorXd::Constant(1, 1.0);
    problem.lower_bounds = Eigen::VectorXd::Zero(2);
    problem.upper_bounds = Eigen::VectorXd::Ones(2);

    OSQPSolver solver;
    auto result = solver.solve(problem);

    REQUIRE(result.success);
    REQUIRE(std::abs(result.solution(0) - 0.8) < 1e-5);
    REQUIRE(std::abs(result.solution(1) - 0.2) < 1e-5);
    REQUIRE(result.iterations > 0);
}

TEST_CASE("OSQP linear program with zero quadratic term", "[OSQP]") {
    // max x0 + 2 x1 subject to x0 + x1 = 1, x1 <= 0.3
    QuadraticProblem problem;
    problem.P = Eigen::MatrixXd::Zero(2, 2);
    problem.q = Eigen::Vector2d(-1.0, -2.0);
    problem.A_eq = Eigen::MatrixXd::Ones(1, 2);
    problem.b_eq = Eigen::VectorXd::Constant(1, 1.0);
    problem.lower_bounds = Eigen::VectorXd::Zero(2);
    problem.upper_bounds = Eigen::Vector2d(1.0, 0.3);

    OSQPSolver solver;
    auto result = solver.solve(problem);

    REQUIRE(result.success);
    REQUIRE(std::abs(result.solution(1) - 0.3) < 1e-4);
    REQUIRE(std::abs(result.solution(0) - 0.7) < 1e-4);
}

TEST_CASE("OSQP reports primal infeasibility", "[OSQP]") {
    // x0 + x1 = 2 with both variables capped at 0.5
    QuadraticProblem problem;
    problem.P = Eigen::MatrixXd::Identity(2, 2);
    problem.q = Eigen::VectorXd::Zero(2);
    problem.A_eq = Eigen::MatrixXd::Ones(1, 2);
    problem.b_eq = Eigen::VectorXd::Constant(1, 2.0);
    problem.lower_bounds = Eigen::VectorXd::Zero(2);
    problem.upper_bounds = Eigen::VectorXd::Constant(2, 0.5);

    OSQPSolver solver;
    auto result = solver.solve(problem);

    REQUIRE_FALSE(result.success);
    REQUIRE_FALSE(result.message.empty());
}

TEST_CASE("Malformed problems are rejected", "[OSQP]") {
    QuadraticProblem problem;
    problem.P = Eigen::MatrixXd::Identity(2, 2);
    problem.q = Eigen::VectorXd::Zero(3);
    problem.lower_bounds = Eigen::VectorXd::Zero(2);
    problem.upper_bounds = Eigen::VectorXd::Ones(2);

    OSQPSolver solver;
    REQUIRE_THROWS_AS(solver.solve(problem), std::invalid_argument);
}

TEST_CASE("Setup failure returns a zero solution of problem size", "[OSQP]") {
    QuadraticProblem problem;
    problem.P = Eigen::MatrixXd::Identity(3, 3);
    problem.q = Eigen::VectorXd::Zero(3);
    problem.lower_bounds = Eigen::VectorXd::Zero(3);
    problem.upper_bounds = Eigen::VectorXd::Ones(3);

    // OSQP rejects a non-positive iteration limit during setup
    SolverOptions options;
    options.max_iterations = 0;
    OSQPSolver solver(options);
    auto result = solver.solve(problem);

    REQUIRE_FALSE(result.success);
    REQUIRE(result.solution.size() == 3);
    REQUIRE(result.solution.isZero());
}

TEST_CASE("Solver options validation", "[OSQP]") {
    SolverOptions options;
    REQUIRE_NOTHROW(options.validate());

    options.max_iterations = 0;
    REQUIRE_THROWS_AS(options.validate(), std::invalid_argument);

    options.max_iterations = 100;
    options.tolerance = 0.0;
    REQUIRE_THROWS_AS(options.validate(), std::invalid_argument);
}
