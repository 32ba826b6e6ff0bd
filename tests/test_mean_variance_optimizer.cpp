/**
 * @file test_mean_variance_optimizer.cpp
 * @brief Unit tests for MeanVarianceOptimizer
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <vector>
#include <string>

#include "optimizer/mean_variance_optimizer.hpp"
#include "optimizer/allocation.hpp"

using namespace allocation;
using namespace allocation::optimizer;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixture
// ============================================================================

class OptimizerTestFixture
{
protected:
    // Three independent candidates: high alpha/high risk down to low/low
    Eigen::VectorXd returns_3_;
    Eigen::MatrixXd cov_3_;

    // Two identical, perfectly correlated candidates
    Eigen::VectorXd returns_twin_;
    Eigen::MatrixXd cov_twin_;

    OptimizerTestFixture()
    {
        returns_3_ = Eigen::VectorXd(3);
        returns_3_ << 0.8, 0.5, 0.2;

        Eigen::Vector3d sigma(0.3, 0.2, 0.1);
        cov_3_ = sigma.array().square().matrix().asDiagonal();

        returns_twin_ = Eigen::VectorXd::Constant(2, 0.5);
        cov_twin_ = Eigen::MatrixXd::Constant(2, 2, 0.04);
    }

    static void require_feasible(const OptimizationResult &result,
                                 const OptimizationConstraints &constraints)
    {
        const double eps = 1e-6;
        REQUIRE(result.weights.minCoeff() >= -eps);
        REQUIRE(result.weights.maxCoeff() <= constraints.max_weight + eps);
        REQUIRE(result.weights.sum() <= constraints.budget + eps);
        if (constraints.fully_invested)
        {
            REQUIRE_THAT(result.weights.sum(), WithinAbs(constraints.budget, eps));
        }
    }
};

// ============================================================================
// Basic Unit Tests
// ============================================================================

TEST_CASE_METHOD(OptimizerTestFixture, "MeanVarianceOptimizer construction",
                 "[MeanVarianceOptimizer][Basic]")
{
    SECTION("Default construction") {
        MeanVarianceOptimizer opt;
        REQUIRE(opt.get_name() == "MeanVarianceOptimizer");
        REQUIRE(opt.get_objective() == ObjectiveType::RISK_AVERSION);
        REQUIRE_THAT(opt.get_risk_aversion(), WithinAbs(1.0, 1e-10));
    }

    SECTION("Negative risk aversion throws") {
        MeanVarianceOptimizer opt;
        REQUIRE_THROWS_AS(opt.set_risk_aversion(-0.5), std::invalid_argument);
    }

    SECTION("Objective names parse case-insensitively") {
        REQUIRE(parse_objective_type("Max_Sharpe") == ObjectiveType::MAX_SHARPE);
        REQUIRE(parse_objective_type("target_return") == ObjectiveType::TARGET_RETURN);
        REQUIRE_THROWS_AS(parse_objective_type("max_return"), std::invalid_argument);
    }
}

TEST_CASE("OptimizationConstraints validation", "[MeanVarianceOptimizer][Constraints]")
{
    SECTION("Defaults are valid") {
        OptimizationConstraints c;
        REQUIRE_NOTHROW(c.check_feasibility(3));
    }

    SECTION("Leverage is rejected") {
        OptimizationConstraints c;
        c.budget = 1.5;
        REQUIRE_THROWS_AS(c.validate(), std::invalid_argument);
    }

    SECTION("Caps too small for the budget") {
        OptimizationConstraints c;
        c.max_weight = 0.2;
        REQUIRE_THROWS_AS(c.check_feasibility(3), InfeasibleError);
    }

    SECTION("Floors exceed the budget") {
        OptimizationConstraints c;
        c.min_weight = 0.5;
        REQUIRE_THROWS_AS(c.check_feasibility(3), InfeasibleError);
    }

    SECTION("No candidates") {
        OptimizationConstraints c;
        REQUIRE_THROWS_AS(c.check_feasibility(0), InfeasibleError);
    }

    SECTION("Group members resolve to indices") {
        OptimizationConstraints c;
        GroupConstraint g;
        g.name = "region";
        g.members = {"b", "c"};
        g.max_exposure = 0.5;
        c.group_constraints.push_back(g);

        auto resolved = c.resolve_groups({"a", "b", "c"});
        REQUIRE(resolved.group_constraints[0].asset_indices == std::vector<int>{1, 2});
        REQUIRE_THROWS_AS(c.resolve_groups({"a", "b"}), std::invalid_argument);
    }
}

// ============================================================================
// Objectives
// ============================================================================

TEST_CASE_METHOD(OptimizerTestFixture, "Risk aversion trades return for risk",
                 "[MeanVarianceOptimizer][RiskAversion]")
{
    OptimizationConstraints constraints;
    MeanVarianceOptimizer opt(ObjectiveType::RISK_AVERSION);

    SECTION("Moderate aversion favors the high-alpha candidate") {
        opt.set_risk_aversion(1.0);
        auto result = opt.optimize(returns_3_, cov_3_, constraints);

        REQUIRE(result.success);
        require_feasible(result, constraints);
        REQUIRE(result.weights(0) > result.weights(2));
    }

    SECTION("Zero aversion concentrates on the highest alpha") {
        opt.set_risk_aversion(0.0);
        auto result = opt.optimize(returns_3_, cov_3_, constraints);

        REQUIRE(result.success);
        REQUIRE_THAT(result.weights(0), WithinAbs(1.0, 1e-9));
        REQUIRE_THAT(result.expected_return, WithinAbs(0.8, 1e-9));
        REQUIRE_THAT(result.risk_aversion, WithinAbs(0.0, 1e-12));
    }

    SECTION("Extreme aversion approaches inverse-variance weights") {
        opt.set_risk_aversion(1e4);
        auto result = opt.optimize(returns_3_, cov_3_, constraints);

        REQUIRE(result.success);
        require_feasible(result, constraints);
        REQUIRE_THAT(result.weights(0), WithinAbs(0.0816, 2e-3));
        REQUIRE_THAT(result.weights(1), WithinAbs(0.1837, 2e-3));
        REQUIRE_THAT(result.weights(2), WithinAbs(0.7347, 2e-3));
    }

    SECTION("Weight cap spreads the allocation") {
        constraints.max_weight = 0.4;
        opt.set_risk_aversion(0.0);
        auto result = opt.optimize(returns_3_, cov_3_, constraints);

        require_feasible(result, constraints);
        REQUIRE_THAT(result.weights(0), WithinAbs(0.4, 1e-9));
        REQUIRE_THAT(result.weights(1), WithinAbs(0.4, 1e-9));
        REQUIRE_THAT(result.weights(2), WithinAbs(0.2, 1e-9));
    }

    SECTION("Group exposure caps are respected") {
        GroupConstraint g;
        g.name = "high";
        g.asset_indices = {0, 1};
        g.max_exposure = 0.5;
        constraints.group_constraints.push_back(g);

        opt.set_risk_aversion(0.0);
        auto result = opt.optimize(returns_3_, cov_3_, constraints);

        REQUIRE(result.success);
        require_feasible(result, constraints);
        REQUIRE(result.weights(0) + result.weights(1) <= 0.5 + 1e-5);
        REQUIRE_THAT(result.weights(2), WithinAbs(0.5, 1e-4));
    }
}

TEST_CASE_METHOD(OptimizerTestFixture, "Partial investment skips negative alpha",
                 "[MeanVarianceOptimizer][Budget]")
{
    OptimizationConstraints constraints;
    constraints.fully_invested = false;

    Eigen::VectorXd negative = -returns_3_;

    MeanVarianceOptimizer opt(ObjectiveType::RISK_AVERSION);
    opt.set_risk_aversion(0.0);
    auto result = opt.optimize(negative, cov_3_, constraints);

    REQUIRE(result.success);
    REQUIRE_THAT(result.weights.sum(), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(result.volatility, WithinAbs(0.0, 1e-12));
    REQUIRE_FALSE(result.sharpe_ratio.has_value());
}

TEST_CASE_METHOD(OptimizerTestFixture, "Minimum variance portfolio",
                 "[MeanVarianceOptimizer][MinVariance]")
{
    OptimizationConstraints constraints;
    MeanVarianceOptimizer opt(ObjectiveType::MIN_VARIANCE);

    auto result = opt.optimize(returns_3_, cov_3_, constraints);

    REQUIRE(result.success);
    require_feasible(result, constraints);
    REQUIRE_THAT(result.weights(0), WithinAbs(0.0816, 1e-3));
    REQUIRE_THAT(result.weights(1), WithinAbs(0.1837, 1e-3));
    REQUIRE_THAT(result.weights(2), WithinAbs(0.7347, 1e-3));
    REQUIRE(result.sharpe_ratio.has_value());
}

TEST_CASE_METHOD(OptimizerTestFixture, "Maximum Sharpe search",
                 "[MeanVarianceOptimizer][MaxSharpe]")
{
    OptimizationConstraints constraints;

    MeanVarianceOptimizer sharpe_opt(ObjectiveType::MAX_SHARPE);
    auto best = sharpe_opt.optimize(returns_3_, cov_3_, constraints);

    MeanVarianceOptimizer ra_opt(ObjectiveType::RISK_AVERSION);
    ra_opt.set_risk_aversion(1.0);
    auto reference = ra_opt.optimize(returns_3_, cov_3_, constraints);

    REQUIRE(best.success);
    REQUIRE(best.sharpe_ratio.has_value());
    REQUIRE(reference.sharpe_ratio.has_value());
    REQUIRE(*best.sharpe_ratio >= *reference.sharpe_ratio - 1e-6);
    require_feasible(best, constraints);
}

TEST_CASE_METHOD(OptimizerTestFixture, "Target return",
                 "[MeanVarianceOptimizer][TargetReturn]")
{
    OptimizationConstraints constraints;
    MeanVarianceOptimizer opt(ObjectiveType::TARGET_RETURN);

    SECTION("Reachable target is met") {
        opt.set_target_return(0.5);
        auto result = opt.optimize(returns_3_, cov_3_, constraints);

        REQUIRE(result.success);
        REQUIRE_THAT(result.expected_return, WithinAbs(0.5, 1e-4));
        REQUIRE_THAT(result.weights.sum(), WithinAbs(1.0, 1e-4));
    }

    SECTION("Achievable range is bounded by the extreme candidates") {
        auto range = opt.achievable_return_range(returns_3_, constraints);
        REQUIRE_THAT(range.first, WithinAbs(0.2, 1e-12));
        REQUIRE_THAT(range.second, WithinAbs(0.8, 1e-12));
    }

    SECTION("Unreachable target is infeasible") {
        opt.set_target_return(0.9);
        REQUIRE_THROWS_AS(opt.optimize(returns_3_, cov_3_, constraints), InfeasibleError);
    }
}

// ============================================================================
// Numerical Conditions
// ============================================================================

TEST_CASE_METHOD(OptimizerTestFixture, "Perfectly correlated candidates are regularized",
                 "[MeanVarianceOptimizer][Conditioning]")
{
    OptimizationConstraints constraints;
    MeanVarianceOptimizer opt(ObjectiveType::RISK_AVERSION);
    opt.set_risk_aversion(1.0);

    auto result = opt.optimize(returns_twin_, cov_twin_, constraints);

    REQUIRE(result.success);
    REQUIRE(has_warning(result.warnings, WarningCode::REGULARIZED_COVARIANCE));
    require_feasible(result, constraints);
    // Volatility is reported against the unregularized covariance
    REQUIRE_THAT(result.volatility, WithinAbs(0.2, 1e-6));
}

TEST_CASE_METHOD(OptimizerTestFixture, "Invalid inputs are rejected",
                 "[MeanVarianceOptimizer][Validation]")
{
    OptimizationConstraints constraints;
    MeanVarianceOptimizer opt;

    SECTION("Empty input is infeasible") {
        REQUIRE_THROWS_AS(opt.optimize(Eigen::VectorXd(), Eigen::MatrixXd(), constraints),
                          InfeasibleError);
    }

    SECTION("Dimension mismatch") {
        REQUIRE_THROWS_AS(opt.optimize(returns_3_, cov_twin_, constraints), std::invalid_argument);
    }

    SECTION("Non-PSD covariance") {
        Eigen::MatrixXd bad = cov_3_;
        bad(0, 0) = -0.1;
        REQUIRE_THROWS_AS(opt.optimize(returns_3_, bad, constraints), std::invalid_argument);
    }

    SECTION("Contradictory constraints") {
        constraints.max_weight = 0.1;
        REQUIRE_THROWS_AS(opt.optimize(returns_3_, cov_3_, constraints), InfeasibleError);
    }
}

TEST_CASE("Allocation by id", "[Allocation]")
{
    Eigen::VectorXd w(3);
    w << 0.5, 0.3, 0.2;
    auto allocation = Allocation::from_weights({"a", "b", "c"}, w);

    REQUIRE(allocation.size() == 3);
    REQUIRE_THAT(allocation.weight_of("b"), WithinAbs(0.3, 1e-12));
    REQUIRE_THAT(allocation.total(), WithinAbs(1.0, 1e-12));
    REQUIRE(allocation.to_json()["c"].get<double>() == 0.2);
}
