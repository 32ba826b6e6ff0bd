/**
 * @file test_allocation_engine.cpp
 * @brief End-to-end tests for AllocationEngine
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "data/data_loader.hpp"
#include "report/allocation_engine.hpp"
#include <string>
#include <vector>

using namespace allocation;
using namespace allocation::report;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixture
// ============================================================================

class EngineTestFixture
{
protected:
    std::vector<Candidate> candidates_;
    EngineConfig config_;

    EngineTestFixture()
    {
        candidates_ = DataLoader::generate_synthetic_candidates(12, 3, 5);

        config_.frontier.num_points = 6;
        config_.simulation.trials = 400;
        config_.simulation.horizon = 6;
        config_.simulation.seed = 17;
        config_.simulation.threads = 2;
    }
};

// ============================================================================
// Pipeline
// ============================================================================

TEST_CASE_METHOD(EngineTestFixture, "Full pipeline produces every stage", "[Engine]")
{
    std::vector<std::string> steps;
    auto progress = [&steps](int step, int total, const std::string &what) {
        REQUIRE(total == AllocationEngine::NUM_STEPS);
        REQUIRE(step == static_cast<int>(steps.size()) + 1);
        steps.push_back(what);
    };

    auto report = AllocationEngine::run(candidates_, {}, config_, ScoringFunction(), progress);

    REQUIRE(steps.size() == 5);
    REQUIRE(report.ids.size() == candidates_.size());
    REQUIRE(report.optimization.success);
    REQUIRE_THAT(report.allocation.total(), WithinAbs(1.0, 1e-6));
    REQUIRE(report.effective_views == 0);
    REQUIRE(report.posterior_returns.isApprox(report.prior_returns));

    REQUIRE(report.frontier.has_value());
    REQUIRE(report.frontier->success);
    REQUIRE(report.simulation.has_value());
    REQUIRE(report.simulation->trials_completed == 400);
    REQUIRE(report.strategy_comparison.empty());

    auto j = report.to_json();
    for (const char *key : {"candidates", "correlation_model", "effective_views", "prior_returns",
                            "posterior_returns", "volatilities", "allocation", "frontier",
                            "simulation", "strategy_comparison", "warnings"}) {
        REQUIRE(j.contains(key));
    }
    REQUIRE(j["allocation"].contains("allocation"));
    REQUIRE(j["candidates"].size() == candidates_.size());
}

TEST_CASE_METHOD(EngineTestFixture, "Views shift the posterior", "[Engine][Views]")
{
    View view;
    view.targets = {candidates_[3].id};
    view.value = 2.0;
    view.confidence = 0.9;

    auto report = AllocationEngine::run(candidates_, {view}, config_);

    REQUIRE(report.effective_views == 1);
    REQUIRE(report.posterior_returns(3) > report.prior_returns(3));
}

TEST_CASE_METHOD(EngineTestFixture, "Disabled stages are omitted", "[Engine]")
{
    config_.compute_frontier = false;
    config_.run_simulation = false;

    auto report = AllocationEngine::run(candidates_, {}, config_);

    REQUIRE_FALSE(report.frontier.has_value());
    REQUIRE_FALSE(report.simulation.has_value());

    auto j = report.to_json();
    REQUIRE(j["frontier"].is_null());
    REQUIRE(j["simulation"].is_null());
}

TEST_CASE_METHOD(EngineTestFixture, "Strategies are compared when configured", "[Engine][Strategies]")
{
    simulation::EngagementStrategy eager;
    eager.name = "eager";
    eager.multipliers = {1.3, 1.0, 1.0};

    simulation::EngagementStrategy patient;
    patient.name = "patient";
    patient.lapse_multiplier = 0.5;

    config_.compute_frontier = false;
    config_.strategies = {eager, patient};

    auto report = AllocationEngine::run(candidates_, {}, config_);

    REQUIRE(report.strategy_comparison.size() == 2);
    REQUIRE(report.to_json()["strategy_comparison"].size() == 2);
}

TEST_CASE_METHOD(EngineTestFixture, "Runs with the same seed are identical", "[Engine][Determinism]")
{
    config_.compute_frontier = false;

    auto first = AllocationEngine::run(candidates_, {}, config_);
    auto second = AllocationEngine::run(candidates_, {}, config_);

    REQUIRE(first.optimization.weights.isApprox(second.optimization.weights));
    REQUIRE(first.simulation->mean == second.simulation->mean);
}

TEST_CASE_METHOD(EngineTestFixture, "Engine input validation", "[Engine][Validation]")
{
    SECTION("No candidates") {
        REQUIRE_THROWS_AS(AllocationEngine::run({}, {}, config_), InfeasibleError);
    }

    SECTION("View on an unknown candidate") {
        View view;
        view.targets = {"nobody"};
        view.value = 0.5;
        REQUIRE_THROWS_AS(AllocationEngine::run(candidates_, {view}, config_), std::invalid_argument);
    }

    SECTION("Contradictory constraints") {
        config_.optimizer.constraints.max_weight = 0.05;
        REQUIRE_THROWS_AS(AllocationEngine::run(candidates_, {}, config_), InfeasibleError);
    }
}
