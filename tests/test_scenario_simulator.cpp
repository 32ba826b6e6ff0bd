/**
 * @file test_scenario_simulator.cpp
 * @brief Unit tests for ScenarioSimulator and SimulationResult
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "simulation/scenario_simulator.hpp"
#include <cmath>
#include <cstdint>
#include <utility>
#include <vector>

using namespace allocation;
using namespace allocation::simulation;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixture
// ============================================================================

class SimulatorTestFixture
{
protected:
    std::vector<Candidate> candidates_;
    optimizer::Allocation allocation_;

    SimulatorTestFixture()
    {
        candidates_ = {
            {"a", 0.8, 0.3, {}},
            {"b", 0.5, 0.2, {}},
            {"c", 0.2, 0.1, {}}};

        allocation_.ids = {"a", "b", "c"};
        allocation_.weights = {0.5, 0.3, 0.2};
    }

    static SimulationConfig seeded_config(size_t trials, std::uint64_t seed = 42)
    {
        SimulationConfig config;
        config.trials = trials;
        config.seed = seed;
        return config;
    }

    // Every stage advances with certainty and nothing lapses
    static SimulationConfig certain_config()
    {
        SimulationConfig config = seeded_config(10000);
        config.horizon = 10;
        config.transitions.base = {1.0, 1.0, 1.0};
        config.transitions.base_lapse = 0.0;
        return config;
    }
};

// ============================================================================
// Determinism
// ============================================================================

TEST_CASE_METHOD(SimulatorTestFixture, "Fixed seed reproduces the result", "[Simulation][Determinism]")
{
    ScenarioSimulator simulator(seeded_config(2000));

    auto first = simulator.simulate(allocation_, candidates_);
    auto second = simulator.simulate(allocation_, candidates_);

    REQUIRE(first.seed == 42);
    REQUIRE(first.mean == second.mean);
    REQUIRE(first.std_dev == second.std_dev);
    REQUIRE(first.percentiles == second.percentiles);
    REQUIRE(first.terminal_state_distribution == second.terminal_state_distribution);
}

TEST_CASE_METHOD(SimulatorTestFixture, "Result does not depend on thread count", "[Simulation][Determinism]")
{
    SimulationConfig single = seeded_config(3000, 7);
    single.threads = 1;
    SimulationConfig many = seeded_config(3000, 7);
    many.threads = 4;

    auto a = ScenarioSimulator(single).simulate(allocation_, candidates_);
    auto b = ScenarioSimulator(many).simulate(allocation_, candidates_);

    REQUIRE(a.mean == b.mean);
    REQUIRE(a.variance == b.variance);
    REQUIRE(a.percentiles == b.percentiles);
    REQUIRE(a.trials_completed == 3000);
    REQUIRE(b.trials_completed == 3000);
}

TEST_CASE_METHOD(SimulatorTestFixture, "Adjacent seeds give different samples", "[Simulation][Determinism]")
{
    // Seeds that differ only in their low bits must not share trial streams
    const std::vector<std::pair<std::uint64_t, std::uint64_t>> pairs = {{0, 1}, {1, 2}, {42, 43}};

    for (const auto &seeds : pairs)
    {
        auto a = ScenarioSimulator(seeded_config(2000, seeds.first)).simulate(allocation_, candidates_);
        auto b = ScenarioSimulator(seeded_config(2000, seeds.second)).simulate(allocation_, candidates_);

        INFO("seeds " << seeds.first << " and " << seeds.second);
        REQUIRE(a.mean != b.mean);
        REQUIRE(a.std_dev != b.std_dev);
    }
}

// ============================================================================
// Statistics
// ============================================================================

TEST_CASE_METHOD(SimulatorTestFixture, "Certain conversion yields the allocated total", "[Simulation][Statistics]")
{
    ScenarioSimulator simulator(certain_config());
    auto result = simulator.simulate(allocation_, candidates_);

    REQUIRE_THAT(result.mean, WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(result.std_dev, WithinAbs(0.0, 1e-12));
    REQUIRE_FALSE(result.sharpe_ratio.has_value());
    REQUIRE_THAT(result.terminal_fraction(OutcomeState::CONVERTED), WithinAbs(1.0, 1e-12));
    REQUIRE(result.mean_conversion_step.has_value());
    REQUIRE_THAT(*result.mean_conversion_step, WithinAbs(3.0, 1e-12));
    REQUIRE(result.warnings.empty());
}

TEST_CASE_METHOD(SimulatorTestFixture, "Decay discounts late conversions", "[Simulation][Statistics]")
{
    SimulationConfig config = certain_config();
    config.decay_half_life = 3.0;

    auto result = ScenarioSimulator(config).simulate(allocation_, candidates_);

    // Every candidate converts at step 3: one half-life
    REQUIRE_THAT(result.mean, WithinAbs(0.5, 1e-12));
}

TEST_CASE_METHOD(SimulatorTestFixture, "Short horizon leaves candidates in progress", "[Simulation][Statistics]")
{
    SimulationConfig config = certain_config();
    config.horizon = 2;

    auto result = ScenarioSimulator(config).simulate(allocation_, candidates_);

    REQUIRE_THAT(result.mean, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(result.terminal_fraction(OutcomeState::RESPONDED), WithinAbs(1.0, 1e-12));
    REQUIRE_FALSE(result.mean_conversion_step.has_value());
}

TEST_CASE_METHOD(SimulatorTestFixture, "Standard error narrows with more trials", "[Simulation][Statistics]")
{
    auto small = ScenarioSimulator(seeded_config(400, 11)).simulate(allocation_, candidates_);
    auto large = ScenarioSimulator(seeded_config(6400, 11)).simulate(allocation_, candidates_);

    REQUIRE(small.std_dev > 0.0);
    REQUIRE(large.standard_error < small.standard_error);

    // sqrt(6400 / 400) = 4
    const double ratio = small.standard_error / large.standard_error;
    REQUIRE(ratio > 3.0);
    REQUIRE(ratio < 5.5);
}

TEST_CASE_METHOD(SimulatorTestFixture, "Terminal distribution sums to one", "[Simulation][Statistics]")
{
    auto result = ScenarioSimulator(seeded_config(1000)).simulate(allocation_, candidates_);

    double total = 0.0;
    for (double f : result.terminal_state_distribution)
    {
        total += f;
    }
    REQUIRE_THAT(total, WithinAbs(1.0, 1e-12));
    REQUIRE(result.percentiles.at(5.0) <= result.percentiles.at(50.0));
    REQUIRE(result.percentiles.at(50.0) <= result.percentiles.at(95.0));
}

TEST_CASE("Percentile interpolation", "[Simulation][Statistics]")
{
    std::vector<double> sorted = {0.0, 1.0, 2.0, 3.0, 4.0};

    REQUIRE_THAT(SimulationResult::interpolate_percentile(sorted, 0.0), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(SimulationResult::interpolate_percentile(sorted, 50.0), WithinAbs(2.0, 1e-12));
    REQUIRE_THAT(SimulationResult::interpolate_percentile(sorted, 90.0), WithinAbs(3.6, 1e-12));
    REQUIRE_THROWS_AS(SimulationResult::interpolate_percentile({}, 50.0), std::invalid_argument);
}

// ============================================================================
// Strategies and Validation
// ============================================================================

TEST_CASE_METHOD(SimulatorTestFixture, "Strategies are ranked by mean", "[Simulation][Strategies]")
{
    EngagementStrategy passive;
    passive.name = "passive";
    passive.multipliers = {0.5, 0.5, 0.5};

    EngagementStrategy aggressive;
    aggressive.name = "aggressive";
    aggressive.multipliers = {2.0, 1.5, 1.5};
    aggressive.lapse_multiplier = 0.5;

    ScenarioSimulator simulator(seeded_config(3000));
    auto outcomes = simulator.compare_strategies(allocation_, candidates_, {passive, aggressive});

    REQUIRE(outcomes.size() == 2);
    REQUIRE(outcomes[0].strategy.name == "aggressive");
    REQUIRE(outcomes[0].result.mean > outcomes[1].result.mean);

    REQUIRE_THROWS_AS(simulator.compare_strategies(allocation_, candidates_, {}), std::invalid_argument);
}

TEST_CASE_METHOD(SimulatorTestFixture, "Simulator input validation", "[Simulation][Validation]")
{
    SECTION("Unknown allocated candidate") {
        allocation_.ids[2] = "zz";
        ScenarioSimulator simulator(seeded_config(10));
        REQUIRE_THROWS_AS(simulator.simulate(allocation_, candidates_), std::invalid_argument);
    }

    SECTION("Zero trials") {
        SimulationConfig config;
        config.trials = 0;
        REQUIRE_THROWS_AS(ScenarioSimulator(config), std::invalid_argument);
    }

    SECTION("Percentile outside [0, 100]") {
        SimulationConfig config;
        config.percentiles = {150.0};
        REQUIRE_THROWS_AS(ScenarioSimulator(config), std::invalid_argument);
    }
}

TEST_CASE("SimulationConfig from JSON", "[Simulation][Config]")
{
    auto config = SimulationConfig::from_json({
        {"trials", 500},
        {"horizon", 6},
        {"seed", 9},
        {"decay_rate", std::log(2.0) / 4.0},
        {"base_probabilities", {{"engage", 0.6}}},
        {"payoffs", {{"converted", 2.0}, {"responded", 0.5}}}});

    REQUIRE(config.trials == 500);
    REQUIRE(config.horizon == 6);
    REQUIRE(config.seed.has_value());
    REQUIRE(*config.seed == 9);
    REQUIRE_THAT(config.decay_half_life, WithinAbs(4.0, 1e-12));
    REQUIRE_THAT(config.transitions.base.engage, WithinAbs(0.6, 1e-12));
    REQUIRE_THAT(config.transitions.base.respond, WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(config.payoffs.payoff(OutcomeState::CONVERTED), WithinAbs(2.0, 1e-12));
    REQUIRE_THAT(config.payoffs.payoff(OutcomeState::RESPONDED), WithinAbs(0.5, 1e-12));

    REQUIRE_THROWS_AS(SimulationConfig::from_json({{"trials", -1}}), std::invalid_argument);
}
