/**
 * @file test_engine_config.cpp
 * @brief Unit tests for EngineConfig loading
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "config/engine_config.hpp"
#include <cstdio>
#include <fstream>

using namespace allocation;
using Catch::Matchers::WithinAbs;

TEST_CASE("Empty document gives defaults", "[Config]") {
    auto config = EngineConfig::from_json(nlohmann::json::object());

    REQUIRE(config.estimator.type == risk::CorrelationModelConfig().type);
    REQUIRE_THAT(config.views.tau, WithinAbs(0.05, 1e-12));
    REQUIRE(config.optimizer.objective == optimizer::ObjectiveType::RISK_AVERSION);
    REQUIRE_THAT(config.optimizer.risk_aversion, WithinAbs(1.0, 1e-12));
    REQUIRE(config.compute_frontier);
    REQUIRE(config.run_simulation);
    REQUIRE(config.strategies.empty());
}

TEST_CASE("Sections are read", "[Config]") {
    auto config = EngineConfig::from_json(nlohmann::json::parse(R"({
        "estimator": {"type": "constant", "constant_correlation": 0.2},
        "views": {"tau": 0.1, "use_posterior_covariance": true},
        "optimizer": {
            "objective": "max_sharpe",
            "risk_free_rate": 0.05,
            "constraints": {
                "max_weight": 0.3,
                "group_constraints": [{"name": "west", "members": ["a", "b"], "max_exposure": 0.5}]
            }
        },
        "frontier": {"enabled": false, "num_points": 8, "method": "target_return"},
        "simulation": {
            "trials": 500,
            "horizon": 6,
            "seed": 11,
            "decay_half_life": 3,
            "base_probabilities": {"engage": 0.7},
            "strategies": [
                {"name": "aggressive", "engage": 1.2, "lapse": 1.5},
                {"name": "gentle", "engage": 0.9, "lapse": 0.5}
            ]
        }
    })"));

    REQUIRE(config.estimator.type == "constant");
    REQUIRE_THAT(config.estimator.constant_correlation, WithinAbs(0.2, 1e-12));
    REQUIRE(config.views.use_posterior_covariance);
    REQUIRE(config.optimizer.objective == optimizer::ObjectiveType::MAX_SHARPE);
    REQUIRE_THAT(config.optimizer.constraints.max_weight, WithinAbs(0.3, 1e-12));
    REQUIRE(config.optimizer.constraints.group_constraints.size() == 1);
    REQUIRE_FALSE(config.compute_frontier);
    REQUIRE(config.frontier.num_points == 8);
    REQUIRE(config.frontier.method == optimizer::FrontierMethod::TARGET_RETURN);

    REQUIRE(config.run_simulation);
    REQUIRE(config.simulation.trials == 500);
    REQUIRE(config.simulation.seed.has_value());
    REQUIRE(*config.simulation.seed == 11);
    REQUIRE_THAT(config.simulation.transitions.base.engage, WithinAbs(0.7, 1e-12));
    REQUIRE(config.strategies.size() == 2);
    REQUIRE(config.strategies[0].name == "aggressive");
    REQUIRE_THAT(config.strategies[1].lapse_multiplier, WithinAbs(0.5, 1e-12));
}

TEST_CASE("Constraint keys may sit directly in the optimizer section", "[Config]") {
    auto config = OptimizerConfig::from_json({{"max_weight", 0.25}, {"fully_invested", false}});

    REQUIRE_THAT(config.constraints.max_weight, WithinAbs(0.25, 1e-12));
    REQUIRE_FALSE(config.constraints.fully_invested);
}

TEST_CASE("Invalid configuration values are rejected", "[Config][Validation]") {
    SECTION("Negative risk aversion") {
        REQUIRE_THROWS_AS(EngineConfig::from_json({{"optimizer", {{"risk_aversion", -1.0}}}}),
                          std::invalid_argument);
    }

    SECTION("Non-positive tau") {
        REQUIRE_THROWS_AS(EngineConfig::from_json({{"views", {{"tau", 0.0}}}}), std::invalid_argument);
    }

    SECTION("Unknown objective") {
        REQUIRE_THROWS_AS(EngineConfig::from_json({{"optimizer", {{"objective", "greedy"}}}}),
                          std::invalid_argument);
    }

    SECTION("Non-positive trials") {
        REQUIRE_THROWS_AS(EngineConfig::from_json({{"simulation", {{"trials", 0}}}}),
                          std::invalid_argument);
    }

    SECTION("Negative decay rate") {
        REQUIRE_THROWS_AS(EngineConfig::from_json({{"simulation", {{"decay_rate", -0.1}}}}),
                          std::invalid_argument);
    }
}

TEST_CASE("Configuration survives a JSON round trip", "[Config]") {
    EngineConfig original;
    original.optimizer.risk_aversion = 3.0;
    original.optimizer.constraints.max_weight = 0.4;
    original.compute_frontier = false;
    original.simulation.trials = 1234;
    original.simulation.seed = 99;

    simulation::EngagementStrategy strategy;
    strategy.name = "steady";
    original.strategies.push_back(strategy);

    auto restored = EngineConfig::from_json(original.to_json());

    REQUIRE_THAT(restored.optimizer.risk_aversion, WithinAbs(3.0, 1e-12));
    REQUIRE_THAT(restored.optimizer.constraints.max_weight, WithinAbs(0.4, 1e-12));
    REQUIRE_FALSE(restored.compute_frontier);
    REQUIRE(restored.simulation.trials == 1234);
    REQUIRE(*restored.simulation.seed == 99);
    REQUIRE(restored.strategies.size() == 1);
    REQUIRE(restored.strategies[0].name == "steady");
}

TEST_CASE("Configuration file loading", "[Config]") {
    const std::string path = "test_engine_config.json";
    {
        std::ofstream file(path);
        file << R"({"optimizer": {"risk_aversion": 4.0}})";
    }

    auto config = EngineConfig::load_from_file(path);
    std::remove(path.c_str());

    REQUIRE_THAT(config.optimizer.risk_aversion, WithinAbs(4.0, 1e-12));
    REQUIRE_THROWS_AS(EngineConfig::load_from_file("missing_config.json"), std::runtime_error);
}
