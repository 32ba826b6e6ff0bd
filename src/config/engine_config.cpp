/**
 * @file engine_config.cpp
 * @brief Implementation of configuration structures
 */

#include "config/engine_config.hpp"
#include "data/data_loader.hpp"
#include <stdexcept>

namespace allocation
{

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    OptimizerConfig OptimizerConfig::from_json(const nlohmann::json &j)
    {
        OptimizerConfig config;

        if (j.contains("objective"))
        {
            config.objective = optimizer::parse_objective_type(j.at("objective").get<std::string>());
        }
        config.risk_aversion = j.value("risk_aversion", config.risk_aversion);
        config.target_return = j.value("target_return", config.target_return);
        config.risk_free_rate = j.value("risk_free_rate", config.risk_free_rate);
        config.condition_threshold = j.value("condition_threshold", config.condition_threshold);
        config.weight_cutoff = j.value("weight_cutoff", config.weight_cutoff);
        config.max_iterations = j.value("max_iterations", config.max_iterations);
        config.tolerance = j.value("tolerance", config.tolerance);

        if (j.contains("constraints"))
        {
            config.constraints = optimizer::OptimizationConstraints::from_json(j.at("constraints"));
        }
        else
        {
            config.constraints = optimizer::OptimizationConstraints::from_json(j);
        }

        if (config.risk_aversion < 0.0)
        {
            throw std::invalid_argument(
                "risk_aversion must be non-negative, got: " + std::to_string(config.risk_aversion));
        }
        if (config.max_iterations <= 0 || !(config.tolerance > 0.0))
        {
            throw std::invalid_argument("Solver max_iterations and tolerance must be positive");
        }

        return config;
    }

    nlohmann::json OptimizerConfig::to_json() const
    {
        return nlohmann::json{
            {"objective", optimizer::to_string(objective)},
            {"risk_aversion", risk_aversion},
            {"target_return", target_return},
            {"risk_free_rate", risk_free_rate},
            {"condition_threshold", condition_threshold},
            {"weight_cutoff", weight_cutoff},
            {"max_iterations", max_iterations},
            {"tolerance", tolerance},
            {"constraints", constraints.to_json()}};
    }

    optimizer::SolverOptions OptimizerConfig::solver_options() const
    {
        optimizer::SolverOptions options;
        options.max_iterations = max_iterations;
        options.tolerance = tolerance;
        return options;
    }

    EngineConfig EngineConfig::from_json(const nlohmann::json &j)
    {
        EngineConfig config;

        if (j.contains("estimator"))
        {
            config.estimator = risk::CorrelationModelConfig::from_json(j.at("estimator"));
        }

        if (j.contains("views"))
        {
            config.views = views::BlenderConfig::from_json(j.at("views"));
        }

        if (j.contains("optimizer"))
        {
            config.optimizer = OptimizerConfig::from_json(j.at("optimizer"));
        }

        if (j.contains("frontier"))
        {
            const auto &section = j.at("frontier");
            config.frontier = optimizer::FrontierConfig::from_json(section);
            config.compute_frontier = section.value("enabled", config.compute_frontier);
        }

        if (j.contains("simulation"))
        {
            const auto &section = j.at("simulation");
            config.simulation = simulation::SimulationConfig::from_json(section);
            config.run_simulation = section.value("enabled", config.run_simulation);

            if (section.contains("strategies"))
            {
                for (const auto &s : section.at("strategies"))
                {
                    config.strategies.push_back(simulation::EngagementStrategy::from_json(s));
                }
            }
        }

        return config;
    }

    EngineConfig EngineConfig::load_from_file(const std::string &config_path)
    {
        return from_json(DataLoader::load_json(config_path));
    }

    nlohmann::json EngineConfig::to_json() const
    {
        nlohmann::json frontier_json = frontier.to_json();
        frontier_json["enabled"] = compute_frontier;

        nlohmann::json simulation_json = simulation.to_json();
        simulation_json["enabled"] = run_simulation;
        simulation_json["strategies"] = nlohmann::json::array();
        for (const auto &s : strategies)
        {
            simulation_json["strategies"].push_back(s.to_json());
        }

        return nlohmann::json{
            {"estimator", estimator.to_json()},
            {"views", views.to_json()},
            {"optimizer", optimizer.to_json()},
            {"frontier", frontier_json},
            {"simulation", simulation_json}};
    }

} // namespace allocation
