/**
 * @file scenario_simulator.cpp
 * @brief Implementation of ScenarioSimulator
 */

#include "simulation/scenario_simulator.hpp"
#include "simulation/random_stream.hpp"
#include "simulation/trial_pool.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace allocation
{
    namespace simulation
    {

        // ============================================================================
        // OutcomePayoffs
        // ============================================================================

        OutcomePayoffs OutcomePayoffs::from_json(const nlohmann::json &j)
        {
            OutcomePayoffs payoffs;
            for (auto it = j.begin(); it != j.end(); ++it)
            {
                const double value = it.value().get<double>();
                if (!std::isfinite(value))
                {
                    throw std::invalid_argument("Payoff for '" + it.key() + "' must be finite");
                }
                payoffs.set(parse_outcome_state(it.key()), value);
            }
            return payoffs;
        }

        nlohmann::json OutcomePayoffs::to_json() const
        {
            nlohmann::json j = nlohmann::json::object();
            for (OutcomeState state : ALL_OUTCOME_STATES)
            {
                j[to_string(state)] = payoff(state);
            }
            return j;
        }

        // ============================================================================
        // SimulationConfig
        // ============================================================================

        void SimulationConfig::validate() const
        {
            if (trials == 0)
            {
                throw std::invalid_argument("Simulation trials must be positive");
            }
            if (horizon <= 0)
            {
                throw std::invalid_argument(
                    "Simulation horizon must be positive, got: " + std::to_string(horizon));
            }
            if (threads < 0)
            {
                throw std::invalid_argument(
                    "Simulation threads must be non-negative, got: " + std::to_string(threads));
            }
            if (time_budget_ms < 0)
            {
                throw std::invalid_argument("Simulation time budget must be non-negative");
            }
            if (!(decay_half_life >= 0.0) || !std::isfinite(decay_half_life))
            {
                throw std::invalid_argument(
                    "Decay half-life must be non-negative and finite, got: " + std::to_string(decay_half_life));
            }
            for (double level : percentiles)
            {
                if (!(level >= 0.0 && level <= 100.0))
                {
                    throw std::invalid_argument(
                        "Percentile must be in [0, 100], got: " + std::to_string(level));
                }
            }
            transitions.validate();
        }

        SimulationConfig SimulationConfig::from_json(const nlohmann::json &j)
        {
            SimulationConfig config;

            if (j.contains("trials"))
            {
                const long long trials = j.at("trials").get<long long>();
                if (trials <= 0)
                {
                    throw std::invalid_argument("Simulation trials must be positive");
                }
                config.trials = static_cast<size_t>(trials);
            }
            config.horizon = j.value("horizon", config.horizon);
            if (j.contains("seed") && !j.at("seed").is_null())
            {
                config.seed = j.at("seed").get<std::uint64_t>();
            }
            config.threads = j.value("threads", config.threads);
            config.time_budget_ms = j.value("time_budget_ms", config.time_budget_ms);

            if (j.contains("decay_half_life"))
            {
                config.decay_half_life = j.at("decay_half_life").get<double>();
            }
            else if (j.contains("decay_rate"))
            {
                const double rate = j.at("decay_rate").get<double>();
                if (!(rate >= 0.0))
                {
                    throw std::invalid_argument("Decay rate must be non-negative, got: " + std::to_string(rate));
                }
                config.decay_half_life = rate > 0.0 ? std::log(2.0) / rate : 0.0;
            }

            if (j.contains("percentiles"))
            {
                config.percentiles = j.at("percentiles").get<std::vector<double>>();
            }

            config.transitions = TransitionConfig::from_json(j);

            if (j.contains("payoffs"))
            {
                config.payoffs = OutcomePayoffs::from_json(j.at("payoffs"));
            }
            config.scale_payoff_by_alpha = j.value("scale_payoff_by_alpha", config.scale_payoff_by_alpha);

            config.validate();
            return config;
        }

        nlohmann::json SimulationConfig::to_json() const
        {
            nlohmann::json j = transitions.to_json();
            j["trials"] = trials;
            j["horizon"] = horizon;
            j["seed"] = seed ? nlohmann::json(*seed) : nlohmann::json(nullptr);
            j["threads"] = threads;
            j["time_budget_ms"] = time_budget_ms;
            j["decay_half_life"] = decay_half_life;
            j["percentiles"] = percentiles;
            j["payoffs"] = payoffs.to_json();
            j["scale_payoff_by_alpha"] = scale_payoff_by_alpha;
            return j;
        }

        // ============================================================================
        // EngagementStrategy
        // ============================================================================

        EngagementStrategy EngagementStrategy::from_json(const nlohmann::json &j)
        {
            EngagementStrategy strategy;
            strategy.name = j.at("name").get<std::string>();
            strategy.multipliers = StageProbabilities::from_json(j, strategy.multipliers);
            strategy.lapse_multiplier = j.value("lapse", strategy.lapse_multiplier);
            return strategy;
        }

        nlohmann::json EngagementStrategy::to_json() const
        {
            nlohmann::json j = multipliers.to_json();
            j["name"] = name;
            j["lapse"] = lapse_multiplier;
            return j;
        }

        nlohmann::json StrategyOutcome::to_json() const
        {
            return nlohmann::json{
                {"strategy", strategy.to_json()},
                {"result", result.to_json()}};
        }

        // ============================================================================
        // ScenarioSimulator
        // ============================================================================

        ScenarioSimulator::ScenarioSimulator(const SimulationConfig &config)
            : config_(config)
        {
            config_.validate();
        }

        std::vector<ScenarioSimulator::Participant> ScenarioSimulator::match_participants(
            const optimizer::Allocation &allocation,
            const std::vector<Candidate> &candidates)
        {
            std::unordered_map<std::string, const Candidate *> by_id;
            for (const auto &c : candidates)
            {
                by_id[c.id] = &c;
            }

            std::vector<Participant> participants;
            participants.reserve(allocation.size());

            for (size_t i = 0; i < allocation.size(); ++i)
            {
                auto it = by_id.find(allocation.ids[i]);
                if (it == by_id.end())
                {
                    throw std::invalid_argument(
                        "Allocated candidate '" + allocation.ids[i] + "' has no candidate record");
                }
                const double weight = allocation.weights[i];
                if (!(weight >= 0.0) || !std::isfinite(weight))
                {
                    throw std::invalid_argument(
                        "Allocation weight for '" + allocation.ids[i] + "' must be non-negative");
                }
                participants.push_back({weight, it->second->alpha, it->second->risk});
            }

            return participants;
        }

        double ScenarioSimulator::decay_factor(int steps) const
        {
            if (config_.decay_half_life <= 0.0)
            {
                return 1.0;
            }
            return std::pow(0.5, static_cast<double>(steps) / config_.decay_half_life);
        }

        ScenarioSimulator::TrialOutcome ScenarioSimulator::run_trial(
            const std::vector<Participant> &participants,
            const TransitionModel &model,
            std::uint64_t seed,
            std::uint64_t trial_index) const
        {
            TrialRandomStream stream(seed, trial_index);
            TrialOutcome outcome;

            for (const auto &p : participants)
            {
                OutcomeState state = OutcomeState::PROSPECT;
                int terminal_step = config_.horizon;

                for (int step = 0; step < config_.horizon; ++step)
                {
                    const double p_adv = model.advance_probability(state, p.alpha, p.risk);
                    const double p_lapse = (1.0 - p_adv) * model.lapse_hazard(step);
                    const double u = stream.uniform();

                    if (u < p_adv)
                    {
                        state = next_state(state);
                    }
                    else if (u < p_adv + p_lapse)
                    {
                        state = OutcomeState::LAPSED;
                    }

                    if (is_terminal(state))
                    {
                        terminal_step = step + 1;
                        break;
                    }
                }

                double payoff = config_.payoffs.payoff(state);
                if (config_.scale_payoff_by_alpha)
                {
                    payoff *= p.alpha;
                }

                outcome.value += p.weight * payoff * decay_factor(terminal_step);
                outcome.terminal_counts[state_index(state)] += 1;

                if (state == OutcomeState::CONVERTED)
                {
                    ++outcome.conversions;
                    outcome.conversion_step_sum += terminal_step;
                }
            }

            return outcome;
        }

        SimulationResult ScenarioSimulator::run(const std::vector<Participant> &participants,
                                                const TransitionModel &model,
                                                std::uint64_t seed) const
        {
            std::vector<TrialOutcome> slots(config_.trials);

            TrialPool pool(config_.threads);
            TrialPoolReport report = pool.run(
                config_.trials,
                [&](size_t i)
                { slots[i] = run_trial(participants, model, seed, static_cast<std::uint64_t>(i)); },
                std::chrono::milliseconds(config_.time_budget_ms));

            if (report.completed_count == 0)
            {
                throw std::runtime_error("Simulation time budget expired before any trial completed");
            }

            // Reduce in trial-index order so the result is independent of scheduling
            std::vector<double> values;
            values.reserve(report.completed_count);
            std::array<long long, NUM_OUTCOME_STATES> state_totals{};
            long long conversions = 0;
            long long conversion_steps = 0;

            for (size_t i = 0; i < slots.size(); ++i)
            {
                if (!report.completed[i])
                {
                    continue;
                }
                values.push_back(slots[i].value);
                for (int s = 0; s < NUM_OUTCOME_STATES; ++s)
                {
                    state_totals[s] += slots[i].terminal_counts[s];
                }
                conversions += slots[i].conversions;
                conversion_steps += slots[i].conversion_step_sum;
            }

            SimulationResult result = SimulationResult::from_values(values, config_.percentiles);
            result.trials_requested = config_.trials;
            result.horizon = config_.horizon;
            result.seed = seed;

            const double candidate_trials = static_cast<double>(values.size() * participants.size());
            if (candidate_trials > 0.0)
            {
                for (int s = 0; s < NUM_OUTCOME_STATES; ++s)
                {
                    result.terminal_state_distribution[s] = state_totals[s] / candidate_trials;
                }
            }
            if (conversions > 0)
            {
                result.mean_conversion_step = static_cast<double>(conversion_steps) / conversions;
            }

            if (report.budget_expired || report.completed_count < config_.trials)
            {
                result.warnings.push_back(
                    {WarningCode::PARTIAL_SIMULATION,
                     "Time budget of " + std::to_string(config_.time_budget_ms) + " ms expired after " +
                         std::to_string(report.completed_count) + " of " +
                         std::to_string(config_.trials) + " trials"});
            }

            return result;
        }

        SimulationResult ScenarioSimulator::simulate(const optimizer::Allocation &allocation,
                                                     const std::vector<Candidate> &candidates) const
        {
            return simulate(allocation, candidates, TransitionModel(config_.transitions));
        }

        SimulationResult ScenarioSimulator::simulate(const optimizer::Allocation &allocation,
                                                     const std::vector<Candidate> &candidates,
                                                     const TransitionModel &model) const
        {
            const std::vector<Participant> participants = match_participants(allocation, candidates);
            const std::uint64_t seed = config_.seed ? *config_.seed : entropy_seed();
            return run(participants, model, seed);
        }

        std::vector<StrategyOutcome> ScenarioSimulator::compare_strategies(
            const optimizer::Allocation &allocation,
            const std::vector<Candidate> &candidates,
            const std::vector<EngagementStrategy> &strategies) const
        {
            if (strategies.empty())
            {
                throw std::invalid_argument("No strategies to compare");
            }

            const std::vector<Participant> participants = match_participants(allocation, candidates);
            const TransitionModel base_model(config_.transitions);

            // Common random numbers: every strategy sees the same per-trial streams
            const std::uint64_t seed = config_.seed ? *config_.seed : entropy_seed();

            std::vector<StrategyOutcome> outcomes;
            outcomes.reserve(strategies.size());

            for (const auto &strategy : strategies)
            {
                TransitionModel model = base_model.with_multipliers(strategy.multipliers,
                                                                    strategy.lapse_multiplier);
                outcomes.push_back({strategy, run(participants, model, seed)});
            }

            std::stable_sort(outcomes.begin(), outcomes.end(),
                             [](const StrategyOutcome &a, const StrategyOutcome &b)
                             { return a.result.mean > b.result.mean; });

            return outcomes;
        }

    } // namespace simulation
} // namespace allocation
