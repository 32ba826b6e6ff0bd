/**
 * @file allocation_engine.cpp
 * @brief Implementation of AllocationEngine
 */

#include "report/allocation_engine.hpp"
#include "optimizer/efficient_frontier.hpp"
#include "optimizer/mean_variance_optimizer.hpp"
#include "risk/correlation_model_factory.hpp"
#include "risk/risk_return_estimator.hpp"
#include "simulation/scenario_simulator.hpp"
#include "views/view_blender.hpp"
#include <memory>

namespace allocation
{
    namespace report
    {

        namespace
        {
            void report_step(const ProgressCallback &progress, int step, const std::string &what)
            {
                if (progress)
                {
                    progress(step, AllocationEngine::NUM_STEPS, what);
                }
            }
        } // namespace

        AllocationReport AllocationEngine::run(const std::vector<Candidate> &candidates,
                                               const std::vector<View> &user_views,
                                               const EngineConfig &config,
                                               const ScoringFunction &scorer,
                                               const ProgressCallback &progress)
        {
            AllocationReport report;

            // ==========================
            // 1. Risk/return estimation
            // ==========================
            report_step(progress, 1, "Estimating returns and covariance");

            std::shared_ptr<const risk::CorrelationModel> model =
                risk::CorrelationModelFactory::create(config.estimator);
            risk::RiskReturnEstimator estimator(model, scorer);
            risk::RiskReturnEstimate estimate = estimator.estimate(candidates);

            report.ids = estimate.ids;
            report.correlation_model = model->get_name();
            append_warnings(report.warnings, estimate.warnings);

            // ==========================
            // 2. View blending
            // ==========================
            report_step(progress, 2, "Blending " + std::to_string(user_views.size()) + " views");

            const int n = static_cast<int>(estimate.ids.size());
            Eigen::VectorXd prior = estimate.expected_returns;
            if (config.views.use_implied_prior)
            {
                // Equal-weight reference allocation of the full budget
                const Eigen::VectorXd market_weights =
                    Eigen::VectorXd::Constant(n, config.optimizer.constraints.budget / n);
                prior = views::ViewBlender::implied_prior_returns(
                    market_weights, estimate.covariance, config.views.market_risk_aversion);
            }

            views::ViewBlender blender(config.views);
            views::BlendResult blend = blender.blend(estimate.ids, prior, estimate.covariance, user_views);

            report.prior_returns = prior;
            report.posterior_returns = blend.posterior_returns;
            report.effective_views = blend.effective_views;
            append_warnings(report.warnings, blend.warnings);

            const Eigen::MatrixXd &covariance = config.views.use_posterior_covariance
                                                    ? blend.posterior_covariance
                                                    : estimate.covariance;
            report.volatilities = covariance.diagonal().cwiseMax(0.0).cwiseSqrt();

            // ==========================
            // 3. Allocation
            // ==========================
            report_step(progress, 3, "Optimizing allocation (" +
                                         optimizer::to_string(config.optimizer.objective) + ")");

            const optimizer::OptimizationConstraints constraints =
                config.optimizer.constraints.resolve_groups(estimate.ids);

            optimizer::MeanVarianceOptimizer mv(config.optimizer.objective, config.optimizer.risk_free_rate);
            mv.set_risk_aversion(config.optimizer.risk_aversion);
            mv.set_target_return(config.optimizer.target_return);
            mv.set_condition_threshold(config.optimizer.condition_threshold);
            mv.set_weight_cutoff(config.optimizer.weight_cutoff);
            mv.set_solver_options(config.optimizer.solver_options());

            report.optimization = mv.optimize(report.posterior_returns, covariance, constraints);
            report.allocation = optimizer::Allocation::from_weights(estimate.ids, report.optimization.weights);
            append_warnings(report.warnings, report.optimization.warnings);

            // ==========================
            // 4. Efficient frontier
            // ==========================
            if (config.compute_frontier)
            {
                report_step(progress, 4, "Tracing efficient frontier");

                optimizer::EfficientFrontier frontier(config.frontier);
                frontier.set_condition_threshold(config.optimizer.condition_threshold);
                frontier.set_weight_cutoff(config.optimizer.weight_cutoff);
                frontier.set_solver_options(config.optimizer.solver_options());

                report.frontier = frontier.compute(estimate.ids, report.posterior_returns, covariance,
                                                   constraints, config.optimizer.risk_free_rate);
                for (const auto &w : report.frontier->warnings)
                {
                    if (!has_warning(report.warnings, w.code))
                    {
                        report.warnings.push_back(w);
                    }
                }
            }
            else
            {
                report_step(progress, 4, "Efficient frontier disabled");
            }

            // ==========================
            // 5. Scenario simulation
            // ==========================
            if (config.run_simulation && report.optimization.success)
            {
                report_step(progress, 5, "Simulating " + std::to_string(config.simulation.trials) + " trials");

                // Simulated candidates carry the blended return as their score
                std::vector<Candidate> simulated = candidates;
                for (size_t i = 0; i < simulated.size(); ++i)
                {
                    simulated[i].alpha = report.posterior_returns(static_cast<Eigen::Index>(i));
                }

                simulation::ScenarioSimulator simulator(config.simulation);
                report.simulation = simulator.simulate(report.allocation, simulated);
                append_warnings(report.warnings, report.simulation->warnings);

                if (!config.strategies.empty())
                {
                    report.strategy_comparison =
                        simulator.compare_strategies(report.allocation, simulated, config.strategies);
                }
            }
            else
            {
                report_step(progress, 5, report.optimization.success ? "Simulation disabled"
                                                                     : "Simulation skipped: optimization failed");
            }

            return report;
        }

    } // namespace report
} // namespace allocation
