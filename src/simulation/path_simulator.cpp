/**
 * @file path_simulator.cpp
 * @brief Implementation of the return-path Monte Carlo simulator.
 */

#include "simulation/path_simulator.hpp"
#include "simulation/batch_runner.hpp"
#include "analytics/trade_metrics.hpp"
#include "core/errors.hpp"
#include "report/report_formatter.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <random>

namespace tradelab
{
    namespace simulation
    {

        ReturnModel parse_return_model(const std::string &name)
        {
            std::string s = name;
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                           { return std::tolower(c); });
            if (s == "bootstrap" || s == "empirical")
                return ReturnModel::BOOTSTRAP;
            if (s == "normal" || s == "parametric" || s == "parametric_normal")
                return ReturnModel::PARAMETRIC_NORMAL;
            throw InvalidConfiguration("Unknown return model: " + name);
        }

        // ===================================================================
        // Constructors
        // ===================================================================

        PathSimulator::PathSimulator(data::ReturnSeries returns, ReturnModel model)
            : returns_(std::move(returns)), model_(model), mean_(0.0), std_dev_(0.0)
        {
            if (returns_.empty())
            {
                throw InvalidConfiguration("Return series cannot be empty");
            }
            analytics::require_finite(returns_, "return series");

            mean_ = analytics::mean(returns_);
            std_dev_ = analytics::sample_std_dev(returns_);
        }

        PathSimulator::PathSimulator(double mean_return, double std_dev)
            : returns_(), model_(ReturnModel::PARAMETRIC_NORMAL), mean_(mean_return), std_dev_(std_dev)
        {
        }

        PathSimulator PathSimulator::from_moments(double mean_return, double std_dev)
        {
            if (!std::isfinite(mean_return) || !std::isfinite(std_dev))
            {
                throw InvalidConfiguration("Return moments must be finite");
            }
            if (std_dev < 0.0)
            {
                throw InvalidConfiguration(
                    "Expected non-negative value for parameter 'std_dev', got: " + std::to_string(std_dev));
            }
            return PathSimulator(mean_return, std_dev);
        }

        // ===================================================================
        // Simulation
        // ===================================================================

        SimulationRun PathSimulator::run(const SimulationConfig &config,
                                         const CancellationToken *cancel) const
        {
            config.validate();
            auto executor = make_executor(static_cast<std::size_t>(config.num_threads));
            return run(config, *executor, cancel);
        }

        SimulationRun PathSimulator::run(const SimulationConfig &config,
                                         ParallelExecutor &executor,
                                         const CancellationToken *cancel) const
        {
            config.validate();
            const int horizon = config.horizon;

            PathFiller fill;
            if (model_ == ReturnModel::BOOTSTRAP)
            {
                const data::ReturnSeries &source = returns_;
                fill = [&source, horizon](PathEngine &engine, PathRow row)
                {
                    std::uniform_int_distribution<std::size_t> pick(0, source.size() - 1);
                    for (int t = 0; t < horizon; ++t)
                    {
                        row(t + 1) = row(t) * (1.0 + source[pick(engine)]);
                    }
                };
            }
            else
            {
                const double mu = mean_;
                const double sigma = std_dev_;
                fill = [mu, sigma, horizon](PathEngine &engine, PathRow row)
                {
                    if (sigma == 0.0)
                    {
                        for (int t = 0; t < horizon; ++t)
                        {
                            row(t + 1) = row(t) * (1.0 + mu);
                        }
                        return;
                    }
                    std::normal_distribution<double> draw(mu, sigma);
                    for (int t = 0; t < horizon; ++t)
                    {
                        row(t + 1) = row(t) * (1.0 + draw(engine));
                    }
                };
            }

            return run_batched(config, resolve_seed(config), fill, executor, cancel);
        }

        std::string PathSimulator::generate_report(const SimulationConfig &config) const
        {
            SimulationRun result = run(config);
            return report::format_simulation_report(calculate_statistics(result),
                                                    "MONTE CARLO SIMULATION RESULTS");
        }

    } // namespace simulation
} // namespace tradelab
