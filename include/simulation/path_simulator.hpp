/**
 * @file path_simulator.hpp
 * @brief Return-path Monte Carlo simulator.
 *
 * Projects a distribution of future equity outcomes by compounding
 * per-period returns drawn independently from a return distribution:
 *
 *   capital[t + 1] = capital[t] * (1 + r)
 *
 * Two return models are supported. BOOTSTRAP resamples the empirical
 * series with replacement; PARAMETRIC_NORMAL draws from a normal
 * distribution with the series' mean and sample standard deviation.
 */

#ifndef TRADELAB_SIMULATION_PATH_SIMULATOR_HPP
#define TRADELAB_SIMULATION_PATH_SIMULATOR_HPP

#include "data/trade.hpp"
#include "simulation/cancellation_token.hpp"
#include "simulation/parallel_executor.hpp"
#include "simulation/simulation_run.hpp"

#include <string>

namespace tradelab
{
    namespace simulation
    {

        /**
         * @enum ReturnModel
         * @brief Distribution the per-period returns are drawn from.
         */
        enum class ReturnModel
        {
            BOOTSTRAP,        ///< Empirical resampling with replacement
            PARAMETRIC_NORMAL ///< N(mean, std) estimated from the series
        };

        /**
         * @brief Parse "bootstrap" / "normal" (case-insensitive).
         * @throws InvalidConfiguration On an unknown name.
         */
        ReturnModel parse_return_model(const std::string &name);

        /**
         * @class PathSimulator
         * @brief Generates SimulationRuns from a fixed return distribution.
         *
         * Usage:
         * @code
         *   PathSimulator sim(daily_returns);
         *   SimulationConfig cfg;
         *   cfg.num_simulations = 10000;
         *   cfg.horizon = 252;
         *   cfg.random_seed = 42;
         *   auto run = sim.run(cfg);
         *   auto stats = calculate_statistics(run);
         * @endcode
         *
         * Thread safety: run() is const and may be called concurrently.
         * The simulator performs no I/O and does not log.
         */
        class PathSimulator
        {
        public:
            /**
             * @brief Construct from an empirical return series.
             * @param returns Per-period fractional returns.
             * @param model Return model (default BOOTSTRAP).
             * @throws InvalidConfiguration If returns is empty.
             * @throws NonFiniteInput If returns contains NaN or infinity.
             */
            explicit PathSimulator(data::ReturnSeries returns,
                                   ReturnModel model = ReturnModel::BOOTSTRAP);

            /**
             * @brief Parametric simulator from already-estimated moments.
             * @throws InvalidConfiguration If a moment is non-finite or std_dev < 0.
             */
            static PathSimulator from_moments(double mean_return, double std_dev);

            /**
             * @brief Run on a worker pool sized by config.num_threads.
             * @throws InvalidConfiguration If the configuration is invalid.
             * @throws SimulationCancelled If cancel is set before completion.
             */
            SimulationRun run(const SimulationConfig &config,
                              const CancellationToken *cancel = nullptr) const;

            /**
             * @brief Run on a caller-supplied executor.
             */
            SimulationRun run(const SimulationConfig &config,
                              ParallelExecutor &executor,
                              const CancellationToken *cancel = nullptr) const;

            /** @brief Simulate and render the text report in one call. */
            std::string generate_report(const SimulationConfig &config) const;

            ReturnModel model() const { return model_; }
            const data::ReturnSeries &returns() const { return returns_; }
            double mean_return() const { return mean_; }
            double return_std_dev() const { return std_dev_; }

        private:
            PathSimulator(double mean_return, double std_dev);

            data::ReturnSeries returns_;
            ReturnModel model_;
            double mean_;
            double std_dev_;
        };

    } // namespace simulation
} // namespace tradelab

#endif // TRADELAB_SIMULATION_PATH_SIMULATOR_HPP
