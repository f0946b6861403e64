/**
 * @file trade_resampler.hpp
 * @brief Trade-resampling Monte Carlo simulator.
 *
 * Quantifies sequencing risk in an existing trade history. Each synthetic
 * sequence draws num_trades pnl values from the empirical pnl distribution
 * and accumulates them additively from initial_capital:
 *
 *   capital[k + 1] = capital[k] + pnl
 *
 * WITH_REPLACEMENT varies both order and composition; PERMUTATION
 * reshuffles the exact historical trades and isolates order alone.
 */

#ifndef TRADELAB_SIMULATION_TRADE_RESAMPLER_HPP
#define TRADELAB_SIMULATION_TRADE_RESAMPLER_HPP

#include "data/trade.hpp"
#include "simulation/cancellation_token.hpp"
#include "simulation/parallel_executor.hpp"
#include "simulation/simulation_run.hpp"

#include <string>
#include <vector>

namespace tradelab
{
    namespace simulation
    {

        /**
         * @enum ResampleMethod
         * @brief How synthetic trade sequences are drawn.
         */
        enum class ResampleMethod
        {
            WITH_REPLACEMENT, ///< Bootstrap draw of num_trades pnl values
            PERMUTATION       ///< Shuffle of all historical trades
        };

        /**
         * @brief Parse "with_replacement" / "bootstrap" / "permutation" / "shuffle".
         * @throws InvalidConfiguration On an unknown name.
         */
        ResampleMethod parse_resample_method(const std::string &name);

        /**
         * @class TradeResampler
         * @brief Generates SimulationRuns keyed to trade count.
         *
         * SimulationConfig::horizon is the number of synthetic trades per path.
         *
         * Thread safety: run() is const and may be called concurrently.
         */
        class TradeResampler
        {
        public:
            /**
             * @brief Construct from closed trades.
             * @throws InsufficientData If trades is empty.
             */
            explicit TradeResampler(const data::TradeList &trades,
                                    ResampleMethod method = ResampleMethod::WITH_REPLACEMENT);

            /**
             * @brief Construct from raw pnl values.
             * @throws InsufficientData If pnls is empty.
             * @throws NonFiniteInput If pnls contains NaN or infinity.
             */
            explicit TradeResampler(std::vector<double> pnls,
                                    ResampleMethod method = ResampleMethod::WITH_REPLACEMENT);

            /**
             * @brief Run on a worker pool sized by config.num_threads.
             * @throws InvalidConfiguration If the configuration is invalid, or
             *         PERMUTATION is requested with horizon != number of trades.
             * @throws SimulationCancelled If cancel is set before completion.
             */
            SimulationRun run(const SimulationConfig &config,
                              const CancellationToken *cancel = nullptr) const;

            /** @brief Run on a caller-supplied executor. */
            SimulationRun run(const SimulationConfig &config,
                              ParallelExecutor &executor,
                              const CancellationToken *cancel = nullptr) const;

            /** @brief Simulate and render the text report in one call. */
            std::string generate_report(const SimulationConfig &config) const;

            ResampleMethod method() const { return method_; }
            const std::vector<double> &pnls() const { return pnls_; }
            int num_source_trades() const { return static_cast<int>(pnls_.size()); }

            /** @brief Mean historical pnl per trade. */
            double mean_pnl() const;

        private:
            std::vector<double> pnls_;
            ResampleMethod method_;
        };

    } // namespace simulation
} // namespace tradelab

#endif // TRADELAB_SIMULATION_TRADE_RESAMPLER_HPP
