/**
 * @file simulation_run.hpp
 * @brief Simulation configuration, the generated path set, and its statistics.
 *
 * A SimulationRun stores every EquityPath of one simulator invocation as a
 * row of a dense matrix. It is never modified after construction; all
 * statistics are pure reductions over it and can be recomputed at any time.
 */

#ifndef TRADELAB_SIMULATION_SIMULATION_RUN_HPP
#define TRADELAB_SIMULATION_SIMULATION_RUN_HPP

#include "analytics/trade_metrics.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace tradelab
{
    namespace simulation
    {

        /**
         * @struct SimulationConfig
         * @brief Parameters shared by the path simulator and the trade resampler.
         *
         * horizon is counted in periods for the path simulator and in trades
         * for the resampler.
         */
        struct SimulationConfig
        {
            int num_simulations = 10000;           ///< Number of independent paths (>= 1)
            int horizon = 252;                     ///< Steps per path (>= 1)
            double initial_capital = 100000.0;     ///< Starting capital (> 0)
            std::optional<std::uint64_t> random_seed; ///< Fixed seed for reproducible runs
            int batch_size = 256;                  ///< Paths generated per task (>= 1)
            int num_threads = 0;                   ///< Worker threads, 0 = one per core

            /**
             * @brief Check every field.
             * @throws InvalidConfiguration On the first invalid field.
             */
            void validate() const;

            /**
             * @brief Load from a JSON object, keeping defaults for missing keys.
             *
             * "num_trades" is accepted as an alias of "horizon".
             */
            static SimulationConfig from_json(const nlohmann::json &j);
        };

        /**
         * @class SimulationRun
         * @brief Immutable set of equity paths produced by one simulation.
         *
         * paths() has num_simulations rows and horizon + 1 columns; column 0
         * holds initial_capital for every row.
         */
        class SimulationRun
        {
        public:
            /**
             * @brief Take ownership of a generated path matrix.
             * @throws std::invalid_argument If the matrix shape does not match config.
             */
            SimulationRun(const SimulationConfig &config,
                          Eigen::MatrixXd paths,
                          std::uint64_t seed_used);

            const SimulationConfig &config() const { return config_; }
            const Eigen::MatrixXd &paths() const { return paths_; }

            /** @brief Seed actually used, recorded even when none was configured. */
            std::uint64_t seed_used() const { return seed_used_; }

            int num_paths() const { return static_cast<int>(paths_.rows()); }
            int path_length() const { return static_cast<int>(paths_.cols()); }

            /**
             * @brief Copy of one path.
             * @throws std::out_of_range If index is outside [0, num_paths()).
             */
            std::vector<double> path(int index) const;

            /** @brief Last value of every path. */
            std::vector<double> terminal_values() const;

            /** @brief Maximum drawdown (fraction) of every path. */
            std::vector<double> max_drawdowns() const;

        private:
            SimulationConfig config_;
            Eigen::MatrixXd paths_;
            std::uint64_t seed_used_;
        };

        /**
         * @struct StatisticsSnapshot
         * @brief Distributional summary of a SimulationRun.
         *
         * Returns, probabilities and drawdowns are percentages; equity fields
         * are in account currency. Drawdowns are positive numbers.
         */
        struct StatisticsSnapshot
        {
            int num_simulations = 0;
            int horizon = 0;
            double initial_capital = 0.0;

            double mean_final_equity = 0.0;
            double median_final_equity = 0.0;
            double expected_return = 0.0; ///< Mean percentage change
            double median_return = 0.0;

            double probability_profit = 0.0; ///< % of paths ending above initial_capital
            double prob_10pct_gain = 0.0;
            double prob_20pct_gain = 0.0;
            double prob_10pct_loss = 0.0;
            double prob_20pct_loss = 0.0;

            std::vector<analytics::PercentilePoint> terminal_percentiles; ///< Terminal equity
            std::vector<analytics::PercentilePoint> return_percentiles;   ///< Total return %

            double mean_max_drawdown = 0.0;
            double worst_max_drawdown = 0.0;

            double best_final_equity = 0.0;
            double worst_final_equity = 0.0;
            double best_return = 0.0;
            double worst_return = 0.0;

            /**
             * @brief Terminal-equity percentile at a requested level.
             * @throws std::out_of_range If the level was not computed.
             */
            double terminal_percentile(double level) const;

            /**
             * @brief Return percentile at a requested level.
             * @throws std::out_of_range If the level was not computed.
             */
            double return_percentile(double level) const;

            /** @brief Structured export of every field. */
            nlohmann::json to_json() const;
        };

        /**
         * @brief Reduce a run to its statistics.
         * @param run Simulation output.
         * @param levels Percentile levels in [0, 100].
         * @throws InvalidConfiguration If a level is outside [0, 100].
         */
        StatisticsSnapshot calculate_statistics(
            const SimulationRun &run,
            const std::vector<double> &levels = analytics::default_percentile_levels());

    } // namespace simulation
} // namespace tradelab

#endif // TRADELAB_SIMULATION_SIMULATION_RUN_HPP
