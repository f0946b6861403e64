/**
 * @file trade_loader.hpp
 * @brief Trade ledger and return series loading, configuration, synthetic data
 *
 * Provides functionality to load closed trades and return series from CSV
 * files and the application configuration from JSON files.
 */

#ifndef TRADELAB_DATA_TRADE_LOADER_HPP
#define TRADELAB_DATA_TRADE_LOADER_HPP

#include "data/trade.hpp"
#include "analytics/strategy_comparator.hpp"
#include "analytics/time_of_day_analyzer.hpp"
#include "simulation/path_simulator.hpp"
#include "simulation/simulation_run.hpp"
#include "simulation/trade_resampler.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tradelab
{
    namespace data
    {

        /**
         * @struct DataConfig
         * @brief Input file locations
         */
        struct DataConfig
        {
            std::string trades_file;  ///< Trade ledger CSV
            std::string returns_file; ///< Optional per-period return CSV

            static DataConfig from_json(const nlohmann::json &j);
        };

        /**
         * @struct PathSimulationSettings
         * @brief "simulation" section: path simulator parameters and return model
         */
        struct PathSimulationSettings
        {
            simulation::SimulationConfig config;
            simulation::ReturnModel model = simulation::ReturnModel::BOOTSTRAP;

            static PathSimulationSettings from_json(const nlohmann::json &j);
        };

        /**
         * @struct ResamplerSettings
         * @brief "resampler" section: trade resampler parameters and method
         */
        struct ResamplerSettings
        {
            simulation::SimulationConfig config;
            simulation::ResampleMethod method = simulation::ResampleMethod::WITH_REPLACEMENT;
            bool num_trades_from_history = true; ///< No "num_trades" key: use the ledger size

            static ResamplerSettings from_json(const nlohmann::json &j);
        };

        /**
         * @struct AppConfig
         * @brief Complete application configuration
         */
        struct AppConfig
        {
            DataConfig data;
            PathSimulationSettings simulation;
            ResamplerSettings resampler;
            analytics::TimeOfDayConfig time_of_day;
            analytics::ComparisonConfig comparison;

            /**
             * @brief Load complete configuration from JSON file
             */
            static AppConfig load_from_file(const std::string &config_path);
        };

        /**
         * @struct SyntheticStrategy
         * @brief Pnl distribution of one generated strategy
         */
        struct SyntheticStrategy
        {
            std::string name;
            double mean_pnl;
            double pnl_std_dev;
        };

        /// Trades grouped by strategy label, in first-appearance order.
        using StrategyGroups = std::vector<std::pair<std::string, TradeList>>;

        /**
         * @class TradeLoader
         * @brief Loads trade ledgers and return series from CSV files
         *
         * Trade CSV format (columns located by header name, strategy optional):
         * entry_time,exit_time,symbol,pnl,strategy
         * 2024-01-02 09:30:00,2024-01-02 10:15:00,AAPL,125.50,ema_cross
         */
        class TradeLoader
        {
        public:
            TradeLoader() = default;
            ~TradeLoader() = default;

            // ====================================================================
            // CSV Loading Methods
            // ====================================================================

            /**
             * @brief Load closed trades from a CSV file
             * @param filepath Path to CSV file
             * @return Trades in file order
             * @throws std::runtime_error if the file cannot be read, a required
             *         column is missing, or a row is invalid (message names the line)
             */
            static TradeList load_trades_csv(const std::string &filepath);

            /**
             * @brief Load a return series from a CSV file
             *
             * Reads column "return" (or "returns"), else the last column.
             * Rows with an empty value are skipped; with verbose set each
             * skipped row is reported on std::cerr.
             *
             * @throws std::runtime_error if the file cannot be read, a value is
             *         not numeric, or no return is found
             */
            static ReturnSeries load_returns_csv(const std::string &filepath, bool verbose = false);

            // ====================================================================
            // Configuration Loading
            // ====================================================================

            /**
             * @brief Load JSON file
             * @throws std::runtime_error if file cannot be loaded or parsed
             */
            static nlohmann::json load_json(const std::string &filepath);

            /**
             * @brief Load complete application configuration
             * @throws std::runtime_error On unreadable JSON
             * @throws InvalidConfiguration On invalid section values
             */
            static AppConfig load_config(const std::string &config_path);

            // ====================================================================
            // Grouping
            // ====================================================================

            /**
             * @brief Group trades by strategy label
             *
             * Trades with an empty label are grouped under "default".
             */
            static StrategyGroups group_by_strategy(const TradeList &trades);

            // ====================================================================
            // Data Generation (for testing)
            // ====================================================================

            /**
             * @brief Generate synthetic trades for several strategies
             *
             * Entries fall on weekdays between 09:00 and 15:30 UTC; holding
             * periods are 5 to 120 minutes; pnl ~ N(mean_pnl, pnl_std_dev).
             *
             * @param strategies Strategy pnl distributions
             * @param trades_per_strategy Trades generated per strategy
             * @param start_date First trading day ("YYYY-MM-DD")
             * @param seed Generator seed; equal seeds give equal ledgers
             */
            static TradeList generate_synthetic_trades(
                const std::vector<SyntheticStrategy> &strategies,
                int trades_per_strategy,
                const std::string &start_date = "2024-01-01",
                std::uint64_t seed = 42);

            // ====================================================================
            // Export Methods
            // ====================================================================

            /**
             * @brief Save trades in the format read by load_trades_csv
             * @throws std::runtime_error if the file cannot be written
             */
            static void save_trades_csv(const TradeList &trades, const std::string &filepath);

            /**
             * @brief Parse CSV line into tokens (double quotes group commas)
             */
            static std::vector<std::string> parse_csv_line(const std::string &line);

            /**
             * @brief Trim whitespace from string
             */
            static std::string trim(const std::string &str);
        };

    } // namespace data
} // namespace tradelab

#endif // TRADELAB_DATA_TRADE_LOADER_HPP
