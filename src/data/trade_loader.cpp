/**
 * @file trade_loader.cpp
 * @brief Implementation of TradeLoader and configuration structures
 */

#include "data/trade_loader.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <random>
#include <sstream>

namespace tradelab
{
    namespace data
    {

        namespace
        {

            /// Index of a header column, or -1 when absent.
            int find_column(const std::vector<std::string> &header, const std::string &name)
            {
                for (std::size_t i = 0; i < header.size(); ++i)
                {
                    std::string col = TradeLoader::trim(header[i]);
                    std::transform(col.begin(), col.end(), col.begin(), [](unsigned char c)
                                   { return std::tolower(c); });
                    if (col == name)
                    {
                        return static_cast<int>(i);
                    }
                }
                return -1;
            }

            std::string location(const std::string &filepath, int line_no)
            {
                return filepath + ":" + std::to_string(line_no);
            }

            double parse_double(const std::string &text, const std::string &where)
            {
                std::size_t consumed = 0;
                double value = 0.0;
                try
                {
                    value = std::stod(text, &consumed);
                }
                catch (const std::exception &)
                {
                    throw std::runtime_error("Invalid number '" + text + "' at " + where);
                }
                if (consumed != text.size())
                {
                    throw std::runtime_error("Invalid number '" + text + "' at " + where);
                }
                return value;
            }

            Timestamp next_weekday(Timestamp day)
            {
                do
                {
                    day += std::chrono::hours(24);
                } while (day_of_week(day) >= 5);
                return day;
            }

        } // anonymous namespace

        // =============================================
        // Configuration Structures - from_json Methods
        // =============================================

        DataConfig DataConfig::from_json(const nlohmann::json &j)
        {
            DataConfig config;
            config.trades_file = j.value("trades_file", "data/trades.csv");
            config.returns_file = j.value("returns_file", "");
            return config;
        }

        PathSimulationSettings PathSimulationSettings::from_json(const nlohmann::json &j)
        {
            PathSimulationSettings settings;
            settings.config = simulation::SimulationConfig::from_json(j);
            settings.config.validate();
            settings.model = simulation::parse_return_model(j.value("method", "bootstrap"));
            return settings;
        }

        ResamplerSettings ResamplerSettings::from_json(const nlohmann::json &j)
        {
            ResamplerSettings settings;
            settings.config = simulation::SimulationConfig::from_json(j);
            settings.num_trades_from_history = !j.contains("num_trades") && !j.contains("horizon");
            if (!settings.num_trades_from_history)
            {
                settings.config.validate();
            }
            settings.method = simulation::parse_resample_method(j.value("method", "with_replacement"));
            return settings;
        }

        AppConfig AppConfig::load_from_file(const std::string &config_path)
        {
            return TradeLoader::load_config(config_path);
        }

        // ===========================
        // CSV Loading - Trades
        // ===========================

        TradeList TradeLoader::load_trades_csv(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file: " + filepath);
            }

            std::string line;
            if (!std::getline(file, line))
            {
                throw std::runtime_error("Empty CSV file: " + filepath);
            }

            auto header = parse_csv_line(line);
            const int entry_col = find_column(header, "entry_time");
            const int exit_col = find_column(header, "exit_time");
            const int symbol_col = find_column(header, "symbol");
            const int pnl_col = find_column(header, "pnl");
            const int strategy_col = find_column(header, "strategy");

            if (entry_col < 0 || exit_col < 0 || symbol_col < 0 || pnl_col < 0)
            {
                throw std::runtime_error(
                    "Trade CSV must have entry_time, exit_time, symbol and pnl columns: " + filepath);
            }

            const int required = std::max({entry_col, exit_col, symbol_col, pnl_col, strategy_col}) + 1;

            TradeList trades;
            int line_no = 1;
            while (std::getline(file, line))
            {
                ++line_no;
                if (trim(line).empty())
                    continue;

                auto fields = parse_csv_line(line);
                const std::string where = location(filepath, line_no);

                // strategy may be the trailing column and left off entirely
                int needed = required;
                if (strategy_col == required - 1 && static_cast<int>(fields.size()) == required - 1)
                {
                    needed = required - 1;
                }
                if (static_cast<int>(fields.size()) < needed)
                {
                    throw std::runtime_error("Too few fields at " + where);
                }

                try
                {
                    Timestamp entry = parse_timestamp(trim(fields[entry_col]));
                    Timestamp exit = parse_timestamp(trim(fields[exit_col]));
                    double pnl = parse_double(trim(fields[pnl_col]), where);
                    std::string strategy;
                    if (strategy_col >= 0 && strategy_col < static_cast<int>(fields.size()))
                    {
                        strategy = trim(fields[strategy_col]);
                    }
                    trades.emplace_back(entry, exit, trim(fields[symbol_col]), pnl, strategy);
                }
                catch (const std::invalid_argument &e)
                {
                    throw std::runtime_error("Invalid trade at " + where + ": " + e.what());
                }
            }

            return trades;
        }

        // ===========================
        // CSV Loading - Returns
        // ===========================

        ReturnSeries TradeLoader::load_returns_csv(const std::string &filepath, bool verbose)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file: " + filepath);
            }

            std::string line;
            if (!std::getline(file, line))
            {
                throw std::runtime_error("Empty CSV file: " + filepath);
            }

            auto header = parse_csv_line(line);
            int col = find_column(header, "return");
            if (col < 0)
                col = find_column(header, "returns");
            if (col < 0)
                col = static_cast<int>(header.size()) - 1;

            ReturnSeries returns;
            int line_no = 1;
            while (std::getline(file, line))
            {
                ++line_no;
                if (trim(line).empty())
                    continue;

                auto fields = parse_csv_line(line);
                const std::string where = location(filepath, line_no);
                std::string value = col < static_cast<int>(fields.size()) ? trim(fields[col]) : "";

                if (value.empty())
                {
                    if (verbose)
                    {
                        std::cerr << "  Warning: no return value at " << where << ", row skipped\n";
                    }
                    continue;
                }

                returns.push_back(parse_double(value, where));
            }

            if (returns.empty())
            {
                throw std::runtime_error("No returns found in CSV file: " + filepath);
            }
            return returns;
        }

        // ================
        // JSON Loading
        // ================

        nlohmann::json TradeLoader::load_json(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open JSON file: " + filepath);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("JSON parsing error in " + filepath + ": " + std::string(e.what()));
            }

            return j;
        }

        AppConfig TradeLoader::load_config(const std::string &config_path)
        {
            auto j = load_json(config_path);

            AppConfig config;
            try
            {
                config.data = DataConfig::from_json(j.value("data", nlohmann::json::object()));

                if (j.contains("simulation"))
                {
                    config.simulation = PathSimulationSettings::from_json(j["simulation"]);
                }

                if (j.contains("resampler"))
                {
                    config.resampler = ResamplerSettings::from_json(j["resampler"]);
                }

                if (j.contains("time_of_day"))
                {
                    config.time_of_day = analytics::TimeOfDayConfig::from_json(j["time_of_day"]);
                }

                if (j.contains("comparison"))
                {
                    config.comparison = analytics::ComparisonConfig::from_json(j["comparison"]);
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                throw InvalidConfiguration("Invalid value in " + config_path + ": " + std::string(e.what()));
            }

            return config;
        }

        // ================
        // Grouping
        // ================

        StrategyGroups TradeLoader::group_by_strategy(const TradeList &trades)
        {
            StrategyGroups groups;
            std::map<std::string, std::size_t> index;

            for (const auto &trade : trades)
            {
                const std::string name = trade.strategy().empty() ? "default" : trade.strategy();
                auto it = index.find(name);
                if (it == index.end())
                {
                    index[name] = groups.size();
                    groups.emplace_back(name, TradeList{});
                    groups.back().second.push_back(trade);
                }
                else
                {
                    groups[it->second].second.push_back(trade);
                }
            }

            return groups;
        }

        // ===========================
        // Synthetic Data Generation
        // ===========================

        TradeList TradeLoader::generate_synthetic_trades(
            const std::vector<SyntheticStrategy> &strategies,
            int trades_per_strategy,
            const std::string &start_date,
            std::uint64_t seed)
        {
            if (trades_per_strategy < 1)
            {
                throw InvalidConfiguration(
                    "Expected positive value for parameter 'trades_per_strategy', got: " + std::to_string(trades_per_strategy));
            }

            static const char *SYMBOLS[] = {"AAPL", "MSFT", "NVDA", "AMZN", "SPY"};
            constexpr int TRADES_PER_DAY = 4;
            constexpr int OPEN_MINUTE = 9 * 60;
            constexpr int LAST_ENTRY_MINUTE = 15 * 60 + 30;

            std::mt19937_64 gen(seed);
            std::uniform_int_distribution<int> minute_dist(OPEN_MINUTE, LAST_ENTRY_MINUTE);
            std::uniform_int_distribution<int> hold_dist(5, 120);
            std::uniform_int_distribution<int> symbol_dist(0, 4);

            Timestamp first_day = parse_timestamp(start_date);
            if (day_of_week(first_day) >= 5)
            {
                first_day = next_weekday(first_day);
            }

            TradeList trades;
            trades.reserve(strategies.size() * trades_per_strategy);

            for (const auto &strategy : strategies)
            {
                if (strategy.pnl_std_dev < 0.0)
                {
                    throw InvalidConfiguration("Negative pnl_std_dev for strategy " + strategy.name);
                }
                std::normal_distribution<double> pnl_dist(strategy.mean_pnl, strategy.pnl_std_dev > 0.0 ? strategy.pnl_std_dev : 1.0);

                Timestamp day = first_day;
                for (int k = 0; k < trades_per_strategy; ++k)
                {
                    if (k > 0 && k % TRADES_PER_DAY == 0)
                    {
                        day = next_weekday(day);
                    }

                    Timestamp entry = day + std::chrono::minutes(minute_dist(gen));
                    Timestamp exit = entry + std::chrono::minutes(hold_dist(gen));
                    double pnl = strategy.pnl_std_dev > 0.0 ? pnl_dist(gen) : strategy.mean_pnl;

                    trades.emplace_back(entry, exit, SYMBOLS[symbol_dist(gen)], pnl, strategy.name);
                }
            }

            return trades;
        }

        // ==================
        // Export Methods
        // ==================

        void TradeLoader::save_trades_csv(const TradeList &trades, const std::string &filepath)
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            file << "entry_time,exit_time,symbol,pnl,strategy\n";
            for (const auto &t : trades)
            {
                file << format_timestamp(t.entry_time()) << ","
                     << format_timestamp(t.exit_time()) << ","
                     << t.symbol() << ","
                     << std::fixed << std::setprecision(2) << t.pnl() << ","
                     << t.strategy() << "\n";
            }

            if (!file)
            {
                throw std::runtime_error("Write failed for file: " + filepath);
            }
        }

        // =======================
        // Helper Methods
        // =======================

        std::vector<std::string> TradeLoader::parse_csv_line(const std::string &line)
        {
            std::vector<std::string> tokens;
            std::string token;
            bool in_quotes = false;

            for (char c : line)
            {
                if (c == '"')
                {
                    in_quotes = !in_quotes;
                }
                else if (c == ',' && !in_quotes)
                {
                    tokens.push_back(token);
                    token.clear();
                }
                else if (c != '\r')
                {
                    token += c;
                }
            }

            tokens.push_back(token);
            return tokens;
        }

        std::string TradeLoader::trim(const std::string &str)
        {
            const auto first = str.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
            {
                return "";
            }
            const auto last = str.find_last_not_of(" \t\r\n");
            return str.substr(first, last - first + 1);
        }

    } // namespace data
} // namespace tradelab
