/**
 * @file simulation_run.cpp
 * @brief Implementation of SimulationConfig, SimulationRun and statistics reduction.
 */

#include "simulation/simulation_run.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace tradelab
{
    namespace simulation
    {

        namespace
        {

            double find_level(const std::vector<analytics::PercentilePoint> &points, double level)
            {
                for (const auto &p : points)
                {
                    if (p.level == level)
                    {
                        return p.value;
                    }
                }
                throw std::out_of_range("Percentile level not computed: " + std::to_string(level));
            }

            double share_percent(const std::vector<double> &values, bool (*pred)(double))
            {
                auto hits = std::count_if(values.begin(), values.end(), pred);
                return static_cast<double>(hits) / static_cast<double>(values.size()) * 100.0;
            }

            nlohmann::json percentiles_to_json(const std::vector<analytics::PercentilePoint> &points)
            {
                nlohmann::json arr = nlohmann::json::array();
                for (const auto &p : points)
                {
                    arr.push_back({{"level", p.level}, {"value", p.value}});
                }
                return arr;
            }

        } // anonymous namespace

        // ===================================================================
        // SimulationConfig
        // ===================================================================

        void SimulationConfig::validate() const
        {
            if (num_simulations < 1)
            {
                throw InvalidConfiguration(
                    "Expected positive value for parameter 'num_simulations', got: " + std::to_string(num_simulations));
            }
            if (horizon < 1)
            {
                throw InvalidConfiguration(
                    "Expected positive value for parameter 'horizon', got: " + std::to_string(horizon));
            }
            if (!(initial_capital > 0.0))
            {
                throw InvalidConfiguration(
                    "Expected positive value for parameter 'initial_capital', got: " + std::to_string(initial_capital));
            }
            if (batch_size < 1)
            {
                throw InvalidConfiguration(
                    "Expected positive value for parameter 'batch_size', got: " + std::to_string(batch_size));
            }
            if (num_threads < 0)
            {
                throw InvalidConfiguration(
                    "Expected non-negative value for parameter 'num_threads', got: " + std::to_string(num_threads));
            }
        }

        SimulationConfig SimulationConfig::from_json(const nlohmann::json &j)
        {
            SimulationConfig config;
            config.num_simulations = j.value("num_simulations", config.num_simulations);
            config.horizon = j.value("horizon", j.value("num_trades", config.horizon));
            config.initial_capital = j.value("initial_capital", config.initial_capital);
            config.batch_size = j.value("batch_size", config.batch_size);
            config.num_threads = j.value("num_threads", config.num_threads);

            if (j.contains("random_seed") && !j["random_seed"].is_null())
            {
                config.random_seed = j["random_seed"].get<std::uint64_t>();
            }

            return config;
        }

        // ===================================================================
        // SimulationRun
        // ===================================================================

        SimulationRun::SimulationRun(const SimulationConfig &config,
                                     Eigen::MatrixXd paths,
                                     std::uint64_t seed_used)
            : config_(config), paths_(std::move(paths)), seed_used_(seed_used)
        {
            if (paths_.rows() != config_.num_simulations || paths_.cols() != config_.horizon + 1)
            {
                throw std::invalid_argument(
                    "Path matrix shape (" + std::to_string(paths_.rows()) + "x" + std::to_string(paths_.cols()) + ") does not match configuration (" + std::to_string(config_.num_simulations) + "x" + std::to_string(config_.horizon + 1) + ")");
            }
        }

        std::vector<double> SimulationRun::path(int index) const
        {
            if (index < 0 || index >= num_paths())
            {
                throw std::out_of_range(
                    "Path index " + std::to_string(index) + " outside [0, " + std::to_string(num_paths()) + ")");
            }
            std::vector<double> out(paths_.cols());
            Eigen::Map<Eigen::RowVectorXd>(out.data(), paths_.cols()) = paths_.row(index);
            return out;
        }

        std::vector<double> SimulationRun::terminal_values() const
        {
            std::vector<double> out(paths_.rows());
            Eigen::Map<Eigen::VectorXd>(out.data(), paths_.rows()) = paths_.col(paths_.cols() - 1);
            return out;
        }

        std::vector<double> SimulationRun::max_drawdowns() const
        {
            std::vector<double> out;
            out.reserve(paths_.rows());
            for (int i = 0; i < num_paths(); ++i)
            {
                out.push_back(analytics::max_drawdown(path(i)));
            }
            return out;
        }

        // ===================================================================
        // StatisticsSnapshot
        // ===================================================================

        double StatisticsSnapshot::terminal_percentile(double level) const
        {
            return find_level(terminal_percentiles, level);
        }

        double StatisticsSnapshot::return_percentile(double level) const
        {
            return find_level(return_percentiles, level);
        }

        nlohmann::json StatisticsSnapshot::to_json() const
        {
            nlohmann::json j;

            j["parameters"]["num_simulations"] = num_simulations;
            j["parameters"]["horizon"] = horizon;
            j["parameters"]["initial_capital"] = initial_capital;

            j["expected_outcomes"]["mean_final_equity"] = mean_final_equity;
            j["expected_outcomes"]["median_final_equity"] = median_final_equity;
            j["expected_outcomes"]["expected_return"] = expected_return;
            j["expected_outcomes"]["median_return"] = median_return;

            j["probabilities"]["profit"] = probability_profit;
            j["probabilities"]["gain_10pct"] = prob_10pct_gain;
            j["probabilities"]["gain_20pct"] = prob_20pct_gain;
            j["probabilities"]["loss_10pct"] = prob_10pct_loss;
            j["probabilities"]["loss_20pct"] = prob_20pct_loss;

            j["percentiles"]["terminal_value"] = percentiles_to_json(terminal_percentiles);
            j["percentiles"]["total_return"] = percentiles_to_json(return_percentiles);

            j["drawdown"]["mean_max_drawdown"] = mean_max_drawdown;
            j["drawdown"]["worst_max_drawdown"] = worst_max_drawdown;

            j["extremes"]["best_final_equity"] = best_final_equity;
            j["extremes"]["worst_final_equity"] = worst_final_equity;
            j["extremes"]["best_return"] = best_return;
            j["extremes"]["worst_return"] = worst_return;

            return j;
        }

        StatisticsSnapshot calculate_statistics(const SimulationRun &run,
                                                const std::vector<double> &levels)
        {
            const double capital = run.config().initial_capital;
            const std::vector<double> terminal = run.terminal_values();

            std::vector<double> returns;
            returns.reserve(terminal.size());
            for (double v : terminal)
            {
                returns.push_back((v - capital) / capital * 100.0);
            }

            std::vector<double> drawdowns = run.max_drawdowns();

            StatisticsSnapshot s;
            s.num_simulations = run.num_paths();
            s.horizon = run.config().horizon;
            s.initial_capital = capital;

            s.mean_final_equity = analytics::mean(terminal);
            s.median_final_equity = analytics::percentile(terminal, 50.0);
            s.expected_return = analytics::mean(returns);
            s.median_return = analytics::percentile(returns, 50.0);

            s.probability_profit = share_percent(returns, [](double r)
                                                 { return r > 0.0; });
            s.prob_10pct_gain = share_percent(returns, [](double r)
                                              { return r > 10.0; });
            s.prob_20pct_gain = share_percent(returns, [](double r)
                                              { return r > 20.0; });
            s.prob_10pct_loss = share_percent(returns, [](double r)
                                              { return r < -10.0; });
            s.prob_20pct_loss = share_percent(returns, [](double r)
                                              { return r < -20.0; });

            s.terminal_percentiles = analytics::percentiles(terminal, levels);
            s.return_percentiles = analytics::percentiles(returns, levels);

            s.mean_max_drawdown = analytics::mean(drawdowns) * 100.0;
            s.worst_max_drawdown = *std::max_element(drawdowns.begin(), drawdowns.end()) * 100.0;

            auto [min_it, max_it] = std::minmax_element(terminal.begin(), terminal.end());
            s.best_final_equity = *max_it;
            s.worst_final_equity = *min_it;
            s.best_return = (s.best_final_equity - capital) / capital * 100.0;
            s.worst_return = (s.worst_final_equity - capital) / capital * 100.0;

            return s;
        }

    } // namespace simulation
} // namespace tradelab
