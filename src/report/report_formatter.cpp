/**
 * @file report_formatter.cpp
 * @brief Implementation of the text report renderers.
 */

#include "report/report_formatter.hpp"
#include "core/errors.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace tradelab
{
    namespace report
    {

        namespace
        {

            std::string rule(char c = '=')
            {
                return std::string(RULE_WIDTH, c);
            }

            void header(std::ostringstream &out, const std::string &title)
            {
                out << rule() << "\n"
                    << title << "\n"
                    << rule() << "\n";
            }

            void section(std::ostringstream &out, const std::string &name)
            {
                out << "\n"
                    << name << ":\n"
                    << rule('-') << "\n";
            }

            /// "  Label:<pad>value" with the value starting at a fixed column.
            void line(std::ostringstream &out, const std::string &label, const std::string &value)
            {
                out << "  " << std::left << std::setw(32) << (label + ":") << value << "\n";
            }

            std::string money(double v)
            {
                return "$" + format_number(v);
            }

            std::string pct(double v)
            {
                return format_number(v) + "%";
            }

            std::string hour_label(int hour)
            {
                std::ostringstream ss;
                ss << std::setw(2) << std::setfill('0') << hour << ":00";
                return ss.str();
            }

            std::string join_hours(const std::vector<int> &hours)
            {
                std::string s;
                for (std::size_t i = 0; i < hours.size(); ++i)
                {
                    if (i > 0)
                        s += ", ";
                    s += hour_label(hours[i]);
                }
                return s;
            }

        } // anonymous namespace

        std::string format_number(double value, int decimals)
        {
            if (std::isnan(value))
                return "nan";
            if (std::isinf(value))
                return value > 0 ? "inf" : "-inf";

            std::ostringstream ss;
            ss << std::fixed << std::setprecision(decimals) << value;
            return ss.str();
        }

        // ===================================================================
        // Simulation
        // ===================================================================

        std::string format_simulation_report(const simulation::StatisticsSnapshot &stats,
                                             const std::string &title)
        {
            std::ostringstream out;
            header(out, title);

            section(out, "PARAMETERS");
            line(out, "Simulations", std::to_string(stats.num_simulations));
            line(out, "Horizon", std::to_string(stats.horizon));
            line(out, "Initial Capital", money(stats.initial_capital));

            section(out, "EXPECTED OUTCOMES");
            line(out, "Mean Final Equity", money(stats.mean_final_equity));
            line(out, "Median Final Equity", money(stats.median_final_equity));
            line(out, "Expected Return", pct(stats.expected_return));
            line(out, "Median Return", pct(stats.median_return));

            section(out, "PROBABILITIES");
            line(out, "Probability of Profit", pct(stats.probability_profit));
            line(out, "Probability of +10% Gain", pct(stats.prob_10pct_gain));
            line(out, "Probability of +20% Gain", pct(stats.prob_20pct_gain));
            line(out, "Probability of -10% Loss", pct(stats.prob_10pct_loss));
            line(out, "Probability of -20% Loss", pct(stats.prob_20pct_loss));

            section(out, "PERCENTILES (FINAL EQUITY / RETURN)");
            for (std::size_t i = 0; i < stats.terminal_percentiles.size(); ++i)
            {
                const auto &tp = stats.terminal_percentiles[i];
                std::string value = money(tp.value);
                if (i < stats.return_percentiles.size())
                {
                    value += "  (" + pct(stats.return_percentiles[i].value) + ")";
                }
                line(out, format_number(tp.level, 0) + "th Percentile", value);
            }

            section(out, "DRAWDOWN");
            line(out, "Mean Max Drawdown", pct(stats.mean_max_drawdown));
            line(out, "Worst Max Drawdown", pct(stats.worst_max_drawdown));

            section(out, "EXTREMES");
            line(out, "Best Final Equity", money(stats.best_final_equity) + "  (" + pct(stats.best_return) + ")");
            line(out, "Worst Final Equity", money(stats.worst_final_equity) + "  (" + pct(stats.worst_return) + ")");

            out << "\n"
                << rule() << "\n";
            return out.str();
        }

        // ===================================================================
        // Strategy comparison
        // ===================================================================

        std::string format_comparison_report(const analytics::ComparisonTable &table,
                                             analytics::ComparisonColumn rank_column)
        {
            if (table.empty())
            {
                throw EmptyRegistry("Cannot format a comparison report without strategies");
            }

            std::ostringstream out;
            header(out, "STRATEGY COMPARISON REPORT");

            for (const auto &m : table.rows())
            {
                section(out, m.name);
                line(out, "Total Trades", std::to_string(m.total_trades) + "  (" + std::to_string(m.winning_trades) + " W / " + std::to_string(m.losing_trades) + " L)");
                line(out, "Win Rate", pct(m.win_rate));
                line(out, "Total P&L", money(m.total_pnl));
                line(out, "Avg Win", money(m.avg_win));
                line(out, "Avg Loss", money(m.avg_loss));
                line(out, "Profit Factor", format_number(m.profit_factor));
                line(out, "Sharpe Ratio", format_number(m.sharpe_ratio));
                line(out, "Max Drawdown", money(m.max_drawdown));
                line(out, "Expectancy", money(m.expectancy));
            }

            section(out, "RANKING BY " + analytics::column_name(rank_column));
            analytics::ComparisonTable ranked = table.sorted_by(rank_column);
            const int decimals = rank_column == analytics::ComparisonColumn::TOTAL_TRADES ? 0 : 2;
            int rank = 1;
            for (const auto &m : ranked.rows())
            {
                out << "  " << std::right << std::setw(2) << rank++ << ". "
                    << std::left << std::setw(30) << m.name
                    << format_number(m.value(rank_column), decimals) << "\n";
            }

            const auto &best_pnl = table.top_by(analytics::ComparisonColumn::TOTAL_PNL);
            const auto &best_sharpe = table.top_by(analytics::ComparisonColumn::SHARPE_RATIO);
            section(out, "LEADERS");
            line(out, "Best Total P&L", best_pnl.name + "  (" + money(best_pnl.total_pnl) + ")");
            line(out, "Best Sharpe Ratio", best_sharpe.name + "  (" + format_number(best_sharpe.sharpe_ratio) + ")");

            out << "\n"
                << rule() << "\n";
            return out.str();
        }

        std::string format_statistical_test(const analytics::StatisticalTestResult &result)
        {
            std::ostringstream out;
            header(out, "STATISTICAL SIGNIFICANCE TEST");

            line(out, result.strategy1 + " Mean P&L", money(result.mean_pnl_1));
            line(out, result.strategy2 + " Mean P&L", money(result.mean_pnl_2));
            line(out, "T-Statistic", format_number(result.t_statistic, 4));
            line(out, "Degrees of Freedom", format_number(result.degrees_of_freedom));
            line(out, "P-Value", format_number(result.p_value, 4));
            line(out, "Cohen's d", format_number(result.cohens_d, 4));
            line(out, "Significant (p < 0.05)", result.is_significant ? "YES" : "NO");

            out << "\n";
            if (result.is_significant)
            {
                out << "  " << result.better_strategy << " is better with "
                    << pct(result.confidence) << " confidence\n";
            }
            else
            {
                out << "  No statistically significant difference\n";
            }

            out << "\n"
                << rule() << "\n";
            return out.str();
        }

        // ===================================================================
        // Time of day
        // ===================================================================

        std::string format_time_of_day_report(const analytics::TimeOfDayAnalyzer &analyzer)
        {
            const auto &config = analyzer.config();
            std::ostringstream out;
            header(out, "TIME-OF-DAY ANALYSIS");

            line(out, "Trades Analyzed", std::to_string(analyzer.total_trades()));
            line(out, "Bucket Size", std::to_string(config.bucket_minutes) + " minutes");
            line(out, "Minimum Trades per Bucket", std::to_string(config.min_bucket_trades));

            section(out, "PERFORMANCE BY HOUR");
            for (const auto &h : analyzer.analyze_by_hour())
            {
                out << "  " << hour_label(h.hour)
                    << " | Trades: " << std::right << std::setw(4) << h.stats.trade_count
                    << " | Avg P&L: " << std::setw(10) << format_number(h.stats.mean_pnl)
                    << " | Win Rate: " << std::setw(6) << format_number(h.stats.win_rate) << "%\n";
            }

            std::vector<int> best = analyzer.get_best_hours(config.top_n);
            std::vector<int> worst = analyzer.get_worst_hours(config.top_n);
            out << "\n";
            line(out, "Best Hours", best.empty() ? "n/a" : join_hours(best));
            line(out, "Worst Hours", worst.empty() ? "n/a" : join_hours(worst));

            section(out, "PERFORMANCE BY DAY OF WEEK");
            for (const auto &d : analyzer.analyze_by_day())
            {
                out << "  " << std::left << std::setw(9) << data::weekday_name(d.weekday)
                    << " | Trades: " << std::right << std::setw(4) << d.stats.trade_count
                    << " | Total P&L: " << std::setw(12) << format_number(d.stats.total_pnl)
                    << " | Avg: " << std::setw(10) << format_number(d.stats.mean_pnl) << "\n";
            }

            section(out, "BEST TRADING TIME");
            try
            {
                analytics::TimeBucket top = analyzer.find_best_trading_times();
                line(out, "Bucket", data::weekday_name(top.key.weekday) + " " + top.key.time_label(config.bucket_minutes));
                line(out, "Trades", std::to_string(top.stats.trade_count));
                line(out, "Total P&L", money(top.stats.total_pnl));
                line(out, "Win Rate", pct(top.stats.win_rate));
            }
            catch (const InsufficientData &)
            {
                out << "  No bucket has at least " << config.min_bucket_trades << " trades\n";
            }

            out << "\n"
                << rule() << "\n";
            return out.str();
        }

    } // namespace report
} // namespace tradelab
