/**
 * @file strategy_comparator.cpp
 * @brief Implementation of StrategyComparator and ComparisonTable.
 */

#include "analytics/strategy_comparator.hpp"
#include "analytics/trade_metrics.hpp"
#include "core/errors.hpp"
#include "report/report_formatter.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace tradelab
{
    namespace analytics
    {

        namespace
        {

            struct ColumnName
            {
                ComparisonColumn column;
                const char *name;
            };

            const ColumnName COLUMN_NAMES[] = {
                {ComparisonColumn::TOTAL_TRADES, "total_trades"},
                {ComparisonColumn::WIN_RATE, "win_rate"},
                {ComparisonColumn::TOTAL_PNL, "total_pnl"},
                {ComparisonColumn::SHARPE_RATIO, "sharpe_ratio"},
                {ComparisonColumn::PROFIT_FACTOR, "profit_factor"},
                {ComparisonColumn::EXPECTANCY, "expectancy"},
                {ComparisonColumn::AVG_WIN, "avg_win"},
                {ComparisonColumn::AVG_LOSS, "avg_loss"},
                {ComparisonColumn::MAX_DRAWDOWN, "max_drawdown"},
            };

            /// JSON has no infinity; +inf profit factors are exported as "inf".
            nlohmann::json finite_or_label(double v)
            {
                if (std::isinf(v))
                {
                    return v > 0 ? "inf" : "-inf";
                }
                return v;
            }

        } // anonymous namespace

        ComparisonColumn parse_comparison_column(const std::string &name)
        {
            std::string s = name;
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                           { return std::tolower(c); });
            if (s == "sharpe" || s == "sharpe_like_ratio")
            {
                return ComparisonColumn::SHARPE_RATIO;
            }
            for (const auto &entry : COLUMN_NAMES)
            {
                if (s == entry.name)
                {
                    return entry.column;
                }
            }
            throw InvalidConfiguration("Unknown comparison column: " + name);
        }

        std::string column_name(ComparisonColumn column)
        {
            for (const auto &entry : COLUMN_NAMES)
            {
                if (entry.column == column)
                {
                    return entry.name;
                }
            }
            return "unknown";
        }

        ComparisonConfig ComparisonConfig::from_json(const nlohmann::json &j)
        {
            ComparisonConfig config;
            if (j.contains("rank_by"))
            {
                config.rank_by = parse_comparison_column(j.at("rank_by").get<std::string>());
            }
            return config;
        }

        // ===================================================================
        // StrategyMetrics
        // ===================================================================

        double StrategyMetrics::value(ComparisonColumn column) const
        {
            switch (column)
            {
            case ComparisonColumn::TOTAL_TRADES:
                return static_cast<double>(total_trades);
            case ComparisonColumn::WIN_RATE:
                return win_rate;
            case ComparisonColumn::TOTAL_PNL:
                return total_pnl;
            case ComparisonColumn::SHARPE_RATIO:
                return sharpe_ratio;
            case ComparisonColumn::PROFIT_FACTOR:
                return profit_factor;
            case ComparisonColumn::EXPECTANCY:
                return expectancy;
            case ComparisonColumn::AVG_WIN:
                return avg_win;
            case ComparisonColumn::AVG_LOSS:
                return avg_loss;
            case ComparisonColumn::MAX_DRAWDOWN:
                return max_drawdown;
            }
            throw std::invalid_argument("Unhandled comparison column");
        }

        // ===================================================================
        // ComparisonTable
        // ===================================================================

        ComparisonTable::ComparisonTable(std::vector<StrategyMetrics> rows)
            : rows_(std::move(rows))
        {
        }

        ComparisonTable ComparisonTable::sorted_by(ComparisonColumn column, bool descending) const
        {
            std::vector<StrategyMetrics> sorted(rows_);
            std::sort(sorted.begin(), sorted.end(),
                      [](const StrategyMetrics &a, const StrategyMetrics &b)
                      { return a.registration_index < b.registration_index; });
            std::stable_sort(sorted.begin(), sorted.end(),
                             [column, descending](const StrategyMetrics &a, const StrategyMetrics &b)
                             {
                                 return descending ? a.value(column) > b.value(column)
                                                   : a.value(column) < b.value(column);
                             });
            return ComparisonTable(std::move(sorted));
        }

        const StrategyMetrics &ComparisonTable::top_by(ComparisonColumn column) const
        {
            if (rows_.empty())
            {
                throw EmptyRegistry("Comparison table has no rows");
            }

            const StrategyMetrics *best = &rows_.front();
            for (const auto &r : rows_)
            {
                double v = r.value(column);
                double bv = best->value(column);
                if (v > bv || (v == bv && r.registration_index < best->registration_index))
                {
                    best = &r;
                }
            }
            return *best;
        }

        const StrategyMetrics &ComparisonTable::row(const std::string &name) const
        {
            for (const auto &r : rows_)
            {
                if (r.name == name)
                {
                    return r;
                }
            }
            throw UnknownStrategy("No comparison row for strategy '" + name + "'");
        }

        std::vector<std::string> ComparisonTable::names() const
        {
            std::vector<std::string> out;
            out.reserve(rows_.size());
            for (const auto &r : rows_)
            {
                out.push_back(r.name);
            }
            return out;
        }

        nlohmann::json ComparisonTable::to_json() const
        {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto &r : rows_)
            {
                nlohmann::json j;
                j["strategy"] = r.name;
                j["total_trades"] = r.total_trades;
                j["winning_trades"] = r.winning_trades;
                j["losing_trades"] = r.losing_trades;
                j["win_rate"] = r.win_rate;
                j["total_pnl"] = r.total_pnl;
                j["avg_win"] = r.avg_win;
                j["avg_loss"] = r.avg_loss;
                j["profit_factor"] = finite_or_label(r.profit_factor);
                j["sharpe_ratio"] = r.sharpe_ratio;
                j["max_drawdown"] = r.max_drawdown;
                j["expectancy"] = r.expectancy;
                arr.push_back(j);
            }
            return arr;
        }

        nlohmann::json StatisticalTestResult::to_json() const
        {
            nlohmann::json j;
            j["strategy1"] = strategy1;
            j["strategy2"] = strategy2;
            j["mean_pnl_1"] = mean_pnl_1;
            j["mean_pnl_2"] = mean_pnl_2;
            j["t_statistic"] = finite_or_label(t_statistic);
            j["degrees_of_freedom"] = degrees_of_freedom;
            j["p_value"] = p_value;
            j["is_significant"] = is_significant;
            j["cohens_d"] = cohens_d;
            j["better_strategy"] = better_strategy;
            j["confidence"] = confidence;
            return j;
        }

        // ===================================================================
        // StrategyComparator
        // ===================================================================

        void StrategyComparator::add_strategy(const std::string &name, data::TradeList trades)
        {
            if (name.empty())
            {
                throw std::invalid_argument("Strategy name cannot be empty");
            }
            if (index_.count(name))
            {
                throw DuplicateName("Strategy '" + name + "' is already registered");
            }
            if (trades.empty())
            {
                throw InsufficientData("Strategy '" + name + "' has no trades");
            }

            index_[name] = records_.size();
            records_.push_back({name, std::move(trades)});
        }

        StrategyMetrics StrategyComparator::calculate_metrics(const std::string &name,
                                                              const data::TradeList &trades)
        {
            std::vector<double> pnls = extract_pnl(trades);

            StrategyMetrics m;
            m.name = name;
            m.total_trades = static_cast<int>(trades.size());
            m.winning_trades = static_cast<int>(std::count_if(pnls.begin(), pnls.end(), [](double p)
                                                              { return p > 0.0; }));
            m.losing_trades = static_cast<int>(std::count_if(pnls.begin(), pnls.end(), [](double p)
                                                             { return p < 0.0; }));
            m.win_rate = win_rate(trades) * 100.0;
            m.total_pnl = total_pnl(trades);
            m.avg_win = average_win(trades);
            m.avg_loss = average_loss(trades);
            m.profit_factor = profit_factor(trades);
            m.sharpe_ratio = sharpe_like_ratio(pnls);
            m.max_drawdown = max_drawdown_amount(pnls);
            m.expectancy = expectancy(trades);
            return m;
        }

        ComparisonTable StrategyComparator::compare_all() const
        {
            if (records_.empty())
            {
                throw EmptyRegistry("No strategies registered for comparison");
            }

            std::vector<StrategyMetrics> rows;
            rows.reserve(records_.size());
            for (std::size_t i = 0; i < records_.size(); ++i)
            {
                StrategyMetrics m = calculate_metrics(records_[i].name, records_[i].trades);
                m.registration_index = static_cast<int>(i);
                rows.push_back(std::move(m));
            }
            return ComparisonTable(std::move(rows));
        }

        ComparisonTable StrategyComparator::rank_by(ComparisonColumn column, bool descending) const
        {
            return compare_all().sorted_by(column, descending);
        }

        StatisticalTestResult StrategyComparator::run_statistical_test(const std::string &strategy1,
                                                                       const std::string &strategy2) const
        {
            std::vector<double> a = extract_pnl(record(strategy1).trades);
            std::vector<double> b = extract_pnl(record(strategy2).trades);

            TTestResult t = welch_t_test(a, b);

            StatisticalTestResult result;
            result.strategy1 = strategy1;
            result.strategy2 = strategy2;
            result.mean_pnl_1 = mean(a);
            result.mean_pnl_2 = mean(b);
            result.t_statistic = t.t_statistic;
            result.degrees_of_freedom = t.degrees_of_freedom;
            result.p_value = t.p_value;
            result.is_significant = t.p_value < 0.05;
            result.cohens_d = cohens_d(a, b);
            result.better_strategy = result.mean_pnl_2 > result.mean_pnl_1 ? strategy2 : strategy1;
            result.confidence = result.is_significant ? (1.0 - t.p_value) * 100.0 : 0.0;
            return result;
        }

        std::string StrategyComparator::generate_comparison_report(ComparisonColumn rank_column) const
        {
            ComparisonTable table = compare_all();
            return report::format_comparison_report(table, rank_column);
        }

        bool StrategyComparator::contains(const std::string &name) const
        {
            return index_.count(name) > 0;
        }

        std::vector<std::string> StrategyComparator::strategy_names() const
        {
            std::vector<std::string> names;
            names.reserve(records_.size());
            for (const auto &r : records_)
            {
                names.push_back(r.name);
            }
            return names;
        }

        nlohmann::json StrategyComparator::to_json() const
        {
            if (records_.empty())
            {
                return nlohmann::json::array();
            }
            return compare_all().to_json();
        }

        const data::TradeList &StrategyComparator::trades(const std::string &name) const
        {
            return record(name).trades;
        }

        const StrategyRecord &StrategyComparator::record(const std::string &name) const
        {
            auto it = index_.find(name);
            if (it == index_.end())
            {
                throw UnknownStrategy("Strategy '" + name + "' is not registered");
            }
            return records_[it->second];
        }

    } // namespace analytics
} // namespace tradelab
