/**
 * @file strategy_comparator.hpp
 * @brief Side-by-side comparison and ranking of named trade collections.
 *
 * A StrategyComparator owns a registry of strategies keyed by unique name.
 * compare_all() computes one metric row per strategy through the shared
 * metric primitives; rows can be ranked by any numeric column with a
 * stable sort, so ties keep registration order.
 */

#ifndef TRADELAB_ANALYTICS_STRATEGY_COMPARATOR_HPP
#define TRADELAB_ANALYTICS_STRATEGY_COMPARATOR_HPP

#include "data/trade.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace tradelab
{
    namespace analytics
    {

        /**
         * @enum ComparisonColumn
         * @brief Numeric columns of a ComparisonTable.
         */
        enum class ComparisonColumn
        {
            TOTAL_TRADES,
            WIN_RATE,
            TOTAL_PNL,
            SHARPE_RATIO,
            PROFIT_FACTOR,
            EXPECTANCY,
            AVG_WIN,
            AVG_LOSS,
            MAX_DRAWDOWN
        };

        /**
         * @brief Parse a column name such as "total_pnl" or "sharpe_ratio".
         * @throws InvalidConfiguration On an unknown name.
         */
        ComparisonColumn parse_comparison_column(const std::string &name);

        /** @brief Canonical snake_case name of a column. */
        std::string column_name(ComparisonColumn column);

        /**
         * @struct StrategyMetrics
         * @brief One row of a ComparisonTable.
         */
        struct StrategyMetrics
        {
            std::string name;
            int registration_index = 0; ///< Order in which the strategy was added

            int total_trades = 0;
            int winning_trades = 0;
            int losing_trades = 0;
            double win_rate = 0.0;      ///< Percentage of winning trades
            double total_pnl = 0.0;
            double avg_win = 0.0;
            double avg_loss = 0.0;      ///< Positive magnitude
            double profit_factor = 0.0; ///< +inf when there are no losers
            double sharpe_ratio = 0.0;  ///< Mean pnl / sample std of pnl
            double max_drawdown = 0.0;  ///< Largest decline of cumulative pnl
            double expectancy = 0.0;

            /** @brief Value of a column for sorting. */
            double value(ComparisonColumn column) const;
        };

        /**
         * @class ComparisonTable
         * @brief Ordered per-strategy metric rows.
         *
         * Derived data; regenerate it rather than caching it.
         */
        class ComparisonTable
        {
        public:
            explicit ComparisonTable(std::vector<StrategyMetrics> rows);

            const std::vector<StrategyMetrics> &rows() const { return rows_; }
            int size() const { return static_cast<int>(rows_.size()); }
            bool empty() const { return rows_.empty(); }

            /**
             * @brief Copy sorted by a column; ties fall back to registration order.
             * @param column Column to sort by.
             * @param descending Largest first when true (default).
             */
            ComparisonTable sorted_by(ComparisonColumn column, bool descending = true) const;

            /**
             * @brief Row with the largest value in a column (earliest registered on ties).
             * @throws EmptyRegistry If the table has no rows.
             */
            const StrategyMetrics &top_by(ComparisonColumn column) const;

            /**
             * @brief Row for a strategy name.
             * @throws UnknownStrategy If no row has that name.
             */
            const StrategyMetrics &row(const std::string &name) const;

            /** @brief Names in current row order. */
            std::vector<std::string> names() const;

            /** @brief Array of row objects in current order. */
            nlohmann::json to_json() const;

        private:
            std::vector<StrategyMetrics> rows_;
        };

        /**
         * @struct StatisticalTestResult
         * @brief Welch t-test comparison of two strategies' pnl.
         */
        struct StatisticalTestResult
        {
            std::string strategy1;
            std::string strategy2;
            double mean_pnl_1 = 0.0;
            double mean_pnl_2 = 0.0;
            double t_statistic = 0.0;
            double degrees_of_freedom = 0.0;
            double p_value = 1.0;
            bool is_significant = false; ///< p < 0.05
            double cohens_d = 0.0;
            std::string better_strategy; ///< Higher mean pnl (strategy1 on ties)
            double confidence = 0.0;     ///< (1 - p) * 100 when significant, else 0

            nlohmann::json to_json() const;
        };

        /**
         * @struct StrategyRecord
         * @brief A registered strategy and its trades.
         */
        struct StrategyRecord
        {
            std::string name;
            data::TradeList trades;
        };

        /**
         * @struct ComparisonConfig
         * @brief Presentation settings for the comparison report.
         */
        struct ComparisonConfig
        {
            ComparisonColumn rank_by = ComparisonColumn::SHARPE_RATIO;

            static ComparisonConfig from_json(const nlohmann::json &j);
        };

        /**
         * @class StrategyComparator
         * @brief Registry of named strategies with comparison and ranking.
         *
         * Usage:
         * @code
         *   StrategyComparator cmp;
         *   cmp.add_strategy("ema_cross", ema_trades);
         *   cmp.add_strategy("rsi_reversal", rsi_trades);
         *   auto ranked = cmp.rank_by(ComparisonColumn::TOTAL_PNL);
         *   std::cout << cmp.generate_comparison_report();
         * @endcode
         */
        class StrategyComparator
        {
        public:
            StrategyComparator() = default;

            /**
             * @brief Register a strategy.
             * @throws std::invalid_argument If name is empty.
             * @throws DuplicateName If name is already registered.
             * @throws InsufficientData If trades is empty.
             */
            void add_strategy(const std::string &name, data::TradeList trades);

            /**
             * @brief One metric row per strategy, in registration order.
             * @throws EmptyRegistry If no strategy has been added.
             */
            ComparisonTable compare_all() const;

            /**
             * @brief compare_all() sorted by a column.
             * @throws EmptyRegistry If no strategy has been added.
             */
            ComparisonTable rank_by(ComparisonColumn column, bool descending = true) const;

            /**
             * @brief Welch t-test on the pnl of two registered strategies.
             * @throws UnknownStrategy If either name is not registered.
             * @throws InsufficientData If either has fewer than 2 trades.
             */
            StatisticalTestResult run_statistical_test(const std::string &strategy1,
                                                       const std::string &strategy2) const;

            /**
             * @brief Text summary with per-strategy metrics, the ranking, and
             *        the leaders by total pnl and by risk-adjusted ratio.
             * @throws EmptyRegistry If no strategy has been added.
             */
            std::string generate_comparison_report(
                ComparisonColumn rank_column = ComparisonColumn::SHARPE_RATIO) const;

            /** @brief Compute a metric row for one trade collection. */
            static StrategyMetrics calculate_metrics(const std::string &name,
                                                     const data::TradeList &trades);

            bool contains(const std::string &name) const;
            int size() const { return static_cast<int>(records_.size()); }
            std::vector<std::string> strategy_names() const;

            /** @brief Metric rows in registration order; empty array with no strategies. */
            nlohmann::json to_json() const;

            /**
             * @brief Registered trades for a strategy.
             * @throws UnknownStrategy If name is not registered.
             */
            const data::TradeList &trades(const std::string &name) const;

        private:
            const StrategyRecord &record(const std::string &name) const;

            std::vector<StrategyRecord> records_;
            std::map<std::string, std::size_t> index_;
        };

    } // namespace analytics
} // namespace tradelab

#endif // TRADELAB_ANALYTICS_STRATEGY_COMPARATOR_HPP
