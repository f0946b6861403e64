/**
 * @file report_formatter.hpp
 * @brief Plain-text rendering of simulation, comparison and time-of-day results.
 *
 * Every report starts and ends with an 80-character '=' rule below/above an
 * upper-case title. Currency amounts and percentages use two decimals.
 * The functions are pure: they only read their arguments.
 */

#ifndef TRADELAB_REPORT_REPORT_FORMATTER_HPP
#define TRADELAB_REPORT_REPORT_FORMATTER_HPP

#include "analytics/strategy_comparator.hpp"
#include "analytics/time_of_day_analyzer.hpp"
#include "simulation/simulation_run.hpp"

#include <string>

namespace tradelab
{
    namespace report
    {

        /// Width of the '=' and '-' rules.
        constexpr int RULE_WIDTH = 80;

        /**
         * @brief Fixed-point rendering with "inf" / "-inf" / "nan" for
         *        non-finite values.
         */
        std::string format_number(double value, int decimals = 2);

        /** @brief Simulation statistics: outcomes, probabilities, percentiles, drawdown. */
        std::string format_simulation_report(const simulation::StatisticsSnapshot &stats,
                                             const std::string &title);

        /**
         * @brief Per-strategy metric blocks, the ranking by rank_column, and the
         *        leaders by total pnl and by Sharpe-like ratio.
         */
        std::string format_comparison_report(const analytics::ComparisonTable &table,
                                             analytics::ComparisonColumn rank_column);

        std::string format_statistical_test(const analytics::StatisticalTestResult &result);

        /** @brief Hourly and weekday tables plus best/worst hours and best bucket. */
        std::string format_time_of_day_report(const analytics::TimeOfDayAnalyzer &analyzer);

    } // namespace report
} // namespace tradelab

#endif // TRADELAB_REPORT_REPORT_FORMATTER_HPP
