/**
 * @file time_of_day_analyzer.hpp
 * @brief Trade performance bucketed by entry hour and weekday.
 *
 * Each trade is assigned to the (hour, slot, weekday) cell of its entry
 * time. With 60-minute buckets slot is always 0; with 30-minute buckets
 * slot 1 covers minutes 30-59. Cells without trades are never materialized.
 */

#ifndef TRADELAB_ANALYTICS_TIME_OF_DAY_ANALYZER_HPP
#define TRADELAB_ANALYTICS_TIME_OF_DAY_ANALYZER_HPP

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
         * @struct TimeOfDayConfig
         * @brief Bucketing parameters.
         */
        struct TimeOfDayConfig
        {
            int bucket_minutes = 60;   ///< 60 (hourly) or 30 (half-hourly)
            int min_bucket_trades = 5; ///< Trades a bucket needs to be ranked
            int top_n = 3;             ///< Hours listed in best/worst sections of the report

            /** @throws InvalidConfiguration On the first invalid field. */
            void validate() const;

            static TimeOfDayConfig from_json(const nlohmann::json &j);
        };

        /**
         * @struct BucketKey
         * @brief Cell coordinates; weekday 0 = Monday.
         */
        struct BucketKey
        {
            int hour = 0;
            int slot = 0;
            int weekday = 0;

            bool operator<(const BucketKey &other) const;
            bool operator==(const BucketKey &other) const;

            /** @brief Start of the slot as "HH:MM". */
            std::string time_label(int bucket_minutes) const;
        };

        /**
         * @struct BucketStats
         * @brief Aggregates of the trades in one cell.
         */
        struct BucketStats
        {
            int trade_count = 0;
            int winning_trades = 0;
            double win_rate = 0.0; ///< Percentage
            double total_pnl = 0.0;
            double mean_pnl = 0.0;

            void add(double pnl);
        };

        struct TimeBucket
        {
            BucketKey key;
            BucketStats stats;
        };

        struct HourStats
        {
            int hour = 0;
            BucketStats stats;
        };

        struct DayStats
        {
            int weekday = 0;
            BucketStats stats;
        };

        /**
         * @class TimeOfDayAnalyzer
         * @brief Buckets a trade collection once and answers queries on it.
         *
         * Usage:
         * @code
         *   TimeOfDayAnalyzer analyzer(trades);
         *   TimeBucket best = analyzer.find_best_trading_times();
         *   std::cout << analyzer.generate_report();
         * @endcode
         */
        class TimeOfDayAnalyzer
        {
        public:
            /**
             * @brief Bucket trades by entry time.
             * @throws InvalidConfiguration If config is invalid.
             */
            explicit TimeOfDayAnalyzer(const data::TradeList &trades,
                                       const TimeOfDayConfig &config = TimeOfDayConfig());

            /** @brief Non-empty cells ordered by weekday, hour, slot. */
            std::vector<TimeBucket> buckets() const;

            /** @brief Per-hour aggregates across all weekdays, ascending hour. */
            std::vector<HourStats> analyze_by_hour() const;

            /** @brief Per-weekday aggregates across all hours, Monday first. */
            std::vector<DayStats> analyze_by_day() const;

            /**
             * @brief Cell with the highest total pnl among cells holding at
             *        least min_bucket_trades trades.
             *
             * Ties go to the earliest cell in buckets() order.
             *
             * @throws InsufficientData If no cell meets the threshold.
             */
            TimeBucket find_best_trading_times() const;

            /** @brief Up to top_n qualifying hours, highest mean pnl first. */
            std::vector<int> get_best_hours(int top_n) const;

            /** @brief Up to top_n qualifying hours, lowest mean pnl first. */
            std::vector<int> get_worst_hours(int top_n) const;

            std::string generate_report() const;
            nlohmann::json to_json() const;

            const TimeOfDayConfig &config() const { return config_; }
            int total_trades() const { return total_trades_; }

        private:
            std::vector<HourStats> qualifying_hours() const;

            TimeOfDayConfig config_;
            std::map<BucketKey, BucketStats> cells_;
            int total_trades_ = 0;
        };

    } // namespace analytics
} // namespace tradelab

#endif // TRADELAB_ANALYTICS_TIME_OF_DAY_ANALYZER_HPP
