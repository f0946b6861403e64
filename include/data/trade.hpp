/**
 * @file trade.hpp
 * @brief Closed-trade value type and timestamp helpers.
 *
 * A Trade is validated once at construction and is immutable afterwards.
 * Timestamps are UTC system_clock time points; calendar fields are derived
 * without consulting the local time zone.
 */

#ifndef TRADELAB_DATA_TRADE_HPP
#define TRADELAB_DATA_TRADE_HPP

#include <chrono>
#include <string>
#include <vector>

namespace tradelab
{
    namespace data
    {

        using Timestamp = std::chrono::system_clock::time_point;

        /// Ordered per-period fractional returns (0.01 = +1%).
        using ReturnSeries = std::vector<double>;

        /**
         * @class Trade
         * @brief A single closed trade.
         *
         * Invariants checked by the constructor:
         * - entry_time <= exit_time
         * - pnl is finite
         * - symbol is non-empty
         *
         * The strategy label may be empty (untagged trade).
         */
        class Trade
        {
        public:
            /**
             * @brief Construct a validated trade.
             * @param entry_time Time the position was opened (UTC).
             * @param exit_time Time the position was closed (UTC).
             * @param symbol Instrument symbol.
             * @param pnl Realized profit or loss in account currency.
             * @param strategy Strategy label.
             * @throws std::invalid_argument If any invariant is violated.
             */
            Trade(Timestamp entry_time,
                  Timestamp exit_time,
                  std::string symbol,
                  double pnl,
                  std::string strategy = "");

            Timestamp entry_time() const { return entry_time_; }
            Timestamp exit_time() const { return exit_time_; }
            const std::string &symbol() const { return symbol_; }
            double pnl() const { return pnl_; }
            const std::string &strategy() const { return strategy_; }

            /** @brief True when pnl > 0. */
            bool is_winner() const { return pnl_ > 0.0; }

            /** @brief Holding period in seconds. */
            long long holding_seconds() const;

            /**
             * @brief Copy of this trade with pnl multiplied by factor.
             * @throws std::invalid_argument If the scaled pnl is not finite.
             */
            Trade scaled(double factor) const;

        private:
            Timestamp entry_time_;
            Timestamp exit_time_;
            std::string symbol_;
            double pnl_;
            std::string strategy_;
        };

        using TradeList = std::vector<Trade>;

        // ===================================================================
        // Timestamp helpers
        // ===================================================================

        /**
         * @brief Parse a UTC timestamp.
         *
         * Accepted forms: "YYYY-MM-DD", "YYYY-MM-DD HH:MM", "YYYY-MM-DD HH:MM:SS",
         * with 'T' also accepted as the date/time separator.
         *
         * @throws std::invalid_argument On malformed or out-of-range fields.
         */
        Timestamp parse_timestamp(const std::string &text);

        /**
         * @brief Build a timestamp from calendar fields (UTC).
         * @throws std::invalid_argument On out-of-range fields.
         */
        Timestamp make_timestamp(int year, int month, int day,
                                 int hour = 0, int minute = 0, int second = 0);

        /** @brief Format as "YYYY-MM-DD HH:MM:SS". */
        std::string format_timestamp(Timestamp ts);

        /** @brief Hour of day, 0-23. */
        int hour_of_day(Timestamp ts);

        /** @brief Minute of hour, 0-59. */
        int minute_of_hour(Timestamp ts);

        /** @brief Day of week, 0 = Monday .. 6 = Sunday. */
        int day_of_week(Timestamp ts);

        /** @brief English weekday name for 0 = Monday .. 6 = Sunday. */
        std::string weekday_name(int day);

    } // namespace data
} // namespace tradelab

#endif // TRADELAB_DATA_TRADE_HPP
