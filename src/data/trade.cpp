/**
 * @file trade.cpp
 * @brief Implementation of Trade and the UTC timestamp helpers.
 */

#include "data/trade.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace tradelab
{
    namespace data
    {

        namespace
        {

            constexpr long long SECONDS_PER_DAY = 86400;

            /**
             * @brief Days since 1970-01-01 for a proleptic Gregorian date.
             *
             * Howard Hinnant's days_from_civil algorithm.
             */
            long long days_from_civil(int y, int m, int d)
            {
                y -= m <= 2 ? 1 : 0;
                const long long era = (y >= 0 ? y : y - 399) / 400;
                const long long yoe = y - era * 400;
                const long long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
                const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
                return era * 146097 + doe - 719468;
            }

            void civil_from_days(long long z, int &y, int &m, int &d)
            {
                z += 719468;
                const long long era = (z >= 0 ? z : z - 146096) / 146097;
                const long long doe = z - era * 146097;
                const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
                const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
                const long long mp = (5 * doy + 2) / 153;
                d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
                m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
                y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
            }

            bool is_leap(int y)
            {
                return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
            }

            int days_in_month(int y, int m)
            {
                static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
                if (m == 2 && is_leap(y))
                {
                    return 29;
                }
                return DAYS[m - 1];
            }

            long long epoch_seconds(Timestamp ts)
            {
                return std::chrono::duration_cast<std::chrono::seconds>(
                           ts.time_since_epoch())
                    .count();
            }

            /// Seconds since midnight, non-negative for pre-1970 times too.
            long long seconds_of_day(Timestamp ts)
            {
                long long s = epoch_seconds(ts) % SECONDS_PER_DAY;
                return s < 0 ? s + SECONDS_PER_DAY : s;
            }

            long long epoch_days(Timestamp ts)
            {
                long long s = epoch_seconds(ts);
                long long days = s / SECONDS_PER_DAY;
                if (s % SECONDS_PER_DAY < 0)
                {
                    --days;
                }
                return days;
            }

            int parse_field(const std::string &text, size_t pos, size_t len)
            {
                if (pos + len > text.size())
                {
                    throw std::invalid_argument("Timestamp too short: '" + text + "'");
                }
                int value = 0;
                for (size_t i = pos; i < pos + len; ++i)
                {
                    if (!std::isdigit(static_cast<unsigned char>(text[i])))
                    {
                        throw std::invalid_argument("Non-digit in timestamp: '" + text + "'");
                    }
                    value = value * 10 + (text[i] - '0');
                }
                return value;
            }

            void expect_char(const std::string &text, size_t pos, char c)
            {
                if (pos >= text.size() || text[pos] != c)
                {
                    throw std::invalid_argument("Malformed timestamp: '" + text + "'");
                }
            }

        } // anonymous namespace

        // ===================================================================
        // Trade
        // ===================================================================

        Trade::Trade(Timestamp entry_time,
                     Timestamp exit_time,
                     std::string symbol,
                     double pnl,
                     std::string strategy)
            : entry_time_(entry_time), exit_time_(exit_time), symbol_(std::move(symbol)), pnl_(pnl), strategy_(std::move(strategy))
        {
            if (exit_time_ < entry_time_)
            {
                throw std::invalid_argument(
                    "Trade exit time (" + format_timestamp(exit_time_) + ") precedes entry time (" + format_timestamp(entry_time_) + ")");
            }
            if (!std::isfinite(pnl_))
            {
                throw std::invalid_argument("Trade pnl must be finite");
            }
            if (symbol_.empty())
            {
                throw std::invalid_argument("Trade symbol cannot be empty");
            }
        }

        long long Trade::holding_seconds() const
        {
            return std::chrono::duration_cast<std::chrono::seconds>(exit_time_ - entry_time_).count();
        }

        Trade Trade::scaled(double factor) const
        {
            return Trade(entry_time_, exit_time_, symbol_, pnl_ * factor, strategy_);
        }

        // ===================================================================
        // Timestamp helpers
        // ===================================================================

        Timestamp make_timestamp(int year, int month, int day,
                                 int hour, int minute, int second)
        {
            if (month < 1 || month > 12)
            {
                throw std::invalid_argument("Month out of range: " + std::to_string(month));
            }
            if (day < 1 || day > days_in_month(year, month))
            {
                throw std::invalid_argument("Day out of range: " + std::to_string(day));
            }
            if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59)
            {
                throw std::invalid_argument(
                    "Time of day out of range: " + std::to_string(hour) + ":" + std::to_string(minute) + ":" + std::to_string(second));
            }

            long long secs = days_from_civil(year, month, day) * SECONDS_PER_DAY + hour * 3600LL + minute * 60LL + second;
            return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::seconds(secs)));
        }

        Timestamp parse_timestamp(const std::string &raw)
        {
            // Trim surrounding whitespace
            size_t first = raw.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
            {
                throw std::invalid_argument("Empty timestamp");
            }
            size_t last = raw.find_last_not_of(" \t\r\n");
            std::string text = raw.substr(first, last - first + 1);

            // YYYY-MM-DD
            int year = parse_field(text, 0, 4);
            expect_char(text, 4, '-');
            int month = parse_field(text, 5, 2);
            expect_char(text, 7, '-');
            int day = parse_field(text, 8, 2);

            int hour = 0;
            int minute = 0;
            int second = 0;

            if (text.size() > 10)
            {
                if (text[10] != ' ' && text[10] != 'T')
                {
                    throw std::invalid_argument("Malformed timestamp: '" + text + "'");
                }
                hour = parse_field(text, 11, 2);
                expect_char(text, 13, ':');
                minute = parse_field(text, 14, 2);
                if (text.size() > 16)
                {
                    expect_char(text, 16, ':');
                    second = parse_field(text, 17, 2);
                    if (text.size() != 19)
                    {
                        throw std::invalid_argument("Trailing characters in timestamp: '" + text + "'");
                    }
                }
            }

            return make_timestamp(year, month, day, hour, minute, second);
        }

        std::string format_timestamp(Timestamp ts)
        {
            int y = 0;
            int m = 0;
            int d = 0;
            civil_from_days(epoch_days(ts), y, m, d);
            long long sod = seconds_of_day(ts);

            char buffer[32];
            std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d",
                          y, m, d,
                          static_cast<int>(sod / 3600),
                          static_cast<int>((sod % 3600) / 60),
                          static_cast<int>(sod % 60));
            return std::string(buffer);
        }

        int hour_of_day(Timestamp ts)
        {
            return static_cast<int>(seconds_of_day(ts) / 3600);
        }

        int minute_of_hour(Timestamp ts)
        {
            return static_cast<int>((seconds_of_day(ts) % 3600) / 60);
        }

        int day_of_week(Timestamp ts)
        {
            // 1970-01-01 was a Thursday (3 with Monday = 0)
            long long wd = (epoch_days(ts) + 3) % 7;
            return static_cast<int>(wd < 0 ? wd + 7 : wd);
        }

        std::string weekday_name(int day)
        {
            static const char *NAMES[] = {"Monday", "Tuesday", "Wednesday", "Thursday",
                                          "Friday", "Saturday", "Sunday"};
            if (day < 0 || day > 6)
            {
                throw std::invalid_argument("Weekday out of range: " + std::to_string(day));
            }
            return NAMES[day];
        }

    } // namespace data
} // namespace tradelab
