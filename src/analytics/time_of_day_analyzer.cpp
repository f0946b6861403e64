/**
 * @file time_of_day_analyzer.cpp
 * @brief Implementation of TimeOfDayAnalyzer.
 */

#include "analytics/time_of_day_analyzer.hpp"
#include "core/errors.hpp"
#include "report/report_formatter.hpp"

#include <algorithm>
#include <cstdio>
#include <tuple>

namespace tradelab
{
    namespace analytics
    {

        void TimeOfDayConfig::validate() const
        {
            if (bucket_minutes != 60 && bucket_minutes != 30)
            {
                throw InvalidConfiguration(
                    "bucket_minutes must be 60 or 30, got: " + std::to_string(bucket_minutes));
            }
            if (min_bucket_trades < 1)
            {
                throw InvalidConfiguration(
                    "Expected positive value for parameter 'min_bucket_trades', got: " + std::to_string(min_bucket_trades));
            }
            if (top_n < 1)
            {
                throw InvalidConfiguration(
                    "Expected positive value for parameter 'top_n', got: " + std::to_string(top_n));
            }
        }

        TimeOfDayConfig TimeOfDayConfig::from_json(const nlohmann::json &j)
        {
            TimeOfDayConfig config;
            if (j.contains("bucket_minutes"))
                config.bucket_minutes = j.at("bucket_minutes").get<int>();
            if (j.contains("min_bucket_trades"))
                config.min_bucket_trades = j.at("min_bucket_trades").get<int>();
            if (j.contains("top_n"))
                config.top_n = j.at("top_n").get<int>();
            config.validate();
            return config;
        }

        bool BucketKey::operator<(const BucketKey &other) const
        {
            return std::tie(weekday, hour, slot) < std::tie(other.weekday, other.hour, other.slot);
        }

        bool BucketKey::operator==(const BucketKey &other) const
        {
            return weekday == other.weekday && hour == other.hour && slot == other.slot;
        }

        std::string BucketKey::time_label(int bucket_minutes) const
        {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "%02d:%02d", hour, slot * bucket_minutes);
            return buf;
        }

        void BucketStats::add(double pnl)
        {
            ++trade_count;
            if (pnl > 0.0)
            {
                ++winning_trades;
            }
            total_pnl += pnl;
            mean_pnl = total_pnl / trade_count;
            win_rate = 100.0 * winning_trades / trade_count;
        }

        namespace
        {
            /// Merge b into a; mean and win rate are recomputed from the sums.
            void merge(BucketStats &a, const BucketStats &b)
            {
                a.trade_count += b.trade_count;
                a.winning_trades += b.winning_trades;
                a.total_pnl += b.total_pnl;
                if (a.trade_count > 0)
                {
                    a.mean_pnl = a.total_pnl / a.trade_count;
                    a.win_rate = 100.0 * a.winning_trades / a.trade_count;
                }
            }

            nlohmann::json stats_json(const BucketStats &s)
            {
                return {{"trade_count", s.trade_count},
                        {"win_rate", s.win_rate},
                        {"total_pnl", s.total_pnl},
                        {"mean_pnl", s.mean_pnl}};
            }
        } // anonymous namespace

        TimeOfDayAnalyzer::TimeOfDayAnalyzer(const data::TradeList &trades,
                                             const TimeOfDayConfig &config)
            : config_(config)
        {
            config_.validate();

            for (const auto &trade : trades)
            {
                BucketKey key;
                key.hour = data::hour_of_day(trade.entry_time());
                key.slot = data::minute_of_hour(trade.entry_time()) / config_.bucket_minutes;
                key.weekday = data::day_of_week(trade.entry_time());
                cells_[key].add(trade.pnl());
                ++total_trades_;
            }
        }

        std::vector<TimeBucket> TimeOfDayAnalyzer::buckets() const
        {
            std::vector<TimeBucket> out;
            out.reserve(cells_.size());
            for (const auto &cell : cells_)
            {
                out.push_back({cell.first, cell.second});
            }
            return out;
        }

        std::vector<HourStats> TimeOfDayAnalyzer::analyze_by_hour() const
        {
            std::map<int, BucketStats> by_hour;
            for (const auto &cell : cells_)
            {
                merge(by_hour[cell.first.hour], cell.second);
            }

            std::vector<HourStats> out;
            for (const auto &h : by_hour)
            {
                out.push_back({h.first, h.second});
            }
            return out;
        }

        std::vector<DayStats> TimeOfDayAnalyzer::analyze_by_day() const
        {
            std::map<int, BucketStats> by_day;
            for (const auto &cell : cells_)
            {
                merge(by_day[cell.first.weekday], cell.second);
            }

            std::vector<DayStats> out;
            for (const auto &d : by_day)
            {
                out.push_back({d.first, d.second});
            }
            return out;
        }

        TimeBucket TimeOfDayAnalyzer::find_best_trading_times() const
        {
            const TimeBucket *best = nullptr;
            std::vector<TimeBucket> all = buckets();
            for (const auto &b : all)
            {
                if (b.stats.trade_count < config_.min_bucket_trades)
                {
                    continue;
                }
                if (best == nullptr || b.stats.total_pnl > best->stats.total_pnl)
                {
                    best = &b;
                }
            }

            if (best == nullptr)
            {
                throw InsufficientData(
                    "No time bucket has at least " + std::to_string(config_.min_bucket_trades) + " trades");
            }
            return *best;
        }

        std::vector<HourStats> TimeOfDayAnalyzer::qualifying_hours() const
        {
            std::vector<HourStats> hours = analyze_by_hour();
            hours.erase(std::remove_if(hours.begin(), hours.end(),
                                       [this](const HourStats &h)
                                       { return h.stats.trade_count < config_.min_bucket_trades; }),
                        hours.end());
            return hours;
        }

        std::vector<int> TimeOfDayAnalyzer::get_best_hours(int top_n) const
        {
            std::vector<HourStats> hours = qualifying_hours();
            std::stable_sort(hours.begin(), hours.end(), [](const HourStats &a, const HourStats &b)
                             { return a.stats.mean_pnl > b.stats.mean_pnl; });

            std::vector<int> out;
            for (int i = 0; i < top_n && i < static_cast<int>(hours.size()); ++i)
            {
                out.push_back(hours[i].hour);
            }
            return out;
        }

        std::vector<int> TimeOfDayAnalyzer::get_worst_hours(int top_n) const
        {
            std::vector<HourStats> hours = qualifying_hours();
            std::stable_sort(hours.begin(), hours.end(), [](const HourStats &a, const HourStats &b)
                             { return a.stats.mean_pnl < b.stats.mean_pnl; });

            std::vector<int> out;
            for (int i = 0; i < top_n && i < static_cast<int>(hours.size()); ++i)
            {
                out.push_back(hours[i].hour);
            }
            return out;
        }

        std::string TimeOfDayAnalyzer::generate_report() const
        {
            return report::format_time_of_day_report(*this);
        }

        nlohmann::json TimeOfDayAnalyzer::to_json() const
        {
            nlohmann::json j;
            j["bucket_minutes"] = config_.bucket_minutes;
            j["min_bucket_trades"] = config_.min_bucket_trades;
            j["total_trades"] = total_trades_;

            nlohmann::json cells = nlohmann::json::array();
            for (const auto &cell : cells_)
            {
                nlohmann::json c = stats_json(cell.second);
                c["weekday"] = data::weekday_name(cell.first.weekday);
                c["time"] = cell.first.time_label(config_.bucket_minutes);
                cells.push_back(c);
            }
            j["buckets"] = cells;

            nlohmann::json hours = nlohmann::json::array();
            for (const auto &h : analyze_by_hour())
            {
                nlohmann::json c = stats_json(h.stats);
                c["hour"] = h.hour;
                hours.push_back(c);
            }
            j["by_hour"] = hours;

            nlohmann::json days = nlohmann::json::array();
            for (const auto &d : analyze_by_day())
            {
                nlohmann::json c = stats_json(d.stats);
                c["weekday"] = data::weekday_name(d.weekday);
                days.push_back(c);
            }
            j["by_day"] = days;

            j["best_hours"] = get_best_hours(config_.top_n);
            j["worst_hours"] = get_worst_hours(config_.top_n);

            try
            {
                TimeBucket best = find_best_trading_times();
                j["best_bucket"] = {{"weekday", data::weekday_name(best.key.weekday)},
                                    {"time", best.key.time_label(config_.bucket_minutes)},
                                    {"total_pnl", best.stats.total_pnl},
                                    {"trade_count", best.stats.trade_count}};
            }
            catch (const InsufficientData &)
            {
                j["best_bucket"] = nullptr;
            }
            return j;
        }

    } // namespace analytics
} // namespace tradelab
