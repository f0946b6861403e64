/**
 * @file test_trade.cpp
 * @brief Unit tests for the Trade value type and timestamp helpers
 */

#include <catch2/catch_test_macros.hpp>
#include "data/trade.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

using namespace tradelab::data;

TEST_CASE("Trade construction", "[Trade]") {
    Timestamp entry = make_timestamp(2024, 1, 2, 9, 30);
    Timestamp exit = make_timestamp(2024, 1, 2, 10, 15);

    SECTION("Valid trade") {
        Trade t(entry, exit, "AAPL", 125.5, "ema_cross");
        REQUIRE(t.symbol() == "AAPL");
        REQUIRE(t.pnl() == 125.5);
        REQUIRE(t.strategy() == "ema_cross");
        REQUIRE(t.is_winner());
        REQUIRE(t.holding_seconds() == 45 * 60);
    }

    SECTION("Zero pnl is not a winner") {
        Trade t(entry, exit, "AAPL", 0.0);
        REQUIRE_FALSE(t.is_winner());
        REQUIRE(t.strategy().empty());
    }

    SECTION("Exit before entry is rejected") {
        REQUIRE_THROWS_AS(Trade(exit, entry, "AAPL", 1.0), std::invalid_argument);
    }

    SECTION("Non-finite pnl is rejected") {
        REQUIRE_THROWS_AS(Trade(entry, exit, "AAPL", std::numeric_limits<double>::quiet_NaN()),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(Trade(entry, exit, "AAPL", std::numeric_limits<double>::infinity()),
                          std::invalid_argument);
    }

    SECTION("Empty symbol is rejected") {
        REQUIRE_THROWS_AS(Trade(entry, exit, "", 1.0), std::invalid_argument);
    }

    SECTION("Scaled copy") {
        Trade t(entry, exit, "AAPL", 100.0, "a");
        Trade s = t.scaled(1.2);
        REQUIRE(std::abs(s.pnl() - 120.0) < 1e-12);
        REQUIRE(s.symbol() == "AAPL");
        REQUIRE(s.entry_time() == t.entry_time());
    }
}

TEST_CASE("Timestamp parsing and calendar fields", "[Trade][Timestamp]") {
    SECTION("Space and T separators agree") {
        REQUIRE(parse_timestamp("2024-03-15 14:05:09") == parse_timestamp("2024-03-15T14:05:09"));
    }

    SECTION("Seconds and time are optional") {
        REQUIRE(parse_timestamp("2024-03-15 14:05") == make_timestamp(2024, 3, 15, 14, 5, 0));
        REQUIRE(parse_timestamp("2024-03-15") == make_timestamp(2024, 3, 15));
    }

    SECTION("Format round trip") {
        Timestamp ts = make_timestamp(2023, 12, 31, 23, 59, 58);
        REQUIRE(format_timestamp(ts) == "2023-12-31 23:59:58");
        REQUIRE(parse_timestamp(format_timestamp(ts)) == ts);
    }

    SECTION("Hour, minute and weekday") {
        // 2024-01-01 was a Monday
        Timestamp ts = make_timestamp(2024, 1, 1, 9, 45);
        REQUIRE(hour_of_day(ts) == 9);
        REQUIRE(minute_of_hour(ts) == 45);
        REQUIRE(day_of_week(ts) == 0);
        REQUIRE(day_of_week(make_timestamp(2024, 1, 7)) == 6);
        REQUIRE(day_of_week(make_timestamp(1970, 1, 1)) == 3);
        REQUIRE(weekday_name(0) == "Monday");
        REQUIRE(weekday_name(6) == "Sunday");
    }

    SECTION("Leap day") {
        REQUIRE_NOTHROW(make_timestamp(2024, 2, 29));
        REQUIRE_THROWS_AS(make_timestamp(2023, 2, 29), std::invalid_argument);
    }

    SECTION("Malformed input") {
        REQUIRE_THROWS_AS(parse_timestamp(""), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_timestamp("2024/01/02"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_timestamp("2024-13-01"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_timestamp("2024-01-02 25:00"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_timestamp("not a date"), std::invalid_argument);
    }
}
