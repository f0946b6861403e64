/**
 * @file test_trade_metrics.cpp
 * @brief Unit tests for the trade and series metric functions
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/trade_metrics.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <limits>

using namespace tradelab;
using namespace tradelab::analytics;
using Catch::Matchers::WithinAbs;

namespace {

data::TradeList trades_with_pnl(const std::vector<double>& pnls) {
    data::TradeList trades;
    data::Timestamp t = data::make_timestamp(2024, 1, 2, 10, 0);
    for (double p : pnls) {
        trades.emplace_back(t, t + std::chrono::minutes(30), "SPY", p, "test");
        t += std::chrono::hours(24);
    }
    return trades;
}

} // namespace

TEST_CASE("Series statistics", "[TradeMetrics]") {
    SECTION("Mean and sample standard deviation") {
        std::vector<double> v = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
        REQUIRE_THAT(mean(v), WithinAbs(5.0, 1e-12));
        REQUIRE_THAT(sample_std_dev(v), WithinAbs(std::sqrt(32.0 / 7.0), 1e-12));
    }

    SECTION("Single observation has zero deviation") {
        REQUIRE(sample_std_dev({3.0}) == 0.0);
    }

    SECTION("Empty and non-finite inputs are errors") {
        REQUIRE_THROWS_AS(mean({}), EmptyInput);
        REQUIRE_THROWS_AS(mean({1.0, std::numeric_limits<double>::quiet_NaN()}), NonFiniteInput);
        REQUIRE_THROWS_AS(sample_std_dev({1.0, std::numeric_limits<double>::infinity()}), NonFiniteInput);
    }

    SECTION("Sharpe-like ratio") {
        std::vector<double> v = {1.0, 2.0, 3.0};
        REQUIRE_THAT(sharpe_like_ratio(v), WithinAbs(2.0, 1e-12));
    }

    SECTION("Sharpe-like ratio is zero at zero deviation") {
        REQUIRE(sharpe_like_ratio({0.5, 0.5, 0.5}) == 0.0);
        REQUIRE(sharpe_like_ratio({0.5}) == 0.0);
    }

    SECTION("Constant series with inexact binary values have zero deviation") {
        REQUIRE(sample_std_dev(std::vector<double>(3, 0.1)) == 0.0);
        REQUIRE(sharpe_like_ratio(std::vector<double>(3, 0.1)) == 0.0);
        REQUIRE(sharpe_like_ratio(std::vector<double>(7, 33.33)) == 0.0);
        REQUIRE(sharpe_like_ratio(std::vector<double>(7, 1.1)) == 0.0);
        REQUIRE(sharpe_like_ratio(std::vector<double>(5, -0.3)) == 0.0);
    }
}

TEST_CASE("Maximum drawdown", "[TradeMetrics][Drawdown]") {
    SECTION("Strictly increasing path has zero drawdown") {
        REQUIRE(max_drawdown({100.0, 101.0, 105.0, 110.0, 200.0}) == 0.0);
    }

    SECTION("Halve then fully recover is exactly one half") {
        REQUIRE(max_drawdown({100.0, 50.0, 100.0}) == 0.5);
        REQUIRE(max_drawdown({100.0, 80.0, 50.0, 75.0, 100.0, 120.0}) == 0.5);
    }

    SECTION("Drawdown measured from the running peak") {
        REQUIRE_THAT(max_drawdown({100.0, 120.0, 90.0, 130.0, 117.0}), WithinAbs(0.25, 1e-12));
    }

    SECTION("Non-positive start is rejected") {
        REQUIRE_THROWS_AS(max_drawdown({0.0, 1.0}), std::invalid_argument);
        REQUIRE_THROWS_AS(max_drawdown({}), EmptyInput);
    }

    SECTION("Absolute drawdown of cumulative pnl") {
        // cumulative: 100, 50, 250, 50, 150
        REQUIRE_THAT(max_drawdown_amount({100.0, -50.0, 200.0, -200.0, 100.0}), WithinAbs(200.0, 1e-12));
        // losing from the first trade counts from zero
        REQUIRE_THAT(max_drawdown_amount({-30.0, 10.0}), WithinAbs(30.0, 1e-12));
        REQUIRE(max_drawdown_amount({1.0, 2.0, 3.0}) == 0.0);
    }
}

TEST_CASE("Percentiles", "[TradeMetrics][Percentile]") {
    std::vector<double> v = {5.0, 1.0, 4.0, 2.0, 3.0};

    SECTION("Linear interpolation between closest ranks") {
        REQUIRE(percentile(v, 0.0) == 1.0);
        REQUIRE(percentile(v, 50.0) == 3.0);
        REQUIRE(percentile(v, 100.0) == 5.0);
        REQUIRE_THAT(percentile(v, 25.0), WithinAbs(2.0, 1e-12));
        REQUIRE_THAT(percentile(v, 90.0), WithinAbs(4.6, 1e-12));
    }

    SECTION("Default levels are monotonic") {
        auto points = percentiles(v, default_percentile_levels());
        REQUIRE(points.size() == 5);
        for (size_t i = 1; i < points.size(); ++i) {
            REQUIRE(points[i].level > points[i - 1].level);
            REQUIRE(points[i].value >= points[i - 1].value);
        }
    }

    SECTION("Errors") {
        REQUIRE_THROWS_AS(percentiles({}, {50.0}), EmptyInput);
        REQUIRE_THROWS_AS(percentiles(v, {101.0}), InvalidConfiguration);
        REQUIRE_THROWS_AS(percentiles(v, {-1.0}), InvalidConfiguration);
    }
}

TEST_CASE("Trade-level metrics", "[TradeMetrics]") {
    auto trades = trades_with_pnl({100.0, -50.0, 200.0, -25.0, 0.0});

    SECTION("Win rate is a fraction of strictly positive trades") {
        REQUIRE_THAT(win_rate(trades), WithinAbs(0.4, 1e-12));
    }

    SECTION("Totals and averages") {
        REQUIRE_THAT(total_pnl(trades), WithinAbs(225.0, 1e-12));
        REQUIRE_THAT(average_win(trades), WithinAbs(150.0, 1e-12));
        REQUIRE_THAT(average_loss(trades), WithinAbs(37.5, 1e-12));
        REQUIRE_THAT(expectancy(trades), WithinAbs(0.4 * 150.0 - 0.6 * 37.5, 1e-12));
    }

    SECTION("Profit factor") {
        REQUIRE_THAT(profit_factor(trades), WithinAbs(300.0 / 75.0, 1e-12));
    }

    SECTION("Profit factor is +infinity with winners and no losers") {
        double pf = profit_factor(trades_with_pnl({10.0, 20.0, 0.0}));
        REQUIRE(std::isinf(pf));
        REQUIRE(pf > 0.0);
    }

    SECTION("Profit factor is zero without winners") {
        REQUIRE(profit_factor(trades_with_pnl({-10.0, -5.0})) == 0.0);
    }

    SECTION("Empty collections are errors") {
        data::TradeList empty;
        REQUIRE_THROWS_AS(win_rate(empty), EmptyInput);
        REQUIRE_THROWS_AS(profit_factor(empty), EmptyInput);
    }

    SECTION("Pnl extraction keeps order") {
        auto pnls = extract_pnl(trades);
        REQUIRE(pnls == std::vector<double>{100.0, -50.0, 200.0, -25.0, 0.0});
    }
}

TEST_CASE("Welch t-test", "[TradeMetrics][TTest]") {
    SECTION("Known values") {
        // Means 2.5 and 5.5, both variances 5/3, n = 4
        std::vector<double> a = {1.0, 2.0, 3.0, 4.0};
        std::vector<double> b = {4.0, 5.0, 6.0, 7.0};
        auto r = welch_t_test(a, b);
        double se = std::sqrt(2.0 * (5.0 / 3.0) / 4.0);
        REQUIRE_THAT(r.t_statistic, WithinAbs(-3.0 / se, 1e-9));
        REQUIRE_THAT(r.degrees_of_freedom, WithinAbs(6.0, 1e-9));
        REQUIRE(r.p_value > 0.01);
        REQUIRE(r.p_value < 0.03);
    }

    SECTION("Identical samples are not significant") {
        std::vector<double> a = {1.0, 2.0, 3.0, 4.0, 5.0};
        auto r = welch_t_test(a, a);
        REQUIRE_THAT(r.t_statistic, WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(r.p_value, WithinAbs(1.0, 1e-9));
    }

    SECTION("Equal constant samples are not significant") {
        auto r = welch_t_test(std::vector<double>(7, 33.33), std::vector<double>(5, 33.33));
        REQUIRE(r.t_statistic == 0.0);
        REQUIRE(r.p_value == 1.0);

        auto s = welch_t_test(std::vector<double>(3, 0.1), std::vector<double>(4, 0.1));
        REQUIRE(s.p_value == 1.0);
        REQUIRE(cohens_d(std::vector<double>(7, 33.33), std::vector<double>(5, 33.33)) == 0.0);
    }

    SECTION("Different constant samples are infinitely separated") {
        auto r = welch_t_test(std::vector<double>(3, 0.1), std::vector<double>(3, 0.2));
        REQUIRE(std::isinf(r.t_statistic));
        REQUIRE(r.t_statistic < 0.0);
        REQUIRE(r.p_value == 0.0);
    }

    SECTION("Two-sided p-value at tabulated critical values") {
        REQUIRE_THAT(student_t_two_sided_p(1.962339, 1000.0), WithinAbs(0.05, 1e-4));
        REQUIRE_THAT(student_t_two_sided_p(2.228139, 10.0), WithinAbs(0.05, 1e-4));
        REQUIRE_THAT(student_t_two_sided_p(0.0, 10.0), WithinAbs(1.0, 1e-12));
    }

    SECTION("Too few observations") {
        REQUIRE_THROWS_AS(welch_t_test({1.0}, {1.0, 2.0}), InsufficientData);
    }

    SECTION("Cohen's d") {
        std::vector<double> a = {1.0, 2.0, 3.0, 4.0};
        std::vector<double> b = {4.0, 5.0, 6.0, 7.0};
        REQUIRE_THAT(cohens_d(a, b), WithinAbs(-3.0 / std::sqrt(5.0 / 3.0), 1e-9));
    }
}
