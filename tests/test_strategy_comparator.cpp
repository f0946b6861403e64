/**
 * @file test_strategy_comparator.cpp
 * @brief Tests for StrategyComparator, ComparisonTable and the significance test
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/strategy_comparator.hpp"
#include "core/errors.hpp"
#include <cmath>

using namespace tradelab;
using namespace tradelab::analytics;
using Catch::Matchers::WithinAbs;

namespace {

data::TradeList make_trades(const std::vector<double>& pnls, const std::string& strategy) {
    data::TradeList trades;
    data::Timestamp t = data::make_timestamp(2024, 4, 1, 10, 0);
    for (double p : pnls) {
        trades.emplace_back(t, t + std::chrono::minutes(45), "ES", p, strategy);
        t += std::chrono::hours(24);
    }
    return trades;
}

data::TradeList scaled(const data::TradeList& trades, double factor) {
    data::TradeList out;
    for (const auto& t : trades) out.push_back(t.scaled(factor));
    return out;
}

const std::vector<double> BASE_PNLS = {120.0, -45.0, 80.0, -30.0, 200.0, -60.0, 35.0, 90.0};

} // namespace

TEST_CASE("Registration rules", "[StrategyComparator]") {
    StrategyComparator cmp;

    SECTION("Comparing an empty registry fails") {
        REQUIRE_THROWS_AS(cmp.compare_all(), EmptyRegistry);
        REQUIRE_THROWS_AS(cmp.rank_by(ComparisonColumn::TOTAL_PNL), EmptyRegistry);
        REQUIRE_THROWS_AS(cmp.generate_comparison_report(), EmptyRegistry);
        REQUIRE(cmp.to_json().empty());
    }

    SECTION("Duplicate names are rejected without overwriting") {
        cmp.add_strategy("alpha", make_trades({10.0, 20.0}, "alpha"));
        REQUIRE_THROWS_AS(cmp.add_strategy("alpha", make_trades({-5.0}, "alpha")), DuplicateName);
        REQUIRE(cmp.size() == 1);
        REQUIRE(cmp.trades("alpha").size() == 2);
    }

    SECTION("Empty names and empty trade lists are rejected") {
        REQUIRE_THROWS_AS(cmp.add_strategy("", make_trades({1.0}, "")), std::invalid_argument);
        REQUIRE_THROWS_AS(cmp.add_strategy("none", data::TradeList{}), InsufficientData);
        REQUIRE(cmp.size() == 0);
    }

    SECTION("Lookups of unknown names fail") {
        cmp.add_strategy("alpha", make_trades({10.0, 20.0}, "alpha"));
        REQUIRE(cmp.contains("alpha"));
        REQUIRE_FALSE(cmp.contains("beta"));
        REQUIRE_THROWS_AS(cmp.trades("beta"), UnknownStrategy);
        REQUIRE_THROWS_AS(cmp.run_statistical_test("alpha", "beta"), UnknownStrategy);
        REQUIRE_THROWS_AS(cmp.compare_all().row("beta"), UnknownStrategy);
    }
}

TEST_CASE("Metric rows", "[StrategyComparator]") {
    auto m = StrategyComparator::calculate_metrics("s", make_trades({100.0, -50.0, 200.0, -25.0}, "s"));

    REQUIRE(m.total_trades == 4);
    REQUIRE(m.winning_trades == 2);
    REQUIRE(m.losing_trades == 2);
    REQUIRE_THAT(m.win_rate, WithinAbs(50.0, 1e-12));
    REQUIRE_THAT(m.total_pnl, WithinAbs(225.0, 1e-12));
    REQUIRE_THAT(m.avg_win, WithinAbs(150.0, 1e-12));
    REQUIRE_THAT(m.avg_loss, WithinAbs(37.5, 1e-12));
    REQUIRE_THAT(m.profit_factor, WithinAbs(4.0, 1e-12));
    REQUIRE_THAT(m.max_drawdown, WithinAbs(50.0, 1e-12));
    REQUIRE_THAT(m.expectancy, WithinAbs(0.5 * 150.0 - 0.5 * 37.5, 1e-12));
    REQUIRE(m.sharpe_ratio > 0.0);

    SECTION("All-winning strategy has infinite profit factor") {
        auto w = StrategyComparator::calculate_metrics("w", make_trades({5.0, 7.0}, "w"));
        REQUIRE(std::isinf(w.profit_factor));
        REQUIRE(w.value(ComparisonColumn::PROFIT_FACTOR) > 1e300);
    }
}

TEST_CASE("Scenario: scaled copies rank by total pnl", "[StrategyComparator][Scenario]") {
    auto a = make_trades(BASE_PNLS, "A");
    StrategyComparator cmp;
    cmp.add_strategy("A", a);
    cmp.add_strategy("B", scaled(a, 1.2));
    cmp.add_strategy("C", scaled(a, 0.8));

    auto table = cmp.compare_all();
    REQUIRE(table.size() == 3);
    REQUIRE(table.names() == std::vector<std::string>{"A", "B", "C"});

    REQUIRE(table.row("A").total_pnl > 0.0);
    REQUIRE(table.row("B").total_pnl > table.row("A").total_pnl);
    REQUIRE(table.row("C").total_pnl < table.row("A").total_pnl);

    auto ranked = cmp.rank_by(ComparisonColumn::TOTAL_PNL);
    REQUIRE(ranked.names() == std::vector<std::string>{"B", "A", "C"});

    auto ascending = cmp.rank_by(ComparisonColumn::TOTAL_PNL, false);
    REQUIRE(ascending.names() == std::vector<std::string>{"C", "A", "B"});

    REQUIRE(table.top_by(ComparisonColumn::TOTAL_PNL).name == "B");

    // Scaling does not change win rate
    REQUIRE_THAT(table.row("B").win_rate, WithinAbs(table.row("A").win_rate, 1e-12));
}

TEST_CASE("Ranking ties keep registration order", "[StrategyComparator]") {
    StrategyComparator cmp;
    cmp.add_strategy("first", make_trades({10.0, -5.0, 20.0}, "first"));
    cmp.add_strategy("better", make_trades({50.0, -5.0, 20.0}, "better"));
    cmp.add_strategy("second", make_trades({10.0, -5.0, 20.0}, "second"));

    auto ranked = cmp.rank_by(ComparisonColumn::TOTAL_PNL);
    REQUIRE(ranked.names() == std::vector<std::string>{"better", "first", "second"});

    auto by_trades = cmp.rank_by(ComparisonColumn::TOTAL_TRADES);
    REQUIRE(by_trades.names() == std::vector<std::string>{"first", "better", "second"});
    REQUIRE(by_trades.top_by(ComparisonColumn::TOTAL_TRADES).name == "first");
}

TEST_CASE("Statistical test between strategies", "[StrategyComparator][TTest]") {
    StrategyComparator cmp;

    SECTION("Clearly separated strategies") {
        cmp.add_strategy("weak", make_trades({-10.0, -12.0, -8.0, -11.0, -9.0, -10.0}, "weak"));
        cmp.add_strategy("strong", make_trades({50.0, 52.0, 48.0, 51.0, 49.0, 50.0}, "strong"));

        auto r = cmp.run_statistical_test("weak", "strong");
        REQUIRE(r.strategy1 == "weak");
        REQUIRE(r.strategy2 == "strong");
        REQUIRE(r.t_statistic < 0.0);
        REQUIRE(r.is_significant);
        REQUIRE(r.p_value < 0.05);
        REQUIRE(r.better_strategy == "strong");
        REQUIRE(r.confidence > 95.0);
        REQUIRE(r.cohens_d < 0.0);
        REQUIRE(r.to_json()["better_strategy"] == "strong");
    }

    SECTION("Indistinguishable strategies") {
        cmp.add_strategy("x", make_trades({10.0, -10.0, 5.0, -5.0}, "x"));
        cmp.add_strategy("y", make_trades({-5.0, 5.0, -10.0, 10.0}, "y"));

        auto r = cmp.run_statistical_test("x", "y");
        REQUIRE_FALSE(r.is_significant);
        REQUIRE(r.confidence == 0.0);
        REQUIRE(r.better_strategy == "x");
    }

    SECTION("Single-trade strategies cannot be tested") {
        cmp.add_strategy("one", make_trades({10.0}, "one"));
        cmp.add_strategy("two", make_trades({10.0, 20.0}, "two"));
        REQUIRE_THROWS_AS(cmp.run_statistical_test("one", "two"), InsufficientData);
    }
}

TEST_CASE("Comparison columns and export", "[StrategyComparator]") {
    REQUIRE(parse_comparison_column("total_pnl") == ComparisonColumn::TOTAL_PNL);
    REQUIRE(parse_comparison_column("Sharpe") == ComparisonColumn::SHARPE_RATIO);
    REQUIRE(column_name(ComparisonColumn::PROFIT_FACTOR) == "profit_factor");
    REQUIRE_THROWS_AS(parse_comparison_column("alpha"), InvalidConfiguration);

    StrategyComparator cmp;
    cmp.add_strategy("winner", make_trades({5.0, 7.0}, "winner"));
    cmp.add_strategy("mixed", make_trades({5.0, -7.0}, "mixed"));

    auto j = cmp.to_json();
    REQUIRE(j.size() == 2);
    REQUIRE(j[0]["strategy"] == "winner");
    REQUIRE(j[0]["profit_factor"] == "inf");
    REQUIRE(j[1]["total_trades"] == 2);

    auto config = ComparisonConfig::from_json(nlohmann::json{{"rank_by", "win_rate"}});
    REQUIRE(config.rank_by == ComparisonColumn::WIN_RATE);
    REQUIRE(ComparisonConfig::from_json(nlohmann::json::object()).rank_by == ComparisonColumn::SHARPE_RATIO);
}

TEST_CASE("Constant pnl does not win on Sharpe ratio", "[StrategyComparator]") {
    StrategyComparator cmp;
    cmp.add_strategy("constant", make_trades(std::vector<double>(7, 33.33), "constant"));
    cmp.add_strategy("varied", make_trades({50.0, -10.0, 40.0, 20.0, 30.0}, "varied"));

    auto table = cmp.compare_all();
    REQUIRE(table.row("constant").sharpe_ratio == 0.0);
    REQUIRE(table.row("varied").sharpe_ratio > 0.0);
    REQUIRE(table.top_by(ComparisonColumn::SHARPE_RATIO).name == "varied");
    REQUIRE(cmp.rank_by(ComparisonColumn::SHARPE_RATIO).names().front() == "varied");

    auto text = cmp.generate_comparison_report(ComparisonColumn::SHARPE_RATIO);
    REQUIRE(text.find("varied  (") != std::string::npos);

    SECTION("Identical constant strategies are not significantly different") {
        cmp.add_strategy("constant_copy", make_trades(std::vector<double>(5, 33.33), "constant_copy"));
        auto r = cmp.run_statistical_test("constant", "constant_copy");
        REQUIRE_FALSE(r.is_significant);
        REQUIRE(r.p_value == 1.0);
        REQUIRE(r.confidence == 0.0);
    }
}
