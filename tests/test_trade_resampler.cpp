/**
 * @file test_trade_resampler.cpp
 * @brief Tests for the trade-resampling Monte Carlo simulator
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "simulation/trade_resampler.hpp"
#include "analytics/trade_metrics.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <limits>

using namespace tradelab;
using namespace tradelab::simulation;
using Catch::Matchers::WithinAbs;

namespace {

/// 50 trades with a mix of winners and losers; total pnl 1275.
std::vector<double> fifty_pnls() {
    std::vector<double> pnls;
    for (int i = 1; i <= 50; ++i) {
        pnls.push_back(i % 3 == 0 ? -2.0 * i : 1.0 * i + 10.0);
    }
    return pnls;
}

data::TradeList to_trades(const std::vector<double>& pnls) {
    data::TradeList trades;
    data::Timestamp t = data::make_timestamp(2024, 2, 1, 9, 30);
    for (double p : pnls) {
        trades.emplace_back(t, t + std::chrono::minutes(20), "QQQ", p, "resample");
        t += std::chrono::hours(1);
    }
    return trades;
}

} // namespace

TEST_CASE("Resampled paths are additive", "[TradeResampler]") {
    SimulationConfig config;
    config.num_simulations = 20;
    config.horizon = 8;
    config.initial_capital = 1000.0;
    config.random_seed = 5;

    TradeResampler resampler(std::vector<double>{10.0});
    auto run = resampler.run(config);

    REQUIRE(run.path_length() == 9);
    for (int i = 0; i < run.num_paths(); ++i) {
        auto p = run.path(i);
        for (size_t k = 0; k < p.size(); ++k) {
            REQUIRE(p[k] == 1000.0 + 10.0 * k);
        }
    }
}

TEST_CASE("Every step is a historical pnl", "[TradeResampler]") {
    std::vector<double> pnls = {-40.0, 15.0, 60.0};
    SimulationConfig config;
    config.num_simulations = 50;
    config.horizon = 12;
    config.initial_capital = 10000.0;
    config.random_seed = 17;

    auto run = TradeResampler(to_trades(pnls)).run(config);
    for (int i = 0; i < run.num_paths(); ++i) {
        auto p = run.path(i);
        for (size_t k = 1; k < p.size(); ++k) {
            double step = p[k] - p[k - 1];
            bool known = std::abs(step + 40.0) < 1e-9 || std::abs(step - 15.0) < 1e-9 ||
                         std::abs(step - 60.0) < 1e-9;
            REQUIRE(known);
        }
    }
}

TEST_CASE("Scenario: resampled mean converges to the expected terminal equity", "[TradeResampler][Scenario]") {
    auto pnls = fifty_pnls();
    auto trades = to_trades(pnls);
    const double total = analytics::total_pnl(trades);

    SimulationConfig config;
    config.num_simulations = 5000;
    config.horizon = 100;
    config.initial_capital = 100000.0;
    config.random_seed = 2718;

    TradeResampler resampler(trades);
    REQUIRE_THAT(resampler.mean_pnl(), WithinAbs(total / 50.0, 1e-9));

    auto stats = calculate_statistics(resampler.run(config));

    // Twice the history's total: 100 draws from a 50-trade population
    const double expected = config.initial_capital + 2.0 * total;
    const double std_error = analytics::sample_std_dev(pnls) * std::sqrt(100.0) /
                             std::sqrt(static_cast<double>(config.num_simulations));

    REQUIRE(std::abs(stats.mean_final_equity - expected) < 3.0 * std_error);
}

TEST_CASE("Permutation isolates ordering", "[TradeResampler]") {
    auto pnls = fifty_pnls();
    double total = 0.0;
    for (double p : pnls) total += p;

    SimulationConfig config;
    config.num_simulations = 100;
    config.horizon = 50;
    config.initial_capital = 25000.0;
    config.random_seed = 3;

    TradeResampler resampler(pnls, ResampleMethod::PERMUTATION);

    SECTION("Every sequence ends at the historical total") {
        auto run = resampler.run(config);
        for (double v : run.terminal_values()) {
            REQUIRE_THAT(v, WithinAbs(config.initial_capital + total, 1e-6));
        }
    }

    SECTION("Orders differ between paths") {
        auto run = resampler.run(config);
        REQUIRE_FALSE(run.paths().row(0).cwiseEqual(run.paths().row(1)).all());
    }

    SECTION("Sequence length must equal the history size") {
        config.horizon = 60;
        REQUIRE_THROWS_AS(resampler.run(config), InvalidConfiguration);
    }

    SECTION("Method names") {
        REQUIRE(parse_resample_method("shuffle") == ResampleMethod::PERMUTATION);
        REQUIRE(parse_resample_method("WITH_REPLACEMENT") == ResampleMethod::WITH_REPLACEMENT);
        REQUIRE_THROWS_AS(parse_resample_method("jackknife"), InvalidConfiguration);
    }
}

TEST_CASE("Resampler errors and determinism", "[TradeResampler][Errors]") {
    SimulationConfig config;
    config.num_simulations = 64;
    config.horizon = 20;
    config.random_seed = 11;

    SECTION("Empty history") {
        REQUIRE_THROWS_AS(TradeResampler(data::TradeList{}), InsufficientData);
        REQUIRE_THROWS_AS(TradeResampler(std::vector<double>{}), InsufficientData);
    }

    SECTION("Non-finite pnl") {
        std::vector<double> bad = {1.0, std::numeric_limits<double>::infinity()};
        REQUIRE_THROWS_AS(TradeResampler(bad), NonFiniteInput);
    }

    SECTION("Invalid configuration") {
        TradeResampler resampler(std::vector<double>{1.0, -1.0});
        config.initial_capital = 0.0;
        REQUIRE_THROWS_AS(resampler.run(config), InvalidConfiguration);
    }

    SECTION("Same seed, same sequences, regardless of threads") {
        TradeResampler resampler(fifty_pnls());
        config.num_threads = 1;
        auto a = resampler.run(config);
        config.num_threads = 4;
        config.batch_size = 3;
        auto b = resampler.run(config);
        REQUIRE(a.paths().cwiseEqual(b.paths()).all());
    }

    SECTION("Report") {
        TradeResampler resampler(fifty_pnls());
        auto text = resampler.generate_report(config);
        REQUIRE(text.find("TRADE RESAMPLING SIMULATION RESULTS") != std::string::npos);
    }
}
