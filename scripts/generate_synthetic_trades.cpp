/**
 * @file generate_synthetic_trades.cpp
 * @brief Generate a synthetic multi-strategy trade ledger for TradeLab
 */

#include "data/trade_loader.hpp"
#include "analytics/trade_metrics.hpp"
#include <iostream>
#include <iomanip>

using namespace tradelab;

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic Trade Generator ===\n" << std::endl;

    // Strategies with distinct edge and noise
    std::vector<data::SyntheticStrategy> strategies = {
        {"ema_cross",    45.0, 300.0},   // Trend following: modest edge
        {"rsi_reversal", 20.0, 150.0},   // Mean reversion: small, steady
        {"breakout",     60.0, 600.0},   // Breakout: large edge, noisy
        {"gap_fade",    -10.0, 200.0}    // Negative expectancy control
    };

    std::string output_file = "data/trades.csv";
    std::string start_date = "2024-01-02";
    int trades_per_strategy = 250;
    std::uint64_t seed = 42;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--output" && i + 1 < argc) {
            output_file = argv[++i];
        } else if (arg == "--trades" && i + 1 < argc) {
            trades_per_strategy = std::stoi(argv[++i]);
        } else if (arg == "--start" && i + 1 < argc) {
            start_date = argv[++i];
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = std::stoull(argv[++i]);
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                      << "Options:\n"
                      << "  --output FILE      Output CSV file (default: data/trades.csv)\n"
                      << "  --trades N         Trades per strategy (default: 250)\n"
                      << "  --start DATE       First trading day (default: 2024-01-02)\n"
                      << "  --seed N           Random seed (default: 42)\n"
                      << "  --help             Show this help\n";
            return 0;
        }
    }

    std::cout << "Generating " << trades_per_strategy << " trades for "
              << strategies.size() << " strategies..." << std::endl;

    try {
        auto trades = data::TradeLoader::generate_synthetic_trades(
            strategies, trades_per_strategy, start_date, seed);

        std::cout << "Saving to " << output_file << "..." << std::endl;
        data::TradeLoader::save_trades_csv(trades, output_file);

        std::cout << "\n=== Generated Ledger Summary ===\n";
        std::cout << "Trades: " << trades.size() << " ("
                  << data::format_timestamp(trades.front().entry_time()) << " to "
                  << data::format_timestamp(trades.back().exit_time()) << ")\n\n";

        std::cout << std::string(60, '-') << "\n";
        std::cout << std::left << std::setw(16) << "Strategy"
                  << std::right << std::setw(12) << "Total P&L"
                  << std::setw(12) << "Win Rate"
                  << std::setw(12) << "Sharpe\n";
        std::cout << std::string(60, '-') << "\n";

        for (const auto& group : data::TradeLoader::group_by_strategy(trades)) {
            auto pnls = analytics::extract_pnl(group.second);
            std::cout << std::left << std::setw(16) << group.first
                      << std::right << std::setw(12) << std::fixed << std::setprecision(2)
                      << analytics::total_pnl(group.second)
                      << std::setw(11) << analytics::win_rate(group.second) * 100.0 << "%"
                      << std::setw(11) << std::setprecision(3)
                      << analytics::sharpe_like_ratio(pnls) << "\n";
        }
        std::cout << std::string(60, '-') << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nData generation complete.\n" << std::endl;
    std::cout << "You can now run:\n";
    std::cout << "  ./build/bin/tradelab --config data/config/tradelab_config.json --verbose\n";
    std::cout << std::endl;

    return 0;
}
