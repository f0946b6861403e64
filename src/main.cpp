/**
 * @file main.cpp
 * @brief Main entry point for TradeLab
 *
 * Command-line application that loads a trade ledger, runs the Monte Carlo
 * simulators, compares strategies and analyzes performance by time of day.
 */

#include "data/trade_loader.hpp"
#include "analytics/strategy_comparator.hpp"
#include "analytics/time_of_day_analyzer.hpp"
#include "simulation/path_simulator.hpp"
#include "simulation/trade_resampler.hpp"
#include "report/report_formatter.hpp"
#include "core/errors.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <exception>
#include <iomanip>
#include <chrono>

using namespace tradelab;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "TradeLab v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --mode MODE           simulate | resample | compare | time | all (default: all)\n"
              << "  --json                Print results as one JSON document\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/tradelab_config.json --verbose\n"
              << "  " << program_name << " --config data/config/tradelab_config.json --mode compare --json\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner(std::ostream &out)
{
    out << "\n"
        << "================================================================\n"
        << "       TradeLab v1.0.0                                         \n"
        << "       Monte Carlo and Strategy Analytics for Trade Ledgers    \n"
        << "================================================================\n"
        << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string mode = "all";
    bool json = false;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--mode" && i + 1 < argc)
            {
                args.mode = argv[++i];
            }
            else if (arg == "--json")
            {
                args.json = true;
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty() &&
               (mode == "all" || mode == "simulate" || mode == "resample" ||
                mode == "compare" || mode == "time");
    }

    bool runs(const std::string &stage) const
    {
        return mode == "all" || mode == stage;
    }
};

/**
 * @brief Per-trade returns relative to the starting capital.
 *
 * Used by the path simulator when no return series file is configured.
 */
data::ReturnSeries returns_from_trades(const data::TradeList &trades, double initial_capital)
{
    data::ReturnSeries returns;
    returns.reserve(trades.size());
    for (const auto &t : trades)
    {
        returns.push_back(t.pnl() / initial_capital);
    }
    return returns;
}

/**
 * @brief Run the analysis pipeline
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    // Structured output owns stdout; progress goes to stderr instead.
    std::ostream &log = args.json ? std::cerr : std::cout;
    nlohmann::json output;

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        log << "[1/6] Loading configuration..." << std::endl;
        auto config = data::TradeLoader::load_config(args.config_path);

        if (args.verbose)
        {
            log << "  - Trades file: " << config.data.trades_file << "\n";
            log << "  - Returns file: "
                << (config.data.returns_file.empty() ? "(derived from trades)" : config.data.returns_file) << "\n";
            log << "  - Simulations: " << config.simulation.config.num_simulations
                << " x " << config.simulation.config.horizon << " periods\n";
            log << "  - Time buckets: " << config.time_of_day.bucket_minutes << " minutes\n";
        }

        // ====================================================================
        // 2. Load Trade Ledger
        // ====================================================================
        log << "[2/6] Loading trade ledger..." << std::endl;
        auto trades = data::TradeLoader::load_trades_csv(config.data.trades_file);
        auto groups = data::TradeLoader::group_by_strategy(trades);

        log << "  - Loaded " << trades.size() << " trades across "
            << groups.size() << " strategies\n";

        if (args.verbose)
        {
            for (const auto &g : groups)
            {
                log << "    " << std::setw(20) << std::left << g.first
                    << g.second.size() << " trades\n";
            }
        }

        // ====================================================================
        // 3. Return-Path Monte Carlo
        // ====================================================================
        if (args.runs("simulate"))
        {
            log << "[3/6] Running return-path Monte Carlo..." << std::endl;

            const auto &sim = config.simulation;
            data::ReturnSeries returns =
                config.data.returns_file.empty()
                    ? returns_from_trades(trades, sim.config.initial_capital)
                    : data::TradeLoader::load_returns_csv(config.data.returns_file, args.verbose);

            simulation::PathSimulator simulator(returns, sim.model);
            auto result = simulator.run(sim.config);
            auto stats = simulation::calculate_statistics(result);

            if (args.verbose)
            {
                log << "  - Return observations: " << returns.size() << "\n";
                log << "  - Seed used: " << result.seed_used() << "\n";
            }

            if (args.json)
            {
                output["simulation"] = stats.to_json();
                output["simulation"]["seed_used"] = result.seed_used();
            }
            else
            {
                std::cout << "\n"
                          << report::format_simulation_report(stats, "MONTE CARLO SIMULATION RESULTS");
            }
        }
        else
        {
            log << "[3/6] Skipping return-path Monte Carlo\n";
        }

        // ====================================================================
        // 4. Trade Resampling
        // ====================================================================
        if (args.runs("resample"))
        {
            log << "[4/6] Running trade resampling..." << std::endl;

            auto settings = config.resampler;
            if (settings.num_trades_from_history)
            {
                settings.config.horizon = static_cast<int>(trades.size());
            }

            simulation::TradeResampler resampler(trades, settings.method);
            auto result = resampler.run(settings.config);
            auto stats = simulation::calculate_statistics(result);

            if (args.verbose)
            {
                log << "  - Mean pnl per trade: " << report::format_number(resampler.mean_pnl()) << "\n";
                log << "  - Trades per sequence: " << settings.config.horizon << "\n";
            }

            if (args.json)
            {
                output["resampling"] = stats.to_json();
                output["resampling"]["seed_used"] = result.seed_used();
            }
            else
            {
                std::cout << "\n"
                          << report::format_simulation_report(stats, "TRADE RESAMPLING SIMULATION RESULTS");
            }
        }
        else
        {
            log << "[4/6] Skipping trade resampling\n";
        }

        // ====================================================================
        // 5. Strategy Comparison
        // ====================================================================
        if (args.runs("compare"))
        {
            log << "[5/6] Comparing strategies..." << std::endl;

            analytics::StrategyComparator comparator;
            for (const auto &g : groups)
            {
                comparator.add_strategy(g.first, g.second);
            }

            auto ranked = comparator.rank_by(config.comparison.rank_by);

            if (args.json)
            {
                output["comparison"]["rank_by"] = analytics::column_name(config.comparison.rank_by);
                output["comparison"]["ranking"] = ranked.to_json();
            }
            else
            {
                std::cout << "\n"
                          << comparator.generate_comparison_report(config.comparison.rank_by);
            }

            // Test the two leading strategies against each other
            if (ranked.size() >= 2)
            {
                try
                {
                    auto test = comparator.run_statistical_test(ranked.rows()[0].name,
                                                                ranked.rows()[1].name);
                    if (args.json)
                    {
                        output["comparison"]["statistical_test"] = test.to_json();
                    }
                    else
                    {
                        std::cout << "\n"
                                  << report::format_statistical_test(test);
                    }
                }
                catch (const InsufficientData &e)
                {
                    log << "  - Statistical test skipped: " << e.what() << "\n";
                }
            }
        }
        else
        {
            log << "[5/6] Skipping strategy comparison\n";
        }

        // ====================================================================
        // 6. Time-of-Day Analysis
        // ====================================================================
        if (args.runs("time"))
        {
            log << "[6/6] Analyzing performance by time of day..." << std::endl;

            analytics::TimeOfDayAnalyzer analyzer(trades, config.time_of_day);

            if (args.verbose)
            {
                log << "  - Non-empty buckets: " << analyzer.buckets().size() << "\n";
            }

            if (args.json)
            {
                output["time_of_day"] = analyzer.to_json();
            }
            else
            {
                std::cout << "\n"
                          << analyzer.generate_report();
            }
        }
        else
        {
            log << "[6/6] Skipping time-of-day analysis\n";
        }

        if (args.json)
        {
            std::cout << output.dump(2) << std::endl;
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        log << "\n================================================================\n";
        log << "Analysis completed successfully in "
            << duration << " ms\n";
        log << "================================================================\n"
            << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    // Parse command-line arguments
    auto args = CommandLineArgs::parse(argc, argv);

    // Show help if requested or invalid args
    if (args.show_help || !args.is_valid())
    {
        print_banner(std::cout);
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner(args.json ? std::cerr : std::cout);

    return run(args);
}
