/**
 * @file trade_resampler.cpp
 * @brief Implementation of the trade-resampling Monte Carlo simulator.
 */

#include "simulation/trade_resampler.hpp"
#include "simulation/batch_runner.hpp"
#include "analytics/trade_metrics.hpp"
#include "core/errors.hpp"
#include "report/report_formatter.hpp"

#include <algorithm>
#include <cctype>
#include <random>

namespace tradelab
{
    namespace simulation
    {

        ResampleMethod parse_resample_method(const std::string &name)
        {
            std::string s = name;
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                           { return std::tolower(c); });
            if (s == "with_replacement" || s == "bootstrap")
                return ResampleMethod::WITH_REPLACEMENT;
            if (s == "permutation" || s == "shuffle")
                return ResampleMethod::PERMUTATION;
            throw InvalidConfiguration("Unknown resample method: " + name);
        }

        TradeResampler::TradeResampler(const data::TradeList &trades, ResampleMethod method)
            : pnls_(analytics::extract_pnl(trades)), method_(method)
        {
            if (pnls_.empty())
            {
                throw InsufficientData("Trade resampling requires at least one historical trade");
            }
        }

        TradeResampler::TradeResampler(std::vector<double> pnls, ResampleMethod method)
            : pnls_(std::move(pnls)), method_(method)
        {
            if (pnls_.empty())
            {
                throw InsufficientData("Trade resampling requires at least one historical trade");
            }
            analytics::require_finite(pnls_, "trade pnl series");
        }

        double TradeResampler::mean_pnl() const
        {
            return analytics::mean(pnls_);
        }

        SimulationRun TradeResampler::run(const SimulationConfig &config,
                                          const CancellationToken *cancel) const
        {
            config.validate();
            auto executor = make_executor(static_cast<std::size_t>(config.num_threads));
            return run(config, *executor, cancel);
        }

        SimulationRun TradeResampler::run(const SimulationConfig &config,
                                          ParallelExecutor &executor,
                                          const CancellationToken *cancel) const
        {
            config.validate();
            const int num_trades = config.horizon;
            const std::vector<double> &source = pnls_;

            PathFiller fill;
            if (method_ == ResampleMethod::WITH_REPLACEMENT)
            {
                fill = [&source, num_trades](PathEngine &engine, PathRow row)
                {
                    std::uniform_int_distribution<std::size_t> pick(0, source.size() - 1);
                    for (int k = 0; k < num_trades; ++k)
                    {
                        row(k + 1) = row(k) + source[pick(engine)];
                    }
                };
            }
            else
            {
                if (num_trades != static_cast<int>(source.size()))
                {
                    throw InvalidConfiguration(
                        "Permutation resampling needs num_trades equal to the history size (" + std::to_string(source.size()) + "), got: " + std::to_string(num_trades));
                }
                fill = [&source, num_trades](PathEngine &engine, PathRow row)
                {
                    std::vector<double> order(source);
                    std::shuffle(order.begin(), order.end(), engine);
                    for (int k = 0; k < num_trades; ++k)
                    {
                        row(k + 1) = row(k) + order[k];
                    }
                };
            }

            return run_batched(config, resolve_seed(config), fill, executor, cancel);
        }

        std::string TradeResampler::generate_report(const SimulationConfig &config) const
        {
            SimulationRun result = run(config);
            return report::format_simulation_report(calculate_statistics(result),
                                                    "TRADE RESAMPLING SIMULATION RESULTS");
        }

    } // namespace simulation
} // namespace tradelab
