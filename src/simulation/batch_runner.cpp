/**
 * @file batch_runner.cpp
 * @brief Implementation of batched path generation.
 */

#include "simulation/batch_runner.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <vector>

namespace tradelab
{
    namespace simulation
    {

        std::uint64_t resolve_seed(const SimulationConfig &config)
        {
            if (config.random_seed)
            {
                return *config.random_seed;
            }
            std::random_device rd;
            return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
        }

        PathEngine make_path_engine(std::uint64_t base_seed, std::uint64_t path_index)
        {
            std::seed_seq seq{static_cast<std::uint32_t>(base_seed & 0xffffffffULL),
                              static_cast<std::uint32_t>(base_seed >> 32),
                              static_cast<std::uint32_t>(path_index & 0xffffffffULL),
                              static_cast<std::uint32_t>(path_index >> 32)};
            return PathEngine(seq);
        }

        SimulationRun run_batched(const SimulationConfig &config,
                                  std::uint64_t seed,
                                  const PathFiller &fill,
                                  ParallelExecutor &executor,
                                  const CancellationToken *cancel)
        {
            config.validate();

            const int n = config.num_simulations;
            const int cols = config.horizon + 1;
            const int batch = std::min(config.batch_size, n);
            const int num_batches = (n + batch - 1) / batch;

            // One slot per batch; each task writes only its own slot
            std::vector<Eigen::MatrixXd> blocks(num_batches);
            std::atomic<bool> skipped(false);

            std::vector<std::future<void>> futures;
            futures.reserve(num_batches);

            for (int b = 0; b < num_batches; ++b)
            {
                if (cancel && cancel->is_cancelled())
                {
                    skipped = true;
                    break;
                }

                const int first = b * batch;
                const int rows = std::min(batch, n - first);

                futures.push_back(executor.submit(
                    [&blocks, &fill, &skipped, &config, cancel, seed, b, first, rows, cols]()
                    {
                        if (cancel && cancel->is_cancelled())
                        {
                            skipped = true;
                            return;
                        }

                        Eigen::MatrixXd block(rows, cols);
                        for (int r = 0; r < rows; ++r)
                        {
                            PathEngine engine = make_path_engine(seed, static_cast<std::uint64_t>(first + r));
                            block(r, 0) = config.initial_capital;
                            fill(engine, block.row(r));
                        }
                        blocks[b] = std::move(block);
                    }));
            }

            // Wait for every submitted task before surfacing any failure so
            // no task outlives the locals it captured.
            std::exception_ptr first_error;
            for (auto &f : futures)
            {
                try
                {
                    f.get();
                }
                catch (...)
                {
                    if (!first_error)
                    {
                        first_error = std::current_exception();
                    }
                }
            }
            if (first_error)
            {
                std::rethrow_exception(first_error);
            }

            if (skipped)
            {
                throw SimulationCancelled(
                    "Simulation cancelled before all " + std::to_string(num_batches) + " batches completed");
            }

            Eigen::MatrixXd paths(n, cols);
            for (int b = 0; b < num_batches; ++b)
            {
                paths.middleRows(b * batch, blocks[b].rows()) = blocks[b];
            }

            return SimulationRun(config, std::move(paths), seed);
        }

    } // namespace simulation
} // namespace tradelab
