/**
 * @file batch_runner.hpp
 * @brief Batched, parallel generation of independent equity paths.
 *
 * Paths are split into fixed-size batches, one task per batch. Every task
 * fills its own matrix block and every path draws from its own generator,
 * seeded from (base seed, path index), so the result does not depend on the
 * thread count or the batch size. Blocks are concatenated once all tasks
 * have finished.
 */

#ifndef TRADELAB_SIMULATION_BATCH_RUNNER_HPP
#define TRADELAB_SIMULATION_BATCH_RUNNER_HPP

#include "simulation/cancellation_token.hpp"
#include "simulation/parallel_executor.hpp"
#include "simulation/simulation_run.hpp"

#include <Eigen/Dense>

#include <cstdint>
#include <functional>
#include <random>

namespace tradelab
{
    namespace simulation
    {

        /// Generator type owned by a single path.
        using PathEngine = std::mt19937_64;

        /// Writable view of one row of a column-major path matrix.
        using PathRow = Eigen::Ref<Eigen::RowVectorXd, 0, Eigen::InnerStride<>>;

        /**
         * @brief Fills one path row.
         *
         * The row has horizon + 1 entries and arrives with column 0 already
         * set to initial_capital.
         */
        using PathFiller = std::function<void(PathEngine &engine, PathRow row)>;

        /**
         * @brief Seed to use for a run: the configured one, or a fresh one
         *        from std::random_device.
         */
        std::uint64_t resolve_seed(const SimulationConfig &config);

        /**
         * @brief Deterministic generator for one path.
         */
        PathEngine make_path_engine(std::uint64_t base_seed, std::uint64_t path_index);

        /**
         * @brief Generate config.num_simulations paths.
         *
         * @param config Validated simulation configuration.
         * @param seed Base seed (see resolve_seed).
         * @param fill Per-path generator; must not touch shared mutable state.
         * @param executor Executor that runs the batches.
         * @param cancel Optional token polled before each batch.
         * @return Complete SimulationRun.
         * @throws SimulationCancelled If the token was set before all batches ran.
         */
        SimulationRun run_batched(const SimulationConfig &config,
                                  std::uint64_t seed,
                                  const PathFiller &fill,
                                  ParallelExecutor &executor,
                                  const CancellationToken *cancel = nullptr);

    } // namespace simulation
} // namespace tradelab

#endif // TRADELAB_SIMULATION_BATCH_RUNNER_HPP
