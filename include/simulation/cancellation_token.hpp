/**
 * @file cancellation_token.hpp
 * @brief Cooperative cancellation flag shared between a caller and a simulation.
 */

#ifndef TRADELAB_SIMULATION_CANCELLATION_TOKEN_HPP
#define TRADELAB_SIMULATION_CANCELLATION_TOKEN_HPP

#include <atomic>

namespace tradelab
{
    namespace simulation
    {

        /**
         * @class CancellationToken
         * @brief Thread-safe one-way flag polled between simulation batches.
         *
         * Once cancel() is called the flag stays set; a running simulation
         * stops scheduling work and throws SimulationCancelled.
         */
        class CancellationToken
        {
        public:
            CancellationToken() : cancelled_(false) {}

            CancellationToken(const CancellationToken &) = delete;
            CancellationToken &operator=(const CancellationToken &) = delete;

            void cancel() { cancelled_.store(true, std::memory_order_release); }

            bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

        private:
            std::atomic<bool> cancelled_;
        };

    } // namespace simulation
} // namespace tradelab

#endif // TRADELAB_SIMULATION_CANCELLATION_TOKEN_HPP
