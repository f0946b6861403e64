/**
 * @file parallel_executor.hpp
 * @brief Executor policies used to distribute simulation batches.
 *
 * - SingleThreadExecutor runs each task inline on the calling thread.
 * - ThreadPoolExecutor owns a fixed set of worker threads fed from a queue.
 *
 * Both return a std::future<void> per task; an exception thrown by a task
 * is stored in its future and rethrown by get().
 */

#ifndef TRADELAB_SIMULATION_PARALLEL_EXECUTOR_HPP
#define TRADELAB_SIMULATION_PARALLEL_EXECUTOR_HPP

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace tradelab
{
    namespace simulation
    {

        /**
         * @class ParallelExecutor
         * @brief Abstract task submission interface.
         */
        class ParallelExecutor
        {
        public:
            virtual ~ParallelExecutor() = default;

            /**
             * @brief Schedule a task.
             * @return Future that becomes ready when the task finishes.
             */
            virtual std::future<void> submit(std::function<void()> task) = 0;

            /** @brief Number of tasks that may run at the same time. */
            virtual std::size_t concurrency() const = 0;
        };

        /**
         * @class SingleThreadExecutor
         * @brief Runs tasks synchronously inside submit().
         */
        class SingleThreadExecutor : public ParallelExecutor
        {
        public:
            std::future<void> submit(std::function<void()> task) override
            {
                std::promise<void> prom;
                auto fut = prom.get_future();
                try
                {
                    task();
                    prom.set_value();
                }
                catch (...)
                {
                    prom.set_exception(std::current_exception());
                }
                return fut;
            }

            std::size_t concurrency() const override { return 1; }
        };

        /**
         * @class ThreadPoolExecutor
         * @brief Fixed-size pool of worker threads.
         *
         * A thread count of 0 selects std::thread::hardware_concurrency(),
         * falling back to 2 when the platform reports 0. Queued tasks are
         * drained before the destructor joins the workers.
         */
        class ThreadPoolExecutor : public ParallelExecutor
        {
        public:
            explicit ThreadPoolExecutor(std::size_t num_threads = 0)
                : stop_(false)
            {
                std::size_t threads = num_threads;
                if (threads == 0)
                {
                    threads = std::thread::hardware_concurrency();
                    if (threads == 0)
                    {
                        threads = 2;
                    }
                }

                try
                {
                    for (std::size_t i = 0; i < threads; ++i)
                    {
                        workers_.emplace_back([this]
                                              { worker_loop(); });
                    }
                }
                catch (...)
                {
                    shutdown();
                    throw;
                }
            }

            ThreadPoolExecutor(const ThreadPoolExecutor &) = delete;
            ThreadPoolExecutor &operator=(const ThreadPoolExecutor &) = delete;

            ~ThreadPoolExecutor() override
            {
                shutdown();
            }

            std::future<void> submit(std::function<void()> task) override
            {
                auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
                auto fut = packaged->get_future();
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (stop_)
                    {
                        throw std::runtime_error("Cannot submit to a stopped ThreadPoolExecutor");
                    }
                    tasks_.emplace([packaged]
                                   { (*packaged)(); });
                }
                condition_.notify_one();
                return fut;
            }

            std::size_t concurrency() const override { return workers_.size(); }

        private:
            void worker_loop()
            {
                for (;;)
                {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(mutex_);
                        condition_.wait(lock, [this]
                                        { return stop_ || !tasks_.empty(); });
                        if (stop_ && tasks_.empty())
                        {
                            return;
                        }
                        task = std::move(tasks_.front());
                        tasks_.pop();
                    }
                    task();
                }
            }

            void shutdown()
            {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    stop_ = true;
                }
                condition_.notify_all();
                for (auto &worker : workers_)
                {
                    if (worker.joinable())
                    {
                        worker.join();
                    }
                }
            }

            std::vector<std::thread> workers_;
            std::queue<std::function<void()>> tasks_;
            std::mutex mutex_;
            std::condition_variable condition_;
            bool stop_;
        };

        /**
         * @brief Executor matching a requested thread count.
         * @param num_threads 1 for inline execution, 0 for one worker per core.
         */
        inline std::unique_ptr<ParallelExecutor> make_executor(std::size_t num_threads)
        {
            if (num_threads == 1)
            {
                return std::make_unique<SingleThreadExecutor>();
            }
            return std::make_unique<ThreadPoolExecutor>(num_threads);
        }

    } // namespace simulation
} // namespace tradelab

#endif // TRADELAB_SIMULATION_PARALLEL_EXECUTOR_HPP
