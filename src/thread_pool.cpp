// src/thread_pool.cpp
#include "thread_pool.hpp"
#include "logging.hpp"

namespace SnapFetch
{
    namespace Concurrency
    {

        ThreadPool::ThreadPool(size_t num_threads) : stop_all(false)
        {
            if (num_threads == 0)
            {
                throw std::runtime_error("ThreadPool cannot be initialized with 0 threads.");
            }
            workers.reserve(num_threads);
            for (size_t i = 0; i < num_threads; ++i)
            {
                workers.emplace_back([this] { workerLoop(); });
            }
            Logging::logger()->debug("ThreadPool initialized with {} threads.", num_threads);
        }

        ThreadPool::~ThreadPool()
        {
            shutdown();
        }

        void ThreadPool::workerLoop()
        {
            for (;;)
            {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex);
                    condition.wait(lock, [this] { return stop_all || !tasks.empty(); });

                    // Drain the queue before exiting
                    if (stop_all && tasks.empty())
                        return;

                    task = std::move(tasks.front());
                    tasks.pop();
                }
                // packaged_task stores any exception in its future, so nothing escapes here
                task();
            }
        }

        void ThreadPool::shutdown()
        {
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                if (stop_all && workers.empty())
                    return;
                stop_all = true;
            }
            condition.notify_all();
            for (std::thread &worker : workers)
            {
                if (worker.joinable())
                {
                    worker.join();
                }
            }
            workers.clear();
            Logging::logger()->debug("ThreadPool stopped.");
        }

        size_t ThreadPool::pending() const
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            return tasks.size();
        }

    } // namespace Concurrency
} // namespace SnapFetch
