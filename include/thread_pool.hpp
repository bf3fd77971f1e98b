// include/thread_pool.hpp
#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future> // For std::future, std::packaged_task
#include <memory> // For std::make_shared
#include <functional> // For std::function
#include <stdexcept> // For std::runtime_error

namespace SnapFetch {
namespace Concurrency {

// Fixed-size worker pool. Tasks run in FIFO order on whichever worker is free.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Enqueue a task to be executed by a thread in the pool.
    // Returns a std::future that will hold the result of the task.
    template<class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::result_of<F(Args...)>::type>;

    // Stop accepting work, let queued tasks finish and join the workers. Idempotent.
    void shutdown();

    size_t size() const { return workers.size(); }

    // Tasks waiting for a worker.
    size_t pending() const;

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;

    mutable std::mutex queue_mutex;
    std::condition_variable condition;
    bool stop_all;

    void workerLoop();
};

template<class F, class... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<typename std::result_of<F(Args...)>::type>
{
    using return_type = typename std::result_of<F(Args...)>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> res = task->get_future();
    {
        std::unique_lock<std::mutex> lock(queue_mutex);

        if (stop_all)
            throw std::runtime_error("enqueue on stopped ThreadPool");

        tasks.emplace([task]() { (*task)(); });
    }
    condition.notify_one();
    return res;
}

} // namespace Concurrency
} // namespace SnapFetch
