#include <gtest/gtest.h>
#include "thread_pool.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <vector>

using SnapFetch::Concurrency::ThreadPool;

TEST(ThreadPoolTest, RunsTasksAndReturnsResults) {
    ThreadPool pool(4);
    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.enqueue([](int x) { return x * x; }, i));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
    EXPECT_EQ(pool.size(), 4u);
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(1);
    auto fut = pool.enqueue([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(fut.get(), std::runtime_error);
}

TEST(ThreadPoolTest, ZeroThreadsIsRejected) {
    EXPECT_THROW(ThreadPool pool(0), std::runtime_error);
}

TEST(ThreadPoolTest, ShutdownDrainsQueueAndRejectsNewWork) {
    std::atomic<int> ran{0};
    ThreadPool pool(2);
    for (int i = 0; i < 50; ++i) {
        pool.enqueue([&ran] {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ++ran;
        });
    }
    pool.shutdown();
    EXPECT_EQ(ran.load(), 50);
    EXPECT_EQ(pool.pending(), 0u);
    EXPECT_THROW(pool.enqueue([] {}), std::runtime_error);
    pool.shutdown();
}
