/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <latch>

using namespace codelab;

TEST(ThreadPoolTest, BasicSubmit) {
    ThreadPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, MultipleSubmissions) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i] { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(ThreadPoolTest, ConcurrentExecution) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([&counter] {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }

    for (auto& f : futures) f.get();
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, ShutdownSignalsCancellableTasks) {
    ThreadPool pool(1);
    std::latch started(1);
    auto future = pool.submit_cancellable([&started](std::stop_token stop) {
        started.count_down();
        while (!stop.stop_requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return true;
    });

    started.wait();
    pool.shutdown();
    EXPECT_TRUE(future.get());
}

TEST(ThreadPoolTest, TrySubmitRefusesWhenQueueIsFull) {
    ThreadPool pool(1, 1);
    std::latch release(1);
    std::latch started(1);

    // Occupy the only worker.
    auto busy = pool.try_submit_cancellable([&](std::stop_token) {
        started.count_down();
        release.wait();
        return 1;
    });
    ASSERT_TRUE(busy.has_value());
    started.wait();

    auto queued = pool.try_submit_cancellable([](std::stop_token) { return 2; });
    ASSERT_TRUE(queued.has_value());
    EXPECT_EQ(pool.queued_count(), 1u);

    auto refused = pool.try_submit_cancellable([](std::stop_token) { return 3; });
    EXPECT_FALSE(refused.has_value());

    release.count_down();
    EXPECT_EQ(busy->get(), 1);
    EXPECT_EQ(queued->get(), 2);
}

TEST(ThreadPoolTest, TrySubmitRefusesAfterShutdown) {
    ThreadPool pool(2);
    pool.shutdown();
    auto refused = pool.try_submit_cancellable([](std::stop_token) { return 0; });
    EXPECT_FALSE(refused.has_value());
}
