/**
 * @file test_thread_pool.cpp
 * @brief Worker pool used by parallel packet synthesis
 */

#include <gtest/gtest.h>
#include "rainbow_thread_pool.hpp"

#include <atomic>
#include <stdexcept>
#include <vector>

using namespace rainbow;

TEST(ThreadPoolTest, SubmitReturnsResults) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.total_threads(), 3u);
    EXPECT_TRUE(pool.is_running());

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool.submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(futures[static_cast<size_t>(i)].get(), i * i);
    }
}

TEST(ThreadPoolTest, DefaultSizeHasWorkers) {
    ThreadPool pool;
    EXPECT_GE(pool.total_threads(), 1u);
}

TEST(ThreadPoolTest, ExceptionTravelsThroughFuture) {
    ThreadPool pool(2);
    auto f = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);
}

TEST(ThreadPoolTest, RunIndexedVisitsEveryIndex) {
    ThreadPool pool(4);
    std::vector<std::atomic<int>> hits(100);
    pool.run_indexed(hits.size(), [&](size_t i) { hits[i].fetch_add(1); });
    for (const auto& h : hits) {
        EXPECT_EQ(h.load(), 1);
    }
}

TEST(ThreadPoolTest, RunIndexedWaitsForAllThenRethrows) {
    ThreadPool pool(4);
    std::atomic<int> done{0};
    EXPECT_THROW(pool.run_indexed(50, [&](size_t i) {
                     if (i == 10) throw std::invalid_argument("bad index");
                     done.fetch_add(1);
                 }),
                 std::invalid_argument);
    EXPECT_EQ(done.load(), 49);
}

TEST(ThreadPoolTest, ShutdownDrainsAndRejects) {
    ThreadPool pool(2);
    std::atomic<int> ran{0};
    for (int i = 0; i < 10; ++i) {
        pool.submit([&ran]() { ran.fetch_add(1); });
    }
    pool.shutdown();
    EXPECT_EQ(ran.load(), 10);
    EXPECT_FALSE(pool.is_running());
    EXPECT_EQ(pool.pending_tasks(), 0u);
    EXPECT_THROW(pool.submit([]() {}), std::runtime_error);

    // Second shutdown is a no-op
    pool.shutdown();
}
