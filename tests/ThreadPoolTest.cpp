#include "core/ThreadPool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using bulkfetch::core::ThreadPool;

TEST(ThreadPoolTest, ReturnsTaskResults) {
    ThreadPool pool(3);
    std::vector<std::future<int>> results;
    for (int i = 0; i < 10; ++i) {
        results.push_back(pool.submit([](int x) { return x * x; }, i));
    }
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, ExceptionReachesTheFuture) {
    ThreadPool pool(1);
    auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    auto fine = pool.submit([] { return 7; });

    EXPECT_THROW(failing.get(), std::runtime_error);
    EXPECT_EQ(fine.get(), 7);
}

TEST(ThreadPoolTest, NeverRunsMoreThanItsSize) {
    ThreadPool pool(2);
    EXPECT_EQ(pool.size(), 2u);

    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::vector<std::future<void>> pending;
    for (int i = 0; i < 12; ++i) {
        pending.push_back(pool.submit([&] {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --running;
        }));
    }
    for (auto& task : pending) task.get();

    EXPECT_LE(peak.load(), 2);
    EXPECT_EQ(running.load(), 0);
}

TEST(ThreadPoolTest, DestructorDrainsQueuedWork) {
    std::atomic<int> done{0};
    {
        ThreadPool pool(1);
        for (int i = 0; i < 5; ++i) {
            pool.submit([&done] {
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
                ++done;
            });
        }
    }
    EXPECT_EQ(done.load(), 5);
}
