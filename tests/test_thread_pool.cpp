/**
 * bashgate - thread pool tests
 */

#include <gtest/gtest.h>
#include <bashgate/core/thread_pool.hpp>

#include <atomic>
#include <stdexcept>
#include <unistd.h>

using namespace bashgate;

TEST(ThreadPoolTest, RunsEveryTask) {
    std::atomic<int> count(0);
    {
        ThreadPool pool(4);
        for (int i = 0; i < 100; ++i) {
            EXPECT_TRUE(pool.submit([&count] { count.fetch_add(1); }));
        }
        pool.shutdown();
    }
    EXPECT_EQ(count.load(), 100);
}

TEST(ThreadPoolTest, TasksRunConcurrently) {
    ThreadPool pool(2);
    std::atomic<int> running(0);
    std::atomic<int> peak(0);

    for (int i = 0; i < 2; ++i) {
        pool.submit([&] {
            int now = running.fetch_add(1) + 1;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            usleep(200000);
            running.fetch_sub(1);
        });
    }
    pool.shutdown();
    EXPECT_EQ(peak.load(), 2);
}

TEST(ThreadPoolTest, SubmitAfterShutdownIsRefused) {
    ThreadPool pool(1);
    pool.shutdown();
    EXPECT_FALSE(pool.submit([] {}));
    pool.shutdown();
}

TEST(ThreadPoolTest, ThrowingTaskDoesNotKillWorker) {
    std::atomic<int> count(0);
    ThreadPool pool(1);
    pool.submit([] { throw std::runtime_error("boom"); });
    pool.submit([&count] { count.fetch_add(1); });
    pool.shutdown();
    EXPECT_EQ(count.load(), 1);
    EXPECT_EQ(pool.pending(), 0u);
}
