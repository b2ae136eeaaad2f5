/**
 * @file test_thread_pool_adapter.cpp
 * @brief Unit tests for the worker pool adapters
 */

#include <gtest/gtest.h>

#include <kcenon/vfs_transfer/adapters/thread_pool_adapter.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

namespace kcenon::vfs_transfer::adapters::test {

class AsyncWorkerPoolTest : public ::testing::Test {};

TEST_F(AsyncWorkerPoolTest, RunsSubmittedTasks) {
    async_worker_pool pool(4);
    std::atomic<int> counter{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.submit([&counter] { counter.fetch_add(1); }));
    }
    for (auto& future : futures) {
        future.get();
    }

    EXPECT_EQ(counter.load(), 10);
    EXPECT_EQ(pool.pending_tasks(), 0u);
    EXPECT_EQ(pool.worker_count(), 4u);
    EXPECT_TRUE(pool.is_running());
}

TEST_F(AsyncWorkerPoolTest, ExceptionReachesFuture) {
    async_worker_pool pool(1);

    auto future = pool.submit([] { throw std::runtime_error("boom"); });

    EXPECT_THROW(future.get(), std::runtime_error);
    EXPECT_EQ(pool.pending_tasks(), 0u);
}

TEST_F(AsyncWorkerPoolTest, ZeroWorkersUsesHardware) {
    async_worker_pool pool(0);
    EXPECT_GE(pool.worker_count(), 1u);
}

TEST(WorkerPoolFactoryTest, CreatesWorkingPool) {
    auto pool = worker_pool_factory::create(2, "factory_test");
    ASSERT_NE(pool, nullptr);

    std::atomic<bool> ran{false};
    pool->submit([&ran] { ran.store(true); }).get();

    EXPECT_TRUE(ran.load());
    EXPECT_TRUE(pool->is_running());
}

TEST(WorkerPoolFactoryTest, ReportsBackingImplementation) {
    auto pool = worker_pool_factory::create(1);
    if (worker_pool_factory::has_thread_system()) {
        EXPECT_EQ(dynamic_cast<async_worker_pool*>(pool.get()), nullptr);
    } else {
        EXPECT_NE(dynamic_cast<async_worker_pool*>(pool.get()), nullptr);
    }
}

}  // namespace kcenon::vfs_transfer::adapters::test
