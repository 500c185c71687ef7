// EN: Unit tests for the fixed-size ThreadPool
// FR: Tests unitaires pour le ThreadPool de taille fixe

#include <gtest/gtest.h>
#include "../include/infrastructure/threading/thread_pool.hpp"
#include "../include/infrastructure/logging/logger.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace GCS;
using namespace std::chrono_literals;

class ThreadPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }
};

TEST_F(ThreadPoolTest, RunsSubmittedTasksAndReturnsValues) {
    ThreadPoolConfig config;
    config.worker_count = 2;
    ThreadPool pool(config);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.submit([i]() { return i * i; }));
    }

    int sum = 0;
    for (auto& future : futures) {
        sum += future.get();
    }
    EXPECT_EQ(sum, 285);

    pool.waitForAll();
    auto stats = pool.getStats();
    EXPECT_EQ(stats.completed_tasks, 10u);
    EXPECT_EQ(stats.total_threads, 2u);
}

TEST_F(ThreadPoolTest, RejectsZeroWorkers) {
    ThreadPoolConfig config;
    config.worker_count = 0;
    EXPECT_THROW(ThreadPool pool(config), std::invalid_argument);
}

// EN: With one busy worker, queued tasks run by priority then submission order
// FR: Avec un seul worker occupé, les tâches en queue s'exécutent par priorité puis ordre de soumission
TEST_F(ThreadPoolTest, HigherPriorityRunsFirst) {
    ThreadPool pool;

    std::mutex gate_mutex;
    std::unique_lock<std::mutex> gate(gate_mutex);
    auto blocker = pool.submit([&gate_mutex]() { std::lock_guard<std::mutex> lock(gate_mutex); });

    while (pool.getStats().active_threads == 0) {
        std::this_thread::sleep_for(1ms);
    }

    std::vector<int> order;
    std::mutex order_mutex;
    auto record = [&order, &order_mutex](int value) {
        std::lock_guard<std::mutex> lock(order_mutex);
        order.push_back(value);
    };

    auto low = pool.submit(TaskPriority::LOW, record, 0);
    auto normal_a = pool.submit(TaskPriority::NORMAL, record, 1);
    auto high = pool.submit(TaskPriority::HIGH, record, 2);
    auto normal_b = pool.submit(TaskPriority::NORMAL, record, 3);

    gate.unlock();
    pool.waitForAll();

    ASSERT_EQ(order.size(), 4u);
    EXPECT_EQ(order, (std::vector<int>{2, 1, 3, 0}));
}

TEST_F(ThreadPoolTest, TaskExceptionReachesFuture) {
    ThreadPool pool;
    auto future = pool.submitNamed("chunk_7", TaskPriority::NORMAL, []() -> int {
        throw std::runtime_error("line failure");
    });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST_F(ThreadPoolTest, BoundedQueueRejectsOverflow) {
    ThreadPoolConfig config;
    config.max_queue_size = 1;
    ThreadPool pool(config);

    std::mutex gate_mutex;
    std::unique_lock<std::mutex> gate(gate_mutex);
    auto blocker = pool.submit([&gate_mutex]() { std::lock_guard<std::mutex> lock(gate_mutex); });
    while (pool.getStats().active_threads == 0) {
        std::this_thread::sleep_for(1ms);
    }

    auto queued = pool.submit([]() {});
    EXPECT_THROW(pool.submit([]() {}), std::runtime_error);

    gate.unlock();
    pool.waitForAll();
    EXPECT_EQ(pool.getStats().peak_queue_size, 1u);
}

TEST_F(ThreadPoolTest, SubmitAfterShutdownThrows) {
    ThreadPool pool;
    pool.shutdown();
    EXPECT_TRUE(pool.isShutdown());
    EXPECT_THROW(pool.submit([]() {}), std::runtime_error);
}

TEST_F(ThreadPoolTest, ForceShutdownDropsQueuedTasks) {
    ThreadPool pool;
    std::atomic<int> executed{0};
    std::atomic<bool> release{false};

    auto blocker = pool.submit([&release, &executed]() {
        while (!release.load()) {
            std::this_thread::sleep_for(1ms);
        }
        executed++;
    });
    while (pool.getStats().active_threads == 0) {
        std::this_thread::sleep_for(1ms);
    }
    for (int i = 0; i < 5; ++i) {
        pool.submit([&executed]() { executed++; });
    }

    std::thread releaser([&release]() {
        std::this_thread::sleep_for(20ms);
        release.store(true);
    });
    pool.forceShutdown();
    releaser.join();

    EXPECT_EQ(executed.load(), 1);
}
