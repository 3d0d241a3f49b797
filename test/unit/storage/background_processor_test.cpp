#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include <atomic>
#include <vector>
#include <memory>
#include <mutex>

#include "metricstore/storage/background_processor.h"

using namespace metricstore::storage;
using namespace metricstore::core;

class BackgroundProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        BackgroundProcessorConfig config;
        config.num_workers = 2;
        config.max_queue_size = 100;
        config.shutdown_timeout = std::chrono::milliseconds(2000);
        config.worker_wait_timeout = std::chrono::milliseconds(20);

        processor_ = std::make_unique<BackgroundProcessor>(config);
        auto result = processor_->initialize();
        ASSERT_TRUE(result.ok()) << "Failed to initialize background processor: " << result.error();
    }

    void TearDown() override {
        if (processor_) {
            processor_->shutdown();
        }
    }

    std::unique_ptr<BackgroundProcessor> processor_;
    std::atomic<int> completed_tasks_{0};
    std::atomic<int> failed_tasks_{0};

    // Helper function to create a simple task
    std::function<Result<void>()> createSimpleTask(bool should_succeed = true, int delay_ms = 0) {
        return [this, should_succeed, delay_ms]() -> Result<void> {
            if (delay_ms > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            }
            if (should_succeed) {
                completed_tasks_.fetch_add(1);
                return Result<void>();
            }
            failed_tasks_.fetch_add(1);
            return Result<void>::error("Task failed");
        };
    }

    // Helper function to wait for a condition with timeout
    template<typename Predicate>
    bool waitForCondition(Predicate pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        auto start = std::chrono::steady_clock::now();
        while (!pred()) {
            if (std::chrono::steady_clock::now() - start > timeout) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return true;
    }
};

TEST_F(BackgroundProcessorTest, BasicInitialization) {
    EXPECT_TRUE(processor_->isRunning());
    EXPECT_EQ(processor_->getStats().queue_size, 0u);
}

TEST_F(BackgroundProcessorTest, InvalidInitialization) {
    BackgroundProcessorConfig config;
    config.num_workers = 0;

    BackgroundProcessor processor(config);
    auto result = processor.initialize();
    EXPECT_FALSE(result.ok());
    EXPECT_FALSE(processor.isRunning());

    config.num_workers = 1;
    config.max_queue_size = 0;
    BackgroundProcessor no_queue(config);
    EXPECT_FALSE(no_queue.initialize().ok());
}

TEST_F(BackgroundProcessorTest, DoubleInitialization) {
    auto result = processor_->initialize();
    EXPECT_FALSE(result.ok()) << "Should not allow double initialization";
}

TEST_F(BackgroundProcessorTest, TasksRunAndAreCountedByType) {
    ASSERT_TRUE(processor_->submitFlushTask(createSimpleTask()).ok());
    ASSERT_TRUE(processor_->submitCompactionTask(createSimpleTask()).ok());
    ASSERT_TRUE(processor_->submitCleanupTask(createSimpleTask(false)).ok());

    ASSERT_TRUE(processor_->waitForCompletion().ok());

    auto stats = processor_->getStats();
    EXPECT_EQ(stats.tasks_submitted, 3u);
    EXPECT_EQ(stats.tasks_processed, 3u);
    EXPECT_EQ(stats.tasks_failed, 1u);
    EXPECT_EQ(stats.flush_tasks, 1u);
    EXPECT_EQ(stats.compaction_tasks, 1u);
    EXPECT_EQ(stats.cleanup_tasks, 1u);
    EXPECT_EQ(completed_tasks_.load(), 2);
    EXPECT_EQ(failed_tasks_.load(), 1);
}

TEST_F(BackgroundProcessorTest, ThrowingTaskCountsAsFailure) {
    ASSERT_TRUE(processor_->submitFlushTask([]() -> Result<void> {
        throw std::runtime_error("Test exception");
    }).ok());
    ASSERT_TRUE(processor_->submitFlushTask(createSimpleTask()).ok());

    ASSERT_TRUE(processor_->waitForCompletion().ok());
    EXPECT_EQ(processor_->getStats().tasks_failed, 1u);
    EXPECT_EQ(completed_tasks_.load(), 1);
}

TEST_F(BackgroundProcessorTest, PriorityOrderOnSingleWorker) {
    BackgroundProcessorConfig config;
    config.num_workers = 1;
    BackgroundProcessor processor(config);
    ASSERT_TRUE(processor.initialize().ok());

    std::mutex order_mutex;
    std::vector<int> order;
    std::atomic<bool> release{false};

    // Occupy the worker so the rest queue up behind it
    ASSERT_TRUE(processor.submitFlushTask([&]() -> Result<void> {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return Result<void>();
    }, 0).ok());
    ASSERT_TRUE(waitForCondition([&] { return processor.getStats().queue_size == 0; }));

    auto record = [&](int id) {
        return [&, id]() -> Result<void> {
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(id);
            return Result<void>();
        };
    };
    ASSERT_TRUE(processor.submitCleanupTask(record(4), 4).ok());
    ASSERT_TRUE(processor.submitFlushTask(record(1), 1).ok());
    ASSERT_TRUE(processor.submitCompactionTask(record(3), 3).ok());
    ASSERT_TRUE(processor.submitFlushTask(record(2), 1).ok());

    release.store(true);
    ASSERT_TRUE(processor.waitForCompletion().ok());
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3, 4}));
    ASSERT_TRUE(processor.shutdown().ok());
}

TEST_F(BackgroundProcessorTest, QueueFullRejectsTask) {
    BackgroundProcessorConfig config;
    config.num_workers = 1;
    config.max_queue_size = 1;
    BackgroundProcessor processor(config);
    ASSERT_TRUE(processor.initialize().ok());

    std::atomic<bool> release{false};
    auto blocker = [&]() -> Result<void> {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return Result<void>();
    };
    ASSERT_TRUE(processor.submitFlushTask(blocker).ok());
    ASSERT_TRUE(waitForCondition([&] { return processor.getStats().queue_size == 0; }));

    ASSERT_TRUE(processor.submitFlushTask(createSimpleTask()).ok());
    EXPECT_FALSE(processor.submitFlushTask(createSimpleTask()).ok());
    EXPECT_EQ(processor.getStats().tasks_rejected, 1u);

    release.store(true);
    ASSERT_TRUE(processor.shutdown().ok());
}

TEST_F(BackgroundProcessorTest, RecurringTaskRepeatsUntilCancelled) {
    std::atomic<int> runs{0};
    auto schedule = processor_->scheduleRecurring(BackgroundTaskType::FLUSH, std::chrono::milliseconds(10),
                                                  [&]() -> Result<void> {
                                                      runs.fetch_add(1);
                                                      return Result<void>();
                                                  });
    ASSERT_TRUE(schedule.ok());
    ASSERT_TRUE(waitForCondition([&] { return runs.load() >= 3; }));

    processor_->cancelRecurring(schedule.value());
    ASSERT_TRUE(processor_->waitForCompletion().ok());
    int after_cancel = runs.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    EXPECT_EQ(runs.load(), after_cancel);
}

TEST_F(BackgroundProcessorTest, RecurringTaskSurvivesFailures) {
    std::atomic<int> runs{0};
    auto schedule = processor_->scheduleRecurring(BackgroundTaskType::COMPACTION, std::chrono::milliseconds(5),
                                                  [&]() -> Result<void> {
                                                      if (runs.fetch_add(1) % 2 == 0) {
                                                          throw std::runtime_error("transient");
                                                      }
                                                      return Result<void>::error("failed");
                                                  });
    ASSERT_TRUE(schedule.ok());
    EXPECT_TRUE(waitForCondition([&] { return runs.load() >= 4; }));
}

TEST_F(BackgroundProcessorTest, RecurringRejectsNonPositiveInterval) {
    auto schedule = processor_->scheduleRecurring(BackgroundTaskType::CLEANUP, std::chrono::milliseconds(0),
                                                  createSimpleTask());
    EXPECT_EQ(schedule.code(), Error::Code::INVALID_QUERY);
}

TEST_F(BackgroundProcessorTest, ShutdownDrainsQueuedTasks) {
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(processor_->submitFlushTask(createSimpleTask(true, 1)).ok());
    }
    ASSERT_TRUE(processor_->shutdown().ok());
    EXPECT_EQ(completed_tasks_.load(), 20);
    EXPECT_FALSE(processor_->isRunning());
    EXPECT_FALSE(processor_->submitFlushTask(createSimpleTask()).ok());
}

TEST_F(BackgroundProcessorTest, ShutdownDiscardsTasksQueuedPastTimeout) {
    BackgroundProcessorConfig config;
    config.num_workers = 1;
    config.shutdown_timeout = std::chrono::milliseconds(100);
    BackgroundProcessor processor(config);
    ASSERT_TRUE(processor.initialize().ok());

    std::atomic<bool> started{false};
    std::atomic<bool> slow_done{false};
    ASSERT_TRUE(processor.submitCompactionTask([&]() -> Result<void> {
        started.store(true);
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        slow_done.store(true);
        return Result<void>();
    }).ok());
    ASSERT_TRUE(waitForCondition([&]() { return started.load(); }));
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(processor.submitFlushTask(createSimpleTask()).ok());
    }

    auto begin = std::chrono::steady_clock::now();
    auto stopped = processor.shutdown();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    ASSERT_FALSE(stopped.ok());
    EXPECT_EQ(stopped.code(), Error::Code::TIMEOUT);
    EXPECT_TRUE(slow_done.load());
    EXPECT_EQ(completed_tasks_.load(), 0);
    EXPECT_EQ(processor.getStats().tasks_rejected, 5u);
    EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
    EXPECT_FALSE(processor.isRunning());
}

TEST_F(BackgroundProcessorTest, ConcurrentSubmission) {
    const int kThreads = 4;
    const int kPerThread = 20;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < kPerThread; ++i) {
                auto result = processor_->submitFlushTask(createSimpleTask());
                EXPECT_TRUE(result.ok());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    ASSERT_TRUE(processor_->waitForCompletion().ok());
    EXPECT_EQ(completed_tasks_.load(), kThreads * kPerThread);
}
