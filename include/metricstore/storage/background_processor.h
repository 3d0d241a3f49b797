#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "metricstore/core/result.h"

namespace metricstore {
namespace storage {

// What a queued task does; drives statistics only
enum class BackgroundTaskType {
    FLUSH,
    COMPACTION,
    CLEANUP
};

const char* BackgroundTaskTypeName(BackgroundTaskType type);

struct BackgroundTask {
    BackgroundTaskType type;
    std::function<core::Result<void>()> task_func;
    std::chrono::steady_clock::time_point created_time;
    uint32_t priority;  // 0 runs first
    uint64_t task_id;   // Submission sequence, assigned on submit

    BackgroundTask(BackgroundTaskType t, std::function<core::Result<void>()> func, uint32_t p = 5)
        : type(t), task_func(std::move(func)), created_time(std::chrono::steady_clock::now()),
          priority(p), task_id(0) {}
};

struct BackgroundProcessorConfig {
    uint32_t num_workers = 1;
    uint32_t max_queue_size = 1000;
    std::chrono::milliseconds shutdown_timeout{5000};    // Queued tasks still waiting after it are discarded
    std::chrono::milliseconds worker_wait_timeout{100};  // Upper bound of one idle wait

    BackgroundProcessorConfig() = default;
};

struct BackgroundProcessorStatsSnapshot {
    uint64_t tasks_submitted = 0;
    uint64_t tasks_processed = 0;
    uint64_t tasks_failed = 0;
    uint64_t tasks_rejected = 0;
    uint64_t flush_tasks = 0;
    uint64_t compaction_tasks = 0;
    uint64_t cleanup_tasks = 0;
    uint64_t queue_size = 0;
};

/**
 * @brief Dedicated worker for flushes and the retention cycle
 *
 * One-shot tasks are ordered by priority, then by submission order. A
 * recurring task is queued again once its previous run has finished and its
 * interval has elapsed; it stops at cancelRecurring() or shutdown.
 */
class BackgroundProcessor {
public:
    explicit BackgroundProcessor(const BackgroundProcessorConfig& config = BackgroundProcessorConfig{});
    ~BackgroundProcessor();

    BackgroundProcessor(const BackgroundProcessor&) = delete;
    BackgroundProcessor& operator=(const BackgroundProcessor&) = delete;
    BackgroundProcessor(BackgroundProcessor&&) = delete;
    BackgroundProcessor& operator=(BackgroundProcessor&&) = delete;

    // Fails on a zero worker count or queue size, or when already running
    core::Result<void> initialize();

    /**
     * @brief Drain queued one-shot tasks and join the workers
     *
     * Recurring tasks are not run again once shutdown has been requested.
     * Tasks still queued after shutdown_timeout are discarded and the call
     * fails with TIMEOUT once the running tasks have finished.
     */
    core::Result<void> shutdown();

    core::Result<void> submitTask(BackgroundTask task);

    core::Result<void> submitFlushTask(std::function<core::Result<void>()> task_func, uint32_t priority = 1);
    core::Result<void> submitCompactionTask(std::function<core::Result<void>()> task_func, uint32_t priority = 3);
    core::Result<void> submitCleanupTask(std::function<core::Result<void>()> task_func, uint32_t priority = 4);

    /**
     * @brief Run a task every interval until shutdown
     * @param type Task type, for statistics and logging
     * @param interval Time between the end of one run and the start of the next
     * @param task_func Task body; failures are logged and the schedule continues
     * @param priority Priority of each queued run
     * @return Id that can be passed to cancelRecurring()
     */
    core::Result<uint64_t> scheduleRecurring(BackgroundTaskType type,
                                             std::chrono::milliseconds interval,
                                             std::function<core::Result<void>()> task_func,
                                             uint32_t priority = 5);

    void cancelRecurring(uint64_t schedule_id);

    /**
     * @brief Wait until the queue is empty and no task is running
     */
    core::Result<void> waitForCompletion(std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    BackgroundProcessorStatsSnapshot getStats() const;

    const BackgroundProcessorConfig& getConfig() const { return config_; }

    bool isRunning() const { return initialized_.load() && !shutdown_requested_.load(); }

private:
    struct RecurringTask {
        uint64_t schedule_id;
        BackgroundTaskType type;
        std::chrono::milliseconds interval;
        std::function<core::Result<void>()> task_func;
        uint32_t priority;
        std::chrono::steady_clock::time_point next_run;
        bool queued;   // a run is in the queue or executing
    };

    void workerThread();
    void processTask(BackgroundTask& task);
    std::unique_ptr<BackgroundTask> getNextTask();

    // Queue every recurring task whose time has come; caller holds queue_mutex_
    void promoteDueRecurring(std::chrono::steady_clock::time_point now);
    std::chrono::steady_clock::time_point nextWakeup(std::chrono::steady_clock::time_point now) const;
    void onRecurringFinished(uint64_t schedule_id);

    void startWorkers();
    void stopWorkers();
    void updateStats(const BackgroundTask& task, bool success);

    // std::priority_queue pops the greatest element, so "less" means "runs later"
    static bool runsLater(const std::unique_ptr<BackgroundTask>& a, const std::unique_ptr<BackgroundTask>& b) {
        return a->priority != b->priority ? a->priority > b->priority : a->task_id > b->task_id;
    }

    BackgroundProcessorConfig config_;

    std::atomic<uint64_t> tasks_submitted_{0};
    std::atomic<uint64_t> tasks_processed_{0};
    std::atomic<uint64_t> tasks_failed_{0};
    std::atomic<uint64_t> tasks_rejected_{0};
    std::atomic<uint64_t> flush_tasks_{0};
    std::atomic<uint64_t> compaction_tasks_{0};
    std::atomic<uint64_t> cleanup_tasks_{0};

    std::atomic<bool> initialized_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<uint64_t> next_task_id_{1};
    uint64_t next_schedule_id_{1};
    uint32_t active_tasks_{0};

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::condition_variable idle_condition_;
    std::priority_queue<std::unique_ptr<BackgroundTask>,
                        std::vector<std::unique_ptr<BackgroundTask>>,
                        std::function<bool(const std::unique_ptr<BackgroundTask>&,
                                           const std::unique_ptr<BackgroundTask>&)>> task_queue_;
    std::vector<RecurringTask> recurring_;

    std::vector<std::thread> workers_;
};

} // namespace storage
} // namespace metricstore
