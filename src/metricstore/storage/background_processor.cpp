#include "metricstore/storage/background_processor.h"
#include "metricstore/common/logger.h"
#include "metricstore/core/error.h"
#include <algorithm>

namespace metricstore {
namespace storage {

const char* BackgroundTaskTypeName(BackgroundTaskType type) {
    switch (type) {
        case BackgroundTaskType::FLUSH: return "flush";
        case BackgroundTaskType::COMPACTION: return "compaction";
        case BackgroundTaskType::CLEANUP: return "cleanup";
    }
    return "unknown";
}

BackgroundProcessor::BackgroundProcessor(const BackgroundProcessorConfig& config)
    : config_(config), task_queue_(runsLater) {
}

BackgroundProcessor::~BackgroundProcessor() {
    if (initialized_.load()) {
        auto result = shutdown();
        if (!result.ok()) {
            METRICSTORE_WARN("BackgroundProcessor shutdown failed: {}", result.error());
        }
    }
}

core::Result<void> BackgroundProcessor::initialize() {
    if (initialized_.load()) {
        return core::Result<void>::error("BackgroundProcessor already initialized");
    }

    if (config_.num_workers == 0) {
        return core::Result<void>::error("Invalid number of workers: 0", core::Error::Code::INVALID_QUERY);
    }

    if (config_.max_queue_size == 0) {
        return core::Result<void>::error("Invalid max queue size: 0", core::Error::Code::INVALID_QUERY);
    }

    shutdown_requested_.store(false);
    startWorkers();

    initialized_.store(true);
    return core::Result<void>();
}

core::Result<void> BackgroundProcessor::shutdown() {
    if (!initialized_.load() || shutdown_requested_.load()) {
        return core::Result<void>();
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_requested_.store(true);
        recurring_.clear();
    }
    queue_condition_.notify_all();

    size_t discarded = 0;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        bool drained = idle_condition_.wait_for(lock, config_.shutdown_timeout,
                                                [this] { return task_queue_.empty(); });
        if (!drained) {
            discarded = task_queue_.size();
            while (!task_queue_.empty()) {
                task_queue_.pop();
            }
            tasks_rejected_.fetch_add(discarded);
        }
    }

    // Waits only for tasks already running
    stopWorkers();

    initialized_.store(false);
    if (discarded > 0) {
        METRICSTORE_WARN("Background processor discarded {} queued tasks after {} ms",
                         discarded, config_.shutdown_timeout.count());
        return core::Result<void>::error(
            fmt::format("Shutdown timed out with {} tasks queued", discarded), core::Error::Code::TIMEOUT);
    }
    return core::Result<void>();
}

core::Result<void> BackgroundProcessor::submitTask(BackgroundTask task) {
    if (shutdown_requested_.load()) {
        return core::Result<void>::error("BackgroundProcessor is shutting down");
    }

    if (!initialized_.load()) {
        return core::Result<void>::error("BackgroundProcessor not initialized");
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);

        if (task_queue_.size() >= config_.max_queue_size) {
            tasks_rejected_.fetch_add(1);
            return core::Result<void>::error("Queue is full");
        }

        task.task_id = next_task_id_.fetch_add(1);
        task_queue_.push(std::make_unique<BackgroundTask>(std::move(task)));
        tasks_submitted_.fetch_add(1);
    }

    queue_condition_.notify_one();
    return core::Result<void>();
}

core::Result<void> BackgroundProcessor::submitFlushTask(std::function<core::Result<void>()> task_func, uint32_t priority) {
    return submitTask(BackgroundTask(BackgroundTaskType::FLUSH, std::move(task_func), priority));
}

core::Result<void> BackgroundProcessor::submitCompactionTask(std::function<core::Result<void>()> task_func, uint32_t priority) {
    return submitTask(BackgroundTask(BackgroundTaskType::COMPACTION, std::move(task_func), priority));
}

core::Result<void> BackgroundProcessor::submitCleanupTask(std::function<core::Result<void>()> task_func, uint32_t priority) {
    return submitTask(BackgroundTask(BackgroundTaskType::CLEANUP, std::move(task_func), priority));
}

core::Result<uint64_t> BackgroundProcessor::scheduleRecurring(BackgroundTaskType type,
                                                              std::chrono::milliseconds interval,
                                                              std::function<core::Result<void>()> task_func,
                                                              uint32_t priority) {
    if (interval.count() <= 0) {
        return core::Result<uint64_t>::error("Recurring interval must be positive",
                                             core::Error::Code::INVALID_QUERY);
    }
    if (!isRunning()) {
        return core::Result<uint64_t>::error("BackgroundProcessor not running");
    }

    uint64_t schedule_id = 0;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        schedule_id = next_schedule_id_++;
        recurring_.push_back(RecurringTask{schedule_id, type, interval, std::move(task_func), priority,
                                           std::chrono::steady_clock::now() + interval, false});
    }
    queue_condition_.notify_all();

    METRICSTORE_DEBUG("Scheduled recurring {} task every {} ms", BackgroundTaskTypeName(type), interval.count());
    return core::Result<uint64_t>(schedule_id);
}

void BackgroundProcessor::cancelRecurring(uint64_t schedule_id) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    recurring_.erase(std::remove_if(recurring_.begin(), recurring_.end(),
                                    [schedule_id](const RecurringTask& r) { return r.schedule_id == schedule_id; }),
                     recurring_.end());
}

core::Result<void> BackgroundProcessor::waitForCompletion(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    bool drained = idle_condition_.wait_for(lock, timeout, [this] {
        return task_queue_.empty() && active_tasks_ == 0;
    });
    if (!drained) {
        return core::Result<void>::error("Wait for completion timed out", core::Error::Code::TIMEOUT);
    }
    return core::Result<void>();
}

BackgroundProcessorStatsSnapshot BackgroundProcessor::getStats() const {
    BackgroundProcessorStatsSnapshot snap;
    snap.tasks_submitted = tasks_submitted_.load();
    snap.tasks_processed = tasks_processed_.load();
    snap.tasks_failed = tasks_failed_.load();
    snap.tasks_rejected = tasks_rejected_.load();
    snap.flush_tasks = flush_tasks_.load();
    snap.compaction_tasks = compaction_tasks_.load();
    snap.cleanup_tasks = cleanup_tasks_.load();
    std::lock_guard<std::mutex> lock(queue_mutex_);
    snap.queue_size = task_queue_.size();
    return snap;
}

void BackgroundProcessor::workerThread() {
    while (true) {
        auto task = getNextTask();
        if (!task) {
            if (shutdown_requested_.load()) {
                break;
            }
            continue;
        }
        processTask(*task);
    }
}

void BackgroundProcessor::processTask(BackgroundTask& task) {
    bool success = false;
    try {
        auto result = task.task_func();
        success = result.ok();
        if (!success) {
            METRICSTORE_WARN("Background {} task {} failed: {}",
                             BackgroundTaskTypeName(task.type), task.task_id, result.error());
        }
    } catch (const std::exception& e) {
        METRICSTORE_ERROR("Background {} task {} threw: {}",
                          BackgroundTaskTypeName(task.type), task.task_id, e.what());
    }
    updateStats(task, success);

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        --active_tasks_;
    }
    idle_condition_.notify_all();
}

std::unique_ptr<BackgroundTask> BackgroundProcessor::getNextTask() {
    std::unique_lock<std::mutex> lock(queue_mutex_);

    auto now = std::chrono::steady_clock::now();
    if (!shutdown_requested_.load()) {
        promoteDueRecurring(now);
    }

    if (task_queue_.empty()) {
        if (shutdown_requested_.load()) {
            return nullptr;
        }
        queue_condition_.wait_until(lock, nextWakeup(now), [this] {
            return !task_queue_.empty() || shutdown_requested_.load();
        });
        if (task_queue_.empty()) {
            return nullptr;
        }
    }

    auto task = std::move(const_cast<std::unique_ptr<BackgroundTask>&>(task_queue_.top()));
    task_queue_.pop();
    ++active_tasks_;
    return task;
}

void BackgroundProcessor::promoteDueRecurring(std::chrono::steady_clock::time_point now) {
    for (auto& recurring : recurring_) {
        if (recurring.queued || recurring.next_run > now) {
            continue;
        }
        recurring.queued = true;
        uint64_t schedule_id = recurring.schedule_id;
        auto func = recurring.task_func;
        BackgroundTask task(recurring.type, [this, schedule_id, func]() {
            // Re-arm even when the body throws
            struct Rearm {
                BackgroundProcessor* processor;
                uint64_t id;
                ~Rearm() { processor->onRecurringFinished(id); }
            } rearm{this, schedule_id};
            return func();
        }, recurring.priority);
        task.task_id = next_task_id_.fetch_add(1);
        task_queue_.push(std::make_unique<BackgroundTask>(std::move(task)));
        tasks_submitted_.fetch_add(1);
    }
}

std::chrono::steady_clock::time_point BackgroundProcessor::nextWakeup(std::chrono::steady_clock::time_point now) const {
    auto wakeup = now + config_.worker_wait_timeout;
    for (const auto& recurring : recurring_) {
        if (!recurring.queued && recurring.next_run < wakeup) {
            wakeup = recurring.next_run;
        }
    }
    return wakeup;
}

void BackgroundProcessor::onRecurringFinished(uint64_t schedule_id) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    for (auto& recurring : recurring_) {
        if (recurring.schedule_id == schedule_id) {
            recurring.queued = false;
            recurring.next_run = std::chrono::steady_clock::now() + recurring.interval;
            break;
        }
    }
}

void BackgroundProcessor::startWorkers() {
    workers_.clear();
    workers_.reserve(config_.num_workers);

    for (uint32_t i = 0; i < config_.num_workers; ++i) {
        workers_.emplace_back(&BackgroundProcessor::workerThread, this);
    }
}

void BackgroundProcessor::stopWorkers() {
    queue_condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    workers_.clear();
}

void BackgroundProcessor::updateStats(const BackgroundTask& task, bool success) {
    tasks_processed_.fetch_add(1);
    if (!success) {
        tasks_failed_.fetch_add(1);
    }

    switch (task.type) {
        case BackgroundTaskType::FLUSH:
            flush_tasks_.fetch_add(1);
            break;
        case BackgroundTaskType::COMPACTION:
            compaction_tasks_.fetch_add(1);
            break;
        case BackgroundTaskType::CLEANUP:
            cleanup_tasks_.fetch_add(1);
            break;
    }
}

} // namespace storage
} // namespace metricstore
