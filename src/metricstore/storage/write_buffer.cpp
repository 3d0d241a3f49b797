#include "metricstore/storage/write_buffer.h"
#include "metricstore/common/logger.h"

#include <chrono>

namespace metricstore {
namespace storage {

WriteBuffer::WriteBuffer(const core::WriteBufferConfig& config) : config_(config) {
    buffer_.reserve(config_.max_size);
}

WriteBuffer::~WriteBuffer() {
    if (initialized_.load() && !closed_.load()) {
        auto result = shutdown();
        if (!result.ok()) {
            METRICSTORE_ERROR("Write buffer shutdown flush failed: {}", result.error());
        }
    }
}

core::Result<void> WriteBuffer::initialize(std::shared_ptr<Storage> storage,
                                           std::shared_ptr<BackgroundProcessor> processor) {
    if (initialized_.load()) {
        return core::Result<void>::error("WriteBuffer already initialized");
    }
    if (!storage) {
        return core::Result<void>::error("WriteBuffer needs a storage backend", core::Error::Code::INVALID_QUERY);
    }
    auto valid = config_.validate();
    if (!valid.ok()) {
        return valid;
    }

    storage_ = std::move(storage);
    processor_ = std::move(processor);

    if (config_.enabled) {
        if (!processor_ || !processor_->isRunning()) {
            return core::Result<void>::error("WriteBuffer needs a running background processor");
        }
        auto scheduled = processor_->scheduleRecurring(
            BackgroundTaskType::FLUSH, config_.flush_interval,
            [this]() -> core::Result<void> {
                auto flushed = flush();
                if (!flushed.ok()) {
                    return core::PropagateError<void>(flushed);
                }
                return core::Result<void>();
            },
            2);
        if (!scheduled.ok()) {
            return core::PropagateError<void>(scheduled);
        }
        interval_schedule_ = scheduled.value();
    }

    closed_.store(false);
    initialized_.store(true);
    METRICSTORE_DEBUG("Write buffer ready: max_size={} flush_interval={}ms",
                      config_.max_size, config_.flush_interval.count());
    return core::Result<void>();
}

core::Result<void> WriteBuffer::enqueue(core::MetricRecord record) {
    if (!initialized_.load() || closed_.load()) {
        return core::Result<void>::error("WriteBuffer is not accepting records",
                                         core::Error::Code::STORAGE_UNAVAILABLE);
    }
    // A rejected row would fail the whole shared batch
    auto valid = core::ValidateRecord(record);
    if (!valid.ok()) {
        records_rejected_.fetch_add(1);
        return valid;
    }

    if (!config_.enabled) {
        records_enqueued_.fetch_add(1);
        auto written = storage_->write(record);
        if (!written.ok()) {
            records_dropped_.fetch_add(1);
            reportFailure(core::Error(written.error(), written.code()), 1);
            return written;
        }
        records_flushed_.fetch_add(1);
        return core::Result<void>();
    }

    bool full = false;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        buffer_.push_back(std::move(record));
        full = buffer_.size() >= config_.max_size;
    }
    records_enqueued_.fetch_add(1);

    if (full) {
        scheduleAsyncFlush();
    }
    return core::Result<void>();
}

void WriteBuffer::scheduleAsyncFlush() {
    if (closed_.load() || flush_pending_.exchange(true)) {
        return;
    }
    auto submitted = processor_->submitFlushTask([this]() -> core::Result<void> {
        flush_pending_.store(false);
        auto flushed = flush();
        if (!flushed.ok()) {
            return core::PropagateError<void>(flushed);
        }
        return core::Result<void>();
    });
    if (!submitted.ok()) {
        flush_pending_.store(false);
        METRICSTORE_WARN("Could not schedule write buffer flush: {}", submitted.error());
    }
}

core::Result<size_t> WriteBuffer::flush() {
    if (!storage_) {
        return core::Result<size_t>::error("WriteBuffer not initialized");
    }

    std::lock_guard<std::mutex> flush_lock(flush_mutex_);

    std::vector<core::MetricRecord> batch;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        batch.swap(buffer_);
        buffer_.reserve(config_.max_size);
    }
    if (batch.empty()) {
        return core::Result<size_t>(0);
    }

    auto start = std::chrono::steady_clock::now();
    auto written = storage_->write_batch(batch);
    flushes_.fetch_add(1);

    if (!written.ok()) {
        failed_flushes_.fetch_add(1);
        records_dropped_.fetch_add(batch.size());
        METRICSTORE_ERROR("Write buffer flush failed, {} records dropped: {}", batch.size(), written.error());
        reportFailure(core::Error(written.error(), written.code()), batch.size());
        return core::PropagateError<size_t>(written);
    }

    records_flushed_.fetch_add(batch.size());
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    METRICSTORE_DEBUG("Flushed {} records in {} ms", batch.size(), elapsed.count());
    return core::Result<size_t>(batch.size());
}

core::Result<void> WriteBuffer::shutdown() {
    if (!initialized_.load() || closed_.exchange(true)) {
        return core::Result<void>();
    }

    if (processor_) {
        if (interval_schedule_) {
            processor_->cancelRecurring(*interval_schedule_);
            interval_schedule_.reset();
        }
        if (processor_->isRunning()) {
            auto drained = processor_->waitForCompletion();
            if (!drained.ok()) {
                METRICSTORE_WARN("Pending flushes did not finish before shutdown: {}", drained.error());
            }
        }
    }

    if (!config_.auto_flush_on_shutdown) {
        size_t discarded = size();
        if (discarded > 0) {
            METRICSTORE_WARN("Discarding {} buffered records on shutdown", discarded);
        }
        return core::Result<void>();
    }

    auto flushed = flush();
    if (!flushed.ok()) {
        return core::PropagateError<void>(flushed);
    }
    METRICSTORE_DEBUG("Write buffer shut down after final flush of {} records", flushed.value());
    return core::Result<void>();
}

void WriteBuffer::set_error_callback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    error_callback_ = std::move(callback);
}

void WriteBuffer::reportFailure(const core::Error& error, size_t dropped) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = error_callback_;
    }
    if (!callback) {
        return;
    }
    try {
        callback(error, dropped);
    } catch (const std::exception& e) {
        METRICSTORE_ERROR("Write buffer error callback threw: {}", e.what());
    }
}

size_t WriteBuffer::size() const {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    return buffer_.size();
}

WriteBufferStats WriteBuffer::stats() const {
    WriteBufferStats stats;
    stats.records_enqueued = records_enqueued_.load();
    stats.records_flushed = records_flushed_.load();
    stats.records_dropped = records_dropped_.load();
    stats.records_rejected = records_rejected_.load();
    stats.flushes = flushes_.load();
    stats.failed_flushes = failed_flushes_.load();
    stats.pending = size();
    return stats;
}

} // namespace storage
} // namespace metricstore
