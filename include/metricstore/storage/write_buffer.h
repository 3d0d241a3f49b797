#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "metricstore/core/config.h"
#include "metricstore/core/error.h"
#include "metricstore/core/result.h"
#include "metricstore/core/types.h"
#include "metricstore/storage/background_processor.h"
#include "metricstore/storage/storage.h"

namespace metricstore {
namespace storage {

struct WriteBufferStats {
    uint64_t records_enqueued = 0;
    uint64_t records_flushed = 0;
    uint64_t records_dropped = 0;   // lost to failed flushes
    uint64_t records_rejected = 0;  // failed validation, never buffered
    uint64_t flushes = 0;
    uint64_t failed_flushes = 0;
    size_t pending = 0;
};

/**
 * @brief In-memory tail of recently recorded metrics
 *
 * enqueue() only appends under a short lock. Batches reach storage when the
 * buffer holds max_size records (asynchronously, on the background processor),
 * every flush_interval (recurring task), on an explicit flush(), and on
 * shutdown. A batch whose write fails is reported and dropped, never requeued.
 *
 * Records in the buffer are not durable: a process killed without shutdown
 * loses what was enqueued since the last completed flush, which is at most one
 * flush interval of traffic (or max_size records, whichever comes first).
 */
class WriteBuffer {
public:
    using ErrorCallback = std::function<void(const core::Error& error, size_t dropped_records)>;

    explicit WriteBuffer(const core::WriteBufferConfig& config = core::WriteBufferConfig::Default());
    ~WriteBuffer();

    WriteBuffer(const WriteBuffer&) = delete;
    WriteBuffer& operator=(const WriteBuffer&) = delete;

    /**
     * @brief Attach storage and schedule the interval flush
     * @param processor Runs size-triggered and interval flushes; must outlive
     *        the buffer or be shut down before it
     */
    core::Result<void> initialize(std::shared_ptr<Storage> storage,
                                  std::shared_ptr<BackgroundProcessor> processor);

    /**
     * @brief Append one record; never waits for a flush
     *
     * With buffering disabled the record is written through instead.
     */
    core::Result<void> enqueue(core::MetricRecord record);

    /**
     * @brief Write everything currently buffered as one batch
     * @return Number of records written
     */
    core::Result<size_t> flush();

    /**
     * @brief Stop the interval flush and drain the buffer
     */
    core::Result<void> shutdown();

    void set_error_callback(ErrorCallback callback);

    size_t size() const;
    WriteBufferStats stats() const;
    const core::WriteBufferConfig& config() const { return config_; }

private:
    void scheduleAsyncFlush();
    void reportFailure(const core::Error& error, size_t dropped);

    core::WriteBufferConfig config_;
    std::shared_ptr<Storage> storage_;
    std::shared_ptr<BackgroundProcessor> processor_;
    std::optional<uint64_t> interval_schedule_;

    mutable std::mutex buffer_mutex_;
    std::vector<core::MetricRecord> buffer_;

    // Serializes flushes so a caller's flush() also waits for one already in flight
    std::mutex flush_mutex_;

    std::mutex callback_mutex_;
    ErrorCallback error_callback_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> closed_{false};
    std::atomic<bool> flush_pending_{false};

    std::atomic<uint64_t> records_enqueued_{0};
    std::atomic<uint64_t> records_flushed_{0};
    std::atomic<uint64_t> records_dropped_{0};
    std::atomic<uint64_t> records_rejected_{0};
    std::atomic<uint64_t> flushes_{0};
    std::atomic<uint64_t> failed_flushes_{0};
};

} // namespace storage
} // namespace metricstore
