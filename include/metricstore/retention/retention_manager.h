#ifndef METRICSTORE_RETENTION_RETENTION_MANAGER_H_
#define METRICSTORE_RETENTION_RETENTION_MANAGER_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "metricstore/core/config.h"
#include "metricstore/core/query_context.h"
#include "metricstore/core/result.h"
#include "metricstore/core/types.h"
#include "metricstore/storage/background_processor.h"
#include "metricstore/storage/sqlite_storage.h"

namespace metricstore {
namespace retention {

/**
 * @brief Tier boundaries for one retention run
 *
 * Detailed rows in [hourly, detailed) compact into hourly buckets, rows in
 * [daily, hourly) into daily buckets. Hourly buckets starting before hourly
 * roll up into daily buckets. Anything before daily is deleted.
 */
struct RetentionCutoffs {
    core::Timestamp detailed = 0;   // hour aligned
    core::Timestamp hourly = 0;     // day aligned
    core::Timestamp daily = 0;      // day aligned
    core::Timestamp horizon = 0;    // oldest retained instant, unaligned

    static RetentionCutoffs Compute(const core::RetentionPolicy& policy, core::Timestamp now);
};

struct CompactionStats {
    uint64_t detailed_rows_compacted = 0;
    uint64_t hourly_buckets_written = 0;
    uint64_t daily_buckets_written = 0;
    uint64_t buckets_merged = 0;        // folded into an existing bucket of the same key
    uint64_t hourly_buckets_rolled_up = 0;
};

struct PurgeStats {
    uint64_t detailed_rows_purged = 0;
    uint64_t archive_buckets_purged = 0;
};

struct RetentionRunStats {
    CompactionStats compaction;
    PurgeStats purge;
    RetentionCutoffs cutoffs;
    core::Timestamp ran_at = 0;
    int64_t elapsed_ms = 0;
};

/**
 * @brief Demotes aging detailed rows into archive buckets and deletes expired data
 *
 * A run happens in one write transaction: archive buckets are written and the
 * rows they summarize are deleted in the same commit, so a crash leaves either
 * the detailed rows or their aggregate, never neither. Re-running on already
 * compacted data finds no detailed rows to move and changes nothing.
 */
class RetentionManager {
public:
    using Clock = std::function<core::Timestamp()>;

    RetentionManager(std::shared_ptr<storage::SqliteStorage> storage,
                     const core::RetentionPolicy& policy,
                     Clock clock = core::NowMillis);
    ~RetentionManager();

    RetentionManager(const RetentionManager&) = delete;
    RetentionManager& operator=(const RetentionManager&) = delete;

    /**
     * @brief Compact and purge in one transaction
     */
    core::Result<RetentionRunStats> run_once(const core::QueryContext& ctx = core::QueryContext());

    /**
     * @brief Compaction and hourly roll-up only
     */
    core::Result<CompactionStats> compact(const core::QueryContext& ctx = core::QueryContext());

    /**
     * @brief Delete everything older than the final retention window
     */
    core::Result<PurgeStats> purge(const core::QueryContext& ctx = core::QueryContext());

    /**
     * @brief Schedule run_once every cleanup_interval
     */
    core::Result<void> start(std::shared_ptr<storage::BackgroundProcessor> processor);
    void stop();

    RetentionCutoffs cutoffs() const;
    std::optional<RetentionRunStats> last_run() const;
    const core::RetentionPolicy& policy() const { return policy_; }

private:
    core::Result<void> compactInto(storage::WriteTransaction& txn, const RetentionCutoffs& cutoffs,
                                   CompactionStats& stats);
    core::Result<void> purgeInto(storage::WriteTransaction& txn, const RetentionCutoffs& cutoffs,
                                 PurgeStats& stats);

    std::shared_ptr<storage::SqliteStorage> storage_;
    core::RetentionPolicy policy_;
    Clock clock_;

    std::shared_ptr<storage::BackgroundProcessor> processor_;
    std::optional<uint64_t> schedule_id_;

    mutable std::mutex last_run_mutex_;
    std::optional<RetentionRunStats> last_run_;
};

} // namespace retention
} // namespace metricstore

#endif // METRICSTORE_RETENTION_RETENTION_MANAGER_H_
