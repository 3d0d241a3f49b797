#ifndef METRICSTORE_STORAGE_SQLITE_STORAGE_H_
#define METRICSTORE_STORAGE_SQLITE_STORAGE_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "metricstore/core/aggregation.h"
#include "metricstore/core/config.h"
#include "metricstore/core/query_context.h"
#include "metricstore/core/result.h"
#include "metricstore/core/types.h"
#include "metricstore/storage/connection_pool.h"
#include "metricstore/storage/storage.h"

namespace metricstore {
namespace storage {

constexpr const char* kSchemaVersion = "2.0.0";

/**
 * @brief Grouping of a statistics query
 */
enum class StatsGrouping {
    NONE,      // one group over all matched rows
    SCOPE,     // per agent (task/agent tables) or per swarm
    INTERVAL   // per width-aligned time bucket
};

struct StatsGroup {
    std::string scope_id;        // set for SCOPE grouping
    core::Timestamp bucket_start = 0;  // set for INTERVAL grouping
    core::AggregateStats stats;
};

/**
 * @brief Selection of archive buckets
 *
 * Buckets are matched when they overlap the range, i.e. bucket_end > start
 * and bucket_start < end.
 */
struct ArchiveSelector {
    core::Table source_table = core::Table::AGENT;
    std::optional<core::AggregationLevel> level;
    std::optional<std::string> scope_id;
    std::optional<std::string> metric_kind;
    core::TimeRange range;
    std::optional<core::Timestamp> earliest_start;   // buckets starting before it are skipped
};

class SqliteStorage;

/**
 * @brief Read transaction pinned to one pooled connection
 *
 * Every read made through one snapshot sees the same committed state, so a
 * compaction that commits in between cannot make rows disappear from one tier
 * without appearing in the other.
 */
class ReadSnapshot {
public:
    ReadSnapshot() = default;
    ~ReadSnapshot();

    ReadSnapshot(ReadSnapshot&& other) noexcept;
    ReadSnapshot& operator=(ReadSnapshot&& other) noexcept;
    ReadSnapshot(const ReadSnapshot&) = delete;
    ReadSnapshot& operator=(const ReadSnapshot&) = delete;

    core::Result<size_t> scan(core::Table table,
                              const core::QueryFilter& filter,
                              const core::TimeRange& range,
                              const ScanOptions& options,
                              const RecordVisitor& visitor);

    /**
     * @brief count, sum, min, max and sum of squares of a numeric column
     * @param bucket_width Bucket width for INTERVAL grouping, ignored otherwise
     */
    core::Result<std::vector<StatsGroup>> column_stats(core::Table table,
                                                       const std::string& column,
                                                       const core::QueryFilter& filter,
                                                       const core::TimeRange& range,
                                                       StatsGrouping grouping,
                                                       int64_t bucket_width = 0);

    /**
     * @brief Matched values of a numeric column sorted ascending
     */
    core::Result<std::vector<double>> column_values(core::Table table,
                                                    const std::string& column,
                                                    const core::QueryFilter& filter,
                                                    const core::TimeRange& range);

    /**
     * @brief The n rows with the largest value of a column, largest first
     */
    core::Result<core::Records> top_rows(core::Table table,
                                         const std::string& column,
                                         const core::QueryFilter& filter,
                                         const core::TimeRange& range,
                                         size_t n);

    core::Result<std::vector<core::ArchiveBucket>> archive_buckets(const ArchiveSelector& selector);
    core::Result<uint64_t> count_archive(const ArchiveSelector& selector);

    core::Result<uint64_t> count(core::Table table,
                                 const core::QueryFilter& filter,
                                 const core::TimeRange& range);

    /**
     * @brief Number of distinct scope ids (agents or swarms) in a range
     */
    core::Result<uint64_t> distinct_scopes(core::Table table, const core::TimeRange& range);

    /**
     * @brief Distinct scope ids of the selector's source table, counting
     *        both its detailed rows in the range and the selected buckets
     */
    core::Result<uint64_t> distinct_scopes(const ArchiveSelector& selector);

private:
    friend class SqliteStorage;

    ReadSnapshot(PooledConnection conn, const core::QueryContext& ctx);
    void finish();

    PooledConnection conn_;
    std::unique_ptr<core::QueryContext> ctx_;
    bool open_ = false;
};

/**
 * @brief Exclusive write transaction used by compaction and purge
 *
 * Holds the storage write lock for its lifetime. Everything done through it
 * becomes visible atomically on commit(); destruction without commit rolls
 * back.
 */
class WriteTransaction {
public:
    WriteTransaction() = default;
    ~WriteTransaction();

    WriteTransaction(WriteTransaction&& other) noexcept;
    WriteTransaction& operator=(WriteTransaction&& other) noexcept;
    WriteTransaction(const WriteTransaction&) = delete;
    WriteTransaction& operator=(const WriteTransaction&) = delete;

    /**
     * @brief Aggregate detailed rows in a range into buckets of the given level
     *
     * Task rows yield four buckets per agent and time bucket: duration_ms,
     * tokens_used, files_changed and success.
     */
    core::Result<std::vector<core::ArchiveBucket>> group_detailed(core::Table table,
                                                                  core::AggregationLevel level,
                                                                  const core::TimeRange& range);

    /**
     * @brief Archive buckets of one level whose start lies in the range
     */
    core::Result<std::vector<core::ArchiveBucket>> select_archive(core::AggregationLevel level,
                                                                  const core::TimeRange& range);

    core::Result<std::optional<core::ArchiveBucket>> find_bucket(core::Table source_table,
                                                                 core::AggregationLevel level,
                                                                 const std::string& scope_id,
                                                                 const std::string& metric_kind,
                                                                 core::Timestamp bucket_start);

    /**
     * @brief Insert a bucket, or merge its statistics into the existing bucket with the same key
     * @return true when an existing bucket was merged
     */
    core::Result<bool> merge_bucket(const core::ArchiveBucket& bucket);

    core::Result<size_t> delete_detailed(core::Table table, const core::TimeRange& range);
    core::Result<size_t> delete_archive(const core::TimeRange& range);
    core::Result<size_t> delete_archive_ids(const std::vector<int64_t>& ids);

    core::Result<void> commit();

    bool active() const { return active_; }

private:
    friend class SqliteStorage;

    WriteTransaction(std::unique_lock<std::timed_mutex> lock, PooledConnection conn,
                     const core::CompressionConfig& compression);
    void rollback();

    std::unique_lock<std::timed_mutex> lock_;
    PooledConnection conn_;
    core::CompressionConfig compression_;
    bool active_ = false;
};

/**
 * @brief Storage engine backed by a single SQLite database file
 *
 * Detailed rows go to task_metrics, agent_metrics and swarm_metrics; compacted
 * buckets live in metrics_archive. A single timed write lock serializes batch
 * writes, compaction and vacuum; readers use their own pooled connections and
 * are never blocked by it.
 */
class SqliteStorage : public Storage {
public:
    explicit SqliteStorage(const core::CompressionConfig& compression = core::CompressionConfig::Default());
    ~SqliteStorage() override;

    SqliteStorage(const SqliteStorage&) = delete;
    SqliteStorage& operator=(const SqliteStorage&) = delete;

    core::Result<void> init(const core::StorageConfig& config) override;
    core::Result<void> write(const core::MetricRecord& record) override;
    core::Result<void> write_batch(const std::vector<core::MetricRecord>& records) override;

    core::Result<size_t> scan(core::Table table,
                              const core::QueryFilter& filter,
                              const core::TimeRange& range,
                              const ScanOptions& options,
                              const RecordVisitor& visitor,
                              const core::QueryContext& ctx = core::QueryContext()) override;

    core::Result<void> vacuum() override;
    core::Result<void> analyze() override;
    core::Result<void> close() override;
    std::string stats() const override;

    /**
     * @brief Open a consistent read view
     */
    core::Result<ReadSnapshot> snapshot(const core::QueryContext& ctx = core::QueryContext());

    /**
     * @brief Take the write lock and begin an immediate transaction
     */
    core::Result<WriteTransaction> begin_write(const core::QueryContext& ctx = core::QueryContext());

    core::Result<std::string> schema_version();

    const core::StorageConfig& config() const { return config_; }
    bool is_open() const { return initialized_.load(); }

private:
    core::Result<void> createSchema();
    core::Result<PooledConnection> acquire(const core::QueryContext& ctx);
    core::Result<std::unique_lock<std::timed_mutex>> lockWriter(const core::QueryContext& ctx);

    core::StorageConfig config_;
    core::CompressionConfig compression_;
    std::unique_ptr<ConnectionPool> pool_;
    std::timed_mutex write_mutex_;
    std::atomic<bool> initialized_{false};

    std::atomic<uint64_t> batches_written_{0};
    std::atomic<uint64_t> records_written_{0};
    std::atomic<uint64_t> write_retries_{0};
};

} // namespace storage
} // namespace metricstore

#endif // METRICSTORE_STORAGE_SQLITE_STORAGE_H_
