#ifndef METRICSTORE_QUERY_QUERY_ENGINE_H_
#define METRICSTORE_QUERY_QUERY_ENGINE_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "metricstore/core/aggregation.h"
#include "metricstore/core/config.h"
#include "metricstore/core/query_context.h"
#include "metricstore/core/result.h"
#include "metricstore/core/types.h"
#include "metricstore/storage/sqlite_storage.h"

namespace metricstore {
namespace query {

enum class RankOrder {
    DESCENDING,
    ASCENDING
};

/**
 * @brief Raw row query over one table (detailed tables or the archive)
 */
struct RecordQuery {
    core::Table table = core::Table::TASK;
    core::QueryFilter filter;
    core::TimeRange range;
    size_t limit = 0;    // 0 uses QueryConfig::default_limit
    size_t offset = 0;
    core::ScanOrder order = core::ScanOrder::TIME_ASCENDING;
};

/**
 * @brief Scalar aggregation of one numeric column
 *
 * column defaults to duration_ms on the task table and value elsewhere.
 */
struct AggregateQuery {
    core::Table table = core::Table::TASK;
    core::AggregationOp op = core::AggregationOp::AVG;
    std::string column;
    core::QueryFilter filter;
    core::TimeRange range;
};

struct PercentileQuery {
    core::Table table = core::Table::TASK;
    std::string column;
    double p = 0.5;     // 0 <= p <= 1
    core::QueryFilter filter;
    core::TimeRange range;
};

/**
 * @brief Ranking of scope ids (agents or swarms)
 *
 * metric is a numeric column on the task table and a metric kind on the agent
 * and swarm tables.
 */
struct TopNQuery {
    core::Table table = core::Table::TASK;
    std::string metric;
    core::AggregationOp op = core::AggregationOp::AVG;
    RankOrder order = RankOrder::DESCENDING;
    size_t n = 10;
    core::TimeRange range;
};

struct IntervalQuery {
    core::Table table = core::Table::TASK;
    std::string column;
    core::TimeInterval interval = core::TimeInterval::HOUR;
    core::AggregationOp op = core::AggregationOp::AVG;
    core::QueryFilter filter;
    core::TimeRange range;
};

// Task totals and distinct scopes include compacted data; row counts are detailed only
struct SummaryStats {
    uint64_t total_tasks = 0;
    uint64_t successful_tasks = 0;
    std::optional<double> success_rate;
    std::optional<double> avg_duration_ms;
    double total_tokens = 0.0;
    uint64_t distinct_agents = 0;
    uint64_t agent_metric_rows = 0;
    uint64_t swarm_metric_rows = 0;
    uint64_t distinct_swarms = 0;
    uint64_t archive_buckets = 0;
};

/**
 * @brief Read-only questions over the detailed and archive tiers
 *
 * Each call reads through one storage snapshot, so rows moved by a concurrent
 * compaction are counted exactly once. Nothing older than the final retention
 * window is ever returned, whether or not a purge has run yet.
 */
class QueryEngine {
public:
    using Clock = std::function<core::Timestamp()>;

    QueryEngine(std::shared_ptr<storage::SqliteStorage> storage,
                const core::QueryConfig& config = core::QueryConfig::Default(),
                const core::RetentionPolicy& retention = core::RetentionPolicy::Default(),
                Clock clock = core::NowMillis);

    core::Result<core::Records> get_records(const RecordQuery& query,
                                            const core::QueryContext& ctx = core::QueryContext());

    /**
     * @brief Stream rows to a visitor without materializing them
     * @return Number of rows visited
     */
    core::Result<size_t> stream_records(const RecordQuery& query,
                                        const storage::RecordVisitor& visitor,
                                        const core::QueryContext& ctx = core::QueryContext());

    /**
     * @brief One scalar over both tiers
     *
     * Filters on task id, outcome or metadata read detailed rows only; when
     * compacted buckets overlap the range the result is flagged approximate.
     */
    core::Result<core::AggregateResult> aggregate(const AggregateQuery& query,
                                                  const core::QueryContext& ctx = core::QueryContext());

    /**
     * @brief Nearest-rank percentile
     *
     * Exact over detailed rows. When archived buckets fall in the range the
     * value is interpolated from bucket statistics and flagged APPROXIMATE
     * (archive only) or MIXED (both tiers). A filter buckets cannot answer
     * (task id, outcome, metadata) over a partly compacted range yields no
     * value and APPROXIMATE.
     */
    core::Result<core::PercentileResult> percentile(const PercentileQuery& query,
                                                    const core::QueryContext& ctx = core::QueryContext());

    core::Result<std::vector<core::RankedScope>> top_n(const TopNQuery& query,
                                                       const core::QueryContext& ctx = core::QueryContext());

    core::Result<std::vector<core::IntervalPoint>> aggregate_by_interval(
        const IntervalQuery& query, const core::QueryContext& ctx = core::QueryContext());

    /**
     * @brief The n task rows with the longest duration, longest first
     */
    core::Result<core::Records> slowest_tasks(size_t n,
                                              const core::QueryFilter& filter,
                                              const core::TimeRange& range,
                                              const core::QueryContext& ctx = core::QueryContext());

    core::Result<SummaryStats> summary(const core::TimeRange& range,
                                       const core::QueryContext& ctx = core::QueryContext());

    /**
     * @brief Number of stored rows; detailed tables count detailed rows only
     *
     * Use an aggregate COUNT to include records already compacted.
     */
    core::Result<uint64_t> count(core::Table table,
                                 const core::QueryFilter& filter,
                                 const core::TimeRange& range,
                                 const core::QueryContext& ctx = core::QueryContext());

    /**
     * @brief Clamp a range to the retained window
     */
    core::TimeRange retained(const core::TimeRange& range) const;

private:
    core::Timestamp horizon() const;
    core::QueryContext effective(const core::QueryContext& ctx) const;

    std::shared_ptr<storage::SqliteStorage> storage_;
    core::QueryConfig config_;
    core::RetentionPolicy retention_;
    Clock clock_;
};

} // namespace query
} // namespace metricstore

#endif // METRICSTORE_QUERY_QUERY_ENGINE_H_
