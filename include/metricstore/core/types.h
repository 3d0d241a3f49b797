#ifndef METRICSTORE_CORE_TYPES_H_
#define METRICSTORE_CORE_TYPES_H_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "metricstore/core/aggregation.h"
#include "metricstore/core/result.h"

namespace metricstore {
namespace core {

/**
 * @brief Milliseconds since Unix epoch (UTC)
 */
using Timestamp = int64_t;

/**
 * @brief Duration in milliseconds
 */
using Duration = int64_t;

constexpr Duration kMillisPerMinute = 60'000;
constexpr Duration kMillisPerHour = 3'600'000;
constexpr Duration kMillisPerDay = 86'400'000;

/**
 * @brief Opaque producer context. Stored as a serialized JSON object.
 */
using Metadata = std::map<std::string, std::string>;

/**
 * @brief Logical tables of the store
 */
enum class Table {
    TASK,
    AGENT,
    SWARM,
    ARCHIVE
};

const char* TableName(Table table);
Result<Table> ParseTable(const std::string& name);
bool IsDetailedTable(Table table);

enum class TaskOutcome {
    SUCCESS,
    FAILURE,
    TIMEOUT,
    CANCELLED
};

const char* OutcomeName(TaskOutcome outcome);
Result<TaskOutcome> ParseOutcome(const std::string& name);

/**
 * @brief One completed unit of work by one agent
 */
struct TaskMetric {
    std::string task_id;
    std::string agent_id;
    Timestamp timestamp = 0;
    int64_t duration_ms = 0;
    TaskOutcome outcome = TaskOutcome::SUCCESS;
    int64_t tokens_used = 0;
    int64_t files_changed = 0;
    Metadata metadata;

    bool operator==(const TaskMetric& other) const;
    bool operator!=(const TaskMetric& other) const { return !(*this == other); }
};

/**
 * @brief Derived or observed statistic about an agent
 */
struct AgentMetric {
    std::string agent_id;
    Timestamp timestamp = 0;
    std::string metric_kind;
    double value = 0.0;
    Metadata metadata;

    bool operator==(const AgentMetric& other) const;
    bool operator!=(const AgentMetric& other) const { return !(*this == other); }
};

/**
 * @brief Health, throughput, latency or utilization sample of a swarm
 */
struct SwarmMetric {
    std::string swarm_id;
    Timestamp timestamp = 0;
    std::string metric_kind;
    double value = 0.0;
    Metadata metadata;

    bool operator==(const SwarmMetric& other) const;
    bool operator!=(const SwarmMetric& other) const { return !(*this == other); }
};

/**
 * @brief One compacted bucket of the archive tier
 *
 * For task rows the scope is the agent id and the metric kind is the
 * compacted column (duration_ms, tokens_used, files_changed, success).
 */
struct ArchiveBucket {
    int64_t id = 0;
    Table source_table = Table::AGENT;
    AggregationLevel level = AggregationLevel::HOURLY;
    std::string scope_id;
    std::string metric_kind;
    Timestamp bucket_start = 0;
    std::string bucket_date;   // YYYY-MM-DD (UTC)
    AggregateStats stats;
    Timestamp created_at = 0;

    Timestamp bucket_end() const { return bucket_start + BucketWidth(level); }
};

/**
 * @brief A detailed record of any kind, as produced by the producer interface
 */
using MetricRecord = std::variant<TaskMetric, AgentMetric, SwarmMetric>;

/**
 * @brief A row returned by a read: detailed or archived
 */
using Record = std::variant<TaskMetric, AgentMetric, SwarmMetric, ArchiveBucket>;
using Records = std::vector<Record>;

Table TableOf(const MetricRecord& record);
Timestamp TimestampOf(const MetricRecord& record);

/**
 * @brief Reject records with empty scope ids or negative counts
 */
Result<void> ValidateRecord(const MetricRecord& record);

/**
 * @brief Time bound, start inclusive and end exclusive. Absent bounds are open.
 */
struct TimeRange {
    std::optional<Timestamp> start;
    std::optional<Timestamp> end;

    static TimeRange All() { return TimeRange{}; }
    static TimeRange Between(Timestamp start, Timestamp end) { return TimeRange{start, end}; }
    static TimeRange Since(Timestamp start) { return TimeRange{start, std::nullopt}; }

    bool contains(Timestamp ts) const {
        return (!start || ts >= *start) && (!end || ts < *end);
    }
    bool is_empty() const { return start && end && *end <= *start; }
};

/**
 * @brief Exact-match conjunction of predicates
 *
 * Which fields apply depends on the table; a field that does not exist on the
 * queried table makes the query invalid.
 */
struct QueryFilter {
    std::optional<std::string> task_id;
    std::optional<std::string> agent_id;
    std::optional<std::string> swarm_id;
    std::optional<std::string> metric_kind;
    std::optional<TaskOutcome> outcome;
    Metadata metadata;   // key -> expected value, keys match [A-Za-z0-9_]+

    bool empty() const {
        return !task_id && !agent_id && !swarm_id && !metric_kind && !outcome && metadata.empty();
    }
};

/**
 * @brief Validate that every set field of the filter exists on the table
 */
Result<void> ValidateFilter(Table table, const QueryFilter& filter);

/**
 * @brief Numeric columns an aggregation may address on a table
 *
 * Task rows expose duration_ms, tokens_used, files_changed and success (1 for a
 * successful outcome, else 0); agent and swarm rows expose value.
 */
const std::vector<std::string>& NumericColumns(Table table);
Result<void> ValidateColumn(Table table, const std::string& column);

enum class ScanOrder {
    TIME_ASCENDING,
    SCOPE_THEN_TIME
};

Timestamp NowMillis();

/**
 * @brief Start of the width-aligned bucket containing ts
 */
Timestamp FloorTo(Timestamp ts, Duration width);

/**
 * @brief Format a timestamp as ISO-8601 UTC with millisecond precision
 */
std::string FormatIso8601(Timestamp ts);

/**
 * @brief Format the UTC calendar date of a timestamp as YYYY-MM-DD
 */
std::string FormatDate(Timestamp ts);

} // namespace core
} // namespace metricstore

#endif // METRICSTORE_CORE_TYPES_H_
