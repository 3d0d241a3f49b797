#include "metricstore/query/query_engine.h"
#include "metricstore/common/logger.h"
#include "metricstore/retention/retention_manager.h"

#include <algorithm>
#include <map>

namespace metricstore {
namespace query {

namespace {

/**
 * @brief Propagate an error, logging the ones that stopped a query midway
 */
template<typename T, typename U>
core::Result<T> Fail(const char* operation, const core::Result<U>& failed) {
    if (failed.code() == core::Error::Code::TIMEOUT || failed.code() == core::Error::Code::CANCELLED) {
        METRICSTORE_WARN("{} stopped: {}", operation, failed.error());
    }
    return core::PropagateError<T>(failed);
}

std::string DefaultColumn(core::Table table) {
    return table == core::Table::TASK ? "duration_ms" : "value";
}

core::Result<void> RequireDetailed(core::Table table) {
    if (!core::IsDetailedTable(table)) {
        return core::Result<void>::error("Aggregations run over task_metrics, agent_metrics or swarm_metrics",
                                         core::Error::Code::INVALID_QUERY);
    }
    return core::Result<void>();
}

/**
 * @brief Compaction keeps scope id and metric kind only; other predicates
 *        cannot be evaluated against archive buckets
 */
bool ArchiveEligible(const core::QueryFilter& filter) {
    return !filter.task_id && !filter.outcome && filter.metadata.empty();
}

// Buckets starting before the horizon hold expired rows and are never read
storage::ArchiveSelector SelectorFor(core::Table table, const std::string& column,
                                     const core::QueryFilter& filter, const core::TimeRange& range,
                                     core::Timestamp horizon) {
    storage::ArchiveSelector selector;
    selector.source_table = table;
    selector.scope_id = table == core::Table::SWARM ? filter.swarm_id : filter.agent_id;
    if (table == core::Table::TASK) {
        selector.metric_kind = column;
    } else {
        selector.metric_kind = filter.metric_kind;
    }
    selector.range = range;
    selector.earliest_start = horizon;
    return selector;
}

bool Straddles(const core::ArchiveBucket& bucket, const core::TimeRange& range) {
    bool cuts_start = range.start && bucket.bucket_start < *range.start && bucket.bucket_end() > *range.start;
    bool cuts_end = range.end && bucket.bucket_start < *range.end && bucket.bucket_end() > *range.end;
    return cuts_start || cuts_end;
}

} // namespace

QueryEngine::QueryEngine(std::shared_ptr<storage::SqliteStorage> storage,
                         const core::QueryConfig& config,
                         const core::RetentionPolicy& retention,
                         Clock clock)
    : storage_(std::move(storage)), config_(config), retention_(retention), clock_(std::move(clock)) {}

core::QueryContext QueryEngine::effective(const core::QueryContext& ctx) const {
    return ctx.with_default_timeout(config_.default_timeout);
}

core::Timestamp QueryEngine::horizon() const {
    return retention::RetentionCutoffs::Compute(retention_, clock_()).horizon;
}

core::TimeRange QueryEngine::retained(const core::TimeRange& range) const {
    auto floor = horizon();
    core::TimeRange clamped = range;
    if (!clamped.start || *clamped.start < floor) {
        clamped.start = floor;
    }
    return clamped;
}

core::Result<core::Records> QueryEngine::get_records(const RecordQuery& query, const core::QueryContext& ctx) {
    core::Records records;
    auto visited = stream_records(query, [&records](const core::Record& record) {
        records.push_back(record);
        return true;
    }, ctx);
    if (!visited.ok()) {
        return core::PropagateError<core::Records>(visited);
    }
    return core::Result<core::Records>(std::move(records));
}

core::Result<size_t> QueryEngine::stream_records(const RecordQuery& query,
                                                 const storage::RecordVisitor& visitor,
                                                 const core::QueryContext& ctx) {
    storage::ScanOptions options;
    options.limit = query.limit == 0 ? config_.default_limit : query.limit;
    options.offset = query.offset;
    options.order = query.order;

    auto scanned = storage_->scan(query.table, query.filter, retained(query.range), options, visitor,
                                  effective(ctx));
    if (!scanned.ok()) {
        return Fail<size_t>("Record query", scanned);
    }
    return scanned;
}

core::Result<core::AggregateResult> QueryEngine::aggregate(const AggregateQuery& query,
                                                           const core::QueryContext& ctx) {
    using AggResult = core::Result<core::AggregateResult>;
    auto valid = RequireDetailed(query.table);
    if (!valid.ok()) {
        return core::PropagateError<core::AggregateResult>(valid);
    }
    std::string column = query.column.empty() ? DefaultColumn(query.table) : query.column;
    valid = core::ValidateColumn(query.table, column);
    if (!valid.ok()) {
        return core::PropagateError<core::AggregateResult>(valid);
    }

    auto range = retained(query.range);
    auto snap = storage_->snapshot(effective(ctx));
    if (!snap.ok()) {
        return Fail<core::AggregateResult>("Aggregate", snap);
    }

    auto groups = snap.value().column_stats(query.table, column, query.filter, range, storage::StatsGrouping::NONE);
    if (!groups.ok()) {
        return Fail<core::AggregateResult>("Aggregate", groups);
    }

    core::AggregateResult result;
    result.op = query.op;
    core::AggregateStats stats = groups.value().empty() ? core::AggregateStats() : groups.value().front().stats;

    if (ArchiveEligible(query.filter)) {
        auto buckets = snap.value().archive_buckets(SelectorFor(query.table, column, query.filter, range,
                                                                horizon()));
        if (!buckets.ok()) {
            return Fail<core::AggregateResult>("Aggregate", buckets);
        }
        for (const auto& bucket : buckets.value()) {
            stats.merge(bucket.stats);
            result.used_archive = true;
            if (Straddles(bucket, range)) {
                result.approximate = true;
            }
        }
    } else {
        // Compacted rows cannot be matched on task id, outcome or metadata
        auto hidden = snap.value().count_archive(SelectorFor(query.table, column, query.filter, range,
                                                             horizon()));
        if (!hidden.ok()) {
            return Fail<core::AggregateResult>("Aggregate", hidden);
        }
        result.approximate = hidden.value() > 0;
    }

    result.count = stats.count;
    result.value = stats.evaluate(query.op);
    return AggResult(result);
}

core::Result<core::PercentileResult> QueryEngine::percentile(const PercentileQuery& query,
                                                             const core::QueryContext& ctx) {
    using PctResult = core::Result<core::PercentileResult>;
    auto valid = RequireDetailed(query.table);
    if (!valid.ok()) {
        return core::PropagateError<core::PercentileResult>(valid);
    }
    if (!(query.p >= 0.0 && query.p <= 1.0)) {
        return PctResult::error("Percentile must be within [0, 1]", core::Error::Code::INVALID_QUERY);
    }
    std::string column = query.column.empty() ? DefaultColumn(query.table) : query.column;
    valid = core::ValidateColumn(query.table, column);
    if (!valid.ok()) {
        return core::PropagateError<core::PercentileResult>(valid);
    }

    auto range = retained(query.range);
    auto snap = storage_->snapshot(effective(ctx));
    if (!snap.ok()) {
        return Fail<core::PercentileResult>("Percentile", snap);
    }

    auto values = snap.value().column_values(query.table, column, query.filter, range);
    if (!values.ok()) {
        return Fail<core::PercentileResult>("Percentile", values);
    }

    core::AggregateStats archived;
    bool unfiltered_archive = false;
    if (ArchiveEligible(query.filter)) {
        auto buckets = snap.value().archive_buckets(SelectorFor(query.table, column, query.filter, range,
                                                                horizon()));
        if (!buckets.ok()) {
            return Fail<core::PercentileResult>("Percentile", buckets);
        }
        for (const auto& bucket : buckets.value()) {
            archived.merge(bucket.stats);
        }
    } else {
        auto hidden = snap.value().count_archive(SelectorFor(query.table, column, query.filter, range,
                                                             horizon()));
        if (!hidden.ok()) {
            return Fail<core::PercentileResult>("Percentile", hidden);
        }
        unfiltered_archive = hidden.value() > 0;
    }

    const auto& sorted = values.value();
    core::PercentileResult result;

    // Part of the range only exists as buckets the filter cannot be applied to
    if (unfiltered_archive) {
        result.precision = core::Precision::APPROXIMATE;
        result.count = sorted.size();
        return PctResult(result);
    }

    if (archived.empty()) {
        result.precision = core::Precision::EXACT;
        result.count = sorted.size();
        if (!sorted.empty()) {
            size_t index = std::min(sorted.size() - 1, static_cast<size_t>(sorted.size() * query.p));
            result.value = sorted[index];
        }
        return PctResult(result);
    }

    core::AggregateStats combined = archived;
    for (double value : sorted) {
        combined.add(value);
    }
    result.precision = sorted.empty() ? core::Precision::APPROXIMATE : core::Precision::MIXED;
    result.count = combined.count;
    result.value = combined.approximate_percentile(query.p);
    return PctResult(result);
}

core::Result<std::vector<core::RankedScope>> QueryEngine::top_n(const TopNQuery& query,
                                                                const core::QueryContext& ctx) {
    using RankResult = core::Result<std::vector<core::RankedScope>>;
    auto valid = RequireDetailed(query.table);
    if (!valid.ok()) {
        return core::PropagateError<std::vector<core::RankedScope>>(valid);
    }
    if (query.metric.empty()) {
        return RankResult::error("top_n needs a metric", core::Error::Code::INVALID_QUERY);
    }

    std::string column = "value";
    core::QueryFilter filter;
    if (query.table == core::Table::TASK) {
        column = query.metric;
        valid = core::ValidateColumn(query.table, column);
        if (!valid.ok()) {
            return core::PropagateError<std::vector<core::RankedScope>>(valid);
        }
    } else {
        filter.metric_kind = query.metric;
    }

    auto range = retained(query.range);
    auto snap = storage_->snapshot(effective(ctx));
    if (!snap.ok()) {
        return Fail<std::vector<core::RankedScope>>("Top-N", snap);
    }

    auto groups = snap.value().column_stats(query.table, column, filter, range, storage::StatsGrouping::SCOPE);
    if (!groups.ok()) {
        return Fail<std::vector<core::RankedScope>>("Top-N", groups);
    }
    std::map<std::string, core::AggregateStats> per_scope;
    for (const auto& group : groups.value()) {
        per_scope[group.scope_id].merge(group.stats);
    }

    auto buckets = snap.value().archive_buckets(SelectorFor(query.table, column, filter, range,
                                                            horizon()));
    if (!buckets.ok()) {
        return Fail<std::vector<core::RankedScope>>("Top-N", buckets);
    }
    for (const auto& bucket : buckets.value()) {
        per_scope[bucket.scope_id].merge(bucket.stats);
    }

    std::vector<core::RankedScope> ranked;
    for (const auto& entry : per_scope) {
        auto value = entry.second.evaluate(query.op);
        if (!value) {
            continue;
        }
        ranked.push_back(core::RankedScope{entry.first, *value, entry.second.count});
    }

    bool descending = query.order == RankOrder::DESCENDING;
    std::sort(ranked.begin(), ranked.end(), [descending](const core::RankedScope& a, const core::RankedScope& b) {
        if (a.value != b.value) {
            return descending ? a.value > b.value : a.value < b.value;
        }
        return a.scope_id < b.scope_id;
    });
    if (ranked.size() > query.n) {
        ranked.resize(query.n);
    }
    return RankResult(std::move(ranked));
}

core::Result<std::vector<core::IntervalPoint>> QueryEngine::aggregate_by_interval(const IntervalQuery& query,
                                                                                  const core::QueryContext& ctx) {
    using SeriesResult = core::Result<std::vector<core::IntervalPoint>>;
    auto valid = RequireDetailed(query.table);
    if (!valid.ok()) {
        return core::PropagateError<std::vector<core::IntervalPoint>>(valid);
    }
    std::string column = query.column.empty() ? DefaultColumn(query.table) : query.column;
    valid = core::ValidateColumn(query.table, column);
    if (!valid.ok()) {
        return core::PropagateError<std::vector<core::IntervalPoint>>(valid);
    }

    const int64_t width = core::IntervalWidth(query.interval);
    auto range = retained(query.range);
    auto snap = storage_->snapshot(effective(ctx));
    if (!snap.ok()) {
        return Fail<std::vector<core::IntervalPoint>>("Interval aggregation", snap);
    }

    auto groups = snap.value().column_stats(query.table, column, query.filter, range,
                                            storage::StatsGrouping::INTERVAL, width);
    if (!groups.ok()) {
        return Fail<std::vector<core::IntervalPoint>>("Interval aggregation", groups);
    }

    std::map<core::Timestamp, core::AggregateStats> series;
    for (const auto& group : groups.value()) {
        series[group.bucket_start].merge(group.stats);
    }

    if (ArchiveEligible(query.filter)) {
        auto buckets = snap.value().archive_buckets(SelectorFor(query.table, column, query.filter, range,
                                                                horizon()));
        if (!buckets.ok()) {
            return Fail<std::vector<core::IntervalPoint>>("Interval aggregation", buckets);
        }
        for (const auto& bucket : buckets.value()) {
            series[core::FloorTo(bucket.bucket_start, width)].merge(bucket.stats);
        }
    }

    std::vector<core::IntervalPoint> points;
    points.reserve(series.size());
    for (const auto& entry : series) {
        points.push_back(core::IntervalPoint{entry.first, entry.second.evaluate(query.op), entry.second.count});
    }
    return SeriesResult(std::move(points));
}

core::Result<core::Records> QueryEngine::slowest_tasks(size_t n,
                                                       const core::QueryFilter& filter,
                                                       const core::TimeRange& range,
                                                       const core::QueryContext& ctx) {
    auto snap = storage_->snapshot(effective(ctx));
    if (!snap.ok()) {
        return Fail<core::Records>("Slowest tasks", snap);
    }
    auto rows = snap.value().top_rows(core::Table::TASK, "duration_ms", filter, retained(range), n);
    if (!rows.ok()) {
        return Fail<core::Records>("Slowest tasks", rows);
    }
    return rows;
}

core::Result<SummaryStats> QueryEngine::summary(const core::TimeRange& range, const core::QueryContext& ctx) {
    auto window = retained(range);
    auto snap = storage_->snapshot(effective(ctx));
    if (!snap.ok()) {
        return Fail<SummaryStats>("Summary", snap);
    }
    auto& reader = snap.value();
    const core::QueryFilter all;

    // Task totals span both tiers; success, duration_ms and tokens_used all survive compaction
    auto task_stats = [&](const std::string& column) -> core::Result<core::AggregateStats> {
        auto groups = reader.column_stats(core::Table::TASK, column, all, window, storage::StatsGrouping::NONE);
        if (!groups.ok()) {
            return core::PropagateError<core::AggregateStats>(groups);
        }
        core::AggregateStats stats = groups.value().empty() ? core::AggregateStats() : groups.value().front().stats;
        auto buckets = reader.archive_buckets(SelectorFor(core::Table::TASK, column, all, window,
                                                          horizon()));
        if (!buckets.ok()) {
            return core::PropagateError<core::AggregateStats>(buckets);
        }
        for (const auto& bucket : buckets.value()) {
            stats.merge(bucket.stats);
        }
        return core::Result<core::AggregateStats>(stats);
    };

    SummaryStats summary;

    auto success = task_stats("success");
    if (!success.ok()) {
        return Fail<SummaryStats>("Summary", success);
    }
    summary.total_tasks = success.value().count;
    summary.successful_tasks = static_cast<uint64_t>(success.value().sum + 0.5);
    summary.success_rate = success.value().mean();

    auto duration = task_stats("duration_ms");
    if (!duration.ok()) {
        return Fail<SummaryStats>("Summary", duration);
    }
    summary.avg_duration_ms = duration.value().mean();

    auto tokens = task_stats("tokens_used");
    if (!tokens.ok()) {
        return Fail<SummaryStats>("Summary", tokens);
    }
    summary.total_tokens = tokens.value().sum;

    auto agents = reader.distinct_scopes(SelectorFor(core::Table::TASK, "success", all, window, horizon()));
    if (!agents.ok()) {
        return Fail<SummaryStats>("Summary", agents);
    }
    summary.distinct_agents = agents.value();

    auto agent_rows = reader.count(core::Table::AGENT, all, window);
    if (!agent_rows.ok()) {
        return Fail<SummaryStats>("Summary", agent_rows);
    }
    summary.agent_metric_rows = agent_rows.value();

    auto swarm_rows = reader.count(core::Table::SWARM, all, window);
    if (!swarm_rows.ok()) {
        return Fail<SummaryStats>("Summary", swarm_rows);
    }
    summary.swarm_metric_rows = swarm_rows.value();

    auto swarms = reader.distinct_scopes(SelectorFor(core::Table::SWARM, "", all, window, horizon()));
    if (!swarms.ok()) {
        return Fail<SummaryStats>("Summary", swarms);
    }
    summary.distinct_swarms = swarms.value();

    auto buckets = reader.count(core::Table::ARCHIVE, all, window);
    if (!buckets.ok()) {
        return Fail<SummaryStats>("Summary", buckets);
    }
    summary.archive_buckets = buckets.value();

    return core::Result<SummaryStats>(summary);
}

core::Result<uint64_t> QueryEngine::count(core::Table table,
                                          const core::QueryFilter& filter,
                                          const core::TimeRange& range,
                                          const core::QueryContext& ctx) {
    auto snap = storage_->snapshot(effective(ctx));
    if (!snap.ok()) {
        return Fail<uint64_t>("Count", snap);
    }
    auto counted = snap.value().count(table, filter, retained(range));
    if (!counted.ok()) {
        return Fail<uint64_t>("Count", counted);
    }
    return counted;
}

} // namespace query
} // namespace metricstore
