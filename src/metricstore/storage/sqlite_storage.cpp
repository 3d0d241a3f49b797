#include "metricstore/storage/sqlite_storage.h"
#include "metricstore/common/logger.h"
#include "metricstore/storage/codec.h"

#include <sqlite3.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <thread>
#include <variant>

#include <spdlog/fmt/fmt.h>

namespace metricstore {
namespace storage {

namespace {

constexpr int kProgressOpcodes = 1000;
constexpr size_t kCheckEveryRows = 256;

const char* kSchema = R"(
    CREATE TABLE IF NOT EXISTS task_metrics (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        task_id TEXT NOT NULL,
        agent_id TEXT NOT NULL,
        timestamp INTEGER NOT NULL,
        duration_ms INTEGER NOT NULL,
        outcome TEXT NOT NULL,
        success INTEGER NOT NULL,
        tokens_used INTEGER NOT NULL DEFAULT 0,
        files_changed INTEGER NOT NULL DEFAULT 0,
        metadata TEXT NOT NULL DEFAULT '{}'
    );
    CREATE INDEX IF NOT EXISTS idx_task_metrics_timestamp ON task_metrics(timestamp);
    CREATE INDEX IF NOT EXISTS idx_task_metrics_agent_ts ON task_metrics(agent_id, timestamp);
    CREATE INDEX IF NOT EXISTS idx_task_metrics_task_ts ON task_metrics(task_id, timestamp);

    CREATE TABLE IF NOT EXISTS agent_metrics (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        agent_id TEXT NOT NULL,
        timestamp INTEGER NOT NULL,
        metric_kind TEXT NOT NULL,
        value REAL NOT NULL,
        metadata TEXT NOT NULL DEFAULT '{}'
    );
    CREATE INDEX IF NOT EXISTS idx_agent_metrics_timestamp ON agent_metrics(timestamp);
    CREATE INDEX IF NOT EXISTS idx_agent_metrics_scope_ts ON agent_metrics(agent_id, metric_kind, timestamp);

    CREATE TABLE IF NOT EXISTS swarm_metrics (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        swarm_id TEXT NOT NULL,
        timestamp INTEGER NOT NULL,
        metric_kind TEXT NOT NULL,
        value REAL NOT NULL,
        metadata TEXT NOT NULL DEFAULT '{}'
    );
    CREATE INDEX IF NOT EXISTS idx_swarm_metrics_timestamp ON swarm_metrics(timestamp);
    CREATE INDEX IF NOT EXISTS idx_swarm_metrics_scope_ts ON swarm_metrics(swarm_id, metric_kind, timestamp);

    CREATE TABLE IF NOT EXISTS metrics_archive (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        metric_table TEXT NOT NULL,
        aggregation_level TEXT NOT NULL,
        scope_id TEXT NOT NULL,
        metric_kind TEXT NOT NULL,
        bucket_start INTEGER NOT NULL,
        bucket_end INTEGER NOT NULL,
        archive_date TEXT NOT NULL,
        payload BLOB NOT NULL,
        compressed INTEGER NOT NULL,
        record_count INTEGER NOT NULL,
        created_at INTEGER NOT NULL,
        UNIQUE (metric_table, aggregation_level, scope_id, metric_kind, bucket_start)
    );
    CREATE INDEX IF NOT EXISTS idx_metrics_archive_bucket ON metrics_archive(bucket_start);
    CREATE INDEX IF NOT EXISTS idx_metrics_archive_scope ON metrics_archive(scope_id, metric_kind, bucket_start);

    CREATE TABLE IF NOT EXISTS storage_schema_info (
        key TEXT PRIMARY KEY,
        value TEXT NOT NULL,
        updated_at INTEGER NOT NULL
    );
)";

const char* kTaskColumns =
    "id, task_id, agent_id, timestamp, duration_ms, outcome, tokens_used, files_changed, metadata";
const char* kAgentColumns = "id, agent_id, timestamp, metric_kind, value, metadata";
const char* kSwarmColumns = "id, swarm_id, timestamp, metric_kind, value, metadata";
const char* kArchiveColumns =
    "id, metric_table, aggregation_level, scope_id, metric_kind, bucket_start, archive_date, "
    "payload, compressed, created_at";

using Binding = std::variant<int64_t, double, std::string>;

/**
 * @brief Prepared statement that finalizes itself
 *
 * The first failing prepare or bind is remembered and returned by step().
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        rc_ = sqlite3_prepare_v2(db, sql.c_str(), static_cast<int>(sql.size()), &stmt_, nullptr);
    }

    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK; }
    int rc() const { return rc_; }

    void bind_int(int index, int64_t value) { track(sqlite3_bind_int64(stmt_, index, value)); }
    void bind_real(int index, double value) { track(sqlite3_bind_double(stmt_, index, value)); }
    void bind_text(int index, const std::string& value) {
        track(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }
    void bind_blob(int index, const std::vector<uint8_t>& value) {
        track(sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }

    int bind_all(const std::vector<Binding>& values, int first = 1) {
        int index = first;
        for (const auto& value : values) {
            if (std::holds_alternative<int64_t>(value)) {
                bind_int(index, std::get<int64_t>(value));
            } else if (std::holds_alternative<double>(value)) {
                bind_real(index, std::get<double>(value));
            } else {
                bind_text(index, std::get<std::string>(value));
            }
            ++index;
        }
        return index;
    }

    int step() {
        if (rc_ != SQLITE_OK) {
            return rc_;
        }
        return sqlite3_step(stmt_);
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    double real(int col) const { return sqlite3_column_double(stmt_, col); }
    bool is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

    std::string text(int col) const {
        const unsigned char* data = sqlite3_column_text(stmt_, col);
        int size = sqlite3_column_bytes(stmt_, col);
        return data ? std::string(reinterpret_cast<const char*>(data), static_cast<size_t>(size)) : std::string();
    }

    const uint8_t* blob(int col, size_t* size) const {
        const void* data = sqlite3_column_blob(stmt_, col);
        *size = static_cast<size_t>(sqlite3_column_bytes(stmt_, col));
        return static_cast<const uint8_t*>(data);
    }

private:
    void track(int rc) {
        if (rc_ == SQLITE_OK && rc != SQLITE_OK) {
            rc_ = rc;
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_OK;
};

bool IsTransient(int rc) {
    int primary = rc & 0xFF;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

core::Error::Code MapSqliteError(int rc, const core::QueryContext* ctx) {
    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_IOERR:
        case SQLITE_CORRUPT:
        case SQLITE_CANTOPEN:
        case SQLITE_NOTADB:
        case SQLITE_READONLY:
        case SQLITE_PROTOCOL:
            return core::Error::Code::STORAGE_UNAVAILABLE;
        case SQLITE_FULL:
            return core::Error::Code::RETENTION_FAILURE;
        case SQLITE_INTERRUPT:
            return ctx && ctx->cancelled() ? core::Error::Code::CANCELLED : core::Error::Code::TIMEOUT;
        default:
            return core::Error::Code::INTERNAL;
    }
}

template<typename T>
core::Result<T> SqlError(sqlite3* db, int rc, const std::string& what,
                         const core::QueryContext* ctx = nullptr) {
    auto code = MapSqliteError(rc, ctx);
    if (code == core::Error::Code::CANCELLED) {
        return core::Result<T>::error(what + ": query cancelled", code);
    }
    if (code == core::Error::Code::TIMEOUT) {
        return core::Result<T>::error(what + ": query timed out", code);
    }
    return core::Result<T>::error(fmt::format("{}: {} ({})", what, sqlite3_errmsg(db), sqlite3_errstr(rc)),
                                  code);
}

int Exec(sqlite3* db, const char* sql, std::string* message) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK && message) {
        *message = err ? err : sqlite3_errstr(rc);
    }
    sqlite3_free(err);
    return rc;
}

int ProgressCallback(void* arg) {
    const auto* ctx = static_cast<const core::QueryContext*>(arg);
    return ctx->cancelled() || ctx->expired() ? 1 : 0;
}

std::chrono::milliseconds Budget(std::chrono::milliseconds configured, const core::QueryContext& ctx) {
    return std::min(configured, ctx.remaining());
}

/**
 * @brief Conjunction of SQL conditions with their bound values
 */
struct SqlPredicate {
    std::vector<std::string> conditions;
    std::vector<Binding> bindings;

    void add(const std::string& condition, Binding value) {
        conditions.push_back(condition);
        bindings.push_back(std::move(value));
    }

    void add(const std::string& condition) { conditions.push_back(condition); }

    void add_range(const char* column, const core::TimeRange& range) {
        if (range.start) {
            add(std::string(column) + " >= ?", Binding(int64_t{*range.start}));
        }
        if (range.end) {
            add(std::string(column) + " < ?", Binding(int64_t{*range.end}));
        }
    }

    std::string where() const {
        if (conditions.empty()) {
            return std::string();
        }
        std::string clause = " WHERE ";
        for (size_t i = 0; i < conditions.size(); ++i) {
            if (i > 0) {
                clause += " AND ";
            }
            clause += conditions[i];
        }
        return clause;
    }
};

const char* ScopeColumn(core::Table table) {
    switch (table) {
        case core::Table::TASK:
        case core::Table::AGENT: return "agent_id";
        case core::Table::SWARM: return "swarm_id";
        case core::Table::ARCHIVE: return "scope_id";
    }
    return "scope_id";
}

const char* TimeColumn(core::Table table) {
    return table == core::Table::ARCHIVE ? "bucket_start" : "timestamp";
}

const char* SelectColumns(core::Table table) {
    switch (table) {
        case core::Table::TASK: return kTaskColumns;
        case core::Table::AGENT: return kAgentColumns;
        case core::Table::SWARM: return kSwarmColumns;
        case core::Table::ARCHIVE: return kArchiveColumns;
    }
    return kTaskColumns;
}

std::string OrderBy(core::Table table, core::ScanOrder order) {
    if (order == core::ScanOrder::SCOPE_THEN_TIME) {
        switch (table) {
            case core::Table::TASK: return " ORDER BY agent_id, timestamp, id";
            case core::Table::AGENT: return " ORDER BY agent_id, metric_kind, timestamp, id";
            case core::Table::SWARM: return " ORDER BY swarm_id, metric_kind, timestamp, id";
            case core::Table::ARCHIVE: return " ORDER BY metric_table, scope_id, metric_kind, bucket_start, id";
        }
    }
    return fmt::format(" ORDER BY {}, id", TimeColumn(table));
}

// Buckets overlapping the selector range, not only those starting inside it
SqlPredicate ArchivePredicate(const ArchiveSelector& selector) {
    SqlPredicate predicate;
    predicate.add("metric_table = ?", Binding(std::string(core::TableName(selector.source_table))));
    if (selector.level) {
        predicate.add("aggregation_level = ?", Binding(std::string(core::AggregationLevelName(*selector.level))));
    }
    if (selector.scope_id) {
        predicate.add("scope_id = ?", Binding(*selector.scope_id));
    }
    if (selector.metric_kind) {
        predicate.add("metric_kind = ?", Binding(*selector.metric_kind));
    }
    if (selector.range.start) {
        predicate.add("bucket_end > ?", Binding(int64_t{*selector.range.start}));
    }
    if (selector.range.end) {
        predicate.add("bucket_start < ?", Binding(int64_t{*selector.range.end}));
    }
    if (selector.earliest_start) {
        predicate.add("bucket_start >= ?", Binding(int64_t{*selector.earliest_start}));
    }
    return predicate;
}

SqlPredicate BuildPredicate(core::Table table, const core::QueryFilter& filter, const core::TimeRange& range) {
    SqlPredicate predicate;
    if (table == core::Table::ARCHIVE) {
        if (filter.agent_id) {
            predicate.add("scope_id = ?", Binding(*filter.agent_id));
            predicate.add("metric_table IN ('task_metrics', 'agent_metrics')");
        }
        if (filter.swarm_id) {
            predicate.add("scope_id = ?", Binding(*filter.swarm_id));
            predicate.add("metric_table = 'swarm_metrics'");
        }
    } else {
        if (filter.task_id) {
            predicate.add("task_id = ?", Binding(*filter.task_id));
        }
        if (filter.agent_id) {
            predicate.add("agent_id = ?", Binding(*filter.agent_id));
        }
        if (filter.swarm_id) {
            predicate.add("swarm_id = ?", Binding(*filter.swarm_id));
        }
        if (filter.outcome) {
            predicate.add("outcome = ?", Binding(std::string(core::OutcomeName(*filter.outcome))));
        }
        for (const auto& [key, value] : filter.metadata) {
            predicate.add("json_extract(metadata, ?) = ?", Binding("$." + key));
            predicate.bindings.push_back(Binding(value));
        }
    }
    if (filter.metric_kind) {
        predicate.add("metric_kind = ?", Binding(*filter.metric_kind));
    }
    predicate.add_range(TimeColumn(table), range);
    return predicate;
}

std::string BucketExpr(int64_t width) {
    return fmt::format("(timestamp - (((timestamp % {0}) + {0}) % {0}))", width);
}

core::Result<core::ArchiveBucket> ReadArchiveRow(const Statement& stmt) {
    auto table = core::ParseTable(stmt.text(1));
    if (!table.ok()) {
        return core::PropagateError<core::ArchiveBucket>(table);
    }
    auto level = core::ParseAggregationLevel(stmt.text(2));
    if (!level.ok()) {
        return core::PropagateError<core::ArchiveBucket>(level);
    }

    size_t size = 0;
    const uint8_t* payload = stmt.blob(7, &size);
    auto stats = DecodeStats(payload, size, stmt.int64(8) != 0);
    if (!stats.ok()) {
        return core::PropagateError<core::ArchiveBucket>(stats);
    }

    core::ArchiveBucket bucket;
    bucket.id = stmt.int64(0);
    bucket.source_table = table.value();
    bucket.level = level.value();
    bucket.scope_id = stmt.text(3);
    bucket.metric_kind = stmt.text(4);
    bucket.bucket_start = stmt.int64(5);
    bucket.bucket_date = stmt.text(6);
    bucket.stats = stats.value();
    bucket.created_at = stmt.int64(9);
    return core::Result<core::ArchiveBucket>(std::move(bucket));
}

core::Result<core::Record> ReadRow(core::Table table, const Statement& stmt) {
    switch (table) {
        case core::Table::TASK: {
            core::TaskMetric task;
            task.task_id = stmt.text(1);
            task.agent_id = stmt.text(2);
            task.timestamp = stmt.int64(3);
            task.duration_ms = stmt.int64(4);
            auto outcome = core::ParseOutcome(stmt.text(5));
            if (!outcome.ok()) {
                return core::Result<core::Record>::error("Corrupt task row: " + outcome.error());
            }
            task.outcome = outcome.value();
            task.tokens_used = stmt.int64(6);
            task.files_changed = stmt.int64(7);
            auto metadata = DecodeMetadata(stmt.text(8));
            if (!metadata.ok()) {
                return core::PropagateError<core::Record>(metadata);
            }
            task.metadata = metadata.take_value();
            return core::Result<core::Record>(core::Record(std::move(task)));
        }
        case core::Table::AGENT: {
            core::AgentMetric agent;
            agent.agent_id = stmt.text(1);
            agent.timestamp = stmt.int64(2);
            agent.metric_kind = stmt.text(3);
            agent.value = stmt.real(4);
            auto metadata = DecodeMetadata(stmt.text(5));
            if (!metadata.ok()) {
                return core::PropagateError<core::Record>(metadata);
            }
            agent.metadata = metadata.take_value();
            return core::Result<core::Record>(core::Record(std::move(agent)));
        }
        case core::Table::SWARM: {
            core::SwarmMetric swarm;
            swarm.swarm_id = stmt.text(1);
            swarm.timestamp = stmt.int64(2);
            swarm.metric_kind = stmt.text(3);
            swarm.value = stmt.real(4);
            auto metadata = DecodeMetadata(stmt.text(5));
            if (!metadata.ok()) {
                return core::PropagateError<core::Record>(metadata);
            }
            swarm.metadata = metadata.take_value();
            return core::Result<core::Record>(core::Record(std::move(swarm)));
        }
        case core::Table::ARCHIVE: {
            auto bucket = ReadArchiveRow(stmt);
            if (!bucket.ok()) {
                return core::PropagateError<core::Record>(bucket);
            }
            return core::Result<core::Record>(core::Record(bucket.take_value()));
        }
    }
    return core::Result<core::Record>::error("Unknown table");
}

core::AggregateStats StatsFromColumns(const Statement& stmt, int first) {
    core::AggregateStats stats;
    stats.count = static_cast<uint64_t>(stmt.int64(first));
    if (stats.count == 0) {
        return stats;
    }
    stats.sum = stmt.real(first + 1);
    stats.min = stmt.real(first + 2);
    stats.max = stmt.real(first + 3);
    stats.sum_sq = stmt.real(first + 4);
    return stats;
}

std::string StatsColumns(const std::string& column) {
    return fmt::format("COUNT({0}), TOTAL({0}), MIN({0}), MAX({0}), TOTAL(CAST({0} AS REAL) * {0})", column);
}

int InsertBatch(sqlite3* db, const std::vector<core::MetricRecord>& records, std::string* message) {
    int rc = Exec(db, "BEGIN IMMEDIATE", message);
    if (rc != SQLITE_OK) {
        return rc;
    }

    auto fail = [db, message](int failed_rc) {
        *message = sqlite3_errmsg(db);
        Exec(db, "ROLLBACK", nullptr);
        return failed_rc;
    };

    {
        Statement task_stmt(db,
            "INSERT INTO task_metrics (task_id, agent_id, timestamp, duration_ms, outcome, success, "
            "tokens_used, files_changed, metadata) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
        Statement agent_stmt(db,
            "INSERT INTO agent_metrics (agent_id, timestamp, metric_kind, value, metadata) VALUES (?, ?, ?, ?, ?)");
        Statement swarm_stmt(db,
            "INSERT INTO swarm_metrics (swarm_id, timestamp, metric_kind, value, metadata) VALUES (?, ?, ?, ?, ?)");

        for (const auto& record : records) {
            Statement* stmt = nullptr;
            if (const auto* task = std::get_if<core::TaskMetric>(&record)) {
                stmt = &task_stmt;
                stmt->bind_text(1, task->task_id);
                stmt->bind_text(2, task->agent_id);
                stmt->bind_int(3, task->timestamp);
                stmt->bind_int(4, task->duration_ms);
                stmt->bind_text(5, core::OutcomeName(task->outcome));
                stmt->bind_int(6, task->outcome == core::TaskOutcome::SUCCESS ? 1 : 0);
                stmt->bind_int(7, task->tokens_used);
                stmt->bind_int(8, task->files_changed);
                stmt->bind_text(9, EncodeMetadata(task->metadata));
            } else if (const auto* agent = std::get_if<core::AgentMetric>(&record)) {
                stmt = &agent_stmt;
                stmt->bind_text(1, agent->agent_id);
                stmt->bind_int(2, agent->timestamp);
                stmt->bind_text(3, agent->metric_kind);
                stmt->bind_real(4, agent->value);
                stmt->bind_text(5, EncodeMetadata(agent->metadata));
            } else {
                const auto& swarm = std::get<core::SwarmMetric>(record);
                stmt = &swarm_stmt;
                stmt->bind_text(1, swarm.swarm_id);
                stmt->bind_int(2, swarm.timestamp);
                stmt->bind_text(3, swarm.metric_kind);
                stmt->bind_real(4, swarm.value);
                stmt->bind_text(5, EncodeMetadata(swarm.metadata));
            }

            rc = stmt->step();
            if (rc != SQLITE_DONE) {
                return fail(rc);
            }
            stmt->reset();
        }
    }

    rc = Exec(db, "COMMIT", message);
    if (rc != SQLITE_OK) {
        Exec(db, "ROLLBACK", nullptr);
        return rc;
    }
    return SQLITE_OK;
}

core::Result<size_t> ExecuteDelete(sqlite3* db, const std::string& sql, const std::vector<Binding>& bindings,
                                   const char* what) {
    Statement stmt(db, sql);
    stmt.bind_all(bindings);
    int rc = stmt.step();
    if (rc != SQLITE_DONE) {
        return SqlError<size_t>(db, rc, what);
    }
    return core::Result<size_t>(static_cast<size_t>(sqlite3_changes(db)));
}

} // namespace

// ReadSnapshot

ReadSnapshot::ReadSnapshot(PooledConnection conn, const core::QueryContext& ctx)
    : conn_(std::move(conn)), ctx_(std::make_unique<core::QueryContext>(ctx)), open_(true) {
    sqlite3_progress_handler(conn_.get(), kProgressOpcodes, ProgressCallback, ctx_.get());
}

ReadSnapshot::~ReadSnapshot() {
    finish();
}

ReadSnapshot::ReadSnapshot(ReadSnapshot&& other) noexcept
    : conn_(std::move(other.conn_)), ctx_(std::move(other.ctx_)), open_(other.open_) {
    other.open_ = false;
}

ReadSnapshot& ReadSnapshot::operator=(ReadSnapshot&& other) noexcept {
    if (this != &other) {
        finish();
        conn_ = std::move(other.conn_);
        ctx_ = std::move(other.ctx_);
        open_ = other.open_;
        other.open_ = false;
    }
    return *this;
}

void ReadSnapshot::finish() {
    if (!open_) {
        return;
    }
    open_ = false;
    sqlite3_progress_handler(conn_.get(), 0, nullptr, nullptr);
    std::string message;
    if (Exec(conn_.get(), "COMMIT", &message) != SQLITE_OK) {
        METRICSTORE_WARN("Ending read snapshot failed: {}", message);
        Exec(conn_.get(), "ROLLBACK", nullptr);
    }
    conn_.release();
}

core::Result<size_t> ReadSnapshot::scan(core::Table table,
                                        const core::QueryFilter& filter,
                                        const core::TimeRange& range,
                                        const ScanOptions& options,
                                        const RecordVisitor& visitor) {
    if (!open_) {
        return core::Result<size_t>::error("Read snapshot is closed");
    }
    auto valid = core::ValidateFilter(table, filter);
    if (!valid.ok()) {
        return core::PropagateError<size_t>(valid);
    }
    auto live = ctx_->check();
    if (!live.ok()) {
        return core::PropagateError<size_t>(live);
    }
    if (range.is_empty()) {
        return core::Result<size_t>(0);
    }

    auto predicate = BuildPredicate(table, filter, range);
    std::string sql = fmt::format("SELECT {} FROM {}{}{} LIMIT ? OFFSET ?", SelectColumns(table),
                                  core::TableName(table), predicate.where(), OrderBy(table, options.order));

    Statement stmt(conn_.get(), sql);
    int next = stmt.bind_all(predicate.bindings);
    stmt.bind_int(next, options.limit == 0 ? -1 : static_cast<int64_t>(options.limit));
    stmt.bind_int(next + 1, static_cast<int64_t>(options.offset));

    size_t visited = 0;
    while (true) {
        int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            return SqlError<size_t>(conn_.get(), rc, fmt::format("Scan of {} failed", core::TableName(table)),
                                    ctx_.get());
        }
        auto record = ReadRow(table, stmt);
        if (!record.ok()) {
            return core::PropagateError<size_t>(record);
        }
        ++visited;
        if (!visitor(record.value())) {
            break;
        }
        if (visited % kCheckEveryRows == 0) {
            auto still_live = ctx_->check();
            if (!still_live.ok()) {
                return core::PropagateError<size_t>(still_live);
            }
        }
    }
    return core::Result<size_t>(visited);
}

core::Result<std::vector<StatsGroup>> ReadSnapshot::column_stats(core::Table table,
                                                                 const std::string& column,
                                                                 const core::QueryFilter& filter,
                                                                 const core::TimeRange& range,
                                                                 StatsGrouping grouping,
                                                                 int64_t bucket_width) {
    using GroupsResult = core::Result<std::vector<StatsGroup>>;
    if (!open_) {
        return GroupsResult::error("Read snapshot is closed");
    }
    auto valid = core::ValidateFilter(table, filter);
    if (!valid.ok()) {
        return core::PropagateError<std::vector<StatsGroup>>(valid);
    }
    valid = core::ValidateColumn(table, column);
    if (!valid.ok()) {
        return core::PropagateError<std::vector<StatsGroup>>(valid);
    }
    if (grouping == StatsGrouping::INTERVAL && bucket_width <= 0) {
        return GroupsResult::error("Interval grouping needs a positive width", core::Error::Code::INVALID_QUERY);
    }

    std::vector<StatsGroup> groups;
    if (range.is_empty()) {
        if (grouping == StatsGrouping::NONE) {
            groups.emplace_back();
        }
        return GroupsResult(std::move(groups));
    }

    std::string key;
    switch (grouping) {
        case StatsGrouping::NONE: break;
        case StatsGrouping::SCOPE: key = ScopeColumn(table); break;
        case StatsGrouping::INTERVAL: key = BucketExpr(bucket_width); break;
    }

    auto predicate = BuildPredicate(table, filter, range);
    std::string sql = "SELECT ";
    if (!key.empty()) {
        sql += key + ", ";
    }
    sql += StatsColumns(column) + " FROM " + core::TableName(table) + predicate.where();
    if (!key.empty()) {
        sql += " GROUP BY 1 ORDER BY 1";
    }

    Statement stmt(conn_.get(), sql);
    stmt.bind_all(predicate.bindings);
    int first = key.empty() ? 0 : 1;
    while (true) {
        int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            return SqlError<std::vector<StatsGroup>>(conn_.get(), rc, "Statistics query failed", ctx_.get());
        }
        StatsGroup group;
        if (grouping == StatsGrouping::SCOPE) {
            group.scope_id = stmt.text(0);
        } else if (grouping == StatsGrouping::INTERVAL) {
            group.bucket_start = stmt.int64(0);
        }
        group.stats = StatsFromColumns(stmt, first);
        groups.push_back(std::move(group));
    }
    return GroupsResult(std::move(groups));
}

core::Result<std::vector<double>> ReadSnapshot::column_values(core::Table table,
                                                              const std::string& column,
                                                              const core::QueryFilter& filter,
                                                              const core::TimeRange& range) {
    using ValuesResult = core::Result<std::vector<double>>;
    if (!open_) {
        return ValuesResult::error("Read snapshot is closed");
    }
    auto valid = core::ValidateFilter(table, filter);
    if (!valid.ok()) {
        return core::PropagateError<std::vector<double>>(valid);
    }
    valid = core::ValidateColumn(table, column);
    if (!valid.ok()) {
        return core::PropagateError<std::vector<double>>(valid);
    }

    std::vector<double> values;
    if (range.is_empty()) {
        return ValuesResult(std::move(values));
    }

    auto predicate = BuildPredicate(table, filter, range);
    Statement stmt(conn_.get(), fmt::format("SELECT {0} FROM {1}{2} ORDER BY {0}", column,
                                            core::TableName(table), predicate.where()));
    stmt.bind_all(predicate.bindings);
    while (true) {
        int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            return SqlError<std::vector<double>>(conn_.get(), rc, "Percentile scan failed", ctx_.get());
        }
        values.push_back(stmt.real(0));
        if (values.size() % kCheckEveryRows == 0) {
            auto live = ctx_->check();
            if (!live.ok()) {
                return core::PropagateError<std::vector<double>>(live);
            }
        }
    }
    return ValuesResult(std::move(values));
}

core::Result<core::Records> ReadSnapshot::top_rows(core::Table table,
                                                   const std::string& column,
                                                   const core::QueryFilter& filter,
                                                   const core::TimeRange& range,
                                                   size_t n) {
    if (!open_) {
        return core::Result<core::Records>::error("Read snapshot is closed");
    }
    auto valid = core::ValidateFilter(table, filter);
    if (!valid.ok()) {
        return core::PropagateError<core::Records>(valid);
    }
    valid = core::ValidateColumn(table, column);
    if (!valid.ok()) {
        return core::PropagateError<core::Records>(valid);
    }

    core::Records records;
    if (range.is_empty() || n == 0) {
        return core::Result<core::Records>(std::move(records));
    }

    auto predicate = BuildPredicate(table, filter, range);
    Statement stmt(conn_.get(), fmt::format("SELECT {} FROM {}{} ORDER BY {} DESC, timestamp, id LIMIT ?",
                                            SelectColumns(table), core::TableName(table),
                                            predicate.where(), column));
    int next = stmt.bind_all(predicate.bindings);
    stmt.bind_int(next, static_cast<int64_t>(n));
    while (true) {
        int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            return SqlError<core::Records>(conn_.get(), rc, "Top rows query failed", ctx_.get());
        }
        auto record = ReadRow(table, stmt);
        if (!record.ok()) {
            return core::PropagateError<core::Records>(record);
        }
        records.push_back(record.take_value());
    }
    return core::Result<core::Records>(std::move(records));
}

core::Result<std::vector<core::ArchiveBucket>> ReadSnapshot::archive_buckets(const ArchiveSelector& selector) {
    using BucketsResult = core::Result<std::vector<core::ArchiveBucket>>;
    if (!open_) {
        return BucketsResult::error("Read snapshot is closed");
    }

    std::vector<core::ArchiveBucket> buckets;
    if (selector.range.is_empty()) {
        return BucketsResult(std::move(buckets));
    }

    auto predicate = ArchivePredicate(selector);
    Statement stmt(conn_.get(), fmt::format("SELECT {} FROM metrics_archive{} ORDER BY bucket_start, id",
                                            kArchiveColumns, predicate.where()));
    stmt.bind_all(predicate.bindings);
    while (true) {
        int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            return SqlError<std::vector<core::ArchiveBucket>>(conn_.get(), rc, "Archive query failed", ctx_.get());
        }
        auto bucket = ReadArchiveRow(stmt);
        if (!bucket.ok()) {
            return core::PropagateError<std::vector<core::ArchiveBucket>>(bucket);
        }
        buckets.push_back(bucket.take_value());
    }
    return BucketsResult(std::move(buckets));
}

core::Result<uint64_t> ReadSnapshot::count_archive(const ArchiveSelector& selector) {
    if (!open_) {
        return core::Result<uint64_t>::error("Read snapshot is closed");
    }
    if (selector.range.is_empty()) {
        return core::Result<uint64_t>(0);
    }

    auto predicate = ArchivePredicate(selector);
    Statement stmt(conn_.get(), fmt::format("SELECT COUNT(*) FROM metrics_archive{}", predicate.where()));
    stmt.bind_all(predicate.bindings);
    int rc = stmt.step();
    if (rc != SQLITE_ROW) {
        return SqlError<uint64_t>(conn_.get(), rc, "Archive count failed", ctx_.get());
    }
    return core::Result<uint64_t>(static_cast<uint64_t>(stmt.int64(0)));
}

core::Result<uint64_t> ReadSnapshot::count(core::Table table,
                                           const core::QueryFilter& filter,
                                           const core::TimeRange& range) {
    if (!open_) {
        return core::Result<uint64_t>::error("Read snapshot is closed");
    }
    auto valid = core::ValidateFilter(table, filter);
    if (!valid.ok()) {
        return core::PropagateError<uint64_t>(valid);
    }
    if (range.is_empty()) {
        return core::Result<uint64_t>(0);
    }

    auto predicate = BuildPredicate(table, filter, range);
    Statement stmt(conn_.get(), fmt::format("SELECT COUNT(*) FROM {}{}", core::TableName(table), predicate.where()));
    stmt.bind_all(predicate.bindings);
    int rc = stmt.step();
    if (rc != SQLITE_ROW) {
        return SqlError<uint64_t>(conn_.get(), rc, "Count query failed", ctx_.get());
    }
    return core::Result<uint64_t>(static_cast<uint64_t>(stmt.int64(0)));
}

core::Result<uint64_t> ReadSnapshot::distinct_scopes(core::Table table, const core::TimeRange& range) {
    if (!open_) {
        return core::Result<uint64_t>::error("Read snapshot is closed");
    }
    if (range.is_empty()) {
        return core::Result<uint64_t>(0);
    }
    SqlPredicate predicate;
    predicate.add_range(TimeColumn(table), range);
    Statement stmt(conn_.get(), fmt::format("SELECT COUNT(DISTINCT {}) FROM {}{}", ScopeColumn(table),
                                            core::TableName(table), predicate.where()));
    stmt.bind_all(predicate.bindings);
    int rc = stmt.step();
    if (rc != SQLITE_ROW) {
        return SqlError<uint64_t>(conn_.get(), rc, "Distinct scope query failed", ctx_.get());
    }
    return core::Result<uint64_t>(static_cast<uint64_t>(stmt.int64(0)));
}

core::Result<uint64_t> ReadSnapshot::distinct_scopes(const ArchiveSelector& selector) {
    if (!open_) {
        return core::Result<uint64_t>::error("Read snapshot is closed");
    }
    if (selector.range.is_empty()) {
        return core::Result<uint64_t>(0);
    }
    SqlPredicate detailed;
    detailed.add_range(TimeColumn(selector.source_table), selector.range);
    auto archived = ArchivePredicate(selector);
    Statement stmt(conn_.get(), fmt::format(
        "SELECT COUNT(*) FROM (SELECT {} FROM {}{} UNION SELECT scope_id FROM metrics_archive{})",
        ScopeColumn(selector.source_table), core::TableName(selector.source_table), detailed.where(),
        archived.where()));
    auto bindings = detailed.bindings;
    bindings.insert(bindings.end(), archived.bindings.begin(), archived.bindings.end());
    stmt.bind_all(bindings);
    int rc = stmt.step();
    if (rc != SQLITE_ROW) {
        return SqlError<uint64_t>(conn_.get(), rc, "Distinct scope query failed", ctx_.get());
    }
    return core::Result<uint64_t>(static_cast<uint64_t>(stmt.int64(0)));
}

// WriteTransaction

WriteTransaction::WriteTransaction(std::unique_lock<std::timed_mutex> lock, PooledConnection conn,
                                   const core::CompressionConfig& compression)
    : lock_(std::move(lock)), conn_(std::move(conn)), compression_(compression), active_(true) {}

WriteTransaction::~WriteTransaction() {
    rollback();
}

WriteTransaction::WriteTransaction(WriteTransaction&& other) noexcept
    : lock_(std::move(other.lock_)), conn_(std::move(other.conn_)),
      compression_(other.compression_), active_(other.active_) {
    other.active_ = false;
}

WriteTransaction& WriteTransaction::operator=(WriteTransaction&& other) noexcept {
    if (this != &other) {
        rollback();
        lock_ = std::move(other.lock_);
        conn_ = std::move(other.conn_);
        compression_ = other.compression_;
        active_ = other.active_;
        other.active_ = false;
    }
    return *this;
}

void WriteTransaction::rollback() {
    if (!active_) {
        return;
    }
    active_ = false;
    std::string message;
    if (Exec(conn_.get(), "ROLLBACK", &message) != SQLITE_OK) {
        METRICSTORE_ERROR("Rolling back write transaction failed: {}", message);
    }
    conn_.release();
    if (lock_.owns_lock()) {
        lock_.unlock();
    }
}

core::Result<void> WriteTransaction::commit() {
    if (!active_) {
        return core::Result<void>::error("Write transaction is not active");
    }
    int rc = Exec(conn_.get(), "COMMIT", nullptr);
    if (rc != SQLITE_OK) {
        auto error = SqlError<void>(conn_.get(), rc, "Commit failed");
        rollback();
        return error;
    }
    active_ = false;
    conn_.release();
    lock_.unlock();
    return core::Result<void>();
}

core::Result<std::vector<core::ArchiveBucket>> WriteTransaction::group_detailed(core::Table table,
                                                                                core::AggregationLevel level,
                                                                                const core::TimeRange& range) {
    using BucketsResult = core::Result<std::vector<core::ArchiveBucket>>;
    if (!active_) {
        return BucketsResult::error("Write transaction is not active");
    }
    if (!core::IsDetailedTable(table)) {
        return BucketsResult::error("Only detailed tables can be compacted", core::Error::Code::INVALID_QUERY);
    }

    std::vector<core::ArchiveBucket> buckets;
    if (range.is_empty()) {
        return BucketsResult(std::move(buckets));
    }

    const int64_t width = core::BucketWidth(level);
    SqlPredicate predicate;
    predicate.add_range("timestamp", range);

    std::string sql;
    if (table == core::Table::TASK) {
        sql = "SELECT agent_id, " + BucketExpr(width) + " AS bucket";
        for (const auto& column : core::NumericColumns(table)) {
            sql += ", " + StatsColumns(column);
        }
        sql += " FROM task_metrics" + predicate.where() + " GROUP BY agent_id, bucket ORDER BY agent_id, bucket";
    } else {
        sql = fmt::format("SELECT {0}, metric_kind, {1} AS bucket, {2} FROM {3}{4} "
                          "GROUP BY {0}, metric_kind, bucket ORDER BY {0}, metric_kind, bucket",
                          ScopeColumn(table), BucketExpr(width), StatsColumns("value"),
                          core::TableName(table), predicate.where());
    }

    Statement stmt(conn_.get(), sql);
    stmt.bind_all(predicate.bindings);
    const core::Timestamp now = core::NowMillis();
    while (true) {
        int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            return SqlError<std::vector<core::ArchiveBucket>>(conn_.get(), rc, "Grouping detailed rows failed");
        }

        core::ArchiveBucket bucket;
        bucket.source_table = table;
        bucket.level = level;
        bucket.scope_id = stmt.text(0);
        bucket.created_at = now;
        if (table == core::Table::TASK) {
            bucket.bucket_start = stmt.int64(1);
            bucket.bucket_date = core::FormatDate(bucket.bucket_start);
            int first = 2;
            for (const auto& column : core::NumericColumns(table)) {
                core::ArchiveBucket per_column = bucket;
                per_column.metric_kind = column;
                per_column.stats = StatsFromColumns(stmt, first);
                buckets.push_back(std::move(per_column));
                first += 5;
            }
        } else {
            bucket.metric_kind = stmt.text(1);
            bucket.bucket_start = stmt.int64(2);
            bucket.bucket_date = core::FormatDate(bucket.bucket_start);
            bucket.stats = StatsFromColumns(stmt, 3);
            buckets.push_back(std::move(bucket));
        }
    }
    return BucketsResult(std::move(buckets));
}

core::Result<std::vector<core::ArchiveBucket>> WriteTransaction::select_archive(core::AggregationLevel level,
                                                                                const core::TimeRange& range) {
    using BucketsResult = core::Result<std::vector<core::ArchiveBucket>>;
    if (!active_) {
        return BucketsResult::error("Write transaction is not active");
    }

    SqlPredicate predicate;
    predicate.add("aggregation_level = ?", Binding(std::string(core::AggregationLevelName(level))));
    predicate.add_range("bucket_start", range);

    Statement stmt(conn_.get(), fmt::format("SELECT {} FROM metrics_archive{} ORDER BY bucket_start, id",
                                            kArchiveColumns, predicate.where()));
    stmt.bind_all(predicate.bindings);

    std::vector<core::ArchiveBucket> buckets;
    while (true) {
        int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            return SqlError<std::vector<core::ArchiveBucket>>(conn_.get(), rc, "Archive selection failed");
        }
        auto bucket = ReadArchiveRow(stmt);
        if (!bucket.ok()) {
            return core::PropagateError<std::vector<core::ArchiveBucket>>(bucket);
        }
        buckets.push_back(bucket.take_value());
    }
    return BucketsResult(std::move(buckets));
}

core::Result<std::optional<core::ArchiveBucket>> WriteTransaction::find_bucket(core::Table source_table,
                                                                               core::AggregationLevel level,
                                                                               const std::string& scope_id,
                                                                               const std::string& metric_kind,
                                                                               core::Timestamp bucket_start) {
    using BucketResult = core::Result<std::optional<core::ArchiveBucket>>;
    if (!active_) {
        return BucketResult::error("Write transaction is not active");
    }

    Statement stmt(conn_.get(), fmt::format(
        "SELECT {} FROM metrics_archive WHERE metric_table = ? AND aggregation_level = ? "
        "AND scope_id = ? AND metric_kind = ? AND bucket_start = ?", kArchiveColumns));
    stmt.bind_text(1, core::TableName(source_table));
    stmt.bind_text(2, core::AggregationLevelName(level));
    stmt.bind_text(3, scope_id);
    stmt.bind_text(4, metric_kind);
    stmt.bind_int(5, bucket_start);

    int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return BucketResult(std::optional<core::ArchiveBucket>());
    }
    if (rc != SQLITE_ROW) {
        return SqlError<std::optional<core::ArchiveBucket>>(conn_.get(), rc, "Archive lookup failed");
    }
    auto bucket = ReadArchiveRow(stmt);
    if (!bucket.ok()) {
        return core::PropagateError<std::optional<core::ArchiveBucket>>(bucket);
    }
    return BucketResult(std::optional<core::ArchiveBucket>(bucket.take_value()));
}

core::Result<bool> WriteTransaction::merge_bucket(const core::ArchiveBucket& bucket) {
    if (bucket.stats.empty()) {
        return core::Result<bool>(false);
    }

    auto existing = find_bucket(bucket.source_table, bucket.level, bucket.scope_id,
                                bucket.metric_kind, bucket.bucket_start);
    if (!existing.ok()) {
        return core::PropagateError<bool>(existing);
    }

    core::AggregateStats stats = bucket.stats;
    if (existing.value()) {
        stats = existing.value()->stats;
        stats.merge(bucket.stats);
    }

    auto payload = EncodeStats(stats, compression_);
    if (!payload.ok()) {
        return core::PropagateError<bool>(payload);
    }

    if (existing.value()) {
        Statement stmt(conn_.get(),
            "UPDATE metrics_archive SET payload = ?, compressed = ?, record_count = ? WHERE id = ?");
        stmt.bind_blob(1, payload.value().bytes);
        stmt.bind_int(2, payload.value().compressed ? 1 : 0);
        stmt.bind_int(3, static_cast<int64_t>(stats.count));
        stmt.bind_int(4, existing.value()->id);
        int rc = stmt.step();
        if (rc != SQLITE_DONE) {
            return SqlError<bool>(conn_.get(), rc, "Archive merge failed");
        }
        return core::Result<bool>(true);
    }

    Statement stmt(conn_.get(),
        "INSERT INTO metrics_archive (metric_table, aggregation_level, scope_id, metric_kind, bucket_start, "
        "bucket_end, archive_date, payload, compressed, record_count, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.bind_text(1, core::TableName(bucket.source_table));
    stmt.bind_text(2, core::AggregationLevelName(bucket.level));
    stmt.bind_text(3, bucket.scope_id);
    stmt.bind_text(4, bucket.metric_kind);
    stmt.bind_int(5, bucket.bucket_start);
    stmt.bind_int(6, bucket.bucket_end());
    stmt.bind_text(7, bucket.bucket_date.empty() ? core::FormatDate(bucket.bucket_start) : bucket.bucket_date);
    stmt.bind_blob(8, payload.value().bytes);
    stmt.bind_int(9, payload.value().compressed ? 1 : 0);
    stmt.bind_int(10, static_cast<int64_t>(stats.count));
    stmt.bind_int(11, bucket.created_at != 0 ? bucket.created_at : core::NowMillis());
    int rc = stmt.step();
    if (rc != SQLITE_DONE) {
        return SqlError<bool>(conn_.get(), rc, "Archive insert failed");
    }
    return core::Result<bool>(false);
}

core::Result<size_t> WriteTransaction::delete_detailed(core::Table table, const core::TimeRange& range) {
    if (!active_) {
        return core::Result<size_t>::error("Write transaction is not active");
    }
    if (!core::IsDetailedTable(table)) {
        return core::Result<size_t>::error("Not a detailed table", core::Error::Code::INVALID_QUERY);
    }
    if (range.is_empty()) {
        return core::Result<size_t>(0);
    }
    SqlPredicate predicate;
    predicate.add_range("timestamp", range);
    return ExecuteDelete(conn_.get(), std::string("DELETE FROM ") + core::TableName(table) + predicate.where(),
                         predicate.bindings, "Deleting detailed rows failed");
}

core::Result<size_t> WriteTransaction::delete_archive(const core::TimeRange& range) {
    if (!active_) {
        return core::Result<size_t>::error("Write transaction is not active");
    }
    if (range.is_empty()) {
        return core::Result<size_t>(0);
    }
    SqlPredicate predicate;
    predicate.add_range("bucket_start", range);
    return ExecuteDelete(conn_.get(), "DELETE FROM metrics_archive" + predicate.where(),
                         predicate.bindings, "Deleting archive buckets failed");
}

core::Result<size_t> WriteTransaction::delete_archive_ids(const std::vector<int64_t>& ids) {
    if (!active_) {
        return core::Result<size_t>::error("Write transaction is not active");
    }
    Statement stmt(conn_.get(), "DELETE FROM metrics_archive WHERE id = ?");
    size_t deleted = 0;
    for (int64_t id : ids) {
        stmt.bind_int(1, id);
        int rc = stmt.step();
        if (rc != SQLITE_DONE) {
            return SqlError<size_t>(conn_.get(), rc, "Deleting archive bucket failed");
        }
        deleted += static_cast<size_t>(sqlite3_changes(conn_.get()));
        stmt.reset();
    }
    return core::Result<size_t>(deleted);
}

// SqliteStorage

SqliteStorage::SqliteStorage(const core::CompressionConfig& compression) : compression_(compression) {}

SqliteStorage::~SqliteStorage() {
    if (initialized_.load()) {
        auto result = close();
        if (!result.ok()) {
            METRICSTORE_WARN("Closing storage failed: {}", result.error());
        }
    }
}

core::Result<void> SqliteStorage::init(const core::StorageConfig& config) {
    if (initialized_.load()) {
        return core::Result<void>::error("Storage already initialized");
    }
    auto valid = config.validate();
    if (!valid.ok()) {
        return valid;
    }
    config_ = config;

    std::filesystem::path db_file(config_.db_path);
    if (db_file.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_file.parent_path(), ec);
        if (ec) {
            return core::Result<void>::error("Cannot create database directory " +
                                             db_file.parent_path().string() + ": " + ec.message(),
                                             core::Error::Code::STORAGE_UNAVAILABLE);
        }
    }

    pool_ = std::make_unique<ConnectionPool>(config_);
    auto opened = pool_->open();
    if (!opened.ok()) {
        pool_.reset();
        return opened;
    }
    initialized_.store(true);

    auto schema = createSchema();
    if (!schema.ok()) {
        initialized_.store(false);
        pool_->close();
        pool_.reset();
        return schema;
    }

    METRICSTORE_INFO("Metrics storage initialized: {} (schema {})", config_.db_path, kSchemaVersion);
    return core::Result<void>();
}

core::Result<void> SqliteStorage::createSchema() {
    auto lock = lockWriter(core::QueryContext());
    if (!lock.ok()) {
        return core::PropagateError<void>(lock);
    }
    auto conn = acquire(core::QueryContext());
    if (!conn.ok()) {
        return core::PropagateError<void>(conn);
    }

    for (uint32_t attempt = 1;; ++attempt) {
        std::string message;
        int rc = Exec(conn.value().get(), kSchema, &message);
        if (rc == SQLITE_OK) {
            break;
        }
        if (!IsTransient(rc) || attempt >= config_.max_retries) {
            METRICSTORE_ERROR("Schema initialization failed: {}", message);
            return core::Result<void>::error("Schema initialization failed: " + message, MapSqliteError(rc, nullptr));
        }
        std::this_thread::sleep_for(config_.retry_delay * attempt);
    }

    Statement stmt(conn.value().get(),
        "INSERT OR REPLACE INTO storage_schema_info (key, value, updated_at) VALUES ('version', ?, ?)");
    stmt.bind_text(1, kSchemaVersion);
    stmt.bind_int(2, core::NowMillis());
    int rc = stmt.step();
    if (rc != SQLITE_DONE) {
        return SqlError<void>(conn.value().get(), rc, "Recording schema version failed");
    }
    return core::Result<void>();
}

core::Result<std::string> SqliteStorage::schema_version() {
    auto conn = acquire(core::QueryContext());
    if (!conn.ok()) {
        return core::PropagateError<std::string>(conn);
    }
    Statement stmt(conn.value().get(), "SELECT value FROM storage_schema_info WHERE key = 'version'");
    int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return core::Result<std::string>::error("Schema version not recorded", core::Error::Code::NOT_FOUND);
    }
    if (rc != SQLITE_ROW) {
        return SqlError<std::string>(conn.value().get(), rc, "Reading schema version failed");
    }
    return core::Result<std::string>(stmt.text(0));
}

core::Result<PooledConnection> SqliteStorage::acquire(const core::QueryContext& ctx) {
    if (!initialized_.load() || !pool_) {
        return core::Result<PooledConnection>::error("Storage is not open", core::Error::Code::STORAGE_UNAVAILABLE);
    }
    auto live = ctx.check();
    if (!live.ok()) {
        return core::PropagateError<PooledConnection>(live);
    }
    return pool_->acquire(Budget(config_.acquire_timeout, ctx));
}

core::Result<std::unique_lock<std::timed_mutex>> SqliteStorage::lockWriter(const core::QueryContext& ctx) {
    using LockResult = core::Result<std::unique_lock<std::timed_mutex>>;
    auto budget = Budget(config_.acquire_timeout, ctx);
    std::unique_lock<std::timed_mutex> lock(write_mutex_, std::defer_lock);
    if (!lock.try_lock_for(budget)) {
        return LockResult::error("Timed out after " + std::to_string(budget.count()) +
                                 " ms waiting for the storage write lock",
                                 core::Error::Code::TIMEOUT);
    }
    return LockResult(std::move(lock));
}

core::Result<void> SqliteStorage::write(const core::MetricRecord& record) {
    return write_batch(std::vector<core::MetricRecord>{record});
}

core::Result<void> SqliteStorage::write_batch(const std::vector<core::MetricRecord>& records) {
    if (records.empty()) {
        return core::Result<void>();
    }
    for (const auto& record : records) {
        auto valid = core::ValidateRecord(record);
        if (!valid.ok()) {
            return valid;
        }
    }
    auto lock = lockWriter(core::QueryContext());
    if (!lock.ok()) {
        return core::PropagateError<void>(lock);
    }
    auto conn = acquire(core::QueryContext());
    if (!conn.ok()) {
        return core::PropagateError<void>(conn);
    }

    for (uint32_t attempt = 1;; ++attempt) {
        std::string message;
        int rc = InsertBatch(conn.value().get(), records, &message);
        if (rc == SQLITE_OK) {
            batches_written_.fetch_add(1);
            records_written_.fetch_add(records.size());
            return core::Result<void>();
        }
        if (!IsTransient(rc)) {
            METRICSTORE_ERROR("Writing batch of {} records failed: {}", records.size(), message);
            return core::Result<void>::error("Write failed: " + message, MapSqliteError(rc, nullptr));
        }
        if (attempt >= config_.max_retries) {
            METRICSTORE_ERROR("Writing batch of {} records failed after {} attempts: {}",
                              records.size(), attempt, message);
            return core::Result<void>::error(
                fmt::format("Storage unavailable after {} attempts: {}", attempt, message),
                core::Error::Code::STORAGE_UNAVAILABLE);
        }
        write_retries_.fetch_add(1);
        METRICSTORE_WARN("Transient write failure (attempt {}/{}): {}", attempt, config_.max_retries, message);
        std::this_thread::sleep_for(config_.retry_delay * attempt);
    }
}

core::Result<size_t> SqliteStorage::scan(core::Table table,
                                         const core::QueryFilter& filter,
                                         const core::TimeRange& range,
                                         const ScanOptions& options,
                                         const RecordVisitor& visitor,
                                         const core::QueryContext& ctx) {
    auto snap = snapshot(ctx);
    if (!snap.ok()) {
        return core::PropagateError<size_t>(snap);
    }
    return snap.value().scan(table, filter, range, options, visitor);
}

core::Result<ReadSnapshot> SqliteStorage::snapshot(const core::QueryContext& ctx) {
    auto conn = acquire(ctx);
    if (!conn.ok()) {
        return core::PropagateError<ReadSnapshot>(conn);
    }
    int rc = Exec(conn.value().get(), "BEGIN", nullptr);
    if (rc != SQLITE_OK) {
        return SqlError<ReadSnapshot>(conn.value().get(), rc, "Opening read snapshot failed");
    }
    return core::Result<ReadSnapshot>(ReadSnapshot(conn.take_value(), ctx));
}

core::Result<WriteTransaction> SqliteStorage::begin_write(const core::QueryContext& ctx) {
    auto lock = lockWriter(ctx);
    if (!lock.ok()) {
        return core::PropagateError<WriteTransaction>(lock);
    }
    auto conn = acquire(ctx);
    if (!conn.ok()) {
        return core::PropagateError<WriteTransaction>(conn);
    }

    for (uint32_t attempt = 1;; ++attempt) {
        std::string message;
        int rc = Exec(conn.value().get(), "BEGIN IMMEDIATE", &message);
        if (rc == SQLITE_OK) {
            break;
        }
        if (!IsTransient(rc) || attempt >= config_.max_retries) {
            return core::Result<WriteTransaction>::error("Beginning write transaction failed: " + message,
                                                         MapSqliteError(rc, nullptr));
        }
        std::this_thread::sleep_for(config_.retry_delay * attempt);
    }
    return core::Result<WriteTransaction>(WriteTransaction(lock.take_value(), conn.take_value(), compression_));
}

core::Result<void> SqliteStorage::vacuum() {
    auto lock = lockWriter(core::QueryContext());
    if (!lock.ok()) {
        return core::PropagateError<void>(lock);
    }
    auto conn = acquire(core::QueryContext());
    if (!conn.ok()) {
        return core::PropagateError<void>(conn);
    }

    auto start = std::chrono::steady_clock::now();
    for (uint32_t attempt = 1;; ++attempt) {
        std::string message;
        int rc = Exec(conn.value().get(), "VACUUM", &message);
        if (rc == SQLITE_OK) {
            break;
        }
        if (!IsTransient(rc)) {
            METRICSTORE_ERROR("VACUUM failed: {}", message);
            return core::Result<void>::error("VACUUM failed: " + message, MapSqliteError(rc, nullptr));
        }
        if (attempt >= config_.max_retries) {
            return core::Result<void>::error(
                fmt::format("VACUUM failed after {} attempts: {}", attempt, message),
                core::Error::Code::STORAGE_UNAVAILABLE);
        }
        std::this_thread::sleep_for(config_.retry_delay * attempt);
    }

    if (config_.wal_mode) {
        std::string message;
        if (Exec(conn.value().get(), "PRAGMA wal_checkpoint(TRUNCATE)", &message) != SQLITE_OK) {
            METRICSTORE_WARN("WAL checkpoint after VACUUM failed: {}", message);
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    METRICSTORE_INFO("Database vacuumed in {} ms", elapsed.count());
    return core::Result<void>();
}

core::Result<void> SqliteStorage::analyze() {
    auto conn = acquire(core::QueryContext());
    if (!conn.ok()) {
        return core::PropagateError<void>(conn);
    }
    std::string message;
    int rc = Exec(conn.value().get(), "ANALYZE", &message);
    if (rc != SQLITE_OK) {
        return core::Result<void>::error("ANALYZE failed: " + message, MapSqliteError(rc, nullptr));
    }
    METRICSTORE_INFO("Database statistics refreshed");
    return core::Result<void>();
}

core::Result<void> SqliteStorage::close() {
    if (!initialized_.exchange(false)) {
        return core::Result<void>();
    }
    // Wait for an in-flight batch or compaction to finish
    std::lock_guard<std::timed_mutex> lock(write_mutex_);
    if (pool_) {
        pool_->close();
    }
    METRICSTORE_INFO("Metrics storage closed: {}", config_.db_path);
    return core::Result<void>();
}

std::string SqliteStorage::stats() const {
    std::ostringstream ss;
    ss << "SqliteStorage Stats:\n";
    if (!initialized_.load() || !pool_) {
        ss << "  State: closed\n";
        return ss.str();
    }
    ss << "  Database: " << config_.db_path << "\n";

    auto conn = pool_->acquire(config_.acquire_timeout);
    if (conn.ok()) {
        for (auto table : {core::Table::TASK, core::Table::AGENT, core::Table::SWARM, core::Table::ARCHIVE}) {
            Statement stmt(conn.value().get(), fmt::format("SELECT COUNT(*) FROM {}", core::TableName(table)));
            if (stmt.step() == SQLITE_ROW) {
                ss << "  " << core::TableName(table) << ": " << stmt.int64(0) << " rows\n";
            }
        }
    } else {
        ss << "  Row counts unavailable: " << conn.error() << "\n";
    }

    ss << "  Batches written: " << batches_written_.load() << "\n"
       << "  Records written: " << records_written_.load() << "\n"
       << "  Write retries: " << write_retries_.load() << "\n"
       << pool_->stats();
    return ss.str();
}

} // namespace storage
} // namespace metricstore
