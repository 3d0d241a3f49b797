#include "metricstore/core/types.h"

#include <cctype>
#include <cmath>
#include <chrono>
#include <ctime>

#include <spdlog/fmt/fmt.h>

namespace metricstore {
namespace core {

namespace {

bool IsDocumentedMetadataKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    for (char ch : key) {
        if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '_') {
            return false;
        }
    }
    return true;
}

std::tm ToUtc(Timestamp ts) {
    // Floor division so pre-epoch timestamps land on the right second
    std::time_t seconds = static_cast<std::time_t>(ts >= 0 ? ts / 1000 : (ts - 999) / 1000);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    return tm;
}

} // namespace

const char* TableName(Table table) {
    switch (table) {
        case Table::TASK: return "task_metrics";
        case Table::AGENT: return "agent_metrics";
        case Table::SWARM: return "swarm_metrics";
        case Table::ARCHIVE: return "metrics_archive";
    }
    return "unknown";
}

Result<Table> ParseTable(const std::string& name) {
    if (name == "task_metrics" || name == "task") return Result<Table>(Table::TASK);
    if (name == "agent_metrics" || name == "agent") return Result<Table>(Table::AGENT);
    if (name == "swarm_metrics" || name == "swarm") return Result<Table>(Table::SWARM);
    if (name == "metrics_archive" || name == "archive") return Result<Table>(Table::ARCHIVE);
    return Result<Table>::error("Unknown table: " + name, Error::Code::INVALID_QUERY);
}

bool IsDetailedTable(Table table) {
    return table != Table::ARCHIVE;
}

const char* OutcomeName(TaskOutcome outcome) {
    switch (outcome) {
        case TaskOutcome::SUCCESS: return "success";
        case TaskOutcome::FAILURE: return "failure";
        case TaskOutcome::TIMEOUT: return "timeout";
        case TaskOutcome::CANCELLED: return "cancelled";
    }
    return "failure";
}

Result<TaskOutcome> ParseOutcome(const std::string& name) {
    if (name == "success") return Result<TaskOutcome>(TaskOutcome::SUCCESS);
    if (name == "failure") return Result<TaskOutcome>(TaskOutcome::FAILURE);
    if (name == "timeout") return Result<TaskOutcome>(TaskOutcome::TIMEOUT);
    if (name == "cancelled") return Result<TaskOutcome>(TaskOutcome::CANCELLED);
    return Result<TaskOutcome>::error("Unknown task outcome: " + name, Error::Code::INVALID_QUERY);
}

bool TaskMetric::operator==(const TaskMetric& other) const {
    return task_id == other.task_id && agent_id == other.agent_id &&
           timestamp == other.timestamp && duration_ms == other.duration_ms &&
           outcome == other.outcome && tokens_used == other.tokens_used &&
           files_changed == other.files_changed && metadata == other.metadata;
}

bool AgentMetric::operator==(const AgentMetric& other) const {
    return agent_id == other.agent_id && timestamp == other.timestamp &&
           metric_kind == other.metric_kind && value == other.value &&
           metadata == other.metadata;
}

bool SwarmMetric::operator==(const SwarmMetric& other) const {
    return swarm_id == other.swarm_id && timestamp == other.timestamp &&
           metric_kind == other.metric_kind && value == other.value &&
           metadata == other.metadata;
}

Table TableOf(const MetricRecord& record) {
    switch (record.index()) {
        case 0: return Table::TASK;
        case 1: return Table::AGENT;
        default: return Table::SWARM;
    }
}

Timestamp TimestampOf(const MetricRecord& record) {
    return std::visit([](const auto& r) { return r.timestamp; }, record);
}

Result<void> ValidateRecord(const MetricRecord& record) {
    auto reject = [](const std::string& message) {
        return Result<void>::error(message, Error::Code::INVALID_QUERY);
    };

    if (const auto* task = std::get_if<TaskMetric>(&record)) {
        if (task->task_id.empty() || task->agent_id.empty()) {
            return reject("Task metric needs task_id and agent_id");
        }
        if (task->duration_ms < 0 || task->tokens_used < 0 || task->files_changed < 0) {
            return reject(fmt::format("Task metric {} has a negative duration, token or file count", task->task_id));
        }
        return Result<void>();
    }
    if (const auto* agent = std::get_if<AgentMetric>(&record)) {
        if (agent->agent_id.empty() || agent->metric_kind.empty()) {
            return reject("Agent metric needs agent_id and metric_kind");
        }
        if (!std::isfinite(agent->value)) {
            return reject(fmt::format("Agent metric {}/{} value is not finite", agent->agent_id, agent->metric_kind));
        }
        return Result<void>();
    }
    const auto& swarm = std::get<SwarmMetric>(record);
    if (swarm.swarm_id.empty() || swarm.metric_kind.empty()) {
        return reject("Swarm metric needs swarm_id and metric_kind");
    }
    if (!std::isfinite(swarm.value)) {
        return reject(fmt::format("Swarm metric {}/{} value is not finite", swarm.swarm_id, swarm.metric_kind));
    }
    return Result<void>();
}

Result<void> ValidateFilter(Table table, const QueryFilter& filter) {
    auto reject = [table](const char* field) {
        return Result<void>::error(
            fmt::format("Filter field '{}' does not apply to table {}", field, TableName(table)),
            Error::Code::INVALID_QUERY);
    };

    switch (table) {
        case Table::TASK:
            if (filter.swarm_id) return reject("swarm_id");
            if (filter.metric_kind) return reject("metric_kind");
            break;
        case Table::AGENT:
            if (filter.task_id) return reject("task_id");
            if (filter.swarm_id) return reject("swarm_id");
            if (filter.outcome) return reject("outcome");
            break;
        case Table::SWARM:
            if (filter.task_id) return reject("task_id");
            if (filter.agent_id) return reject("agent_id");
            if (filter.outcome) return reject("outcome");
            break;
        case Table::ARCHIVE:
            if (filter.task_id) return reject("task_id");
            if (filter.outcome) return reject("outcome");
            if (!filter.metadata.empty()) return reject("metadata");
            if (filter.agent_id && filter.swarm_id) return reject("swarm_id");
            break;
    }

    for (const auto& [key, value] : filter.metadata) {
        if (!IsDocumentedMetadataKey(key)) {
            return Result<void>::error("Invalid metadata filter key: '" + key + "'",
                                       Error::Code::INVALID_QUERY);
        }
    }
    return Result<void>();
}

const std::vector<std::string>& NumericColumns(Table table) {
    static const std::vector<std::string> task_columns = {"duration_ms", "tokens_used", "files_changed", "success"};
    static const std::vector<std::string> value_columns = {"value"};
    static const std::vector<std::string> none;
    switch (table) {
        case Table::TASK: return task_columns;
        case Table::AGENT:
        case Table::SWARM: return value_columns;
        case Table::ARCHIVE: break;
    }
    return none;
}

Result<void> ValidateColumn(Table table, const std::string& column) {
    const auto& columns = NumericColumns(table);
    for (const auto& candidate : columns) {
        if (candidate == column) {
            return Result<void>();
        }
    }
    return Result<void>::error(
        fmt::format("Unknown column '{}' for table {}", column, TableName(table)),
        Error::Code::INVALID_QUERY);
}

Timestamp NowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

Timestamp FloorTo(Timestamp ts, Duration width) {
    Timestamp rem = ts % width;
    if (rem < 0) {
        rem += width;
    }
    return ts - rem;
}

std::string FormatIso8601(Timestamp ts) {
    std::tm tm = ToUtc(ts);
    int64_t millis = ts % 1000;
    if (millis < 0) {
        millis += 1000;
    }
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
}

std::string FormatDate(Timestamp ts) {
    std::tm tm = ToUtc(ts);
    return fmt::format("{:04d}-{:02d}-{:02d}", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
}

} // namespace core
} // namespace metricstore
