#include "metricstore/export/format_writers.h"
#include "metricstore/storage/codec.h"

#include <cmath>
#include <initializer_list>
#include <string>
#include <variant>
#include <vector>

#include <spdlog/fmt/fmt.h>

namespace metricstore {
namespace exporter {

namespace {

const char* const kCsvHeader[] = {
    "metric_type", "timestamp", "timestamp_iso", "agent_id", "task_id", "swarm_id",
    "duration_ms", "tokens_used", "success", "metric_name", "value",
};

core::Result<uint64_t> OutputFailed() {
    return core::Result<uint64_t>::error("Writing export output failed", core::Error::Code::STORAGE_UNAVAILABLE);
}

void WriteCsvRow(std::ostream& out, const std::vector<std::string>& fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        out << EscapeCsvField(fields[i]);
    }
    out << '\n';
}

std::vector<std::string> CsvFields(const core::TaskMetric& task) {
    return {"task", std::to_string(task.timestamp), core::FormatIso8601(task.timestamp),
            task.agent_id, task.task_id, "", std::to_string(task.duration_ms),
            std::to_string(task.tokens_used), task.outcome == core::TaskOutcome::SUCCESS ? "true" : "false",
            "", ""};
}

std::vector<std::string> CsvFields(const core::AgentMetric& metric) {
    return {"agent", std::to_string(metric.timestamp), core::FormatIso8601(metric.timestamp),
            metric.agent_id, "", "", "", "", "", metric.metric_kind, FormatSampleValue(metric.value)};
}

std::vector<std::string> CsvFields(const core::SwarmMetric& metric) {
    return {"swarm", std::to_string(metric.timestamp), core::FormatIso8601(metric.timestamp),
            "", "", metric.swarm_id, "", "", "", metric.metric_kind, FormatSampleValue(metric.value)};
}

template<typename Row>
void WriteCsvRecord(std::ostream& out, const Row& row, bool include_metadata) {
    auto fields = CsvFields(row);
    if (include_metadata) {
        fields.push_back(storage::EncodeMetadata(row.metadata));
    }
    WriteCsvRow(out, fields);
}

struct Label {
    const char* name;
    const std::string& value;
};

void WriteSample(std::ostream& out, const std::string& name, std::initializer_list<Label> labels,
                 double value, core::Timestamp timestamp) {
    out << name << '{';
    bool first = true;
    for (const auto& label : labels) {
        if (!first) {
            out << ',';
        }
        first = false;
        out << label.name << "=\"" << EscapeLabelValue(label.value) << '"';
    }
    out << "} " << FormatSampleValue(value) << ' ' << timestamp << '\n';
}

void WriteFamilyHeader(std::ostream& out, const std::string& name, const char* help) {
    out << "# HELP " << name << ' ' << help << '\n';
    out << "# TYPE " << name << " gauge\n";
}

} // namespace

std::string EscapeCsvField(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted;
    quoted.reserve(field.size() + 2);
    quoted.push_back('"');
    for (char c : field) {
        if (c == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

std::string EscapeLabelValue(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': escaped += "\\\\"; break;
            case '"': escaped += "\\\""; break;
            case '\n': escaped += "\\n"; break;
            default: escaped.push_back(c);
        }
    }
    return escaped;
}

std::string SanitizeMetricName(const std::string& name) {
    std::string sanitized = name;
    for (auto& c : sanitized) {
        bool valid = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                     c == '_' || c == ':';
        if (!valid) {
            c = '_';
        }
    }
    if (sanitized.empty() || (sanitized[0] >= '0' && sanitized[0] <= '9')) {
        sanitized.insert(sanitized.begin(), '_');
    }
    return sanitized;
}

std::string FormatSampleValue(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    return fmt::format("{}", value);
}

core::Result<uint64_t> CsvFormatWriter::write(ExportSource& source, std::ostream& out) {
    std::vector<std::string> header(std::begin(kCsvHeader), std::end(kCsvHeader));
    if (include_metadata_) {
        header.push_back("metadata");
    }
    WriteCsvRow(out, header);

    uint64_t written = 0;
    for (auto table : {core::Table::TASK, core::Table::AGENT, core::Table::SWARM}) {
        auto streamed = source.stream(table, core::ScanOrder::TIME_ASCENDING, [&](const core::Record& record) {
            if (auto task = std::get_if<core::TaskMetric>(&record)) {
                WriteCsvRecord(out, *task, include_metadata_);
            } else if (auto agent = std::get_if<core::AgentMetric>(&record)) {
                WriteCsvRecord(out, *agent, include_metadata_);
            } else if (auto swarm = std::get_if<core::SwarmMetric>(&record)) {
                WriteCsvRecord(out, *swarm, include_metadata_);
            } else {
                return true;
            }
            ++written;
            return out.good();
        });
        if (!streamed.ok()) {
            return core::PropagateError<uint64_t>(streamed);
        }
        if (!out.good()) {
            return OutputFailed();
        }
    }
    return core::Result<uint64_t>(written);
}

PrometheusFormatWriter::PrometheusFormatWriter(const std::string& prefix)
    : prefix_(SanitizeMetricName(prefix)) {}

core::Result<uint64_t> PrometheusFormatWriter::write(ExportSource& source, std::ostream& out) {
    struct TaskFamily {
        const char* suffix;
        const char* help;
        int64_t core::TaskMetric::*field;
    };
    const TaskFamily task_families[] = {
        {"_task_duration_ms", "Task duration in milliseconds", &core::TaskMetric::duration_ms},
        {"_task_tokens_used", "Tokens consumed by a task", &core::TaskMetric::tokens_used},
        {"_task_files_changed", "Files changed by a task", &core::TaskMetric::files_changed},
    };

    uint64_t written = 0;
    bool first_family = true;
    for (const auto& family : task_families) {
        std::string name = prefix_ + family.suffix;
        WriteFamilyHeader(out, name, family.help);
        auto streamed = source.stream(core::Table::TASK, core::ScanOrder::TIME_ASCENDING,
                                      [&](const core::Record& record) {
            const auto* task = std::get_if<core::TaskMetric>(&record);
            if (!task) {
                return true;
            }
            std::string outcome = core::OutcomeName(task->outcome);
            WriteSample(out, name, {{"agent_id", task->agent_id}, {"task_id", task->task_id},
                                    {"outcome", outcome}},
                        static_cast<double>(task->*family.field), task->timestamp);
            return out.good();
        });
        if (!streamed.ok()) {
            return core::PropagateError<uint64_t>(streamed);
        }
        if (!out.good()) {
            return OutputFailed();
        }
        // Every task row feeds each family; count it once
        if (first_family) {
            written += streamed.value();
            first_family = false;
        }
    }

    std::string agent_name = prefix_ + "_agent_metric";
    WriteFamilyHeader(out, agent_name, "Agent metric sample by kind");
    auto agents = source.stream(core::Table::AGENT, core::ScanOrder::TIME_ASCENDING,
                                [&](const core::Record& record) {
        const auto* metric = std::get_if<core::AgentMetric>(&record);
        if (!metric) {
            return true;
        }
        WriteSample(out, agent_name, {{"agent_id", metric->agent_id}, {"metric_kind", metric->metric_kind}},
                    metric->value, metric->timestamp);
        return out.good();
    });
    if (!agents.ok()) {
        return core::PropagateError<uint64_t>(agents);
    }
    written += agents.value();

    std::string swarm_name = prefix_ + "_swarm_metric";
    WriteFamilyHeader(out, swarm_name, "Swarm metric sample by kind");
    auto swarms = source.stream(core::Table::SWARM, core::ScanOrder::TIME_ASCENDING,
                                [&](const core::Record& record) {
        const auto* metric = std::get_if<core::SwarmMetric>(&record);
        if (!metric) {
            return true;
        }
        WriteSample(out, swarm_name, {{"swarm_id", metric->swarm_id}, {"metric_kind", metric->metric_kind}},
                    metric->value, metric->timestamp);
        return out.good();
    });
    if (!swarms.ok()) {
        return core::PropagateError<uint64_t>(swarms);
    }
    written += swarms.value();

    if (!out.good()) {
        return OutputFailed();
    }
    return core::Result<uint64_t>(written);
}

} // namespace exporter
} // namespace metricstore
