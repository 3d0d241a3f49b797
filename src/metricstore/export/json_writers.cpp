#include "metricstore/export/format_writers.h"

#include <cmath>
#include <optional>
#include <type_traits>
#include <variant>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/writer.h>

namespace metricstore {
namespace exporter {

namespace {

constexpr core::Table kSections[] = {core::Table::TASK, core::Table::AGENT, core::Table::SWARM};

template<typename Writer>
void WriteString(Writer& writer, const std::string& value) {
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

// JSON has no NaN or infinity
template<typename Writer>
void WriteNumber(Writer& writer, double value) {
    if (std::isfinite(value)) {
        writer.Double(value);
    } else {
        writer.Null();
    }
}

template<typename Writer>
void WriteOptional(Writer& writer, const std::optional<double>& value) {
    if (value) {
        WriteNumber(writer, *value);
    } else {
        writer.Null();
    }
}

template<typename Writer>
void WriteTimestamp(Writer& writer, core::Timestamp ts) {
    writer.Key("timestamp");
    writer.Int64(ts);
    writer.Key("timestamp_iso");
    WriteString(writer, core::FormatIso8601(ts));
}

template<typename Writer>
void WriteMetadata(Writer& writer, const core::Metadata& metadata) {
    writer.Key("metadata");
    writer.StartObject();
    for (const auto& entry : metadata) {
        writer.Key(entry.first.c_str(), static_cast<rapidjson::SizeType>(entry.first.size()));
        WriteString(writer, entry.second);
    }
    writer.EndObject();
}

template<typename Writer>
void WriteRow(Writer& writer, const core::TaskMetric& task, bool include_metadata) {
    writer.StartObject();
    writer.Key("task_id");
    WriteString(writer, task.task_id);
    writer.Key("agent_id");
    WriteString(writer, task.agent_id);
    WriteTimestamp(writer, task.timestamp);
    writer.Key("duration_ms");
    writer.Int64(task.duration_ms);
    writer.Key("outcome");
    writer.String(core::OutcomeName(task.outcome));
    writer.Key("success");
    writer.Bool(task.outcome == core::TaskOutcome::SUCCESS);
    writer.Key("tokens_used");
    writer.Int64(task.tokens_used);
    writer.Key("files_changed");
    writer.Int64(task.files_changed);
    if (include_metadata) {
        WriteMetadata(writer, task.metadata);
    }
    writer.EndObject();
}

template<typename Writer>
void WriteRow(Writer& writer, const core::AgentMetric& metric, bool include_metadata) {
    writer.StartObject();
    writer.Key("agent_id");
    WriteString(writer, metric.agent_id);
    WriteTimestamp(writer, metric.timestamp);
    writer.Key("metric_kind");
    WriteString(writer, metric.metric_kind);
    writer.Key("value");
    WriteNumber(writer, metric.value);
    if (include_metadata) {
        WriteMetadata(writer, metric.metadata);
    }
    writer.EndObject();
}

template<typename Writer>
void WriteRow(Writer& writer, const core::SwarmMetric& metric, bool include_metadata) {
    writer.StartObject();
    writer.Key("swarm_id");
    WriteString(writer, metric.swarm_id);
    WriteTimestamp(writer, metric.timestamp);
    writer.Key("metric_kind");
    WriteString(writer, metric.metric_kind);
    writer.Key("value");
    WriteNumber(writer, metric.value);
    if (include_metadata) {
        WriteMetadata(writer, metric.metadata);
    }
    writer.EndObject();
}

template<typename Writer>
void WriteRow(Writer& writer, const core::ArchiveBucket& bucket, bool /*include_metadata*/) {
    writer.StartObject();
    writer.Key("metric_table");
    writer.String(core::TableName(bucket.source_table));
    writer.Key("aggregation_level");
    writer.String(core::AggregationLevelName(bucket.level));
    writer.Key("scope_id");
    WriteString(writer, bucket.scope_id);
    writer.Key("metric_kind");
    WriteString(writer, bucket.metric_kind);
    writer.Key("bucket_start");
    writer.Int64(bucket.bucket_start);
    writer.Key("count");
    writer.Uint64(bucket.stats.count);
    writer.Key("sum");
    WriteNumber(writer, bucket.stats.sum);
    writer.Key("min");
    WriteNumber(writer, bucket.stats.min);
    writer.Key("max");
    WriteNumber(writer, bucket.stats.max);
    writer.EndObject();
}

template<typename Writer>
void WriteSummary(Writer& writer, const query::SummaryStats& summary) {
    writer.StartObject();
    writer.Key("total_tasks");
    writer.Uint64(summary.total_tasks);
    writer.Key("successful_tasks");
    writer.Uint64(summary.successful_tasks);
    writer.Key("success_rate");
    WriteOptional(writer, summary.success_rate);
    writer.Key("avg_duration_ms");
    WriteOptional(writer, summary.avg_duration_ms);
    writer.Key("total_tokens");
    WriteNumber(writer, summary.total_tokens);
    writer.Key("distinct_agents");
    writer.Uint64(summary.distinct_agents);
    writer.Key("agent_metric_rows");
    writer.Uint64(summary.agent_metric_rows);
    writer.Key("swarm_metric_rows");
    writer.Uint64(summary.swarm_metric_rows);
    writer.Key("distinct_swarms");
    writer.Uint64(summary.distinct_swarms);
    writer.Key("archive_buckets");
    writer.Uint64(summary.archive_buckets);
    writer.EndObject();
}

template<typename Writer>
void WriteBound(Writer& writer, const char* key, const std::optional<core::Timestamp>& bound) {
    writer.Key(key);
    if (bound) {
        WriteString(writer, core::FormatIso8601(*bound));
    } else {
        writer.Null();
    }
}

core::Result<uint64_t> OutputFailed() {
    return core::Result<uint64_t>::error("Writing export output failed", core::Error::Code::STORAGE_UNAVAILABLE);
}

template<typename Writer>
core::Result<uint64_t> WriteDocument(Writer& writer, ExportSource& source, bool include_metadata, std::ostream& out) {
    uint64_t counts[3] = {0, 0, 0};
    for (size_t i = 0; i < 3; ++i) {
        auto counted = source.count(kSections[i]);
        if (!counted.ok()) {
            return core::PropagateError<uint64_t>(counted);
        }
        counts[i] = counted.value();
    }

    writer.StartObject();
    writer.Key("export_info");
    writer.StartObject();
    writer.Key("format");
    writer.String("json");
    writer.Key("exported_at");
    WriteString(writer, core::FormatIso8601(source.exported_at()));
    writer.Key("time_range");
    writer.StartObject();
    WriteBound(writer, "start", source.window().start);
    WriteBound(writer, "end", source.window().end);
    writer.EndObject();
    writer.Key("record_counts");
    writer.StartObject();
    for (size_t i = 0; i < 3; ++i) {
        writer.Key(core::TableName(kSections[i]));
        writer.Uint64(counts[i]);
    }
    writer.EndObject();
    writer.EndObject();

    uint64_t written = 0;
    for (auto table : kSections) {
        writer.Key(core::TableName(table));
        writer.StartArray();
        auto streamed = source.stream(table, core::ScanOrder::TIME_ASCENDING,
                                      [&](const core::Record& record) {
            std::visit([&](const auto& row) { WriteRow(writer, row, include_metadata); }, record);
            ++written;
            return out.good();
        });
        if (!streamed.ok()) {
            return core::PropagateError<uint64_t>(streamed);
        }
        if (!out.good()) {
            return OutputFailed();
        }
        writer.EndArray();
    }

    auto summary = source.summary();
    if (!summary.ok()) {
        return core::PropagateError<uint64_t>(summary);
    }
    writer.Key("summary");
    WriteSummary(writer, summary.value());
    writer.EndObject();

    if (!writer.IsComplete() || !out.good()) {
        return OutputFailed();
    }
    return core::Result<uint64_t>(written);
}

/**
 * @brief One datapoint of a Grafana series; archive buckets have none
 */
struct Datapoint {
    std::string target;
    double value = 0.0;
    core::Timestamp timestamp = 0;
};

std::optional<Datapoint> ToDatapoint(const core::Record& record) {
    return std::visit([](const auto& row) -> std::optional<Datapoint> {
        using Row = std::decay_t<decltype(row)>;
        if constexpr (std::is_same_v<Row, core::TaskMetric>) {
            return Datapoint{row.agent_id + ".duration_ms", static_cast<double>(row.duration_ms), row.timestamp};
        } else if constexpr (std::is_same_v<Row, core::AgentMetric>) {
            return Datapoint{row.agent_id + "." + row.metric_kind, row.value, row.timestamp};
        } else if constexpr (std::is_same_v<Row, core::SwarmMetric>) {
            return Datapoint{row.swarm_id + "." + row.metric_kind, row.value, row.timestamp};
        } else {
            return std::nullopt;
        }
    }, record);
}

template<typename Writer>
core::Result<uint64_t> WriteSeries(Writer& writer, ExportSource& source, std::ostream& out) {
    uint64_t written = 0;
    std::optional<std::string> open_target;

    writer.StartArray();
    for (auto table : kSections) {
        // Scope-then-time order keeps each target's datapoints contiguous
        auto streamed = source.stream(table, core::ScanOrder::SCOPE_THEN_TIME,
                                      [&](const core::Record& record) {
            auto point = ToDatapoint(record);
            if (!point) {
                return true;
            }
            if (!open_target || *open_target != point->target) {
                if (open_target) {
                    writer.EndArray();
                    writer.EndObject();
                }
                writer.StartObject();
                writer.Key("target");
                WriteString(writer, point->target);
                writer.Key("datapoints");
                writer.StartArray();
                open_target = point->target;
            }
            writer.StartArray();
            WriteNumber(writer, point->value);
            writer.Int64(point->timestamp);
            writer.EndArray();
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
    if (open_target) {
        writer.EndArray();
        writer.EndObject();
    }
    writer.EndArray();

    if (!writer.IsComplete() || !out.good()) {
        return OutputFailed();
    }
    return core::Result<uint64_t>(written);
}

} // namespace

core::Result<uint64_t> JsonFormatWriter::write(ExportSource& source, std::ostream& out) {
    rapidjson::OStreamWrapper stream(out);
    if (pretty_) {
        rapidjson::PrettyWriter<rapidjson::OStreamWrapper> writer(stream);
        writer.SetIndent(' ', 2);
        return WriteDocument(writer, source, include_metadata_, out);
    }
    rapidjson::Writer<rapidjson::OStreamWrapper> writer(stream);
    return WriteDocument(writer, source, include_metadata_, out);
}

core::Result<uint64_t> GrafanaFormatWriter::write(ExportSource& source, std::ostream& out) {
    rapidjson::OStreamWrapper stream(out);
    if (pretty_) {
        rapidjson::PrettyWriter<rapidjson::OStreamWrapper> writer(stream);
        writer.SetIndent(' ', 2);
        return WriteSeries(writer, source, out);
    }
    rapidjson::Writer<rapidjson::OStreamWrapper> writer(stream);
    return WriteSeries(writer, source, out);
}

} // namespace exporter
} // namespace metricstore
