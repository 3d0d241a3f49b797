#ifndef METRICSTORE_EXPORT_FORMAT_WRITERS_H_
#define METRICSTORE_EXPORT_FORMAT_WRITERS_H_

#include <string>

#include "metricstore/export/exporter.h"

namespace metricstore {
namespace exporter {

/**
 * @brief Nested JSON document
 *
 * {"export_info": {...}, "task_metrics": [...], "agent_metrics": [...],
 *  "swarm_metrics": [...], "summary": {...}}
 */
class JsonFormatWriter : public FormatWriter {
public:
    JsonFormatWriter(bool pretty, bool include_metadata)
        : pretty_(pretty), include_metadata_(include_metadata) {}

    core::Result<uint64_t> write(ExportSource& source, std::ostream& out) override;

private:
    bool pretty_;
    bool include_metadata_;
};

/**
 * @brief One header row, then one row per record of every detailed table
 *
 * Booleans are written as true/false, timestamps as epoch milliseconds plus an
 * ISO-8601 column, and fields are quoted whenever they contain a separator,
 * quote or line break.
 */
class CsvFormatWriter : public FormatWriter {
public:
    explicit CsvFormatWriter(bool include_metadata) : include_metadata_(include_metadata) {}

    core::Result<uint64_t> write(ExportSource& source, std::ostream& out) override;

private:
    bool include_metadata_;
};

/**
 * @brief Text exposition format, one gauge sample per line with a millisecond timestamp
 */
class PrometheusFormatWriter : public FormatWriter {
public:
    explicit PrometheusFormatWriter(const std::string& prefix);

    core::Result<uint64_t> write(ExportSource& source, std::ostream& out) override;

private:
    std::string prefix_;
};

/**
 * @brief Grafana JSON datasource: [{"target": "<scope>.<metric>", "datapoints": [[value, ts_ms], ...]}]
 */
class GrafanaFormatWriter : public FormatWriter {
public:
    explicit GrafanaFormatWriter(bool pretty) : pretty_(pretty) {}

    core::Result<uint64_t> write(ExportSource& source, std::ostream& out) override;

private:
    bool pretty_;
};

// Field quoting for CSV
std::string EscapeCsvField(const std::string& field);

// Label value escaping for the exposition format (backslash, quote, newline)
std::string EscapeLabelValue(const std::string& value);

// Metric name with every character outside [a-zA-Z0-9_:] replaced by '_'
std::string SanitizeMetricName(const std::string& name);

// Shortest text that parses back to the same double; NaN, +Inf and -Inf spelled out
std::string FormatSampleValue(double value);

} // namespace exporter
} // namespace metricstore

#endif // METRICSTORE_EXPORT_FORMAT_WRITERS_H_
