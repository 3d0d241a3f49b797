#ifndef METRICSTORE_EXPORT_EXPORTER_H_
#define METRICSTORE_EXPORT_EXPORTER_H_

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "metricstore/core/config.h"
#include "metricstore/core/query_context.h"
#include "metricstore/core/result.h"
#include "metricstore/core/types.h"
#include "metricstore/query/query_engine.h"
#include "metricstore/storage/sqlite_storage.h"

namespace metricstore {
namespace exporter {

/**
 * @brief What to export and where
 *
 * range wins over time_window_hours when both are set. An empty output_path
 * is only valid for export_to_stream.
 */
struct ExportConfig {
    core::ExportFormat format = core::ExportFormat::JSON;
    std::string output_path;
    std::optional<core::TimeRange> range;
    int time_window_hours = 24;     // 0 exports everything retained
    bool pretty = true;
    bool compress = false;          // gzip; file exports get a .gz suffix
    bool include_metadata = true;
    std::string metric_prefix = "metricstore";
    std::chrono::milliseconds timeout{300000};

    static ExportConfig FromDefaults(const core::ExportDefaults& defaults);

    core::Result<void> validate() const;
};

struct ExportSummary {
    std::string path;               // empty for stream exports
    uint64_t records_written = 0;
    uint64_t bytes_written = 0;     // after compression
    bool compressed = false;
};

/**
 * @brief Rows and summaries a format writer pulls from
 *
 * Every table is read through the same snapshot, so section counts and rows
 * agree even while compaction runs.
 */
class ExportSource {
public:
    ExportSource(storage::ReadSnapshot& snapshot,
                 query::QueryEngine& engine,
                 const core::TimeRange& window,
                 const core::QueryContext& ctx,
                 core::Timestamp exported_at);

    core::Result<size_t> stream(core::Table table, core::ScanOrder order, const storage::RecordVisitor& visitor);
    core::Result<uint64_t> count(core::Table table);
    core::Result<query::SummaryStats> summary();

    const core::TimeRange& window() const { return window_; }
    core::Timestamp exported_at() const { return exported_at_; }

private:
    storage::ReadSnapshot& snapshot_;
    query::QueryEngine& engine_;
    core::TimeRange window_;
    core::QueryContext ctx_;
    core::Timestamp exported_at_;
};

/**
 * @brief Renders one export format
 */
class FormatWriter {
public:
    virtual ~FormatWriter() = default;

    /**
     * @return Number of records rendered
     */
    virtual core::Result<uint64_t> write(ExportSource& source, std::ostream& out) = 0;
};

std::unique_ptr<FormatWriter> MakeFormatWriter(const ExportConfig& config);

/**
 * @brief Streams retained metrics into JSON, CSV, Prometheus text or Grafana JSON
 *
 * Rows are rendered while they are read; no format materializes the export
 * in memory.
 */
class Exporter {
public:
    using Clock = std::function<core::Timestamp()>;

    Exporter(std::shared_ptr<storage::SqliteStorage> storage,
             std::shared_ptr<query::QueryEngine> engine,
             Clock clock = core::NowMillis);

    /**
     * @brief Export to config.output_path
     */
    core::Result<ExportSummary> export_to_file(const ExportConfig& config,
                                               const core::QueryContext& ctx = core::QueryContext());

    core::Result<ExportSummary> export_to_stream(const ExportConfig& config,
                                                 std::ostream& out,
                                                 const core::QueryContext& ctx = core::QueryContext());

    /**
     * @brief Range an export config resolves to at the current time
     */
    core::TimeRange window(const ExportConfig& config) const;

private:
    core::Result<uint64_t> render(const ExportConfig& config, std::ostream& out, const core::QueryContext& ctx);

    std::shared_ptr<storage::SqliteStorage> storage_;
    std::shared_ptr<query::QueryEngine> engine_;
    Clock clock_;
};

} // namespace exporter
} // namespace metricstore

#endif // METRICSTORE_EXPORT_EXPORTER_H_
