#include "metricstore/export/exporter.h"
#include "metricstore/common/logger.h"
#include "metricstore/export/format_writers.h"
#include "metricstore/export/stream_buffers.h"

#include <chrono>
#include <filesystem>
#include <fstream>

namespace metricstore {
namespace exporter {

namespace {

constexpr int kGzipLevel = 6;

} // namespace

ExportConfig ExportConfig::FromDefaults(const core::ExportDefaults& defaults) {
    ExportConfig config;
    config.format = defaults.format;
    config.time_window_hours = defaults.time_window_hours;
    config.pretty = defaults.pretty;
    config.include_metadata = defaults.include_metadata;
    config.metric_prefix = defaults.metric_prefix;
    return config;
}

core::Result<void> ExportConfig::validate() const {
    if (time_window_hours < 0) {
        return core::Result<void>::error("time_window_hours must not be negative", core::Error::Code::INVALID_QUERY);
    }
    if (range && range->is_empty()) {
        return core::Result<void>::error("Export range is empty", core::Error::Code::INVALID_QUERY);
    }
    if (format == core::ExportFormat::PROMETHEUS && metric_prefix.empty()) {
        return core::Result<void>::error("Prometheus export needs a metric prefix", core::Error::Code::INVALID_QUERY);
    }
    if (timeout.count() <= 0) {
        return core::Result<void>::error("Export timeout must be positive", core::Error::Code::INVALID_QUERY);
    }
    return core::Result<void>();
}

ExportSource::ExportSource(storage::ReadSnapshot& snapshot,
                           query::QueryEngine& engine,
                           const core::TimeRange& window,
                           const core::QueryContext& ctx,
                           core::Timestamp exported_at)
    : snapshot_(snapshot), engine_(engine), window_(window), ctx_(ctx), exported_at_(exported_at) {}

core::Result<size_t> ExportSource::stream(core::Table table, core::ScanOrder order,
                                          const storage::RecordVisitor& visitor) {
    storage::ScanOptions options;
    options.order = order;
    return snapshot_.scan(table, core::QueryFilter(), window_, options, visitor);
}

core::Result<uint64_t> ExportSource::count(core::Table table) {
    return snapshot_.count(table, core::QueryFilter(), window_);
}

core::Result<query::SummaryStats> ExportSource::summary() {
    return engine_.summary(window_, ctx_);
}

std::unique_ptr<FormatWriter> MakeFormatWriter(const ExportConfig& config) {
    switch (config.format) {
        case core::ExportFormat::JSON:
            return std::make_unique<JsonFormatWriter>(config.pretty, config.include_metadata);
        case core::ExportFormat::CSV:
            return std::make_unique<CsvFormatWriter>(config.include_metadata);
        case core::ExportFormat::PROMETHEUS:
            return std::make_unique<PrometheusFormatWriter>(config.metric_prefix);
        case core::ExportFormat::GRAFANA:
            return std::make_unique<GrafanaFormatWriter>(config.pretty);
    }
    return nullptr;
}

Exporter::Exporter(std::shared_ptr<storage::SqliteStorage> storage,
                   std::shared_ptr<query::QueryEngine> engine,
                   Clock clock)
    : storage_(std::move(storage)), engine_(std::move(engine)), clock_(std::move(clock)) {}

core::TimeRange Exporter::window(const ExportConfig& config) const {
    core::TimeRange requested;
    if (config.range) {
        requested = *config.range;
    } else if (config.time_window_hours > 0) {
        requested = core::TimeRange::Since(clock_() - config.time_window_hours * core::kMillisPerHour);
    }
    return engine_->retained(requested);
}

core::Result<uint64_t> Exporter::render(const ExportConfig& config, std::ostream& out,
                                        const core::QueryContext& ctx) {
    auto writer = MakeFormatWriter(config);
    if (!writer) {
        return core::Result<uint64_t>::error("Unsupported export format", core::Error::Code::INVALID_QUERY);
    }

    auto bounded = ctx.with_default_timeout(config.timeout);
    auto snap = storage_->snapshot(bounded);
    if (!snap.ok()) {
        return core::PropagateError<uint64_t>(snap);
    }
    ExportSource source(snap.value(), *engine_, window(config), bounded, clock_());
    return writer->write(source, out);
}

core::Result<ExportSummary> Exporter::export_to_stream(const ExportConfig& config,
                                                       std::ostream& out,
                                                       const core::QueryContext& ctx) {
    auto valid = config.validate();
    if (!valid.ok()) {
        return core::PropagateError<ExportSummary>(valid);
    }
    if (!out.rdbuf()) {
        return core::Result<ExportSummary>::error("Export stream has no buffer", core::Error::Code::INVALID_QUERY);
    }

    auto start = std::chrono::steady_clock::now();
    CountingStreamBuf counter(out.rdbuf());
    std::unique_ptr<GzipStreamBuf> gzip;
    if (config.compress) {
        gzip = std::make_unique<GzipStreamBuf>(&counter, kGzipLevel);
        if (!gzip->ok()) {
            return core::Result<ExportSummary>::error("Could not start gzip stream", core::Error::Code::INTERNAL);
        }
    }
    std::ostream sink(gzip ? static_cast<std::streambuf*>(gzip.get()) : &counter);

    auto rendered = render(config, sink, ctx);
    if (!rendered.ok()) {
        METRICSTORE_WARN("{} export failed: {}", core::ExportFormatName(config.format), rendered.error());
        return core::PropagateError<ExportSummary>(rendered);
    }
    sink.flush();
    if (gzip) {
        auto finished = gzip->finish();
        if (!finished.ok()) {
            return core::PropagateError<ExportSummary>(finished);
        }
    }
    if (!sink.good() || counter.pubsync() != 0) {
        return core::Result<ExportSummary>::error("Flushing export output failed",
                                                  core::Error::Code::STORAGE_UNAVAILABLE);
    }

    ExportSummary summary;
    summary.records_written = rendered.value();
    summary.bytes_written = counter.bytes();
    summary.compressed = config.compress;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    METRICSTORE_INFO("Exported {} records as {} ({} bytes{}) in {} ms",
                     summary.records_written, core::ExportFormatName(config.format),
                     summary.bytes_written, summary.compressed ? ", gzip" : "", elapsed);
    return core::Result<ExportSummary>(summary);
}

core::Result<ExportSummary> Exporter::export_to_file(const ExportConfig& config, const core::QueryContext& ctx) {
    if (config.output_path.empty()) {
        return core::Result<ExportSummary>::error("Export output_path is empty", core::Error::Code::INVALID_QUERY);
    }
    std::filesystem::path path(config.output_path);
    if (config.compress) {
        path += ".gz";
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return core::Result<ExportSummary>::error(
                "Cannot create export directory " + path.parent_path().string() + ": " + ec.message(),
                core::Error::Code::STORAGE_UNAVAILABLE);
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return core::Result<ExportSummary>::error("Cannot open export file " + path.string(),
                                                  core::Error::Code::STORAGE_UNAVAILABLE);
    }

    auto exported = export_to_stream(config, file, ctx);
    file.close();
    if (exported.ok() && file.fail()) {
        exported = core::Result<ExportSummary>::error("Closing export file " + path.string() + " failed",
                                                      core::Error::Code::STORAGE_UNAVAILABLE);
    }
    if (!exported.ok()) {
        std::filesystem::remove(path, ec);
        return exported;
    }

    ExportSummary summary = exported.take_value();
    summary.path = path.string();
    METRICSTORE_INFO("Export written to {}", summary.path);
    return core::Result<ExportSummary>(summary);
}

} // namespace exporter
} // namespace metricstore
