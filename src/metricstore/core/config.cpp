#include "metricstore/core/config.h"

namespace metricstore {
namespace core {

Result<void> StorageConfig::validate() const {
    if (db_path.empty()) {
        return Result<void>::error("Storage db_path is empty", Error::Code::INVALID_QUERY);
    }
    if (pool_size == 0) {
        return Result<void>::error("Invalid connection pool size: 0", Error::Code::INVALID_QUERY);
    }
    if (max_retries == 0) {
        return Result<void>::error("max_retries must be at least 1", Error::Code::INVALID_QUERY);
    }
    return Result<void>();
}

Result<void> WriteBufferConfig::validate() const {
    if (max_size == 0) {
        return Result<void>::error("Invalid write buffer max size: 0", Error::Code::INVALID_QUERY);
    }
    if (flush_interval.count() <= 0) {
        return Result<void>::error("Flush interval must be positive", Error::Code::INVALID_QUERY);
    }
    return Result<void>();
}

Result<void> RetentionPolicy::validate() const {
    if (detailed_days <= 0) {
        return Result<void>::error("detailed_days must be positive", Error::Code::INVALID_QUERY);
    }
    if (hourly_days < detailed_days || daily_days < hourly_days) {
        return Result<void>::error(
            "Retention windows must satisfy detailed_days <= hourly_days <= daily_days",
            Error::Code::INVALID_QUERY);
    }
    if (cleanup_interval.count() <= 0) {
        return Result<void>::error("Cleanup interval must be positive", Error::Code::INVALID_QUERY);
    }
    return Result<void>();
}

const char* ExportFormatName(ExportFormat format) {
    switch (format) {
        case ExportFormat::JSON: return "json";
        case ExportFormat::CSV: return "csv";
        case ExportFormat::PROMETHEUS: return "prometheus";
        case ExportFormat::GRAFANA: return "grafana";
    }
    return "json";
}

Result<ExportFormat> ParseExportFormat(const std::string& name) {
    if (name == "json") return Result<ExportFormat>(ExportFormat::JSON);
    if (name == "csv") return Result<ExportFormat>(ExportFormat::CSV);
    if (name == "prometheus") return Result<ExportFormat>(ExportFormat::PROMETHEUS);
    if (name == "grafana") return Result<ExportFormat>(ExportFormat::GRAFANA);
    return Result<ExportFormat>::error("Unsupported export format: " + name,
                                       Error::Code::INVALID_QUERY);
}

Result<void> MetricStoreConfig::validate() const {
    auto result = storage.validate();
    if (!result.ok()) {
        return result;
    }
    result = write_buffer.validate();
    if (!result.ok()) {
        return result;
    }
    result = retention.validate();
    if (!result.ok()) {
        return result;
    }
    if (compression.level < 0 || compression.level > 9) {
        return Result<void>::error("Compression level must be in 0..9", Error::Code::INVALID_QUERY);
    }
    if (query.default_limit == 0) {
        return Result<void>::error("Default query limit must be positive", Error::Code::INVALID_QUERY);
    }
    return Result<void>();
}

} // namespace core
} // namespace metricstore
