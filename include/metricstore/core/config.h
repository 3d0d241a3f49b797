#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "metricstore/core/result.h"

namespace metricstore {
namespace core {

/**
 * @brief Configuration of the embedded relational store
 */
struct StorageConfig {
    std::string db_path;                          // Single database file
    size_t pool_size;                             // Connections shared by readers and the writer
    std::chrono::milliseconds busy_timeout;       // SQLite busy handler timeout per statement
    std::chrono::milliseconds acquire_timeout;    // Max wait for a pooled connection or the write lock
    uint32_t max_retries;                         // Attempts on transient (busy/locked) errors
    std::chrono::milliseconds retry_delay;        // Base delay between attempts
    int64_t cache_size_kib;                       // Page cache per connection
    bool wal_mode;                                // Write-ahead log journal

    StorageConfig() : pool_size(4), busy_timeout(5000), acquire_timeout(5000),
                      max_retries(3), retry_delay(50), cache_size_kib(65536), wal_mode(true) {}

    static StorageConfig Default() {
        StorageConfig config;
        config.db_path = ".swarm/metrics_persistent.db";
        return config;
    }

    Result<void> validate() const;
};

/**
 * @brief Write buffer thresholds
 */
struct WriteBufferConfig {
    bool enabled;                              // Buffer writes; false writes through
    size_t max_size;                           // Flush when this many records are buffered
    std::chrono::milliseconds flush_interval;  // Flush at least this often
    bool auto_flush_on_shutdown;               // Final flush when the buffer is destroyed

    WriteBufferConfig() : enabled(true), max_size(100), flush_interval(5000),
                          auto_flush_on_shutdown(true) {}

    static WriteBufferConfig Default() { return WriteBufferConfig(); }

    Result<void> validate() const;
};

/**
 * @brief Three-tier retention policy
 *
 * detailed rows live detailed_days, hourly buckets hourly_days, daily buckets
 * daily_days. Anything older than daily_days is deleted.
 */
struct RetentionPolicy {
    int detailed_days;
    int hourly_days;
    int daily_days;
    bool auto_cleanup;                         // Schedule the retention cycle
    std::chrono::milliseconds cleanup_interval;
    bool vacuum_after_cleanup;

    RetentionPolicy() : detailed_days(7), hourly_days(30), daily_days(90), auto_cleanup(true),
                        cleanup_interval(std::chrono::hours(24)), vacuum_after_cleanup(false) {}

    static RetentionPolicy Default() { return RetentionPolicy(); }

    Result<void> validate() const;
};

/**
 * @brief Compression of archived aggregate payloads
 */
struct CompressionConfig {
    bool enabled;
    int level;   // zlib level 0-9

    CompressionConfig() : enabled(true), level(6) {}

    static CompressionConfig Default() { return CompressionConfig(); }
};

struct QueryConfig {
    std::chrono::milliseconds default_timeout;
    size_t default_limit;

    QueryConfig() : default_timeout(30000), default_limit(1000) {}

    static QueryConfig Default() { return QueryConfig(); }
};

enum class ExportFormat {
    JSON,
    CSV,
    PROMETHEUS,
    GRAFANA
};

const char* ExportFormatName(ExportFormat format);
Result<ExportFormat> ParseExportFormat(const std::string& name);

struct ExportDefaults {
    ExportFormat format;
    int time_window_hours;      // 0 exports everything
    bool pretty;
    bool include_metadata;
    std::string metric_prefix;  // Prefix of exposition metric names

    ExportDefaults() : format(ExportFormat::JSON), time_window_hours(24), pretty(true),
                       include_metadata(true), metric_prefix("metricstore") {}

    static ExportDefaults Default() { return ExportDefaults(); }
};

/**
 * @brief Top-level configuration of a MetricStore
 */
struct MetricStoreConfig {
    StorageConfig storage;
    WriteBufferConfig write_buffer;
    RetentionPolicy retention;
    CompressionConfig compression;
    QueryConfig query;
    ExportDefaults export_defaults;

    MetricStoreConfig() : storage(StorageConfig::Default()) {}

    static MetricStoreConfig Default() { return MetricStoreConfig(); }

    static MetricStoreConfig ForPath(const std::string& db_path) {
        MetricStoreConfig config;
        config.storage.db_path = db_path;
        return config;
    }

    Result<void> validate() const;
};

} // namespace core
} // namespace metricstore
