#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "metricstore/common/logger.h"
#include "metricstore/metric_store.h"

namespace {

struct CliOptions {
    std::string command;
    std::string db_path = ".swarm/metrics_persistent.db";
    int hours = 24;
    std::string format = "json";
    std::string output;
    bool pretty = true;
    bool gzip = false;
    bool include_metadata = true;
    std::string prefix = "metricstore";
    std::string table = "task_metrics";
    std::string agent_id;
    std::string swarm_id;
    std::string task_id;
    std::string metric_kind;
    size_t limit = 100;
};

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " COMMAND [OPTIONS]" << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  summary              Totals over the time window" << std::endl;
    std::cout << "  export               Export the time window (--format, --output)" << std::endl;
    std::cout << "  compact              Run one retention cycle now" << std::endl;
    std::cout << "  vacuum               Reclaim free pages" << std::endl;
    std::cout << "  query                Print raw rows of one table" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --db PATH            Database file (default: .swarm/metrics_persistent.db)" << std::endl;
    std::cout << "  --hours N            Time window in hours, 0 for everything (default: 24)" << std::endl;
    std::cout << "  --format FORMAT      json, csv, prometheus or grafana (default: json)" << std::endl;
    std::cout << "  --output PATH        Export file; standard output when omitted" << std::endl;
    std::cout << "  --compact-json       Single-line JSON" << std::endl;
    std::cout << "  --gzip               Gzip the export" << std::endl;
    std::cout << "  --no-metadata        Leave metadata out of JSON and CSV" << std::endl;
    std::cout << "  --prefix PREFIX      Metric name prefix for prometheus (default: metricstore)" << std::endl;
    std::cout << "  --table TABLE        task_metrics, agent_metrics, swarm_metrics or metrics_archive" << std::endl;
    std::cout << "  --agent ID, --swarm ID, --task ID, --kind KIND   Query filters" << std::endl;
    std::cout << "  --limit N            Row limit for query (default: 100)" << std::endl;
    std::cout << "  --log-level LEVEL    trace, debug, info, warn, error, critical, off" << std::endl;
    std::cout << "  --help, -h           Show this help message" << std::endl;
}

std::string FormatOptional(const std::optional<double>& value) {
    return value ? fmt::format("{:.3f}", *value) : std::string("n/a");
}

void PrintRecord(const metricstore::core::Record& record) {
    using namespace metricstore::core;
    if (const auto* task = std::get_if<TaskMetric>(&record)) {
        std::cout << fmt::format("{} task={} agent={} duration_ms={} outcome={} tokens={} files={}",
                                 FormatIso8601(task->timestamp), task->task_id, task->agent_id,
                                 task->duration_ms, OutcomeName(task->outcome), task->tokens_used,
                                 task->files_changed) << std::endl;
    } else if (const auto* agent = std::get_if<AgentMetric>(&record)) {
        std::cout << fmt::format("{} agent={} {}={}", FormatIso8601(agent->timestamp), agent->agent_id,
                                 agent->metric_kind, agent->value) << std::endl;
    } else if (const auto* swarm = std::get_if<SwarmMetric>(&record)) {
        std::cout << fmt::format("{} swarm={} {}={}", FormatIso8601(swarm->timestamp), swarm->swarm_id,
                                 swarm->metric_kind, swarm->value) << std::endl;
    } else if (const auto* bucket = std::get_if<ArchiveBucket>(&record)) {
        std::cout << fmt::format("{} {} {} scope={} kind={} count={} avg={}",
                                 bucket->bucket_date, TableName(bucket->source_table),
                                 AggregationLevelName(bucket->level), bucket->scope_id, bucket->metric_kind,
                                 bucket->stats.count, FormatOptional(bucket->stats.mean())) << std::endl;
    }
}

metricstore::core::TimeRange Window(const CliOptions& options) {
    if (options.hours <= 0) {
        return metricstore::core::TimeRange::All();
    }
    return metricstore::core::TimeRange::Since(metricstore::core::NowMillis() -
                                               options.hours * metricstore::core::kMillisPerHour);
}

int RunSummary(metricstore::MetricStore& store, const CliOptions& options) {
    auto summary = store.queries().summary(Window(options));
    if (!summary.ok()) {
        std::cerr << "Summary failed: " << summary.error() << std::endl;
        return 1;
    }
    const auto& s = summary.value();
    std::cout << "Tasks:            " << s.total_tasks << " (" << s.successful_tasks << " successful)" << std::endl;
    std::cout << "Success rate:     " << FormatOptional(s.success_rate) << std::endl;
    std::cout << "Avg duration ms:  " << FormatOptional(s.avg_duration_ms) << std::endl;
    std::cout << "Tokens used:      " << fmt::format("{:.0f}", s.total_tokens) << std::endl;
    std::cout << "Agents:           " << s.distinct_agents << std::endl;
    std::cout << "Agent metrics:    " << s.agent_metric_rows << std::endl;
    std::cout << "Swarms:           " << s.distinct_swarms << std::endl;
    std::cout << "Swarm metrics:    " << s.swarm_metric_rows << std::endl;
    std::cout << "Archive buckets:  " << s.archive_buckets << std::endl;
    return 0;
}

int RunExport(metricstore::MetricStore& store, const CliOptions& options) {
    auto format = metricstore::core::ParseExportFormat(options.format);
    if (!format.ok()) {
        std::cerr << format.error() << std::endl;
        return 1;
    }
    auto config = metricstore::exporter::ExportConfig::FromDefaults(store.config().export_defaults);
    config.format = format.value();
    config.time_window_hours = options.hours;
    config.pretty = options.pretty;
    config.compress = options.gzip;
    config.include_metadata = options.include_metadata;
    config.metric_prefix = options.prefix;
    config.output_path = options.output;

    auto exported = options.output.empty() ? store.export_metrics(config, std::cout)
                                           : store.export_metrics(config);
    if (!exported.ok()) {
        std::cerr << "Export failed: " << exported.error() << std::endl;
        return 1;
    }
    if (!options.output.empty()) {
        std::cout << "Wrote " << exported.value().records_written << " records ("
                  << exported.value().bytes_written << " bytes) to " << exported.value().path << std::endl;
    }
    return 0;
}

int RunCompact(metricstore::MetricStore& store) {
    auto run = store.compact();
    if (!run.ok()) {
        std::cerr << "Compaction failed: " << run.error() << std::endl;
        return 1;
    }
    const auto& stats = run.value();
    std::cout << "Compacted rows:         " << stats.compaction.detailed_rows_compacted << std::endl;
    std::cout << "Hourly buckets written: " << stats.compaction.hourly_buckets_written << std::endl;
    std::cout << "Daily buckets written:  " << stats.compaction.daily_buckets_written << std::endl;
    std::cout << "Hourly rolled up:       " << stats.compaction.hourly_buckets_rolled_up << std::endl;
    std::cout << "Purged rows:            " << stats.purge.detailed_rows_purged << std::endl;
    std::cout << "Purged buckets:         " << stats.purge.archive_buckets_purged << std::endl;
    return 0;
}

int RunVacuum(metricstore::MetricStore& store) {
    auto vacuumed = store.vacuum();
    if (!vacuumed.ok()) {
        std::cerr << "Vacuum failed: " << vacuumed.error() << std::endl;
        return 1;
    }
    std::cout << store.stats() << std::endl;
    return 0;
}

int RunQuery(metricstore::MetricStore& store, const CliOptions& options) {
    auto table = metricstore::core::ParseTable(options.table);
    if (!table.ok()) {
        std::cerr << table.error() << std::endl;
        return 1;
    }
    metricstore::core::QueryFilter filter;
    if (!options.agent_id.empty()) filter.agent_id = options.agent_id;
    if (!options.swarm_id.empty()) filter.swarm_id = options.swarm_id;
    if (!options.task_id.empty()) filter.task_id = options.task_id;
    if (!options.metric_kind.empty()) filter.metric_kind = options.metric_kind;

    auto rows = store.query(table.value(), filter, Window(options), options.limit);
    if (!rows.ok()) {
        std::cerr << "Query failed: " << rows.error() << std::endl;
        return 1;
    }
    for (const auto& record : rows.value()) {
        PrintRecord(record);
    }
    std::cerr << rows.value().size() << " rows" << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    metricstore::common::Logger::Init();
    metricstore::common::Logger::SetLevel(spdlog::level::warn);

    CliOptions options;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--db" && i + 1 < argc) {
            options.db_path = argv[++i];
        } else if (arg == "--hours" && i + 1 < argc) {
            options.hours = std::atoi(argv[++i]);
        } else if (arg == "--format" && i + 1 < argc) {
            options.format = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            options.output = argv[++i];
        } else if (arg == "--compact-json") {
            options.pretty = false;
        } else if (arg == "--gzip") {
            options.gzip = true;
        } else if (arg == "--no-metadata") {
            options.include_metadata = false;
        } else if (arg == "--prefix" && i + 1 < argc) {
            options.prefix = argv[++i];
        } else if (arg == "--table" && i + 1 < argc) {
            options.table = argv[++i];
        } else if (arg == "--agent" && i + 1 < argc) {
            options.agent_id = argv[++i];
        } else if (arg == "--swarm" && i + 1 < argc) {
            options.swarm_id = argv[++i];
        } else if (arg == "--task" && i + 1 < argc) {
            options.task_id = argv[++i];
        } else if (arg == "--kind" && i + 1 < argc) {
            options.metric_kind = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            options.limit = static_cast<size_t>(std::strtoull(argv[++i], nullptr, 10));
        } else if (arg == "--log-level" && i + 1 < argc) {
            auto level = metricstore::common::Logger::ParseLevel(argv[++i]);
            if (!level.ok()) {
                std::cerr << level.error() << std::endl;
                return 1;
            }
            metricstore::common::Logger::SetLevel(level.value());
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (options.command.empty() && arg.rfind("--", 0) != 0) {
            options.command = arg;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            std::cerr << "Use --help for usage information" << std::endl;
            return 1;
        }
    }

    if (options.command.empty()) {
        PrintUsage(argv[0]);
        return 1;
    }
    if (!std::filesystem::exists(options.db_path)) {
        std::cerr << "No database at " << options.db_path << std::endl;
        return 1;
    }

    auto config = metricstore::core::MetricStoreConfig::ForPath(options.db_path);
    config.retention.auto_cleanup = false;

    auto opened = metricstore::MetricStore::Open(config);
    if (!opened.ok()) {
        std::cerr << "Failed to open " << options.db_path << ": " << opened.error() << std::endl;
        return 1;
    }
    auto store = opened.take_value();

    int status = 1;
    if (options.command == "summary") {
        status = RunSummary(*store, options);
    } else if (options.command == "export") {
        status = RunExport(*store, options);
    } else if (options.command == "compact") {
        status = RunCompact(*store);
    } else if (options.command == "vacuum") {
        status = RunVacuum(*store);
    } else if (options.command == "query") {
        status = RunQuery(*store, options);
    } else {
        std::cerr << "Unknown command: " << options.command << std::endl;
    }

    auto closed = store->close();
    if (!closed.ok()) {
        std::cerr << "Close failed: " << closed.error() << std::endl;
        return 1;
    }
    return status;
}
