#ifndef METRICSTORE_METRIC_STORE_H_
#define METRICSTORE_METRIC_STORE_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "metricstore/core/aggregation.h"
#include "metricstore/core/config.h"
#include "metricstore/core/query_context.h"
#include "metricstore/core/result.h"
#include "metricstore/core/types.h"
#include "metricstore/export/exporter.h"
#include "metricstore/query/query_engine.h"
#include "metricstore/retention/retention_manager.h"
#include "metricstore/storage/background_processor.h"
#include "metricstore/storage/sqlite_storage.h"
#include "metricstore/storage/write_buffer.h"

namespace metricstore {

/**
 * @brief Embedded metrics store: producer and consumer entry points over one database file
 *
 * Producers record through the write buffer; readers only ever see flushed
 * rows. Destroying the store flushes whatever is still buffered.
 */
class MetricStore {
public:
    using Clock = std::function<core::Timestamp()>;

    /**
     * @brief Open (or create) the database and start the flush and retention schedules
     */
    static core::Result<std::unique_ptr<MetricStore>> Open(const core::MetricStoreConfig& config,
                                                           Clock clock = core::NowMillis);

    ~MetricStore();

    MetricStore(const MetricStore&) = delete;
    MetricStore& operator=(const MetricStore&) = delete;

    // Producer interface. Failures are returned, never thrown; timestamp defaults to now.
    core::Result<void> record_task(const std::string& task_id,
                                   const std::string& agent_id,
                                   int64_t duration_ms,
                                   core::TaskOutcome outcome,
                                   int64_t tokens_used,
                                   int64_t files_changed,
                                   std::optional<core::Timestamp> timestamp = std::nullopt,
                                   const core::Metadata& metadata = core::Metadata());

    core::Result<void> record_agent_metric(const std::string& agent_id,
                                           const std::string& metric_kind,
                                           double value,
                                           const core::Metadata& metadata = core::Metadata(),
                                           std::optional<core::Timestamp> timestamp = std::nullopt);

    core::Result<void> record_swarm_metric(const std::string& swarm_id,
                                           const std::string& metric_kind,
                                           double value,
                                           const core::Metadata& metadata = core::Metadata(),
                                           std::optional<core::Timestamp> timestamp = std::nullopt);

    /**
     * @brief Record a prepared record; a zero timestamp is stamped with the current time
     */
    core::Result<void> record(core::MetricRecord record);

    // Consumer interface
    core::Result<core::Records> query(core::Table table,
                                      const core::QueryFilter& filter,
                                      const core::TimeRange& range,
                                      size_t limit = 0,
                                      const core::QueryContext& ctx = core::QueryContext());

    core::Result<core::AggregateResult> aggregate(core::Table table,
                                                  core::AggregationOp op,
                                                  const core::QueryFilter& filter,
                                                  const core::TimeRange& range,
                                                  const core::QueryContext& ctx = core::QueryContext());

    core::Result<core::PercentileResult> percentile(const query::PercentileQuery& query,
                                                    const core::QueryContext& ctx = core::QueryContext());

    core::Result<std::vector<core::RankedScope>> top_n(const query::TopNQuery& query,
                                                       const core::QueryContext& ctx = core::QueryContext());

    core::Result<exporter::ExportSummary> export_metrics(const exporter::ExportConfig& config,
                                                         const core::QueryContext& ctx = core::QueryContext());

    core::Result<exporter::ExportSummary> export_metrics(const exporter::ExportConfig& config,
                                                         std::ostream& out,
                                                         const core::QueryContext& ctx = core::QueryContext());

    // Maintenance
    core::Result<size_t> flush();
    core::Result<retention::RetentionRunStats> compact(const core::QueryContext& ctx = core::QueryContext());
    core::Result<void> vacuum();

    /**
     * @brief Final flush, stop background work and close the database
     */
    core::Result<void> close();

    std::string stats() const;

    const core::MetricStoreConfig& config() const { return config_; }
    query::QueryEngine& queries() { return *engine_; }
    exporter::Exporter& exports() { return *exporter_; }
    retention::RetentionManager& retention() { return *retention_; }
    storage::WriteBuffer& write_buffer() { return *buffer_; }
    storage::SqliteStorage& storage() { return *storage_; }

private:
    MetricStore(const core::MetricStoreConfig& config, Clock clock);

    core::Result<void> start();

    core::MetricStoreConfig config_;
    Clock clock_;

    std::shared_ptr<storage::SqliteStorage> storage_;
    std::shared_ptr<storage::BackgroundProcessor> processor_;
    std::unique_ptr<storage::WriteBuffer> buffer_;
    std::unique_ptr<retention::RetentionManager> retention_;
    std::shared_ptr<query::QueryEngine> engine_;
    std::unique_ptr<exporter::Exporter> exporter_;

    std::atomic<bool> closed_{false};
};

} // namespace metricstore

#endif // METRICSTORE_METRIC_STORE_H_
