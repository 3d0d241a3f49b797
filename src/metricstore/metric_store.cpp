#include "metricstore/metric_store.h"
#include "metricstore/common/logger.h"

#include <sstream>
#include <variant>

namespace metricstore {

MetricStore::MetricStore(const core::MetricStoreConfig& config, Clock clock)
    : config_(config), clock_(std::move(clock)) {}

MetricStore::~MetricStore() {
    auto closed = close();
    if (!closed.ok()) {
        METRICSTORE_ERROR("Metric store shutdown failed: {}", closed.error());
    }
}

core::Result<std::unique_ptr<MetricStore>> MetricStore::Open(const core::MetricStoreConfig& config, Clock clock) {
    using OpenResult = core::Result<std::unique_ptr<MetricStore>>;
    auto valid = config.validate();
    if (!valid.ok()) {
        return core::PropagateError<std::unique_ptr<MetricStore>>(valid);
    }
    if (!clock) {
        clock = core::NowMillis;
    }

    std::unique_ptr<MetricStore> store(new MetricStore(config, std::move(clock)));
    auto started = store->start();
    if (!started.ok()) {
        METRICSTORE_ERROR("Opening metric store at {} failed: {}", config.storage.db_path, started.error());
        return core::PropagateError<std::unique_ptr<MetricStore>>(started);
    }
    return OpenResult(std::move(store));
}

core::Result<void> MetricStore::start() {
    storage_ = std::make_shared<storage::SqliteStorage>(config_.compression);
    auto opened = storage_->init(config_.storage);
    if (!opened.ok()) {
        closed_.store(true);
        return opened;
    }

    processor_ = std::make_shared<storage::BackgroundProcessor>();
    auto running = processor_->initialize();
    if (!running.ok()) {
        return running;
    }

    buffer_ = std::make_unique<storage::WriteBuffer>(config_.write_buffer);
    auto buffered = buffer_->initialize(storage_, processor_);
    if (!buffered.ok()) {
        return buffered;
    }

    retention_ = std::make_unique<retention::RetentionManager>(storage_, config_.retention, clock_);
    auto scheduled = retention_->start(processor_);
    if (!scheduled.ok()) {
        return scheduled;
    }

    engine_ = std::make_shared<query::QueryEngine>(storage_, config_.query, config_.retention, clock_);
    exporter_ = std::make_unique<exporter::Exporter>(storage_, engine_, clock_);

    METRICSTORE_INFO("Metric store open at {} (retention {}d/{}d/{}d)", config_.storage.db_path,
                     config_.retention.detailed_days, config_.retention.hourly_days,
                     config_.retention.daily_days);
    return core::Result<void>();
}

core::Result<void> MetricStore::record(core::MetricRecord record) {
    if (closed_.load()) {
        return core::Result<void>::error("Metric store is closed", core::Error::Code::STORAGE_UNAVAILABLE);
    }
    std::visit([this](auto& row) {
        if (row.timestamp == 0) {
            row.timestamp = clock_();
        }
    }, record);

    auto valid = core::ValidateRecord(record);
    if (!valid.ok()) {
        METRICSTORE_DEBUG("Rejected metric record: {}", valid.error());
        return valid;
    }

    try {
        auto enqueued = buffer_->enqueue(std::move(record));
        if (!enqueued.ok()) {
            return core::Result<void>::error("Recording metric failed: " + enqueued.error(), enqueued.code());
        }
    } catch (const std::exception& e) {
        METRICSTORE_ERROR("Recording metric failed: {}", e.what());
        return core::Result<void>::error(std::string("Recording metric failed: ") + e.what(),
                                         core::Error::Code::INTERNAL);
    }
    return core::Result<void>();
}

core::Result<void> MetricStore::record_task(const std::string& task_id,
                                            const std::string& agent_id,
                                            int64_t duration_ms,
                                            core::TaskOutcome outcome,
                                            int64_t tokens_used,
                                            int64_t files_changed,
                                            std::optional<core::Timestamp> timestamp,
                                            const core::Metadata& metadata) {
    core::TaskMetric task;
    task.task_id = task_id;
    task.agent_id = agent_id;
    task.timestamp = timestamp ? *timestamp : clock_();
    task.duration_ms = duration_ms;
    task.outcome = outcome;
    task.tokens_used = tokens_used;
    task.files_changed = files_changed;
    task.metadata = metadata;
    return record(std::move(task));
}

core::Result<void> MetricStore::record_agent_metric(const std::string& agent_id,
                                                    const std::string& metric_kind,
                                                    double value,
                                                    const core::Metadata& metadata,
                                                    std::optional<core::Timestamp> timestamp) {
    core::AgentMetric metric;
    metric.agent_id = agent_id;
    metric.timestamp = timestamp ? *timestamp : clock_();
    metric.metric_kind = metric_kind;
    metric.value = value;
    metric.metadata = metadata;
    return record(std::move(metric));
}

core::Result<void> MetricStore::record_swarm_metric(const std::string& swarm_id,
                                                    const std::string& metric_kind,
                                                    double value,
                                                    const core::Metadata& metadata,
                                                    std::optional<core::Timestamp> timestamp) {
    core::SwarmMetric metric;
    metric.swarm_id = swarm_id;
    metric.timestamp = timestamp ? *timestamp : clock_();
    metric.metric_kind = metric_kind;
    metric.value = value;
    metric.metadata = metadata;
    return record(std::move(metric));
}

core::Result<core::Records> MetricStore::query(core::Table table,
                                               const core::QueryFilter& filter,
                                               const core::TimeRange& range,
                                               size_t limit,
                                               const core::QueryContext& ctx) {
    query::RecordQuery request;
    request.table = table;
    request.filter = filter;
    request.range = range;
    request.limit = limit;
    return engine_->get_records(request, ctx);
}

core::Result<core::AggregateResult> MetricStore::aggregate(core::Table table,
                                                           core::AggregationOp op,
                                                           const core::QueryFilter& filter,
                                                           const core::TimeRange& range,
                                                           const core::QueryContext& ctx) {
    query::AggregateQuery request;
    request.table = table;
    request.op = op;
    request.filter = filter;
    request.range = range;
    return engine_->aggregate(request, ctx);
}

core::Result<core::PercentileResult> MetricStore::percentile(const query::PercentileQuery& query,
                                                             const core::QueryContext& ctx) {
    return engine_->percentile(query, ctx);
}

core::Result<std::vector<core::RankedScope>> MetricStore::top_n(const query::TopNQuery& query,
                                                                const core::QueryContext& ctx) {
    return engine_->top_n(query, ctx);
}

core::Result<exporter::ExportSummary> MetricStore::export_metrics(const exporter::ExportConfig& config,
                                                                  const core::QueryContext& ctx) {
    return exporter_->export_to_file(config, ctx);
}

core::Result<exporter::ExportSummary> MetricStore::export_metrics(const exporter::ExportConfig& config,
                                                                  std::ostream& out,
                                                                  const core::QueryContext& ctx) {
    return exporter_->export_to_stream(config, out, ctx);
}

core::Result<size_t> MetricStore::flush() {
    if (closed_.load()) {
        return core::Result<size_t>::error("Metric store is closed", core::Error::Code::STORAGE_UNAVAILABLE);
    }
    return buffer_->flush();
}

core::Result<retention::RetentionRunStats> MetricStore::compact(const core::QueryContext& ctx) {
    return retention_->run_once(ctx);
}

core::Result<void> MetricStore::vacuum() {
    return storage_->vacuum();
}

core::Result<void> MetricStore::close() {
    if (closed_.exchange(true)) {
        return core::Result<void>();
    }

    core::Result<void> outcome;
    if (buffer_) {
        auto drained = buffer_->shutdown();
        if (!drained.ok()) {
            outcome = drained;
        }
    }
    if (retention_) {
        retention_->stop();
    }
    if (processor_) {
        auto stopped = processor_->shutdown();
        if (!stopped.ok() && outcome.ok()) {
            outcome = stopped;
        }
    }
    if (storage_) {
        auto closed = storage_->close();
        if (!closed.ok() && outcome.ok()) {
            outcome = closed;
        }
    }
    METRICSTORE_INFO("Metric store at {} closed", config_.storage.db_path);
    return outcome;
}

std::string MetricStore::stats() const {
    std::ostringstream out;
    out << storage_->stats();
    if (buffer_) {
        auto buffered = buffer_->stats();
        out << "\nWrite buffer: enqueued=" << buffered.records_enqueued
            << " flushed=" << buffered.records_flushed
            << " dropped=" << buffered.records_dropped
            << " rejected=" << buffered.records_rejected
            << " pending=" << buffered.pending;
    }
    auto last = retention_ ? retention_->last_run() : std::nullopt;
    if (last) {
        out << "\nLast retention run: " << core::FormatIso8601(last->ran_at);
    }
    return out.str();
}

} // namespace metricstore
