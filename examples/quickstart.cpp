#include "metricstore/metric_store.h"
#include <iostream>
#include <string>

using namespace metricstore;

int main() {
    std::cout << "=== metricstore Quick Start Example ===" << std::endl;

    auto config = core::MetricStoreConfig::ForPath("./metricstore_data/metrics.db");
    std::cout << "Opening store at " << config.storage.db_path << std::endl;

    auto opened = MetricStore::Open(config);
    if (!opened.ok()) {
        std::cerr << "Open failed: " << opened.error() << std::endl;
        return 1;
    }
    auto store = opened.take_value();

    // Record a few tasks and a swarm health sample
    for (int i = 0; i < 5; ++i) {
        auto recorded = store->record_task("task-" + std::to_string(i), "agent-1", 200 + 50 * i,
                                           i == 3 ? core::TaskOutcome::FAILURE : core::TaskOutcome::SUCCESS,
                                           1000, 2);
        if (!recorded.ok()) {
            std::cerr << "Record failed: " << recorded.error() << std::endl;
            return 1;
        }
    }
    auto recorded = store->record_swarm_metric("swarm-1", "health", 0.92);
    if (!recorded.ok()) {
        std::cerr << "Record failed: " << recorded.error() << std::endl;
        return 1;
    }

    auto flushed = store->flush();
    if (!flushed.ok()) {
        std::cerr << "Flush failed: " << flushed.error() << std::endl;
        return 1;
    }
    std::cout << "Flushed " << flushed.value() << " records" << std::endl;

    core::QueryFilter filter;
    filter.agent_id = "agent-1";
    auto avg = store->aggregate(core::Table::TASK, core::AggregationOp::AVG, filter, core::TimeRange::All());
    if (avg.ok() && avg.value().value) {
        std::cout << "Average duration: " << *avg.value().value << " ms over "
                  << avg.value().count << " tasks" << std::endl;
    } else if (!avg.ok()) {
        std::cerr << "Aggregate failed: " << avg.error() << std::endl;
    }

    exporter::ExportConfig export_config;
    export_config.format = core::ExportFormat::PROMETHEUS;
    std::cout << "Prometheus export:" << std::endl;
    auto exported = store->export_metrics(export_config, std::cout);
    if (!exported.ok()) {
        std::cerr << "Export failed: " << exported.error() << std::endl;
    }

    auto closed = store->close();
    if (!closed.ok()) {
        std::cerr << "Close failed: " << closed.error() << std::endl;
        return 1;
    }
    std::cout << "Quick start complete" << std::endl;
    return 0;
}
