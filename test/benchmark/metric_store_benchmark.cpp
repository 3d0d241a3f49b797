#include <benchmark/benchmark.h>
#include "metricstore/metric_store.h"
#include "test_util/temp_dir.h"

#include <memory>
#include <random>
#include <string>
#include <vector>

namespace metricstore {
namespace bench {
namespace {

core::MetricStoreConfig BenchConfig(const testutil::ScopedTestDir& dir, size_t buffer_size) {
    auto config = core::MetricStoreConfig::ForPath(dir.file("bench.db"));
    config.write_buffer.max_size = buffer_size;
    config.retention.auto_cleanup = false;
    return config;
}

// Buffered task recording, range(0) is the buffer size
static void BM_RecordTaskBuffered(::benchmark::State& state) {
    testutil::ScopedTestDir dir("metricstore_bench_write");
    auto opened = MetricStore::Open(BenchConfig(dir, static_cast<size_t>(state.range(0))));
    if (!opened.ok()) {
        state.SkipWithError(opened.error().c_str());
        return;
    }
    auto store = opened.take_value();

    int64_t i = 0;
    for (auto _ : state) {
        auto recorded = store->record_task("task-" + std::to_string(i), "agent-" + std::to_string(i % 16),
                                           100 + i % 900, core::TaskOutcome::SUCCESS, 250, 2);
        benchmark::DoNotOptimize(recorded);
        ++i;
    }
    auto flushed = store->flush();
    benchmark::DoNotOptimize(flushed);
    state.SetItemsProcessed(state.iterations());
}

// Direct batch writes bypassing the buffer, range(0) is the batch size
static void BM_WriteBatch(::benchmark::State& state) {
    testutil::ScopedTestDir dir("metricstore_bench_batch");
    auto storage = std::make_shared<storage::SqliteStorage>();
    auto config = core::StorageConfig::Default();
    config.db_path = dir.file("batch.db");
    if (!storage->init(config).ok()) {
        state.SkipWithError("storage init failed");
        return;
    }

    std::vector<core::MetricRecord> batch;
    core::Timestamp now = core::NowMillis();
    for (int64_t i = 0; i < state.range(0); ++i) {
        core::AgentMetric metric;
        metric.agent_id = "agent-" + std::to_string(i % 16);
        metric.metric_kind = "load";
        metric.timestamp = now - i;
        metric.value = static_cast<double>(i);
        batch.push_back(metric);
    }

    for (auto _ : state) {
        auto written = storage->write_batch(batch);
        benchmark::DoNotOptimize(written);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
    storage->close();
}

// Exact percentile over range(0) detailed task rows
static void BM_PercentileExact(::benchmark::State& state) {
    testutil::ScopedTestDir dir("metricstore_bench_pct");
    auto opened = MetricStore::Open(BenchConfig(dir, 1000));
    if (!opened.ok()) {
        state.SkipWithError(opened.error().c_str());
        return;
    }
    auto store = opened.take_value();

    std::mt19937 gen(7);
    std::uniform_int_distribution<int64_t> duration(100, 2000);
    for (int64_t i = 0; i < state.range(0); ++i) {
        auto recorded = store->record_task("task-" + std::to_string(i), "agent-42", duration(gen),
                                           core::TaskOutcome::SUCCESS, 10, 1);
        if (!recorded.ok()) {
            state.SkipWithError(recorded.error().c_str());
            return;
        }
    }
    if (!store->flush().ok()) {
        state.SkipWithError("flush failed");
        return;
    }

    query::PercentileQuery query;
    query.p = 0.95;
    query.filter.agent_id = "agent-42";
    for (auto _ : state) {
        auto p95 = store->percentile(query);
        benchmark::DoNotOptimize(p95);
    }
}

BENCHMARK(BM_RecordTaskBuffered)->Arg(1)->Arg(100)->Arg(1000);
BENCHMARK(BM_WriteBatch)->Arg(10)->Arg(100)->Arg(1000);
BENCHMARK(BM_PercentileExact)->Arg(1000)->Arg(10000);

} // namespace
} // namespace bench
} // namespace metricstore

BENCHMARK_MAIN();
