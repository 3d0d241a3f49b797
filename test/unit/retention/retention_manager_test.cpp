#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <memory>
#include <thread>
#include <vector>

#include "metricstore/retention/retention_manager.h"
#include "test_util/temp_dir.h"
#include "test_util/test_clock.h"

using namespace metricstore;
using namespace metricstore::retention;
using metricstore::testutil::kTestNow;
using metricstore::testutil::MakeAgentMetric;
using metricstore::testutil::MakeSwarmMetric;
using metricstore::testutil::MakeTask;

namespace {

core::Timestamp DaysAgo(double days) {
    return kTestNow - static_cast<core::Timestamp>(days * core::kMillisPerDay);
}

} // namespace

class RetentionManagerTest : public ::testing::Test {
protected:
    RetentionManagerTest() : dir_("metricstore_retention") {}

    void SetUp() override {
        auto config = core::StorageConfig::Default();
        config.db_path = dir_.file("metrics.db");
        storage_ = std::make_shared<storage::SqliteStorage>();
        ASSERT_TRUE(storage_->init(config).ok());

        policy_ = core::RetentionPolicy::Default();
        manager_ = std::make_unique<RetentionManager>(storage_, policy_, clock_.fn());
    }

    void TearDown() override {
        manager_.reset();
        storage_->close();
    }

    uint64_t Count(core::Table table) {
        auto snap = storage_->snapshot();
        EXPECT_TRUE(snap.ok());
        auto count = snap.value().count(table, core::QueryFilter(), core::TimeRange::All());
        EXPECT_TRUE(count.ok());
        return count.value();
    }

    std::vector<core::ArchiveBucket> Buckets(core::Table source,
                                             std::optional<core::AggregationLevel> level = std::nullopt) {
        auto snap = storage_->snapshot();
        EXPECT_TRUE(snap.ok());
        storage::ArchiveSelector selector;
        selector.source_table = source;
        selector.level = level;
        auto buckets = snap.value().archive_buckets(selector);
        EXPECT_TRUE(buckets.ok());
        return buckets.take_value();
    }

    // Rows in the detailed tier plus counts folded into archive buckets
    uint64_t Conserved(core::Table source, const std::string& metric_kind) {
        uint64_t total = 0;
        auto snap = storage_->snapshot();
        EXPECT_TRUE(snap.ok());
        auto detailed = snap.value().count(source, core::QueryFilter(), core::TimeRange::All());
        EXPECT_TRUE(detailed.ok());
        total += detailed.value();
        storage::ArchiveSelector selector;
        selector.source_table = source;
        selector.metric_kind = metric_kind;
        auto buckets = snap.value().archive_buckets(selector);
        EXPECT_TRUE(buckets.ok());
        for (const auto& bucket : buckets.value()) {
            total += bucket.stats.count;
        }
        return total;
    }

    testutil::ScopedTestDir dir_;
    testutil::ManualClock clock_;
    core::RetentionPolicy policy_;
    std::shared_ptr<storage::SqliteStorage> storage_;
    std::unique_ptr<RetentionManager> manager_;
};

TEST_F(RetentionManagerTest, CutoffsAreAlignedAndOrdered) {
    auto cutoffs = RetentionCutoffs::Compute(policy_, kTestNow);
    // 2025-06-08T12:00Z, 2025-05-16T00:00Z, 2025-03-17T00:00Z
    EXPECT_EQ(core::FormatIso8601(cutoffs.detailed), "2025-06-08T12:00:00.000Z");
    EXPECT_EQ(core::FormatIso8601(cutoffs.hourly), "2025-05-16T00:00:00.000Z");
    EXPECT_EQ(core::FormatIso8601(cutoffs.daily), "2025-03-17T00:00:00.000Z");
    EXPECT_EQ(core::FormatIso8601(cutoffs.horizon), "2025-03-17T12:30:00.000Z");
    EXPECT_LE(cutoffs.daily, cutoffs.horizon);
    EXPECT_LE(cutoffs.daily, cutoffs.hourly);
    EXPECT_LE(cutoffs.hourly, cutoffs.detailed);

    EXPECT_EQ(manager_->cutoffs().detailed, cutoffs.detailed);
}

TEST_F(RetentionManagerTest, RecentRowsAreUntouched) {
    ASSERT_TRUE(storage_->write_batch({MakeAgentMetric("a1", "load", DaysAgo(1), 1.0),
                                       MakeTask("t1", "a1", DaysAgo(6.5), 100)}).ok());
    auto run = manager_->run_once();
    ASSERT_TRUE(run.ok()) << run.error();
    EXPECT_EQ(run.value().compaction.detailed_rows_compacted, 0u);
    EXPECT_EQ(Count(core::Table::AGENT), 1u);
    EXPECT_EQ(Count(core::Table::TASK), 1u);
    EXPECT_EQ(Count(core::Table::ARCHIVE), 0u);
}

TEST_F(RetentionManagerTest, AgingRowsCompactIntoHourlyBuckets) {
    // Three samples in one hour ten days ago, one in the next hour
    core::Timestamp hour = core::FloorTo(DaysAgo(10), core::kMillisPerHour);
    ASSERT_TRUE(storage_->write_batch({MakeAgentMetric("a1", "load", hour + 1000, 1.0),
                                       MakeAgentMetric("a1", "load", hour + 2000, 2.0),
                                       MakeAgentMetric("a1", "load", hour + 3000, 6.0),
                                       MakeAgentMetric("a1", "load", hour + core::kMillisPerHour, 4.0)}).ok());

    auto run = manager_->run_once();
    ASSERT_TRUE(run.ok()) << run.error();
    EXPECT_EQ(run.value().compaction.detailed_rows_compacted, 4u);
    EXPECT_EQ(run.value().compaction.hourly_buckets_written, 2u);
    EXPECT_EQ(Count(core::Table::AGENT), 0u);

    auto buckets = Buckets(core::Table::AGENT, core::AggregationLevel::HOURLY);
    ASSERT_EQ(buckets.size(), 2u);
    EXPECT_EQ(buckets[0].bucket_start, hour);
    EXPECT_EQ(buckets[0].stats.count, 3u);
    EXPECT_DOUBLE_EQ(buckets[0].stats.sum, 9.0);
    EXPECT_DOUBLE_EQ(buckets[0].stats.min, 1.0);
    EXPECT_DOUBLE_EQ(buckets[0].stats.max, 6.0);
    EXPECT_DOUBLE_EQ(buckets[0].stats.sum_sq, 41.0);
    EXPECT_EQ(buckets[0].scope_id, "a1");
    EXPECT_EQ(buckets[0].metric_kind, "load");
}

TEST_F(RetentionManagerTest, TaskRowsCompactPerColumn) {
    core::Timestamp hour = core::FloorTo(DaysAgo(8), core::kMillisPerHour);
    ASSERT_TRUE(storage_->write_batch({
        MakeTask("t1", "a1", hour + 10, 100, core::TaskOutcome::SUCCESS, 10, 1),
        MakeTask("t2", "a1", hour + 20, 300, core::TaskOutcome::FAILURE, 30, 0),
        MakeTask("t3", "a2", hour + 30, 50)}).ok());

    ASSERT_TRUE(manager_->run_once().ok());
    EXPECT_EQ(Count(core::Table::TASK), 0u);

    auto buckets = Buckets(core::Table::TASK);
    EXPECT_EQ(buckets.size(), 8u);   // two agents, four columns
    for (const auto& bucket : buckets) {
        if (bucket.scope_id == "a1" && bucket.metric_kind == "success") {
            EXPECT_DOUBLE_EQ(bucket.stats.sum, 1.0);
            EXPECT_EQ(bucket.stats.count, 2u);
        }
        if (bucket.scope_id == "a1" && bucket.metric_kind == "duration_ms") {
            EXPECT_DOUBLE_EQ(bucket.stats.max, 300.0);
        }
    }
}

TEST_F(RetentionManagerTest, OlderRowsCompactIntoDailyBuckets) {
    core::Timestamp day = core::FloorTo(DaysAgo(40), core::kMillisPerDay);
    ASSERT_TRUE(storage_->write_batch({MakeSwarmMetric("s1", "health", day + core::kMillisPerHour, 0.5),
                                       MakeSwarmMetric("s1", "health", day + 20 * core::kMillisPerHour, 1.0)}).ok());

    auto run = manager_->run_once();
    ASSERT_TRUE(run.ok());
    EXPECT_EQ(run.value().compaction.daily_buckets_written, 1u);

    auto buckets = Buckets(core::Table::SWARM, core::AggregationLevel::DAILY);
    ASSERT_EQ(buckets.size(), 1u);
    EXPECT_EQ(buckets[0].bucket_start, day);
    EXPECT_EQ(buckets[0].bucket_date, core::FormatDate(day));
    EXPECT_EQ(buckets[0].stats.count, 2u);
}

TEST_F(RetentionManagerTest, ExpiredDataIsPurged) {
    ASSERT_TRUE(storage_->write_batch({MakeAgentMetric("a1", "load", DaysAgo(100), 1.0),
                                       MakeAgentMetric("a1", "load", DaysAgo(1), 1.0)}).ok());
    auto run = manager_->run_once();
    ASSERT_TRUE(run.ok());
    EXPECT_EQ(run.value().purge.detailed_rows_purged, 1u);
    EXPECT_EQ(Count(core::Table::AGENT), 1u);
    EXPECT_EQ(Count(core::Table::ARCHIVE), 0u);
}

TEST_F(RetentionManagerTest, SecondRunChangesNothing) {
    std::vector<core::MetricRecord> batch;
    for (double days : {0.5, 3.0, 9.0, 12.0, 35.0, 60.0}) {
        batch.push_back(MakeAgentMetric("a1", "load", DaysAgo(days), days));
    }
    ASSERT_TRUE(storage_->write_batch(batch).ok());

    ASSERT_TRUE(manager_->run_once().ok());
    auto archive_after_first = Buckets(core::Table::AGENT);
    uint64_t detailed_after_first = Count(core::Table::AGENT);

    auto second = manager_->run_once();
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.value().compaction.detailed_rows_compacted, 0u);
    EXPECT_EQ(second.value().compaction.hourly_buckets_written, 0u);
    EXPECT_EQ(second.value().compaction.daily_buckets_written, 0u);
    EXPECT_EQ(second.value().purge.archive_buckets_purged, 0u);

    auto archive_after_second = Buckets(core::Table::AGENT);
    ASSERT_EQ(archive_after_second.size(), archive_after_first.size());
    for (size_t i = 0; i < archive_after_first.size(); ++i) {
        EXPECT_EQ(archive_after_second[i].stats, archive_after_first[i].stats);
    }
    EXPECT_EQ(Count(core::Table::AGENT), detailed_after_first);
}

TEST_F(RetentionManagerTest, CountsAreConservedAcrossTiers) {
    std::vector<core::MetricRecord> batch;
    for (int i = 0; i < 80; ++i) {
        batch.push_back(MakeAgentMetric("a" + std::to_string(i % 3), "load", DaysAgo(i), i));
    }
    ASSERT_TRUE(storage_->write_batch(batch).ok());
    EXPECT_EQ(Conserved(core::Table::AGENT, "load"), 80u);

    ASSERT_TRUE(manager_->run_once().ok());
    EXPECT_EQ(Conserved(core::Table::AGENT, "load"), 80u);

    // Hourly buckets now age past their window and fold into days
    clock_.advance(25 * core::kMillisPerDay);
    auto run = manager_->run_once();
    ASSERT_TRUE(run.ok());
    EXPECT_GT(run.value().compaction.hourly_buckets_rolled_up, 0u);

    // Only rows older than the daily cutoff may be gone
    auto cutoffs = manager_->cutoffs();
    uint64_t expected = 0;
    for (int i = 0; i < 80; ++i) {
        if (DaysAgo(i) >= cutoffs.daily) {
            ++expected;
        }
    }
    EXPECT_EQ(Conserved(core::Table::AGENT, "load"), expected);
}

TEST_F(RetentionManagerTest, RollUpMergesHourlyIntoDaily) {
    core::Timestamp day = core::FloorTo(DaysAgo(10), core::kMillisPerDay);
    ASSERT_TRUE(storage_->write_batch({MakeAgentMetric("a1", "load", day + 1 * core::kMillisPerHour, 2.0),
                                       MakeAgentMetric("a1", "load", day + 5 * core::kMillisPerHour, 4.0),
                                       MakeAgentMetric("a1", "load", day + 9 * core::kMillisPerHour, 9.0)}).ok());
    ASSERT_TRUE(manager_->run_once().ok());
    ASSERT_EQ(Buckets(core::Table::AGENT, core::AggregationLevel::HOURLY).size(), 3u);

    clock_.advance(30 * core::kMillisPerDay);
    auto run = manager_->run_once();
    ASSERT_TRUE(run.ok());
    EXPECT_EQ(run.value().compaction.hourly_buckets_rolled_up, 3u);

    EXPECT_TRUE(Buckets(core::Table::AGENT, core::AggregationLevel::HOURLY).empty());
    auto daily = Buckets(core::Table::AGENT, core::AggregationLevel::DAILY);
    ASSERT_EQ(daily.size(), 1u);
    EXPECT_EQ(daily[0].bucket_start, day);
    EXPECT_EQ(daily[0].stats.count, 3u);
    EXPECT_DOUBLE_EQ(daily[0].stats.min, 2.0);
    EXPECT_DOUBLE_EQ(daily[0].stats.max, 9.0);
    EXPECT_DOUBLE_EQ(daily[0].stats.sum, 15.0);
}

TEST_F(RetentionManagerTest, HugeValuesSurviveEveryTier) {
    core::Timestamp hour = core::FloorTo(DaysAgo(10), core::kMillisPerHour);
    ASSERT_TRUE(storage_->write(MakeAgentMetric("a1", "load", hour + core::kMillisPerMinute, 1e200)).ok());
    auto first = manager_->run_once();
    ASSERT_TRUE(first.ok()) << first.error();

    // Merging into the existing bucket decodes its overflowed sum of squares
    ASSERT_TRUE(storage_->write(MakeAgentMetric("a1", "load", hour + 2 * core::kMillisPerMinute, 1e200)).ok());
    auto second = manager_->run_once();
    ASSERT_TRUE(second.ok()) << second.error();
    auto hourly = Buckets(core::Table::AGENT, core::AggregationLevel::HOURLY);
    ASSERT_EQ(hourly.size(), 1u);
    EXPECT_EQ(hourly[0].stats.count, 2u);
    EXPECT_DOUBLE_EQ(hourly[0].stats.sum, 2e200);
    EXPECT_TRUE(std::isinf(hourly[0].stats.sum_sq));

    clock_.advance(30 * core::kMillisPerDay);
    auto rolled = manager_->run_once();
    ASSERT_TRUE(rolled.ok()) << rolled.error();
    auto daily = Buckets(core::Table::AGENT, core::AggregationLevel::DAILY);
    ASSERT_EQ(daily.size(), 1u);
    EXPECT_EQ(daily[0].stats.count, 2u);

    clock_.advance(60 * core::kMillisPerDay);
    auto purged = manager_->run_once();
    ASSERT_TRUE(purged.ok()) << purged.error();
    EXPECT_TRUE(Buckets(core::Table::AGENT).empty());
}

TEST_F(RetentionManagerTest, CompactAndPurgeSeparately) {
    ASSERT_TRUE(storage_->write_batch({MakeAgentMetric("a1", "load", DaysAgo(10), 1.0),
                                       MakeAgentMetric("a1", "load", DaysAgo(120), 1.0)}).ok());
    auto compacted = manager_->compact();
    ASSERT_TRUE(compacted.ok());
    EXPECT_EQ(compacted.value().detailed_rows_compacted, 1u);
    EXPECT_EQ(Count(core::Table::AGENT), 1u);

    auto purged = manager_->purge();
    ASSERT_TRUE(purged.ok());
    EXPECT_EQ(purged.value().detailed_rows_purged, 1u);
    EXPECT_EQ(Count(core::Table::AGENT), 0u);
}

TEST_F(RetentionManagerTest, CancelledRunLeavesDataAlone) {
    ASSERT_TRUE(storage_->write(MakeAgentMetric("a1", "load", DaysAgo(10), 1.0)).ok());
    core::CancellationToken token;
    core::QueryContext ctx;
    ctx.with_cancellation(token);
    token.cancel();

    auto run = manager_->run_once(ctx);
    EXPECT_EQ(run.code(), core::Error::Code::CANCELLED);
    EXPECT_EQ(Count(core::Table::AGENT), 1u);
    EXPECT_FALSE(manager_->last_run().has_value());
}

TEST_F(RetentionManagerTest, ClosedStorageIsRetentionFailure) {
    ASSERT_TRUE(storage_->close().ok());
    auto run = manager_->run_once();
    EXPECT_EQ(run.code(), core::Error::Code::RETENTION_FAILURE);
}

TEST_F(RetentionManagerTest, ScheduledRunsOnProcessor) {
    auto policy = policy_;
    policy.cleanup_interval = std::chrono::milliseconds(10);
    RetentionManager scheduled(storage_, policy, clock_.fn());

    storage::BackgroundProcessorConfig config;
    config.worker_wait_timeout = std::chrono::milliseconds(5);
    auto processor = std::make_shared<storage::BackgroundProcessor>(config);
    ASSERT_TRUE(processor->initialize().ok());
    ASSERT_TRUE(storage_->write(MakeAgentMetric("a1", "load", DaysAgo(10), 1.0)).ok());

    ASSERT_TRUE(scheduled.start(processor).ok());
    EXPECT_FALSE(scheduled.start(processor).ok());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!scheduled.last_run() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_TRUE(scheduled.last_run().has_value());
    EXPECT_EQ(scheduled.last_run()->ran_at, kTestNow);

    scheduled.stop();
    ASSERT_TRUE(processor->shutdown().ok());
    EXPECT_EQ(Count(core::Table::AGENT), 0u);
}

TEST_F(RetentionManagerTest, DisabledAutoCleanupSchedulesNothing) {
    auto policy = policy_;
    policy.auto_cleanup = false;
    RetentionManager manual(storage_, policy, clock_.fn());
    auto processor = std::make_shared<storage::BackgroundProcessor>();
    ASSERT_TRUE(processor->initialize().ok());
    ASSERT_TRUE(manual.start(processor).ok());
    ASSERT_TRUE(processor->waitForCompletion().ok());
    EXPECT_EQ(processor->getStats().tasks_submitted, 0u);
    ASSERT_TRUE(processor->shutdown().ok());
}
