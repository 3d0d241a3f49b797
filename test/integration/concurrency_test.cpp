#include <gtest/gtest.h>
#include "metricstore/metric_store.h"
#include "test_util/temp_dir.h"
#include "test_util/test_clock.h"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace metricstore {
namespace integration {
namespace {

/**
 * @brief Producers, readers and retention runs sharing one store
 *
 * Readers must never see a row twice while compaction moves it from the
 * detailed table into the archive, and nothing recorded may be lost.
 */
class ConcurrencyTest : public ::testing::Test {
protected:
    ConcurrencyTest() : dir_("metricstore_concurrency") {}

    void SetUp() override {
        auto config = core::MetricStoreConfig::ForPath(dir_.file("concurrent.db"));
        config.write_buffer.max_size = 50;
        config.write_buffer.flush_interval = std::chrono::milliseconds(20);
        config.storage.pool_size = 4;
        auto opened = MetricStore::Open(config, clock_.fn());
        ASSERT_TRUE(opened.ok()) << opened.error();
        store_ = opened.take_value();
    }

    testutil::ScopedTestDir dir_;
    testutil::ManualClock clock_;
    std::unique_ptr<MetricStore> store_;
};

constexpr int kWriters = 4;
constexpr int kRecordsPerWriter = 500;

TEST_F(ConcurrencyTest, CompactionDuringWritesNeverDoubleCounts) {
    const uint64_t total = kWriters * kRecordsPerWriter;
    std::atomic<bool> writing{true};
    std::atomic<int> failures{0};
    std::atomic<int> overcounts{0};

    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([this, w, &failures]() {
            std::string agent = "agent-" + std::to_string(w);
            for (int i = 0; i < kRecordsPerWriter; ++i) {
                // Half the rows are old enough to be compacted right away
                core::Timestamp ts = testutil::kTestNow -
                    (i % 2 == 0 ? 10 * core::kMillisPerDay : core::kMillisPerHour) - i;
                if (!store_->record_agent_metric(agent, "load", 1.0, {}, ts).ok()) {
                    failures.fetch_add(1);
                }
            }
        });
    }

    std::thread reader([this, &writing, &failures, &overcounts, total]() {
        while (writing.load()) {
            auto counted = store_->aggregate(core::Table::AGENT, core::AggregationOp::SUM, core::QueryFilter(),
                                             core::TimeRange::All());
            if (!counted.ok()) {
                failures.fetch_add(1);
                continue;
            }
            if (counted.value().count > total || *counted.value().value > static_cast<double>(total)) {
                overcounts.fetch_add(1);
            }
        }
    });

    std::thread compactor([this, &writing, &failures]() {
        while (writing.load()) {
            if (!store_->compact().ok()) {
                failures.fetch_add(1);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    });

    for (auto& writer : writers) {
        writer.join();
    }
    ASSERT_TRUE(store_->flush().ok());
    writing.store(false);
    reader.join();
    compactor.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(overcounts.load(), 0);

    auto final_run = store_->compact();
    ASSERT_TRUE(final_run.ok()) << final_run.error();

    auto counted = store_->aggregate(core::Table::AGENT, core::AggregationOp::COUNT, core::QueryFilter(),
                                     core::TimeRange::All());
    ASSERT_TRUE(counted.ok());
    EXPECT_EQ(counted.value().count, total);
    EXPECT_TRUE(counted.value().used_archive);

    auto detailed = store_->queries().count(core::Table::AGENT, core::QueryFilter(), core::TimeRange::All());
    ASSERT_TRUE(detailed.ok());
    EXPECT_EQ(detailed.value(), total / 2);
}

TEST_F(ConcurrencyTest, ParallelReadersSeeConsistentCounts) {
    for (int i = 0; i < 200; ++i) {
        ASSERT_TRUE(store_->record_task("task-" + std::to_string(i), "agent-" + std::to_string(i % 5),
                                        100 + i, core::TaskOutcome::SUCCESS, 10, 1,
                                        testutil::kTestNow - i * core::kMillisPerMinute).ok());
    }
    ASSERT_TRUE(store_->flush().ok());

    std::atomic<int> mismatches{0};
    std::vector<std::thread> readers;
    for (int r = 0; r < 6; ++r) {
        readers.emplace_back([this, &mismatches]() {
            for (int i = 0; i < 20; ++i) {
                auto summary = store_->queries().summary(core::TimeRange::All());
                if (!summary.ok() || summary.value().total_tasks != 200u || summary.value().distinct_agents != 5u) {
                    mismatches.fetch_add(1);
                }
            }
        });
    }
    for (auto& reader : readers) {
        reader.join();
    }
    EXPECT_EQ(mismatches.load(), 0);
}

} // namespace
} // namespace integration
} // namespace metricstore
