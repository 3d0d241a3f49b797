#include <gtest/gtest.h>
#include "metricstore/core/query_context.h"
#include "metricstore/core/types.h"

#include <cmath>
#include <limits>
#include <thread>

namespace metricstore {
namespace core {
namespace {

TEST(TableTest, NamesAndAliases) {
    EXPECT_STREQ(TableName(Table::TASK), "task_metrics");
    EXPECT_STREQ(TableName(Table::ARCHIVE), "metrics_archive");
    EXPECT_EQ(ParseTable("agent_metrics").value(), Table::AGENT);
    EXPECT_EQ(ParseTable("swarm").value(), Table::SWARM);
    EXPECT_EQ(ParseTable("events").code(), Error::Code::INVALID_QUERY);
    EXPECT_TRUE(IsDetailedTable(Table::TASK));
    EXPECT_FALSE(IsDetailedTable(Table::ARCHIVE));
}

TEST(TimeRangeTest, HalfOpenBounds) {
    auto range = TimeRange::Between(100, 200);
    EXPECT_TRUE(range.contains(100));
    EXPECT_TRUE(range.contains(199));
    EXPECT_FALSE(range.contains(200));
    EXPECT_FALSE(range.contains(99));
    EXPECT_FALSE(range.is_empty());
    EXPECT_TRUE(TimeRange::Between(200, 200).is_empty());
    EXPECT_TRUE(TimeRange::All().contains(-5));
    EXPECT_TRUE(TimeRange::Since(10).contains(1'000'000'000'000));
}

TEST(TimeTest, FloorToHandlesNegativeTimestamps) {
    EXPECT_EQ(FloorTo(kMillisPerHour + 5, kMillisPerHour), kMillisPerHour);
    EXPECT_EQ(FloorTo(kMillisPerHour, kMillisPerHour), kMillisPerHour);
    EXPECT_EQ(FloorTo(-1, kMillisPerDay), -kMillisPerDay);
}

TEST(TimeTest, Formatting) {
    EXPECT_EQ(FormatIso8601(0), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(FormatIso8601(1749990600123), "2025-06-15T12:30:00.123Z");
    EXPECT_EQ(FormatDate(1749990600000), "2025-06-15");
    EXPECT_EQ(FormatIso8601(-1), "1969-12-31T23:59:59.999Z");
}

TEST(FilterValidationTest, FieldsMustExistOnTable) {
    QueryFilter filter;
    filter.swarm_id = "s1";
    EXPECT_EQ(ValidateFilter(Table::TASK, filter).code(), Error::Code::INVALID_QUERY);
    EXPECT_TRUE(ValidateFilter(Table::SWARM, filter).ok());

    QueryFilter by_outcome;
    by_outcome.outcome = TaskOutcome::FAILURE;
    EXPECT_TRUE(ValidateFilter(Table::TASK, by_outcome).ok());
    EXPECT_FALSE(ValidateFilter(Table::AGENT, by_outcome).ok());
    EXPECT_FALSE(ValidateFilter(Table::ARCHIVE, by_outcome).ok());
}

TEST(FilterValidationTest, MetadataKeysAreRestricted) {
    QueryFilter filter;
    filter.metadata["phase"] = "build";
    EXPECT_TRUE(ValidateFilter(Table::AGENT, filter).ok());

    filter.metadata["x') OR 1=1 --"] = "y";
    EXPECT_EQ(ValidateFilter(Table::AGENT, filter).code(), Error::Code::INVALID_QUERY);
}

TEST(ColumnValidationTest, NumericColumnsPerTable) {
    EXPECT_TRUE(ValidateColumn(Table::TASK, "duration_ms").ok());
    EXPECT_TRUE(ValidateColumn(Table::TASK, "success").ok());
    EXPECT_FALSE(ValidateColumn(Table::TASK, "value").ok());
    EXPECT_TRUE(ValidateColumn(Table::SWARM, "value").ok());
    EXPECT_EQ(ValidateColumn(Table::AGENT, "agent_id").code(), Error::Code::INVALID_QUERY);
}

TEST(RecordValidationTest, RejectsMissingIdsAndNegativeCounts) {
    TaskMetric task;
    task.task_id = "t1";
    task.agent_id = "a1";
    task.duration_ms = 10;
    EXPECT_TRUE(ValidateRecord(task).ok());

    task.tokens_used = -1;
    EXPECT_EQ(ValidateRecord(task).code(), Error::Code::INVALID_QUERY);

    AgentMetric agent;
    agent.agent_id = "a1";
    EXPECT_FALSE(ValidateRecord(agent).ok());
    agent.metric_kind = "success_rate";
    EXPECT_TRUE(ValidateRecord(agent).ok());

    SwarmMetric swarm;
    swarm.metric_kind = "health";
    EXPECT_FALSE(ValidateRecord(swarm).ok());
}

TEST(RecordValidationTest, RejectsNonFiniteValues) {
    AgentMetric agent;
    agent.agent_id = "a1";
    agent.metric_kind = "load";
    agent.value = std::nan("");
    EXPECT_EQ(ValidateRecord(agent).code(), Error::Code::INVALID_QUERY);
    agent.value = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(ValidateRecord(agent).ok());
    agent.value = 1e200;
    EXPECT_TRUE(ValidateRecord(agent).ok());

    SwarmMetric swarm;
    swarm.swarm_id = "s1";
    swarm.metric_kind = "health";
    swarm.value = -std::numeric_limits<double>::infinity();
    EXPECT_EQ(ValidateRecord(swarm).code(), Error::Code::INVALID_QUERY);
}

TEST(RecordTest, TableAndTimestampOf) {
    AgentMetric agent;
    agent.timestamp = 42;
    MetricRecord record = agent;
    EXPECT_EQ(TableOf(record), Table::AGENT);
    EXPECT_EQ(TimestampOf(record), 42);
    EXPECT_EQ(TableOf(MetricRecord(SwarmMetric())), Table::SWARM);
}

TEST(QueryContextTest, NoDeadlineByDefault) {
    QueryContext ctx;
    EXPECT_FALSE(ctx.has_deadline());
    EXPECT_TRUE(ctx.check().ok());
    EXPECT_EQ(ctx.remaining(), std::chrono::milliseconds::max());
}

TEST(QueryContextTest, ExpiredDeadlineReportsTimeout) {
    auto ctx = QueryContext::WithTimeout(std::chrono::milliseconds(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_TRUE(ctx.expired());
    EXPECT_EQ(ctx.check().code(), Error::Code::TIMEOUT);
    EXPECT_EQ(ctx.remaining().count(), 0);
}

TEST(QueryContextTest, CancellationWinsOverDeadline) {
    CancellationToken token;
    auto ctx = QueryContext::WithTimeout(std::chrono::milliseconds(1));
    ctx.with_cancellation(token);
    token.cancel();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_EQ(ctx.check().code(), Error::Code::CANCELLED);
}

TEST(QueryContextTest, DefaultTimeoutKeepsExistingDeadline) {
    auto ctx = QueryContext::WithTimeout(std::chrono::hours(1));
    auto bounded = ctx.with_default_timeout(std::chrono::milliseconds(1));
    EXPECT_EQ(bounded.deadline(), ctx.deadline());

    auto fresh = QueryContext().with_default_timeout(std::chrono::milliseconds(1000));
    EXPECT_TRUE(fresh.has_deadline());
}

} // namespace
} // namespace core
} // namespace metricstore
