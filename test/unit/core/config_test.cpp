#include <gtest/gtest.h>
#include "metricstore/core/config.h"
#include <string>

namespace metricstore {
namespace core {
namespace {

TEST(StorageConfigTest, Defaults) {
    auto config = StorageConfig::Default();
    EXPECT_EQ(config.db_path, ".swarm/metrics_persistent.db");
    EXPECT_EQ(config.pool_size, 4u);
    EXPECT_EQ(config.busy_timeout.count(), 5000);
    EXPECT_EQ(config.max_retries, 3u);
    EXPECT_TRUE(config.wal_mode);
    EXPECT_TRUE(config.validate().ok());
}

TEST(StorageConfigTest, RejectsEmptyPathAndPool) {
    StorageConfig config;
    EXPECT_EQ(config.validate().code(), Error::Code::INVALID_QUERY);

    config = StorageConfig::Default();
    config.pool_size = 0;
    EXPECT_FALSE(config.validate().ok());

    config = StorageConfig::Default();
    config.max_retries = 0;
    EXPECT_FALSE(config.validate().ok());
}

TEST(WriteBufferConfigTest, Defaults) {
    auto config = WriteBufferConfig::Default();
    EXPECT_TRUE(config.enabled);
    EXPECT_EQ(config.max_size, 100u);
    EXPECT_EQ(config.flush_interval.count(), 5000);
    EXPECT_TRUE(config.auto_flush_on_shutdown);
    EXPECT_TRUE(config.validate().ok());
}

TEST(WriteBufferConfigTest, RejectsZeroThresholds) {
    WriteBufferConfig config;
    config.max_size = 0;
    EXPECT_FALSE(config.validate().ok());

    config = WriteBufferConfig();
    config.flush_interval = std::chrono::milliseconds(0);
    EXPECT_FALSE(config.validate().ok());
}

TEST(RetentionPolicyTest, Defaults) {
    auto policy = RetentionPolicy::Default();
    EXPECT_EQ(policy.detailed_days, 7);
    EXPECT_EQ(policy.hourly_days, 30);
    EXPECT_EQ(policy.daily_days, 90);
    EXPECT_EQ(policy.cleanup_interval, std::chrono::hours(24));
    EXPECT_TRUE(policy.validate().ok());
}

TEST(RetentionPolicyTest, TiersMustBeOrdered) {
    RetentionPolicy policy;
    policy.detailed_days = 0;
    EXPECT_FALSE(policy.validate().ok());

    policy = RetentionPolicy();
    policy.hourly_days = 5;   // shorter than detailed_days
    EXPECT_FALSE(policy.validate().ok());

    policy = RetentionPolicy();
    policy.daily_days = 20;   // shorter than hourly_days
    EXPECT_FALSE(policy.validate().ok());

    policy = RetentionPolicy();
    policy.detailed_days = 7;
    policy.hourly_days = 7;
    policy.daily_days = 7;
    EXPECT_TRUE(policy.validate().ok());
}

TEST(MetricStoreConfigTest, ForPathValidates) {
    auto config = MetricStoreConfig::ForPath("/tmp/metrics.db");
    EXPECT_EQ(config.storage.db_path, "/tmp/metrics.db");
    EXPECT_TRUE(config.validate().ok());

    config.compression.level = 12;
    EXPECT_EQ(config.validate().code(), Error::Code::INVALID_QUERY);

    config = MetricStoreConfig::ForPath("/tmp/metrics.db");
    config.query.default_limit = 0;
    EXPECT_FALSE(config.validate().ok());

    config = MetricStoreConfig::ForPath("/tmp/metrics.db");
    config.retention.hourly_days = 1;
    EXPECT_FALSE(config.validate().ok());
}

TEST(ExportFormatTest, NamesRoundTrip) {
    for (auto format : {ExportFormat::JSON, ExportFormat::CSV, ExportFormat::PROMETHEUS, ExportFormat::GRAFANA}) {
        auto parsed = ParseExportFormat(ExportFormatName(format));
        ASSERT_TRUE(parsed.ok());
        EXPECT_EQ(parsed.value(), format);
    }
    EXPECT_EQ(ParseExportFormat("xml").code(), Error::Code::INVALID_QUERY);
}

TEST(ExportDefaultsTest, Defaults) {
    auto defaults = ExportDefaults::Default();
    EXPECT_EQ(defaults.format, ExportFormat::JSON);
    EXPECT_EQ(defaults.time_window_hours, 24);
    EXPECT_TRUE(defaults.pretty);
    EXPECT_EQ(defaults.metric_prefix, "metricstore");
}

} // namespace
} // namespace core
} // namespace metricstore
