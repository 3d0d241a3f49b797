#include <gtest/gtest.h>
#include "metricstore/storage/codec.h"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace metricstore {
namespace storage {
namespace {

core::AggregateStats SampleStats() {
    core::AggregateStats stats;
    for (double v : {120.0, 80.5, 300.25, 42.0}) {
        stats.add(v);
    }
    return stats;
}

TEST(MetadataCodecTest, EncodesFlatObject) {
    core::Metadata metadata;
    metadata["phase"] = "build";
    metadata["quote"] = "say \"hi\"";
    auto json = EncodeMetadata(metadata);
    EXPECT_EQ(json, R"({"phase":"build","quote":"say \"hi\""})");

    auto decoded = DecodeMetadata(json);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value(), metadata);
}

TEST(MetadataCodecTest, EmptyInputs) {
    EXPECT_EQ(EncodeMetadata(core::Metadata()), "{}");
    auto decoded = DecodeMetadata("");
    ASSERT_TRUE(decoded.ok());
    EXPECT_TRUE(decoded.value().empty());
}

TEST(MetadataCodecTest, NonStringMembersKeepJsonText) {
    auto decoded = DecodeMetadata(R"({"retries":3,"ok":true,"tags":["a","b"]})");
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value().at("retries"), "3");
    EXPECT_EQ(decoded.value().at("ok"), "true");
    EXPECT_EQ(decoded.value().at("tags"), R"(["a","b"])");
}

TEST(MetadataCodecTest, RejectsNonObjects) {
    EXPECT_FALSE(DecodeMetadata("[1,2]").ok());
    EXPECT_FALSE(DecodeMetadata("{not json").ok());
}

TEST(StatsCodecTest, PlainPayloadIsReadableJson) {
    core::CompressionConfig compression;
    compression.enabled = false;
    auto encoded = EncodeStats(SampleStats(), compression);
    ASSERT_TRUE(encoded.ok());
    EXPECT_FALSE(encoded.value().compressed);

    std::string text(encoded.value().bytes.begin(), encoded.value().bytes.end());
    EXPECT_NE(text.find("\"count\":4"), std::string::npos);

    auto decoded = DecodeStats(encoded.value().bytes.data(), encoded.value().bytes.size(), false);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value(), SampleStats());
}

TEST(StatsCodecTest, OverflowedSumOfSquaresRoundTrips) {
    core::AggregateStats stats;
    stats.add(1e200);
    ASSERT_TRUE(std::isinf(stats.sum_sq));

    core::CompressionConfig compression;
    compression.enabled = false;
    auto encoded = EncodeStats(stats, compression);
    ASSERT_TRUE(encoded.ok()) << encoded.error();
    std::string text(encoded.value().bytes.begin(), encoded.value().bytes.end());
    EXPECT_NE(text.find("\"sum_sq\":Infinity"), std::string::npos) << text;

    auto decoded = DecodeStats(encoded.value().bytes.data(), encoded.value().bytes.size(), false);
    ASSERT_TRUE(decoded.ok()) << decoded.error();
    EXPECT_EQ(decoded.value().count, 1u);
    EXPECT_DOUBLE_EQ(decoded.value().sum, 1e200);
    EXPECT_DOUBLE_EQ(decoded.value().max, 1e200);
    EXPECT_EQ(decoded.value().sum_sq, std::numeric_limits<double>::infinity());

    compression.enabled = true;
    encoded = EncodeStats(stats, compression);
    ASSERT_TRUE(encoded.ok());
    decoded = DecodeStats(encoded.value().bytes.data(), encoded.value().bytes.size(), true);
    ASSERT_TRUE(decoded.ok());
    EXPECT_TRUE(std::isinf(decoded.value().sum_sq));
}

TEST(StatsCodecTest, CompressedPayloadDecodes) {
    core::CompressionConfig compression;
    compression.enabled = true;
    compression.level = 9;
    auto encoded = EncodeStats(SampleStats(), compression);
    ASSERT_TRUE(encoded.ok());
    EXPECT_TRUE(encoded.value().compressed);

    const auto& bytes = encoded.value().bytes;
    auto decoded = DecodeStats(bytes.data(), bytes.size(), true);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value().count, 4u);
    EXPECT_DOUBLE_EQ(decoded.value().sum, SampleStats().sum);
    EXPECT_DOUBLE_EQ(decoded.value().min, 42.0);
    EXPECT_DOUBLE_EQ(decoded.value().max, 300.25);
}

TEST(StatsCodecTest, CorruptPayloadsAreErrors) {
    std::vector<uint8_t> truncated = {1, 2};
    EXPECT_FALSE(DecodeStats(truncated.data(), truncated.size(), true).ok());

    std::vector<uint8_t> garbage = {100, 0, 0, 0, 0xde, 0xad, 0xbe, 0xef};
    EXPECT_FALSE(DecodeStats(garbage.data(), garbage.size(), true).ok());

    std::string missing = R"({"count":1,"sum":2})";
    auto decoded = DecodeStats(reinterpret_cast<const uint8_t*>(missing.data()), missing.size(), false);
    EXPECT_FALSE(decoded.ok());
}

} // namespace
} // namespace storage
} // namespace metricstore
