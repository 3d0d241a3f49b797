#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "metricstore/core/result.h"

namespace metricstore {
namespace core {

enum class AggregationOp {
    AVG,
    SUM,
    COUNT,
    MIN,
    MAX,
    STDDEV
};

const char* AggregationOpName(AggregationOp op);
Result<AggregationOp> ParseAggregationOp(const std::string& name);

/**
 * @brief Archive tier of a compacted bucket
 */
enum class AggregationLevel {
    HOURLY,
    DAILY
};

const char* AggregationLevelName(AggregationLevel level);
Result<AggregationLevel> ParseAggregationLevel(const std::string& name);
int64_t BucketWidth(AggregationLevel level);

/**
 * @brief Interval of a time-bucketed aggregation series
 */
enum class TimeInterval {
    MINUTE,
    HOUR,
    DAY
};

Result<TimeInterval> ParseTimeInterval(const std::string& name);
int64_t IntervalWidth(TimeInterval interval);

/**
 * @brief Mergeable summary of a set of values
 *
 * count, sum, min, max and sum of squares survive compaction; mean and
 * variance are recovered from them.
 */
struct AggregateStats {
    uint64_t count = 0;
    double sum = 0.0;
    double min = 0.0;
    double max = 0.0;
    double sum_sq = 0.0;

    void add(double value);
    void merge(const AggregateStats& other);
    bool empty() const { return count == 0; }

    std::optional<double> mean() const;
    // Population variance, sum_sq / n - mean^2, clamped at zero; nullopt once sum_sq overflows
    std::optional<double> variance() const;
    std::optional<double> stddev() const;

    /**
     * @brief Scalar for an aggregation; nullopt when undefined on an empty set
     *
     * COUNT and SUM are always defined (0 on an empty set).
     */
    std::optional<double> evaluate(AggregationOp op) const;

    /**
     * @brief Approximate percentile interpolated from min, mean and max
     *
     * Lower half interpolates between min and mean, upper half between mean
     * and max.
     */
    std::optional<double> approximate_percentile(double p) const;

    bool operator==(const AggregateStats& other) const;
    bool operator!=(const AggregateStats& other) const { return !(*this == other); }
};

/**
 * @brief Scalar answer of an aggregate query
 */
struct AggregateResult {
    AggregationOp op = AggregationOp::COUNT;
    std::optional<double> value;   // nullopt for avg/stddev/min/max of an empty set
    uint64_t count = 0;
    bool used_archive = false;     // archived buckets contributed
    bool approximate = false;      // an archived bucket straddles a range edge
};

enum class Precision {
    EXACT,        // computed by sorting matched detailed rows
    APPROXIMATE,  // archived buckets only
    MIXED         // detailed rows and archived buckets
};

const char* PrecisionName(Precision precision);

struct PercentileResult {
    std::optional<double> value;
    uint64_t count = 0;
    Precision precision = Precision::EXACT;

    bool approximate() const { return precision != Precision::EXACT; }
};

/**
 * @brief One entry of a top-N ranking
 */
struct RankedScope {
    std::string scope_id;
    double value = 0.0;
    uint64_t count = 0;
};

/**
 * @brief One point of a time-bucketed aggregation series
 */
struct IntervalPoint {
    int64_t bucket_start = 0;
    std::optional<double> value;
    uint64_t count = 0;
};

} // namespace core
} // namespace metricstore
