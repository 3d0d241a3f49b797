#include "metricstore/core/aggregation.h"
#include "metricstore/core/types.h"

#include <algorithm>
#include <cmath>

namespace metricstore {
namespace core {

const char* AggregationOpName(AggregationOp op) {
    switch (op) {
        case AggregationOp::AVG: return "avg";
        case AggregationOp::SUM: return "sum";
        case AggregationOp::COUNT: return "count";
        case AggregationOp::MIN: return "min";
        case AggregationOp::MAX: return "max";
        case AggregationOp::STDDEV: return "stddev";
    }
    return "unknown";
}

Result<AggregationOp> ParseAggregationOp(const std::string& name) {
    if (name == "avg") return Result<AggregationOp>(AggregationOp::AVG);
    if (name == "sum") return Result<AggregationOp>(AggregationOp::SUM);
    if (name == "count") return Result<AggregationOp>(AggregationOp::COUNT);
    if (name == "min") return Result<AggregationOp>(AggregationOp::MIN);
    if (name == "max") return Result<AggregationOp>(AggregationOp::MAX);
    if (name == "stddev") return Result<AggregationOp>(AggregationOp::STDDEV);
    return Result<AggregationOp>::error("Unknown aggregation: " + name, Error::Code::INVALID_QUERY);
}

const char* AggregationLevelName(AggregationLevel level) {
    return level == AggregationLevel::HOURLY ? "hourly" : "daily";
}

Result<AggregationLevel> ParseAggregationLevel(const std::string& name) {
    if (name == "hourly") return Result<AggregationLevel>(AggregationLevel::HOURLY);
    if (name == "daily") return Result<AggregationLevel>(AggregationLevel::DAILY);
    return Result<AggregationLevel>::error("Unknown aggregation level: " + name,
                                           Error::Code::INVALID_QUERY);
}

int64_t BucketWidth(AggregationLevel level) {
    return level == AggregationLevel::HOURLY ? kMillisPerHour : kMillisPerDay;
}

Result<TimeInterval> ParseTimeInterval(const std::string& name) {
    if (name == "minute") return Result<TimeInterval>(TimeInterval::MINUTE);
    if (name == "hour") return Result<TimeInterval>(TimeInterval::HOUR);
    if (name == "day") return Result<TimeInterval>(TimeInterval::DAY);
    return Result<TimeInterval>::error("Unknown time interval: " + name, Error::Code::INVALID_QUERY);
}

int64_t IntervalWidth(TimeInterval interval) {
    switch (interval) {
        case TimeInterval::MINUTE: return kMillisPerMinute;
        case TimeInterval::HOUR: return kMillisPerHour;
        case TimeInterval::DAY: return kMillisPerDay;
    }
    return kMillisPerHour;
}

const char* PrecisionName(Precision precision) {
    switch (precision) {
        case Precision::EXACT: return "exact";
        case Precision::APPROXIMATE: return "approximate";
        case Precision::MIXED: return "mixed";
    }
    return "exact";
}

void AggregateStats::add(double value) {
    if (count == 0) {
        min = value;
        max = value;
    } else {
        min = std::min(min, value);
        max = std::max(max, value);
    }
    ++count;
    sum += value;
    sum_sq += value * value;
}

void AggregateStats::merge(const AggregateStats& other) {
    if (other.count == 0) {
        return;
    }
    if (count == 0) {
        *this = other;
        return;
    }
    count += other.count;
    sum += other.sum;
    sum_sq += other.sum_sq;
    min = std::min(min, other.min);
    max = std::max(max, other.max);
}

std::optional<double> AggregateStats::mean() const {
    if (count == 0) {
        return std::nullopt;
    }
    return sum / static_cast<double>(count);
}

std::optional<double> AggregateStats::variance() const {
    if (count == 0) {
        return std::nullopt;
    }
    double n = static_cast<double>(count);
    double m = sum / n;
    double var = sum_sq / n - m * m;
    if (!std::isfinite(var)) {
        // sum_sq overflowed
        return std::nullopt;
    }
    // Cancellation in the shortcut formula can go slightly negative
    return std::max(var, 0.0);
}

std::optional<double> AggregateStats::stddev() const {
    auto var = variance();
    if (!var) {
        return std::nullopt;
    }
    return std::sqrt(*var);
}

std::optional<double> AggregateStats::evaluate(AggregationOp op) const {
    switch (op) {
        case AggregationOp::COUNT: return static_cast<double>(count);
        case AggregationOp::SUM: return sum;
        case AggregationOp::AVG: return mean();
        case AggregationOp::STDDEV: return stddev();
        case AggregationOp::MIN: return count ? std::optional<double>(min) : std::nullopt;
        case AggregationOp::MAX: return count ? std::optional<double>(max) : std::nullopt;
    }
    return std::nullopt;
}

std::optional<double> AggregateStats::approximate_percentile(double p) const {
    if (count == 0) {
        return std::nullopt;
    }
    p = std::clamp(p, 0.0, 1.0);
    double m = *mean();
    if (p <= 0.5) {
        return min + (m - min) * (p / 0.5);
    }
    return m + (max - m) * ((p - 0.5) / 0.5);
}

bool AggregateStats::operator==(const AggregateStats& other) const {
    return count == other.count && sum == other.sum && min == other.min &&
           max == other.max && sum_sq == other.sum_sq;
}

} // namespace core
} // namespace metricstore
