#ifndef METRICSTORE_CORE_QUERY_CONTEXT_H_
#define METRICSTORE_CORE_QUERY_CONTEXT_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

#include "metricstore/core/result.h"

namespace metricstore {
namespace core {

/**
 * @brief Shared flag a caller flips to abandon an in-flight query
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief Deadline and cancellation for one logical operation
 */
class QueryContext {
public:
    using Clock = std::chrono::steady_clock;

    QueryContext() = default;

    static QueryContext WithTimeout(std::chrono::milliseconds timeout) {
        QueryContext ctx;
        ctx.deadline_ = Clock::now() + timeout;
        return ctx;
    }

    QueryContext& with_cancellation(CancellationToken token) {
        token_ = std::move(token);
        return *this;
    }

    /**
     * @brief Copy of this context with a deadline, keeping an existing one
     */
    QueryContext with_default_timeout(std::chrono::milliseconds timeout) const {
        QueryContext ctx = *this;
        if (!ctx.deadline_) {
            ctx.deadline_ = Clock::now() + timeout;
        }
        return ctx;
    }

    bool has_deadline() const { return deadline_.has_value(); }
    Clock::time_point deadline() const { return deadline_.value_or(Clock::time_point::max()); }

    bool expired() const { return deadline_ && Clock::now() >= *deadline_; }
    bool cancelled() const { return token_ && token_->cancelled(); }

    /**
     * @brief Error to report when iteration has to stop, ok otherwise
     */
    Result<void> check() const {
        if (cancelled()) {
            return Result<void>::error("Query cancelled", Error::Code::CANCELLED);
        }
        if (expired()) {
            return Result<void>::error("Query timed out", Error::Code::TIMEOUT);
        }
        return Result<void>();
    }

    std::chrono::milliseconds remaining() const {
        if (!deadline_) {
            return std::chrono::milliseconds::max();
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

private:
    std::optional<Clock::time_point> deadline_;
    std::optional<CancellationToken> token_;
};

} // namespace core
} // namespace metricstore

#endif // METRICSTORE_CORE_QUERY_CONTEXT_H_
