#ifndef METRICSTORE_CORE_RESULT_H_
#define METRICSTORE_CORE_RESULT_H_

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "metricstore/core/error.h"

namespace metricstore {
namespace core {

/**
 * @brief Result type for operations that can fail
 *
 * Usage:
 * ```
 * Result<int> foo() {
 *     if (error_condition) {
 *         return Result<int>::error("bad filter", Error::Code::INVALID_QUERY);
 *     }
 *     return Result<int>(42);
 * }
 *
 * auto result = foo();
 * if (result.ok()) {
 *     int value = result.value();
 * } else if (result.code() == Error::Code::TIMEOUT) {
 *     ...
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}

    explicit Result(const Error& error) : value_(), error_(ErrorInfo{error.code(), error.what()}) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    // Result is move-only
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool ok() const { return !error_.has_value(); }

    std::string error() const {
        if (!error_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return error_->message;
    }

    Error::Code code() const { return error_ ? error_->code : Error::Code::UNKNOWN; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    T&& take_value() { return std::move(value_); }

    static Result<T> error(const std::string& message, Error::Code code = Error::Code::INTERNAL) {
        Result<T> result{T{}};
        result.error_ = ErrorInfo{code, message};
        return result;
    }

private:
    struct ErrorInfo {
        Error::Code code;
        std::string message;
    };

    T value_;
    std::optional<ErrorInfo> error_;
};

/**
 * @brief Specialization for void results
 */
template<>
class Result<void> {
public:
    Result() = default;

    explicit Result(const Error& error) : error_(ErrorInfo{error.code(), error.what()}) {}

    bool ok() const { return !error_.has_value(); }

    std::string error() const {
        if (!error_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return error_->message;
    }

    Error::Code code() const { return error_ ? error_->code : Error::Code::UNKNOWN; }

    static Result<void> error(const std::string& message, Error::Code code = Error::Code::INTERNAL) {
        Result<void> result;
        result.error_ = ErrorInfo{code, message};
        return result;
    }

private:
    struct ErrorInfo {
        Error::Code code;
        std::string message;
    };

    std::optional<ErrorInfo> error_;
};

/**
 * @brief Re-wrap the error of one result into a result of another type
 */
template<typename T, typename U>
Result<T> PropagateError(const Result<U>& failed) {
    return Result<T>::error(failed.error(), failed.code());
}

} // namespace core
} // namespace metricstore

#endif // METRICSTORE_CORE_RESULT_H_
