#ifndef METRICSTORE_CORE_ERROR_H_
#define METRICSTORE_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace metricstore {
namespace core {

/**
 * @brief Base class for all metricstore errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_QUERY = 1,
        STORAGE_UNAVAILABLE = 2,
        RETENTION_FAILURE = 3,
        TIMEOUT = 4,
        CANCELLED = 5,
        NOT_FOUND = 6,
        INTERNAL = 7
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

/**
 * @brief Malformed filter, unknown table, column or aggregation kind
 */
class InvalidQueryError : public Error {
public:
    explicit InvalidQueryError(const std::string& message)
        : Error(message, Code::INVALID_QUERY) {}
};

/**
 * @brief Storage medium could not be reached after the retry budget was spent
 */
class StorageUnavailableError : public Error {
public:
    explicit StorageUnavailableError(const std::string& message)
        : Error(message, Code::STORAGE_UNAVAILABLE) {}
};

/**
 * @brief Capacity problem: disk full or a retention purge that failed
 */
class RetentionFailureError : public Error {
public:
    explicit RetentionFailureError(const std::string& message)
        : Error(message, Code::RETENTION_FAILURE) {}
};

class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& message)
        : Error(message, Code::TIMEOUT) {}
};

class CancelledError : public Error {
public:
    explicit CancelledError(const std::string& message)
        : Error(message, Code::CANCELLED) {}
};

class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
};

inline const char* ErrorCodeName(Error::Code code) {
    switch (code) {
        case Error::Code::INVALID_QUERY: return "invalid_query";
        case Error::Code::STORAGE_UNAVAILABLE: return "storage_unavailable";
        case Error::Code::RETENTION_FAILURE: return "retention_failure";
        case Error::Code::TIMEOUT: return "timeout";
        case Error::Code::CANCELLED: return "cancelled";
        case Error::Code::NOT_FOUND: return "not_found";
        case Error::Code::INTERNAL: return "internal";
        case Error::Code::UNKNOWN: break;
    }
    return "unknown";
}

} // namespace core
} // namespace metricstore

#endif // METRICSTORE_CORE_ERROR_H_
