#ifndef METRICSTORE_COMMON_LOGGER_H_
#define METRICSTORE_COMMON_LOGGER_H_

#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

#include "metricstore/core/result.h"

namespace metricstore {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);
    static core::Result<spdlog::level::level_enum> ParseLevel(const std::string& name);
};

} // namespace common
} // namespace metricstore

// Macros for convenient logging
#define METRICSTORE_TRACE(...) spdlog::trace(__VA_ARGS__)
#define METRICSTORE_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define METRICSTORE_INFO(...)  spdlog::info(__VA_ARGS__)
#define METRICSTORE_WARN(...)  spdlog::warn(__VA_ARGS__)
#define METRICSTORE_ERROR(...) spdlog::error(__VA_ARGS__)
#define METRICSTORE_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // METRICSTORE_COMMON_LOGGER_H_
