#include "metricstore/common/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>

namespace metricstore {
namespace common {

void Logger::Init() {
    try {
        auto console = spdlog::get("metricstore");
        if (!console) {
            console = spdlog::stdout_color_mt("metricstore");
        }
        spdlog::set_default_logger(console);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
        spdlog::set_level(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

core::Result<spdlog::level::level_enum> Logger::ParseLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str falls back to "off" for unknown names
    if (level == spdlog::level::off && name != "off") {
        return core::Result<spdlog::level::level_enum>::error(
            "Unknown log level: " + name, core::Error::Code::INVALID_QUERY);
    }
    return core::Result<spdlog::level::level_enum>(level);
}

} // namespace common
} // namespace metricstore
