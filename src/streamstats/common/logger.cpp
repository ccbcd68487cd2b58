#include "streamstats/common/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>

namespace streamstats {
namespace common {

void Logger::Init() {
    try {
        auto console = spdlog::stderr_color_mt("console");
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

std::optional<spdlog::level::level_enum> Logger::ParseLevel(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

} // namespace common
} // namespace streamstats
