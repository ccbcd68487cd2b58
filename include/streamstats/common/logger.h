#ifndef STREAMSTATS_COMMON_LOGGER_H_
#define STREAMSTATS_COMMON_LOGGER_H_

#include <optional>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace streamstats {
namespace common {

class Logger {
public:
    // Installs a stderr logger as the spdlog default. stdout is left to the sample sink.
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);

    // Maps "trace", "debug", "info", "warn", "error" and "off" to spdlog levels.
    static std::optional<spdlog::level::level_enum> ParseLevel(const std::string& name);
};

} // namespace common
} // namespace streamstats

// Macros for convenient logging
#define STREAMSTATS_TRACE(...) spdlog::trace(__VA_ARGS__)
#define STREAMSTATS_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define STREAMSTATS_INFO(...)  spdlog::info(__VA_ARGS__)
#define STREAMSTATS_WARN(...)  spdlog::warn(__VA_ARGS__)
#define STREAMSTATS_ERROR(...) spdlog::error(__VA_ARGS__)
#define STREAMSTATS_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // STREAMSTATS_COMMON_LOGGER_H_
