#ifndef STREAMSTATS_CORE_DURATION_H_
#define STREAMSTATS_CORE_DURATION_H_

#include <chrono>
#include <string>

#include "streamstats/core/result.h"

namespace streamstats {
namespace core {

using Duration = std::chrono::nanoseconds;

/**
 * @brief Parse a textual duration such as "300ms", "1.5s", "2h45m" or "0".
 *
 * Accepted units: ns, us (also µs and μs), ms, s, m, h. A leading sign is allowed;
 * callers that need a non-negative value use ParseNonNegativeDuration.
 */
Result<Duration> ParseDuration(const std::string& text);

Result<Duration> ParseNonNegativeDuration(const std::string& text);

/**
 * @brief Format a duration with the largest fitting unit, e.g. "1.5s", "250ms", "0s".
 */
std::string FormatDuration(Duration d);

inline double ToSeconds(Duration d) {
    return std::chrono::duration<double>(d).count();
}

} // namespace core
} // namespace streamstats

#endif // STREAMSTATS_CORE_DURATION_H_
