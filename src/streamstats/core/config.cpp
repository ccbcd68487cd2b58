#include "streamstats/core/config.h"

#include <climits>

namespace streamstats {
namespace core {

Result<void> CollectorConfig::Validate() const {
    if (initial_streams < 0) {
        return Result<void>::error("Invalid number of initial streams: " + std::to_string(initial_streams),
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (sink_interval.count() <= 0) {
        return Result<void>::error("Sink interval must be positive", Error::Code::INVALID_ARGUMENT);
    }
    if (stream_timeout.count() <= 0) {
        return Result<void>::error("Stream timeout must be positive", Error::Code::INVALID_ARGUMENT);
    }
    // poll() takes the timeout in milliseconds as an int
    if (stream_timeout.count() > INT_MAX) {
        return Result<void>::error("Stream timeout must not exceed " + std::to_string(INT_MAX) + "ms",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (no_endpoints_backoff.count() <= 0) {
        return Result<void>::error("No-endpoints back-off must be positive", Error::Code::INVALID_ARGUMENT);
    }
    return Result<void>();
}

Result<void> SinkConfig::Validate() const {
    if (format != "csv" && format != "json") {
        return Result<void>::error("Unknown output format: " + format + " (expected csv or json)",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (path.empty()) {
        return Result<void>::error("Output path must not be empty", Error::Code::INVALID_ARGUMENT);
    }
    return Result<void>();
}

} // namespace core
} // namespace streamstats
