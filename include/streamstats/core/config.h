#pragma once

#include <chrono>
#include <string>

#include "streamstats/core/result.h"

namespace streamstats {
namespace core {

/**
 * @brief Configuration of the stream pool and its statistics emitter
 */
struct CollectorConfig {
    int initial_streams;                                // Streams started by Start()
    std::chrono::milliseconds sink_interval;            // Interval between emitted samples
    std::chrono::milliseconds stream_timeout;           // Connect and inactivity timeout per stream
    std::chrono::milliseconds no_endpoints_backoff;     // Sleep when the registry is empty
    std::string restart_delay;                          // Distribution spec, see DistributionSampler

    CollectorConfig()
        : initial_streams(1), sink_interval(1000), stream_timeout(5000),
          no_endpoints_backoff(5000), restart_delay("const:0ms") {}

    static CollectorConfig Default() {
        return CollectorConfig();
    }

    Result<void> Validate() const;
};

/**
 * @brief Where and how emitted samples are written
 */
struct SinkConfig {
    std::string format = "csv";   // "csv" or "json"
    std::string path = "-";       // "-" writes to stdout

    Result<void> Validate() const;
};

} // namespace core
} // namespace streamstats
