#pragma once

#include <string>
#include <vector>

#include "streamstats/endpoints/endpoint_registry.h"
#include "streamstats/stream/stream.h"

namespace streamstats {
namespace collector {

struct EndpointTestSummary {
    size_t total = 0;
    size_t succeeded = 0;
    std::vector<std::string> errors;

    // "Successfully connected to X / Y endpoints"
    std::string ToString() const;
};

/**
 * @brief Probe every registered endpoint once, sequentially.
 */
EndpointTestSummary TestEndpoints(const endpoints::EndpointRegistry& registry,
                                  stream::StreamFactory& factory);

} // namespace collector
} // namespace streamstats
