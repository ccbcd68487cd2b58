#include "streamstats/collector/endpoint_tester.h"

#include "streamstats/common/logger.h"

namespace streamstats {
namespace collector {

std::string EndpointTestSummary::ToString() const {
    return "Successfully connected to " + std::to_string(succeeded) + " / " + std::to_string(total) +
           " endpoints";
}

EndpointTestSummary TestEndpoints(const endpoints::EndpointRegistry& registry,
                                  stream::StreamFactory& factory) {
    EndpointTestSummary summary;
    for (const auto& host : registry.Snapshot()) {
        for (const auto& endpoint : host.endpoints) {
            ++summary.total;
            auto probed = factory.Probe(endpoint);
            if (probed.ok()) {
                ++summary.succeeded;
                STREAMSTATS_DEBUG("Connected to {}", endpoint.ToString());
            } else {
                summary.errors.push_back("Failed to connect to host " + host.name + " via URL " +
                                         endpoint.ToString() + ": " + probed.error());
            }
        }
    }
    return summary;
}

} // namespace collector
} // namespace streamstats
