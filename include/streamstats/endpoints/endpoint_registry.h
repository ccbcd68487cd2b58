#ifndef STREAMSTATS_ENDPOINTS_ENDPOINT_REGISTRY_H_
#define STREAMSTATS_ENDPOINTS_ENDPOINT_REGISTRY_H_

#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "streamstats/core/result.h"
#include "streamstats/endpoints/endpoint.h"

namespace streamstats {
namespace endpoints {

struct HostEndpoints {
    std::string name;
    std::vector<Endpoint> endpoints;
};

/**
 * @brief Thread-safe set of streaming endpoints grouped by host.
 *
 * Selection rotates over hosts in insertion order and picks a random endpoint
 * of the chosen host, so hosts with few endpoints still get their share.
 */
class EndpointRegistry {
public:
    EndpointRegistry();
    explicit EndpointRegistry(uint64_t seed);

    EndpointRegistry(const EndpointRegistry&) = delete;
    EndpointRegistry& operator=(const EndpointRegistry&) = delete;

    // Appends under host, creating it at the end of the rotation if absent
    void AddEndpoints(const std::string& host, std::vector<Endpoint> endpoints);

    // Clears everything, then inserts hosts in the given order
    void ReplaceAll(std::vector<HostEndpoints> hosts);

    void Clear();

    // Fails with NO_ENDPOINTS when no endpoint is registered
    core::Result<Endpoint> SelectNext();

    std::vector<HostEndpoints> Snapshot() const;
    size_t HostCount() const;
    size_t EndpointCount() const;
    bool Empty() const;

private:
    void AddLocked(const std::string& host, std::vector<Endpoint> endpoints);

    mutable std::mutex mutex_;
    std::vector<HostEndpoints> hosts_;
    uint64_t cursor_ = 0;
    std::mt19937_64 rng_;
};

} // namespace endpoints
} // namespace streamstats

#endif // STREAMSTATS_ENDPOINTS_ENDPOINT_REGISTRY_H_
