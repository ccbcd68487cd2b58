#include "streamstats/endpoints/endpoint_registry.h"

#include <algorithm>

namespace streamstats {
namespace endpoints {

EndpointRegistry::EndpointRegistry() : EndpointRegistry(std::random_device{}()) {}

EndpointRegistry::EndpointRegistry(uint64_t seed) : rng_(seed) {}

void EndpointRegistry::AddEndpoints(const std::string& host, std::vector<Endpoint> endpoints) {
    std::lock_guard<std::mutex> lock(mutex_);
    AddLocked(host, std::move(endpoints));
}

void EndpointRegistry::AddLocked(const std::string& host, std::vector<Endpoint> endpoints) {
    if (endpoints.empty()) {
        return;
    }
    auto it = std::find_if(hosts_.begin(), hosts_.end(),
                           [&host](const HostEndpoints& h) { return h.name == host; });
    if (it == hosts_.end()) {
        hosts_.push_back(HostEndpoints{host, std::move(endpoints)});
        return;
    }
    it->endpoints.insert(it->endpoints.end(),
                         std::make_move_iterator(endpoints.begin()),
                         std::make_move_iterator(endpoints.end()));
}

void EndpointRegistry::ReplaceAll(std::vector<HostEndpoints> hosts) {
    std::lock_guard<std::mutex> lock(mutex_);
    hosts_.clear();
    cursor_ = 0;
    for (auto& h : hosts) {
        AddLocked(h.name, std::move(h.endpoints));
    }
}

void EndpointRegistry::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    hosts_.clear();
    cursor_ = 0;
}

core::Result<Endpoint> EndpointRegistry::SelectNext() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t attempt = 0; attempt < hosts_.size(); ++attempt) {
        const HostEndpoints& host = hosts_[cursor_ % hosts_.size()];
        ++cursor_;
        if (host.endpoints.empty()) {
            continue;
        }
        std::uniform_int_distribution<size_t> pick(0, host.endpoints.size() - 1);
        return core::Result<Endpoint>(host.endpoints[pick(rng_)]);
    }
    return core::Result<Endpoint>(core::NoEndpointsError());
}

std::vector<HostEndpoints> EndpointRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hosts_;
}

size_t EndpointRegistry::HostCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hosts_.size();
}

size_t EndpointRegistry::EndpointCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& h : hosts_) {
        count += h.endpoints.size();
    }
    return count;
}

bool EndpointRegistry::Empty() const {
    return EndpointCount() == 0;
}

} // namespace endpoints
} // namespace streamstats
