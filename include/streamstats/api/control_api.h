#ifndef STREAMSTATS_API_CONTROL_API_H_
#define STREAMSTATS_API_CONTROL_API_H_

#include <string>
#include <vector>

#include "streamstats/collector/stream_collector.h"
#include "streamstats/core/result.h"
#include "streamstats/endpoints/endpoint_registry.h"
#include "streamstats/endpoints/endpoint_spec.h"
#include "streamstats/server/http_server.h"

namespace streamstats {
namespace api {

enum class EndpointUpdateMode {
    REPLACE,  // clear the registry, then add
    APPEND
};

/**
 * @brief Per-spec outcome of an endpoint update.
 */
struct EndpointUpdateReport {
    EndpointUpdateMode mode = EndpointUpdateMode::APPEND;
    std::vector<endpoints::EndpointSpecResult> entries;
    size_t added = 0;       // endpoints that made it into the registry
    bool applied = false;   // false when nothing was changed

    std::string ToText() const;
};

/**
 * @brief Runtime control over the endpoint registry and the stream pool.
 *
 * The HTTP routes are thin wrappers around SetEndpointsFromBody() and
 * SetPoolSize(), so both can be driven without a server.
 */
class ControlApi {
public:
    ControlApi(endpoints::EndpointRegistry& registry, collector::StreamCollector& collector);

    /**
     * @brief Parse specs and update the registry.
     *
     * Fails with INVALID_ARGUMENT when specs is empty. A spec that fails to
     * parse is reported, not fatal. In REPLACE mode the registry is cleared
     * only when at least one endpoint parsed.
     */
    core::Result<EndpointUpdateReport> SetEndpoints(EndpointUpdateMode mode,
                                                    const std::vector<std::string>& specs);

    // One spec per non-empty line
    core::Result<EndpointUpdateReport> SetEndpointsFromBody(EndpointUpdateMode mode, const std::string& body);

    // value must be a decimal integer, negative values shrink the pool to 0
    core::Result<collector::ResizeResult> SetPoolSize(const std::string& value);

    std::string DescribeEndpoints() const;
    std::string DescribeStreams() const;

    // Installs /api/endpoints and /api/streams
    void RegisterRoutes(server::HttpServer& server);

private:
    void HandleEndpoints(const server::Request& request, server::Response& response);
    void HandleStreams(const server::Request& request, server::Response& response);

    endpoints::EndpointRegistry& registry_;
    collector::StreamCollector& collector_;
};

} // namespace api
} // namespace streamstats

#endif // STREAMSTATS_API_CONTROL_API_H_
