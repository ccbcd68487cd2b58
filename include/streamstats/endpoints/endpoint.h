#ifndef STREAMSTATS_ENDPOINTS_ENDPOINT_H_
#define STREAMSTATS_ENDPOINTS_ENDPOINT_H_

#include <cstdint>
#include <optional>
#include <string>

#include "streamstats/core/result.h"

namespace streamstats {
namespace endpoints {

/**
 * @brief Decomposed absolute URL: scheme://[userinfo@]host[:port]path[?query][#fragment]
 */
struct Url {
    std::string scheme;
    std::string userinfo;
    std::string host;                 // Without brackets for IPv6 literals
    std::optional<uint16_t> port;
    std::string path;
    std::string query;                // Without the leading '?'
    std::string fragment;             // Without the leading '#'

    // host[:port], IPv6 literals bracketed
    std::string Authority() const;
    std::string ToString() const;
};

core::Result<Url> ParseUrl(const std::string& text);

/**
 * @brief One concrete stream source.
 *
 * The path is split like a file path: everything up to the last '/' is the
 * application path used to connect, the last component is the stream name.
 */
struct Endpoint {
    Url url;
    std::string app_path;             // e.g. "/live/"
    std::string stream_name;          // e.g. "camera1"
    std::optional<int64_t> pixels;

    std::string ToString() const { return url.ToString(); }
    // URL without the stream name, e.g. rtmp://host:1935/live/
    std::string ConnectTarget() const;
};

bool operator==(const Endpoint& a, const Endpoint& b);

/**
 * @brief Build an endpoint from a concrete URL, extracting the "pixels" query parameter.
 */
core::Result<Endpoint> ParseEndpoint(const std::string& text);

} // namespace endpoints
} // namespace streamstats

#endif // STREAMSTATS_ENDPOINTS_ENDPOINT_H_
