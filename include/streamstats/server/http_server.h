#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "streamstats/core/result.h"
#include "streamstats/server/request.h"

namespace streamstats {
namespace server {

/**
 * @brief Configuration for the control HTTP server
 */
struct ServerConfig {
    std::string listen_address = "0.0.0.0";  // Listen address
    uint16_t port = 7888;                    // Listen port, 0 picks a free port
    size_t num_threads = 4;                  // Number of worker threads
    int timeout_seconds = 30;                // Read and write timeout

    core::Result<void> Validate() const;
};

/**
 * @brief Handler function type for HTTP endpoints
 */
using RequestHandler = std::function<void(const Request& request, Response& response)>;

/**
 * @brief HTTP server hosting the control endpoints
 */
class HttpServer {
public:
    explicit HttpServer(const ServerConfig& config);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind the listen socket and start serving on a background thread
     * @throws ServerError if the address cannot be bound or the server runs already
     */
    void Start();

    /**
     * @brief Stop the HTTP server
     */
    void Stop();

    bool IsRunning() const;

    /**
     * @brief Port the server is bound to, valid after Start()
     */
    int Port() const;

    /**
     * @brief Register a handler for a path
     * @param path The endpoint path (e.g., "/api/streams")
     * @param methods Any of "GET", "POST", "PUT", "DELETE"
     * @param handler The handler function
     */
    void RegisterHandler(const std::string& path, const std::vector<std::string>& methods,
                         RequestHandler handler);

    /**
     * @brief Get server metrics
     * @return JSON string with server metrics
     */
    std::string GetMetrics() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    std::atomic<bool> running_{false};
};

// Exception classes
class ServerError : public std::runtime_error {
public:
    explicit ServerError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace server
} // namespace streamstats
