#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "streamstats/core/result.h"
#include "streamstats/endpoints/endpoint.h"

namespace streamstats {
namespace stream {

enum class ReceiveStatus {
    DATA,           // bytes > 0 were received
    END_OF_STREAM,  // peer closed, inactivity timeout, or local Close()
    ERROR
};

struct ReceiveResult {
    size_t bytes = 0;
    ReceiveStatus status = ReceiveStatus::DATA;
    std::string error;

    static ReceiveResult Data(size_t n) { return ReceiveResult{n, ReceiveStatus::DATA, ""}; }
    static ReceiveResult EndOfStream() { return ReceiveResult{0, ReceiveStatus::END_OF_STREAM, ""}; }
    static ReceiveResult Error(std::string message) {
        return ReceiveResult{0, ReceiveStatus::ERROR, std::move(message)};
    }
};

/**
 * @brief One open connection to a streaming endpoint.
 *
 * Receive() blocks until data arrives, the stream ends or the inactivity
 * timeout expires. Close() may be called from any thread, any number of times,
 * and unblocks a pending Receive().
 */
class Stream {
public:
    virtual ~Stream() = default;

    virtual ReceiveResult Receive() = 0;
    virtual void Close() = 0;
};

/**
 * @brief Opens streams for endpoints.
 */
class StreamFactory {
public:
    virtual ~StreamFactory() = default;

    virtual core::Result<std::unique_ptr<Stream>> Open(const endpoints::Endpoint& endpoint) = 0;

    // Opens and immediately closes a stream, used by the endpoint test
    virtual core::Result<void> Probe(const endpoints::Endpoint& endpoint);
};

} // namespace stream
} // namespace streamstats
