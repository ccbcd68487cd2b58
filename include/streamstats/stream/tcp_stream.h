#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "streamstats/stream/stream.h"

namespace streamstats {
namespace stream {

/**
 * @brief Stream over a plain TCP connection.
 *
 * The payload is not interpreted: each successful recv() counts as one packet.
 */
class TcpStream : public Stream {
public:
    TcpStream(int fd, std::chrono::milliseconds timeout, size_t buffer_size);
    ~TcpStream() override;

    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    ReceiveResult Receive() override;
    void Close() override;

private:
    int fd_;
    std::chrono::milliseconds timeout_;
    std::vector<char> buffer_;
    std::atomic<bool> closed_{false};
};

// Timeout for poll(), clamped to [0, INT_MAX] milliseconds
int PollTimeoutMillis(std::chrono::milliseconds timeout);

class TcpStreamFactory : public StreamFactory {
public:
    explicit TcpStreamFactory(std::chrono::milliseconds timeout, size_t buffer_size = 64 * 1024);

    core::Result<std::unique_ptr<Stream>> Open(const endpoints::Endpoint& endpoint) override;

    // Explicit URL port, else the well-known port of the scheme
    static std::optional<uint16_t> ResolvePort(const endpoints::Url& url);

private:
    std::chrono::milliseconds timeout_;
    size_t buffer_size_;
};

} // namespace stream
} // namespace streamstats
