#include "streamstats/stream/tcp_stream.h"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "streamstats/common/logger.h"

namespace streamstats {
namespace stream {

namespace {

std::string ErrnoText(int err) {
    return std::string(std::strerror(err));
}

// Non-blocking connect bounded by poll, restores blocking mode on success
int ConnectWithTimeout(const addrinfo* ai, int timeout_ms, int* error_out) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
        *error_out = errno;
        return -1;
    }

    int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (rc == 0) {
        ::fcntl(fd, F_SETFL, flags);
        return fd;
    }
    if (errno != EINPROGRESS) {
        *error_out = errno;
        ::close(fd);
        return -1;
    }

    pollfd pfd{fd, POLLOUT, 0};
    do {
        rc = ::poll(&pfd, 1, timeout_ms);
    } while (rc < 0 && errno == EINTR);

    if (rc == 1 && (pfd.revents & (POLLOUT | POLLERR | POLLHUP))) {
        int err = 0;
        socklen_t len = sizeof(err);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0 || err != 0) {
            *error_out = err ? err : errno;
            ::close(fd);
            return -1;
        }
        ::fcntl(fd, F_SETFL, flags);
        return fd;
    }
    ::close(fd);
    *error_out = rc == 0 ? ETIMEDOUT : errno;
    return -1;
}

} // namespace

int PollTimeoutMillis(std::chrono::milliseconds timeout) {
    return static_cast<int>(std::min<std::chrono::milliseconds::rep>(
        std::max<std::chrono::milliseconds::rep>(timeout.count(), 0), INT_MAX));
}

core::Result<void> StreamFactory::Probe(const endpoints::Endpoint& endpoint) {
    auto opened = Open(endpoint);
    if (!opened.ok()) {
        return core::Result<void>::error(opened.error(), opened.code());
    }
    opened.value()->Close();
    return core::Result<void>();
}

TcpStream::TcpStream(int fd, std::chrono::milliseconds timeout, size_t buffer_size)
    : fd_(fd), timeout_(timeout), buffer_(buffer_size) {}

TcpStream::~TcpStream() {
    Close();
    ::close(fd_);
}

ReceiveResult TcpStream::Receive() {
    if (closed_.load()) {
        return ReceiveResult::EndOfStream();
    }

    pollfd pfd{fd_, POLLIN, 0};
    int rc;
    do {
        rc = ::poll(&pfd, 1, PollTimeoutMillis(timeout_));
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        return ReceiveResult::Error("poll failed: " + ErrnoText(errno));
    }
    if (rc == 0) {
        STREAMSTATS_DEBUG("No data for {}ms, ending stream", timeout_.count());
        return ReceiveResult::EndOfStream();
    }

    ssize_t n;
    do {
        n = ::recv(fd_, buffer_.data(), buffer_.size(), 0);
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        return ReceiveResult::Data(static_cast<size_t>(n));
    }
    if (n == 0 || closed_.load()) {
        return ReceiveResult::EndOfStream();
    }
    return ReceiveResult::Error("recv failed: " + ErrnoText(errno));
}

void TcpStream::Close() {
    bool expected = false;
    if (closed_.compare_exchange_strong(expected, true)) {
        // Wakes a blocked poll/recv; the descriptor itself is released by the destructor
        ::shutdown(fd_, SHUT_RDWR);
    }
}

TcpStreamFactory::TcpStreamFactory(std::chrono::milliseconds timeout, size_t buffer_size)
    : timeout_(timeout), buffer_size_(buffer_size) {}

std::optional<uint16_t> TcpStreamFactory::ResolvePort(const endpoints::Url& url) {
    if (url.port) {
        return url.port;
    }
    if (url.scheme == "rtmp") return 1935;
    if (url.scheme == "http") return 80;
    if (url.scheme == "https") return 443;
    return std::nullopt;
}

core::Result<std::unique_ptr<Stream>> TcpStreamFactory::Open(const endpoints::Endpoint& endpoint) {
    using ResultT = core::Result<std::unique_ptr<Stream>>;

    auto port = ResolvePort(endpoint.url);
    if (!port) {
        return ResultT::error("No port given for scheme '" + endpoint.url.scheme + "' in " +
                              endpoint.ToString(), core::Error::Code::INVALID_ARGUMENT);
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    std::string service = std::to_string(*port);
    int gai = ::getaddrinfo(endpoint.url.host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0 || res == nullptr) {
        return ResultT::error("Failed to resolve " + endpoint.url.host + ": " + ::gai_strerror(gai),
                              core::Error::Code::UNAVAILABLE);
    }

    int fd = -1;
    int last_error = 0;
    for (const addrinfo* ai = res; ai != nullptr && fd < 0; ai = ai->ai_next) {
        fd = ConnectWithTimeout(ai, PollTimeoutMillis(timeout_), &last_error);
    }
    ::freeaddrinfo(res);

    if (fd < 0) {
        auto code = last_error == ETIMEDOUT ? core::Error::Code::TIMEOUT : core::Error::Code::UNAVAILABLE;
        return ResultT::error("Failed to connect to " + endpoint.ConnectTarget() + ": " + ErrnoText(last_error),
                              code);
    }

    STREAMSTATS_DEBUG("Connected to {} (stream {})", endpoint.ConnectTarget(), endpoint.stream_name);
    return ResultT(std::make_unique<TcpStream>(fd, timeout_, buffer_size_));
}

} // namespace stream
} // namespace streamstats
