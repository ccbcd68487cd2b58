#include "streamstats/collector/stream_worker.h"

#include <optional>
#include <stdexcept>

#include "streamstats/common/logger.h"

namespace streamstats {
namespace collector {

namespace {

// Waits longer than this are treated as unbounded so that now() + duration cannot overflow
constexpr core::Duration kUnboundedWait = std::chrono::hours(24 * 365);

// Adds to a gauge on construction and takes it back on destruction
class ScopedGauge {
public:
    ScopedGauge(counters::BidirectionalCounter& gauge, int64_t amount)
        : gauge_(gauge), amount_(amount) {
        gauge_.Add(amount_);
    }
    ~ScopedGauge() { gauge_.Add(-amount_); }

    ScopedGauge(const ScopedGauge&) = delete;
    ScopedGauge& operator=(const ScopedGauge&) = delete;

private:
    counters::BidirectionalCounter& gauge_;
    int64_t amount_;
};

} // namespace

const char* WorkerStateName(WorkerState state) {
    switch (state) {
        case WorkerState::IDLE: return "idle";
        case WorkerState::DELAYING: return "delaying";
        case WorkerState::OPENING: return "opening";
        case WorkerState::STREAMING: return "streaming";
        case WorkerState::CLOSING: return "closing";
        case WorkerState::STOPPED: return "stopped";
    }
    return "unknown";
}

StreamWorker::StreamWorker(uint64_t id, WorkerContext context)
    : id_(id), context_(context) {
    if (!context_.registry || !context_.factory || !context_.restart_delay || !context_.statistics) {
        throw std::invalid_argument("StreamWorker requires registry, factory, sampler and statistics");
    }
}

StreamWorker::~StreamWorker() {
    Stop();
}

void StreamWorker::Start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::thread(&StreamWorker::Run, this);
}

void StreamWorker::RequestStop() {
    std::shared_ptr<stream::Stream> handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        handle = current_;
    }
    cv_.notify_all();
    if (handle) {
        handle->Close();
    }
}

void StreamWorker::Join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool StreamWorker::WaitFor(core::Duration duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto stop_requested = [this] { return stopping_.load(); };
    if (duration >= kUnboundedWait) {
        cv_.wait(lock, stop_requested);
    } else if (duration > core::Duration::zero()) {
        cv_.wait_for(lock, duration, stop_requested);
    }
    return !stopping_.load();
}

void StreamWorker::Run() {
    STREAMSTATS_DEBUG("Stream worker {} started", id_);
    while (!stopping_.load()) {
        try {
            RunCycle();
        } catch (const std::exception& e) {
            context_.statistics->errors.Add(1);
            STREAMSTATS_ERROR("Stream worker {} failed: {}", id_, e.what());
        }
    }
    state_ = WorkerState::STOPPED;
    STREAMSTATS_DEBUG("Stream worker {} stopped", id_);
}

void StreamWorker::RunCycle() {
    state_ = WorkerState::DELAYING;
    if (!WaitFor(context_.restart_delay->Sample())) {
        return;
    }

    auto selected = context_.registry->SelectNext();
    if (!selected.ok()) {
        STREAMSTATS_INFO("{}, sleeping for {}...", selected.error(),
                         core::FormatDuration(context_.no_endpoints_backoff));
        WaitFor(context_.no_endpoints_backoff);
        return;
    }
    const endpoints::Endpoint endpoint = selected.take_value();

    state_ = WorkerState::OPENING;
    auto opened = context_.factory->Open(endpoint);
    if (stopping_.load()) {
        if (opened.ok()) {
            opened.value()->Close();
        }
        return;
    }
    if (!opened.ok()) {
        context_.statistics->errors.Add(1);
        STREAMSTATS_ERROR("Error opening stream {}: {}", endpoint.ToString(), opened.error());
        return;
    }

    std::shared_ptr<stream::Stream> handle(opened.take_value());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = handle;
    }
    // A stop between Open() and publishing current_ would otherwise miss this stream
    if (stopping_.load()) {
        handle->Close();
    }

    state_ = WorkerState::STREAMING;
    ReceiveLoop(endpoint, *handle);

    state_ = WorkerState::CLOSING;
    handle->Close();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_.reset();
    }
}

void StreamWorker::ReceiveLoop(const endpoints::Endpoint& endpoint, stream::Stream& handle) {
    CollectorStatistics& stats = *context_.statistics;

    stats.opened.Add(1);
    ScopedGauge open_gauge(stats.open_connections, 1);

    std::optional<ScopedGauge> receiving_gauge;
    std::optional<ScopedGauge> pixels_gauge;
    std::chrono::steady_clock::time_point previous_packet;

    while (true) {
        stream::ReceiveResult received = handle.Receive();
        if (stopping_.load()) {
            return;
        }

        switch (received.status) {
            case stream::ReceiveStatus::DATA: {
                if (received.bytes == 0) {
                    break;
                }
                stats.bytes.Add(received.bytes);
                stats.packets.Add(1);
                auto now = std::chrono::steady_clock::now();
                if (!receiving_gauge) {
                    receiving_gauge.emplace(stats.receiving_connections, 1);
                    if (endpoint.pixels) {
                        pixels_gauge.emplace(stats.pixels, *endpoint.pixels);
                    }
                } else {
                    stats.packet_delay.Add(
                        core::ToSeconds(std::chrono::duration_cast<core::Duration>(now - previous_packet)));
                }
                previous_packet = now;
                break;
            }
            case stream::ReceiveStatus::END_OF_STREAM:
                stats.closed.Add(1);
                STREAMSTATS_DEBUG("Stream {} ended", endpoint.ToString());
                return;
            case stream::ReceiveStatus::ERROR:
                stats.errors.Add(1);
                stats.closed.Add(1);
                STREAMSTATS_ERROR("Error reading from stream {}: {}", endpoint.ToString(), received.error);
                return;
        }
    }
}

} // namespace collector
} // namespace streamstats
