#ifndef STREAMSTATS_COLLECTOR_STREAM_WORKER_H_
#define STREAMSTATS_COLLECTOR_STREAM_WORKER_H_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "streamstats/collector/statistics.h"
#include "streamstats/core/duration.h"
#include "streamstats/distribution/distribution.h"
#include "streamstats/endpoints/endpoint_registry.h"
#include "streamstats/stream/stream.h"

namespace streamstats {
namespace collector {

enum class WorkerState {
    IDLE,
    DELAYING,
    OPENING,
    STREAMING,
    CLOSING,
    STOPPED
};

const char* WorkerStateName(WorkerState state);

/**
 * @brief Everything a worker borrows from its collector. All pointers must
 * outlive the worker.
 */
struct WorkerContext {
    endpoints::EndpointRegistry* registry = nullptr;
    stream::StreamFactory* factory = nullptr;
    distribution::DistributionSampler* restart_delay = nullptr;
    CollectorStatistics* statistics = nullptr;
    core::Duration no_endpoints_backoff = std::chrono::seconds(5);
};

/**
 * @brief Runs one stream at a time on its own thread until stopped.
 *
 * Each cycle sleeps a sampled restart delay, selects an endpoint, opens a
 * stream and receives from it until the stream ends. RequestStop() wakes any
 * sleep and closes the current stream; no counter is touched for a stream
 * interrupted that way.
 */
class StreamWorker {
public:
    StreamWorker(uint64_t id, WorkerContext context);
    ~StreamWorker();

    StreamWorker(const StreamWorker&) = delete;
    StreamWorker& operator=(const StreamWorker&) = delete;

    void Start();

    // Non-blocking, safe to call from any thread and more than once
    void RequestStop();

    // Waits for the worker thread to exit
    void Join();

    void Stop() {
        RequestStop();
        Join();
    }

    uint64_t id() const { return id_; }
    WorkerState state() const { return state_.load(); }
    bool stopping() const { return stopping_.load(); }

private:
    void Run();
    void RunCycle();
    void ReceiveLoop(const endpoints::Endpoint& endpoint, stream::Stream& handle);

    // Returns false when the wait was cut short by RequestStop()
    bool WaitFor(core::Duration duration);

    uint64_t id_;
    WorkerContext context_;

    std::thread thread_;
    std::atomic<bool> stopping_{false};
    std::atomic<WorkerState> state_{WorkerState::IDLE};

    std::mutex mutex_;
    std::condition_variable cv_;
    std::shared_ptr<stream::Stream> current_;
};

} // namespace collector
} // namespace streamstats

#endif // STREAMSTATS_COLLECTOR_STREAM_WORKER_H_
