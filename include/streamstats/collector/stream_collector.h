#ifndef STREAMSTATS_COLLECTOR_STREAM_COLLECTOR_H_
#define STREAMSTATS_COLLECTOR_STREAM_COLLECTOR_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "streamstats/collector/statistics.h"
#include "streamstats/collector/stream_worker.h"
#include "streamstats/core/config.h"
#include "streamstats/sink/sample_sink.h"

namespace streamstats {
namespace collector {

// Upper bound for the pool size accepted from the command line and the control API
constexpr int64_t kMaxPoolSize = 1000000;

struct ResizeResult {
    int64_t previous = 0;
    int64_t current = 0;
};

/**
 * @brief Owns the pool of stream workers and the periodic sample emitter.
 *
 * Resize() returns once the pool holds exactly max(target, 0) workers:
 * excess workers are stopped and joined before it returns. Calls are
 * serialized. After Stop() the pool stays empty and Resize() is a no-op.
 */
class StreamCollector {
public:
    StreamCollector(const core::CollectorConfig& config,
                    endpoints::EndpointRegistry& registry,
                    stream::StreamFactory& factory,
                    distribution::DistributionSampler& restart_delay,
                    sink::SampleSink* sink);
    ~StreamCollector();

    StreamCollector(const StreamCollector&) = delete;
    StreamCollector& operator=(const StreamCollector&) = delete;

    // Starts the emitter (when a sink is set) and grows the pool to initial_size
    void Start(int64_t initial_size);

    ResizeResult Resize(int64_t target);

    void Stop();

    int64_t Size() const { return size_.load(); }
    bool stopped() const { return stopped_.load(); }

    CollectorStatistics& statistics() { return statistics_; }

    /**
     * @brief Read every counter and build one sample.
     *
     * Called by the emitter once per interval with the time since the previous
     * call. Cumulative counters are reset to their current value, so calling
     * this outside the emitter steals deltas from the next emitted sample.
     */
    sink::Sample CollectSample(core::Duration elapsed);

    static const std::vector<std::string>& FieldNames();

private:
    ResizeResult ResizeLocked(int64_t target, bool allow_growth);
    void EmitterLoop();

    core::CollectorConfig config_;
    WorkerContext context_;
    sink::SampleSink* sink_;
    CollectorStatistics statistics_;

    std::mutex resize_mutex_;
    std::vector<std::unique_ptr<StreamWorker>> workers_;
    uint64_t next_worker_id_ = 0;
    std::atomic<int64_t> size_{0};
    std::atomic<bool> stopped_{false};

    std::thread emitter_;
    std::mutex emitter_mutex_;
    std::condition_variable emitter_cv_;
    bool emitter_running_ = false;
};

} // namespace collector
} // namespace streamstats

#endif // STREAMSTATS_COLLECTOR_STREAM_COLLECTOR_H_
