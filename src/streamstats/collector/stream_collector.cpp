#include "streamstats/collector/stream_collector.h"

#include <limits>
#include <stdexcept>

#include "streamstats/common/logger.h"

namespace streamstats {
namespace collector {

namespace {

double Ratio(double numerator, double denominator) {
    if (denominator == 0.0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return numerator / denominator;
}

} // namespace

StreamCollector::StreamCollector(const core::CollectorConfig& config,
                                 endpoints::EndpointRegistry& registry,
                                 stream::StreamFactory& factory,
                                 distribution::DistributionSampler& restart_delay,
                                 sink::SampleSink* sink)
    : config_(config), sink_(sink) {
    auto valid = config_.Validate();
    if (!valid.ok()) {
        throw core::InvalidArgumentError(valid.error());
    }
    context_.registry = &registry;
    context_.factory = &factory;
    context_.restart_delay = &restart_delay;
    context_.statistics = &statistics_;
    context_.no_endpoints_backoff = config_.no_endpoints_backoff;
}

StreamCollector::~StreamCollector() {
    Stop();
}

const std::vector<std::string>& StreamCollector::FieldNames() {
    static const std::vector<std::string> names = {
        "streams", "openConnections", "receivingConnections",
        "opened", "closed", "errors", "bytes", "packets",
        "opened/s", "closed/s", "errors/s", "bytes/s", "packets/s",
        "packetDelay",
        "pixels", "bytes/pixel", "packets/pixel",
        "bytes/connection", "packets/connection",
    };
    return names;
}

void StreamCollector::Start(int64_t initial_size) {
    if (stopped_.load()) {
        STREAMSTATS_WARN("Stream collector already stopped, not starting");
        return;
    }
    if (sink_ != nullptr) {
        std::lock_guard<std::mutex> lock(emitter_mutex_);
        if (!emitter_running_ && !stopped_.load()) {
            emitter_running_ = true;
            emitter_ = std::thread(&StreamCollector::EmitterLoop, this);
        }
    }
    Resize(initial_size);
}

ResizeResult StreamCollector::Resize(int64_t target) {
    std::lock_guard<std::mutex> lock(resize_mutex_);
    if (stopped_.load()) {
        int64_t size = size_.load();
        return ResizeResult{size, size};
    }
    return ResizeLocked(target, true);
}

ResizeResult StreamCollector::ResizeLocked(int64_t target, bool allow_growth) {
    if (target < 0) {
        target = 0;
    }
    ResizeResult result;
    result.previous = static_cast<int64_t>(workers_.size());

    if (target < result.previous) {
        size_t keep = static_cast<size_t>(target);
        STREAMSTATS_INFO("Stopping {} stream(s), new number of streams: {}", result.previous - target, target);
        // Signal everyone first so that the joins below overlap
        for (size_t i = keep; i < workers_.size(); ++i) {
            workers_[i]->RequestStop();
        }
        for (size_t i = keep; i < workers_.size(); ++i) {
            workers_[i]->Join();
        }
        workers_.resize(keep);
    } else if (target > result.previous && allow_growth) {
        STREAMSTATS_INFO("Starting {} new stream(s), new number of streams: {}", target - result.previous, target);
        try {
            workers_.reserve(static_cast<size_t>(target));
            while (static_cast<int64_t>(workers_.size()) < target) {
                auto worker = std::make_unique<StreamWorker>(next_worker_id_++, context_);
                worker->Start();
                workers_.push_back(std::move(worker));
            }
        } catch (const std::exception& e) {
            // Keep the workers that did start, size_ below reflects them
            STREAMSTATS_ERROR("Failed to grow stream pool to {}: {}, running {} stream(s)", target, e.what(),
                              workers_.size());
        }
    }

    result.current = static_cast<int64_t>(workers_.size());
    size_ = result.current;
    return result;
}

void StreamCollector::Stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(resize_mutex_);
        ResizeLocked(0, false);
    }
    {
        std::lock_guard<std::mutex> lock(emitter_mutex_);
        emitter_running_ = false;
    }
    emitter_cv_.notify_all();
    if (emitter_.joinable()) {
        emitter_.join();
    }
    STREAMSTATS_DEBUG("Stream collector stopped");
}

sink::Sample StreamCollector::CollectSample(core::Duration elapsed) {
    auto opened = statistics_.opened.ComputeDelta(elapsed);
    auto closed = statistics_.closed.ComputeDelta(elapsed);
    auto errors = statistics_.errors.ComputeDelta(elapsed);
    auto bytes = statistics_.bytes.ComputeDelta(elapsed);
    auto packets = statistics_.packets.ComputeDelta(elapsed);
    double packet_delay = statistics_.packet_delay.ComputeAverage();
    double pixels = static_cast<double>(statistics_.pixels.Get());
    double receiving = static_cast<double>(statistics_.receiving_connections.Get());

    sink::Sample sample;
    sample.timestamp = std::chrono::system_clock::now();
    const std::vector<double> values = {
        static_cast<double>(Size()),
        static_cast<double>(statistics_.open_connections.Get()),
        receiving,
        static_cast<double>(opened.value),
        static_cast<double>(closed.value),
        static_cast<double>(errors.value),
        static_cast<double>(bytes.value),
        static_cast<double>(packets.value),
        opened.rate_per_second,
        closed.rate_per_second,
        errors.rate_per_second,
        bytes.rate_per_second,
        packets.rate_per_second,
        packet_delay,
        pixels,
        Ratio(bytes.rate_per_second, pixels),
        Ratio(packets.rate_per_second, pixels),
        Ratio(bytes.rate_per_second, receiving),
        Ratio(packets.rate_per_second, receiving),
    };

    const auto& names = FieldNames();
    sample.fields.reserve(names.size());
    for (size_t i = 0; i < names.size(); ++i) {
        sample.fields.emplace_back(names[i], values[i]);
    }
    return sample;
}

void StreamCollector::EmitterLoop() {
    auto previous = std::chrono::steady_clock::now();
    std::unique_lock<std::mutex> lock(emitter_mutex_);
    while (emitter_running_) {
        if (emitter_cv_.wait_for(lock, config_.sink_interval, [this] { return !emitter_running_; })) {
            break;
        }
        lock.unlock();

        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<core::Duration>(now - previous);
        previous = now;

        sink::Sample sample = CollectSample(elapsed);
        auto written = sink_->Write(sample);
        if (!written.ok()) {
            STREAMSTATS_ERROR("Failed to sink stream statistics: {}", written.error());
        }

        lock.lock();
    }
}

} // namespace collector
} // namespace streamstats
