#include "streamstats/counters/counters.h"

#include <limits>

namespace streamstats {
namespace counters {

CumulativeCounter::CumulativeCounter(uint64_t initial)
    : value_(initial), previous_(initial) {}

CumulativeCounter::Delta CumulativeCounter::ComputeDelta(core::Duration elapsed) {
    std::lock_guard<std::mutex> lock(mutex_);
    Delta result;
    result.value = value_.load(std::memory_order_relaxed);

    if (result.value >= previous_) {
        result.delta = result.value - previous_;
    } else {
        // Wrapped past the maximum since the previous read
        result.delta = (std::numeric_limits<uint64_t>::max() - previous_) + result.value + 1;
    }
    previous_ = result.value;

    double seconds = core::ToSeconds(elapsed);
    if (seconds > 0.0) {
        result.rate_per_second = static_cast<double>(result.delta) / seconds;
    }
    return result;
}

void AveragingCounter::Add(double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++count_;
    sum_ += value;
}

double AveragingCounter::ComputeAverage() {
    std::lock_guard<std::mutex> lock(mutex_);
    double average = count_ == 0 ? 0.0 : sum_ / static_cast<double>(count_);
    count_ = 0;
    sum_ = 0.0;
    return average;
}

} // namespace counters
} // namespace streamstats
