#ifndef STREAMSTATS_COUNTERS_COUNTERS_H_
#define STREAMSTATS_COUNTERS_COUNTERS_H_

#include <atomic>
#include <cstdint>
#include <mutex>

#include "streamstats/core/duration.h"

namespace streamstats {
namespace counters {

/**
 * @brief Gauge that moves in both directions (open connections, pixels).
 */
class BidirectionalCounter {
public:
    void Add(int64_t delta) { value_.fetch_add(delta, std::memory_order_relaxed); }
    int64_t Get() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<int64_t> value_{0};
};

/**
 * @brief Monotonic 64-bit counter with wrap-aware deltas.
 *
 * Many writers call Add() concurrently. A single reader calls ComputeDelta()
 * once per emission tick; it returns the value, the amount added since the
 * previous call and the rate over the given interval. The underlying value is
 * unsigned and may wrap; a wrap between two reads still yields the exact sum
 * of adds as long as fewer than 2^64 units were added in between.
 */
class CumulativeCounter {
public:
    struct Delta {
        uint64_t value = 0;
        uint64_t delta = 0;
        double rate_per_second = 0.0;
    };

    CumulativeCounter() = default;
    // Seeds both the value and the previous reference, used to exercise wrap-around
    explicit CumulativeCounter(uint64_t initial);

    CumulativeCounter(const CumulativeCounter&) = delete;
    CumulativeCounter& operator=(const CumulativeCounter&) = delete;

    void Add(uint64_t delta) { value_.fetch_add(delta, std::memory_order_relaxed); }
    uint64_t Get() const { return value_.load(std::memory_order_relaxed); }

    // Non-positive elapsed intervals give a rate of 0
    Delta ComputeDelta(core::Duration elapsed);

private:
    std::atomic<uint64_t> value_{0};
    std::mutex mutex_;
    uint64_t previous_ = 0;
};

/**
 * @brief Accumulates samples and returns their mean, resetting on read.
 */
class AveragingCounter {
public:
    void Add(double value);

    // 0 when nothing was added since the previous call
    double ComputeAverage();

private:
    std::mutex mutex_;
    uint64_t count_ = 0;
    double sum_ = 0.0;
};

} // namespace counters
} // namespace streamstats

#endif // STREAMSTATS_COUNTERS_COUNTERS_H_
