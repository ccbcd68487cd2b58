#ifndef STREAMSTATS_SINK_SAMPLE_H_
#define STREAMSTATS_SINK_SAMPLE_H_

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace streamstats {
namespace sink {

/**
 * @brief One emitted statistics record: a timestamp and ordered named values.
 *
 * Values may be NaN when a ratio has a zero denominator.
 */
struct Sample {
    std::chrono::system_clock::time_point timestamp;
    std::vector<std::pair<std::string, double>> fields;

    // NaN when the field is absent
    double Get(const std::string& name) const;
};

} // namespace sink
} // namespace streamstats

#endif // STREAMSTATS_SINK_SAMPLE_H_
