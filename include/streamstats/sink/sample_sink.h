#ifndef STREAMSTATS_SINK_SAMPLE_SINK_H_
#define STREAMSTATS_SINK_SAMPLE_SINK_H_

#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include "streamstats/core/config.h"
#include "streamstats/core/result.h"
#include "streamstats/sink/sample.h"

namespace streamstats {
namespace sink {

/**
 * @brief Destination for emitted samples.
 */
class SampleSink {
public:
    virtual ~SampleSink() = default;

    virtual core::Result<void> Write(const Sample& sample) = 0;
};

/**
 * @brief Writes a header line once, then "time,<values...>" per sample.
 *
 * The header is repeated whenever the field names change. Non-finite values
 * are written as NaN.
 */
class CsvSampleSink : public SampleSink {
public:
    // The stream must outlive the sink
    explicit CsvSampleSink(std::ostream& out);
    // Owns the file stream
    explicit CsvSampleSink(std::unique_ptr<std::ostream> out);

    core::Result<void> Write(const Sample& sample) override;

private:
    std::unique_ptr<std::ostream> owned_;
    std::ostream& out_;
    std::mutex mutex_;
    std::vector<std::string> header_;
};

/**
 * @brief Writes one JSON object per sample and line: {"time": "...", "<field>": value, ...}.
 *
 * Non-finite values are written as null.
 */
class JsonLinesSampleSink : public SampleSink {
public:
    explicit JsonLinesSampleSink(std::ostream& out);
    explicit JsonLinesSampleSink(std::unique_ptr<std::ostream> out);

    core::Result<void> Write(const Sample& sample) override;

private:
    std::unique_ptr<std::ostream> owned_;
    std::ostream& out_;
    std::mutex mutex_;
};

// RFC 3339 UTC timestamp with millisecond precision
std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

/**
 * @brief Create the sink described by config, opening the output file when
 * the path is not "-".
 */
core::Result<std::unique_ptr<SampleSink>> MakeSampleSink(const core::SinkConfig& config);

} // namespace sink
} // namespace streamstats

#endif // STREAMSTATS_SINK_SAMPLE_SINK_H_
