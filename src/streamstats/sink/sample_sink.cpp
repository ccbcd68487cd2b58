#include "streamstats/sink/sample_sink.h"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "streamstats/common/logger.h"

namespace streamstats {
namespace sink {

double Sample::Get(const std::string& name) const {
    for (const auto& field : fields) {
        if (field.first == name) {
            return field.second;
        }
    }
    return std::numeric_limits<double>::quiet_NaN();
}

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    if (millis < 0) millis += 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    std::ostringstream out;
    out << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}

namespace {

void WriteCsvValue(std::ostream& out, double value) {
    if (!std::isfinite(value)) {
        out << "NaN";
        return;
    }
    std::ostringstream formatted;
    formatted << std::setprecision(15) << value;
    out << formatted.str();
}

} // namespace

CsvSampleSink::CsvSampleSink(std::ostream& out) : out_(out) {}

CsvSampleSink::CsvSampleSink(std::unique_ptr<std::ostream> out)
    : owned_(std::move(out)), out_(*owned_) {}

core::Result<void> CsvSampleSink::Write(const Sample& sample) {
    std::lock_guard<std::mutex> lock(mutex_);

    bool header_changed = header_.size() != sample.fields.size();
    for (size_t i = 0; !header_changed && i < sample.fields.size(); ++i) {
        header_changed = header_[i] != sample.fields[i].first;
    }
    if (header_changed) {
        header_.clear();
        out_ << "time";
        for (const auto& field : sample.fields) {
            header_.push_back(field.first);
            out_ << ',' << field.first;
        }
        out_ << '\n';
    }

    out_ << FormatTimestamp(sample.timestamp);
    for (const auto& field : sample.fields) {
        out_ << ',';
        WriteCsvValue(out_, field.second);
    }
    out_ << '\n';
    out_.flush();

    if (!out_) {
        return core::Result<void>::error("Failed to write CSV sample", core::Error::Code::UNAVAILABLE);
    }
    return core::Result<void>();
}

JsonLinesSampleSink::JsonLinesSampleSink(std::ostream& out) : out_(out) {}

JsonLinesSampleSink::JsonLinesSampleSink(std::unique_ptr<std::ostream> out)
    : owned_(std::move(out)), out_(*owned_) {}

core::Result<void> JsonLinesSampleSink::Write(const Sample& sample) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("time");
    std::string time = FormatTimestamp(sample.timestamp);
    writer.String(time.c_str(), static_cast<rapidjson::SizeType>(time.size()));
    for (const auto& field : sample.fields) {
        writer.Key(field.first.c_str(), static_cast<rapidjson::SizeType>(field.first.size()));
        if (std::isfinite(field.second)) {
            writer.Double(field.second);
        } else {
            writer.Null();
        }
    }
    writer.EndObject();

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << buffer.GetString() << '\n';
    out_.flush();
    if (!out_) {
        return core::Result<void>::error("Failed to write JSON sample", core::Error::Code::UNAVAILABLE);
    }
    return core::Result<void>();
}

core::Result<std::unique_ptr<SampleSink>> MakeSampleSink(const core::SinkConfig& config) {
    using ResultT = core::Result<std::unique_ptr<SampleSink>>;

    auto valid = config.Validate();
    if (!valid.ok()) {
        return ResultT::error(valid.error(), valid.code());
    }

    std::unique_ptr<std::ostream> file;
    if (config.path != "-") {
        auto stream = std::make_unique<std::ofstream>(config.path, std::ios::out | std::ios::app);
        if (!stream->is_open()) {
            return ResultT::error("Failed to open output file " + config.path,
                                  core::Error::Code::INVALID_ARGUMENT);
        }
        file = std::move(stream);
        STREAMSTATS_INFO("Writing {} samples to {}", config.format, config.path);
    }

    std::unique_ptr<SampleSink> sink;
    if (config.format == "json") {
        sink = file ? std::make_unique<JsonLinesSampleSink>(std::move(file))
                    : std::make_unique<JsonLinesSampleSink>(std::cout);
    } else {
        sink = file ? std::make_unique<CsvSampleSink>(std::move(file))
                    : std::make_unique<CsvSampleSink>(std::cout);
    }
    return ResultT(std::move(sink));
}

} // namespace sink
} // namespace streamstats
