#include "streamstats/distribution/distribution.h"

#include <cmath>
#include <type_traits>
#include <vector>

#include "streamstats/common/logger.h"

namespace streamstats {
namespace distribution {

namespace {

const char* kFormatHelp =
    "Invalid random argument format. Please use format [const|equal|norm]:[param1,param2,...]. Reason: ";

core::Result<Distribution> FormatError(const std::string& reason) {
    return core::Result<Distribution>::error(kFormatHelp + reason, core::Error::Code::INVALID_ARGUMENT);
}

std::vector<std::string> Split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t end = s.find(sep, start);
        if (end == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

std::string Trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

} // namespace

bool operator==(const ConstDistribution& a, const ConstDistribution& b) {
    return a.value == b.value;
}

bool operator==(const UniformDistribution& a, const UniformDistribution& b) {
    return a.min == b.min && a.max == b.max;
}

bool operator==(const NormalDistribution& a, const NormalDistribution& b) {
    return a.mean == b.mean && a.stddev == b.stddev;
}

core::Result<Distribution> ParseDistribution(const std::string& spec) {
    if (spec.empty() || spec.find(':') == std::string::npos) {
        return FormatError("Distribution type and parameters must be divided by ':'.");
    }
    auto type_and_params = Split(spec, ':');
    if (type_and_params.size() != 2) {
        return FormatError("Expected exactly one ':' between distribution type and parameters.");
    }
    const std::string kind = Trim(type_and_params[0]);
    auto raw_params = Split(type_and_params[1], ',');

    std::vector<core::Duration> params;
    auto parse_params = [&](size_t expected) -> core::Result<void> {
        if (raw_params.size() != expected) {
            return core::Result<void>::error(
                "Distribution '" + kind + "' expects exactly " + std::to_string(expected) +
                " parameter(s) but got " + std::to_string(raw_params.size()) + ".",
                core::Error::Code::INVALID_ARGUMENT);
        }
        for (const auto& raw : raw_params) {
            auto parsed = core::ParseNonNegativeDuration(Trim(raw));
            if (!parsed.ok()) {
                return core::Result<void>::error(parsed.error(), core::Error::Code::INVALID_ARGUMENT);
            }
            params.push_back(parsed.value());
        }
        return core::Result<void>();
    };

    if (kind == "const") {
        auto res = parse_params(1);
        if (!res.ok()) return FormatError(res.error());
        return core::Result<Distribution>(Distribution(ConstDistribution{params[0]}));
    }
    if (kind == "equal") {
        auto res = parse_params(2);
        if (!res.ok()) return FormatError(res.error());
        if (params[0] > params[1]) {
            return FormatError("Minimum " + core::FormatDuration(params[0]) + " is greater than maximum " +
                               core::FormatDuration(params[1]) + ".");
        }
        return core::Result<Distribution>(Distribution(UniformDistribution{params[0], params[1]}));
    }
    if (kind == "norm") {
        auto res = parse_params(2);
        if (!res.ok()) return FormatError(res.error());
        return core::Result<Distribution>(Distribution(NormalDistribution{params[0], params[1]}));
    }
    return FormatError("Unknown distribution type identifier '" + kind + "'.");
}

std::string DescribeDistribution(const Distribution& distribution) {
    return std::visit([](const auto& d) -> std::string {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, ConstDistribution>) {
            return "Constant value: " + core::FormatDuration(d.value) + ".";
        } else if constexpr (std::is_same_v<T, UniformDistribution>) {
            return "Equal distribution between " + core::FormatDuration(d.min) + " and " +
                   core::FormatDuration(d.max) + ".";
        } else {
            return "Normal distribution with mean " + core::FormatDuration(d.mean) +
                   " and standard deviation " + core::FormatDuration(d.stddev) + ".";
        }
    }, distribution);
}

DistributionSampler::DistributionSampler()
    : DistributionSampler(Distribution(ConstDistribution{core::Duration::zero()})) {}

DistributionSampler::DistributionSampler(Distribution distribution)
    : DistributionSampler(std::move(distribution), std::random_device{}()) {}

DistributionSampler::DistributionSampler(Distribution distribution, uint64_t seed)
    : distribution_(std::move(distribution)), rng_(seed) {}

core::Result<void> DistributionSampler::Set(const std::string& spec) {
    auto parsed = ParseDistribution(spec);
    if (!parsed.ok()) {
        return core::Result<void>::error(parsed.error(), parsed.code());
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        distribution_ = parsed.take_value();
    }
    STREAMSTATS_INFO("Successfully parsed distribution parameter {}. Result: {}", spec, ToString());
    return core::Result<void>();
}

core::Duration DistributionSampler::Sample() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::visit([this](const auto& d) -> core::Duration {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, ConstDistribution>) {
            return d.value;
        } else if constexpr (std::is_same_v<T, UniformDistribution>) {
            if (d.min == d.max) {
                return d.min;
            }
            std::uniform_int_distribution<int64_t> uniform(d.min.count(), d.max.count());
            return core::Duration(uniform(rng_));
        } else {
            if (d.stddev.count() == 0) {
                return d.mean;
            }
            std::normal_distribution<double> normal(static_cast<double>(d.mean.count()),
                                                    static_cast<double>(d.stddev.count()));
            double value = std::round(normal(rng_));
            if (value <= 0.0) {
                return core::Duration::zero();
            }
            if (value >= static_cast<double>(core::Duration::max().count())) {
                return core::Duration::max();
            }
            return core::Duration(static_cast<int64_t>(value));
        }
    }, distribution_);
}

Distribution DistributionSampler::distribution() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return distribution_;
}

std::string DistributionSampler::ToString() const {
    return DescribeDistribution(distribution());
}

} // namespace distribution
} // namespace streamstats
