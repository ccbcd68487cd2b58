#ifndef STREAMSTATS_DISTRIBUTION_DISTRIBUTION_H_
#define STREAMSTATS_DISTRIBUTION_DISTRIBUTION_H_

#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <variant>

#include "streamstats/core/duration.h"
#include "streamstats/core/result.h"

namespace streamstats {
namespace distribution {

struct ConstDistribution {
    core::Duration value{0};
};

// Uniform over [min, max]
struct UniformDistribution {
    core::Duration min{0};
    core::Duration max{0};
};

// Negative samples are clamped to zero
struct NormalDistribution {
    core::Duration mean{0};
    core::Duration stddev{0};
};

using Distribution = std::variant<ConstDistribution, UniformDistribution, NormalDistribution>;

bool operator==(const ConstDistribution& a, const ConstDistribution& b);
bool operator==(const UniformDistribution& a, const UniformDistribution& b);
bool operator==(const NormalDistribution& a, const NormalDistribution& b);

/**
 * @brief Parse "<kind>:<params>" where kind is const, equal or norm.
 *
 * Examples: "const:500ms", "equal:0ms,1s", "norm:100ms,30ms".
 * All durations must be non-negative and equal requires min <= max.
 */
core::Result<Distribution> ParseDistribution(const std::string& spec);

std::string DescribeDistribution(const Distribution& distribution);

/**
 * @brief Thread-safe sampler of restart delays.
 *
 * Workers call Sample() concurrently; Set() swaps the distribution only when
 * the new spec parses.
 */
class DistributionSampler {
public:
    DistributionSampler();
    explicit DistributionSampler(Distribution distribution);
    DistributionSampler(Distribution distribution, uint64_t seed);

    DistributionSampler(const DistributionSampler&) = delete;
    DistributionSampler& operator=(const DistributionSampler&) = delete;

    core::Result<void> Set(const std::string& spec);

    core::Duration Sample();

    Distribution distribution() const;
    std::string ToString() const;

private:
    mutable std::mutex mutex_;
    Distribution distribution_;
    std::mt19937_64 rng_;
};

} // namespace distribution
} // namespace streamstats

#endif // STREAMSTATS_DISTRIBUTION_DISTRIBUTION_H_
