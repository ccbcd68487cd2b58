#pragma once

#include "streamstats/counters/counters.h"

namespace streamstats {
namespace collector {

/**
 * @brief Counters shared by every worker of one collector.
 */
struct CollectorStatistics {
    // Gauges
    counters::BidirectionalCounter open_connections;
    counters::BidirectionalCounter receiving_connections;
    counters::BidirectionalCounter pixels;

    // Totals
    counters::CumulativeCounter opened;
    counters::CumulativeCounter closed;
    counters::CumulativeCounter errors;
    counters::CumulativeCounter bytes;
    counters::CumulativeCounter packets;

    // Seconds between consecutive packets of one stream
    counters::AveragingCounter packet_delay;
};

} // namespace collector
} // namespace streamstats
