#pragma once

#include <cstddef>
#include <vector>

namespace faultline::benchmark {

struct LatencyStats {
    std::size_t count = 0;
    double mean = 0.0;
    double p50 = 0.0;
    double p95 = 0.0;
    double max = 0.0;
};

// Nearest-rank percentiles; all zero for an empty series
LatencyStats computeLatencyStats(std::vector<double> samples);

} // namespace faultline::benchmark
