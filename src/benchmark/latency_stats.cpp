#include <faultline/benchmark/latency_stats.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace faultline::benchmark {

namespace {

double nearestRank(const std::vector<double>& sorted, double p) {
    auto rank = static_cast<std::size_t>(std::ceil(p * static_cast<double>(sorted.size())));
    if (rank == 0)
        rank = 1;
    return sorted[std::min(rank, sorted.size()) - 1];
}

} // namespace

LatencyStats computeLatencyStats(std::vector<double> samples) {
    LatencyStats stats;
    if (samples.empty())
        return stats;
    std::sort(samples.begin(), samples.end());
    stats.count = samples.size();
    stats.mean = std::accumulate(samples.begin(), samples.end(), 0.0) /
                 static_cast<double>(samples.size());
    stats.p50 = nearestRank(samples, 0.50);
    stats.p95 = nearestRank(samples, 0.95);
    stats.max = samples.back();
    return stats;
}

} // namespace faultline::benchmark
