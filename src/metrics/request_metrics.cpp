#include <faultline/metrics/request_metrics.h>

namespace faultline::metrics {

std::optional<RequestCategory> categoryFromString(std::string_view name) {
    for (auto c : kAllCategories) {
        if (name == categoryName(c))
            return c;
    }
    return std::nullopt;
}

RequestCategory categorize(std::string_view path) {
    constexpr std::string_view kMongo = "/api/mongo";
    constexpr std::string_view kCassandra = "/api/cassandra";
    if (path.substr(0, kMongo.size()) == kMongo)
        return RequestCategory::Mongo;
    if (path.substr(0, kCassandra.size()) == kCassandra)
        return RequestCategory::Cassandra;
    return RequestCategory::General;
}

void RequestMetrics::record(RequestCategory category, std::chrono::nanoseconds elapsed) noexcept {
    auto& c = counters_[static_cast<std::size_t>(category)];
    c.count.fetch_add(1, std::memory_order_relaxed);
    c.totalNanos.fetch_add(static_cast<std::uint64_t>(elapsed.count() > 0 ? elapsed.count() : 0),
                           std::memory_order_relaxed);
}

namespace {

RequestStats toStats(std::uint64_t count, std::uint64_t nanos) noexcept {
    RequestStats stats;
    stats.throughput = count;
    stats.avgLatency = count > 0 ? static_cast<double>(nanos) / 1e9 / static_cast<double>(count)
                                 : 0.0;
    return stats;
}

} // namespace

RequestStats RequestMetrics::snapshotAndReset(RequestCategory category) noexcept {
    auto& c = counters_[static_cast<std::size_t>(category)];
    const auto count = c.count.exchange(0, std::memory_order_acq_rel);
    const auto nanos = c.totalNanos.exchange(0, std::memory_order_acq_rel);
    return toStats(count, nanos);
}

RequestStats RequestMetrics::peek(RequestCategory category) const noexcept {
    const auto& c = counters_[static_cast<std::size_t>(category)];
    return toStats(c.count.load(std::memory_order_acquire),
                   c.totalNanos.load(std::memory_order_acquire));
}

} // namespace faultline::metrics
