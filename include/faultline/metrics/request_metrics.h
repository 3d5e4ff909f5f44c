#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace faultline::metrics {

enum class RequestCategory { Mongo = 0, Cassandra = 1, General = 2 };

inline constexpr std::array<RequestCategory, 3> kAllCategories{
    RequestCategory::Mongo, RequestCategory::Cassandra, RequestCategory::General};

constexpr const char* categoryName(RequestCategory c) {
    switch (c) {
        case RequestCategory::Mongo: return "mongo";
        case RequestCategory::Cassandra: return "cassandra";
        case RequestCategory::General: return "general";
    }
    return "general";
}

std::optional<RequestCategory> categoryFromString(std::string_view name);

// Category of an API path: /api/mongo... and /api/cassandra... are per-store
RequestCategory categorize(std::string_view path);

struct RequestStats {
    // Requests observed since the previous read
    std::uint64_t throughput = 0;
    // Mean handling time in seconds
    double avgLatency = 0.0;
};

/**
 * @brief Lock-free request counters, reset on read.
 */
class RequestMetrics {
public:
    void record(RequestCategory category, std::chrono::nanoseconds elapsed) noexcept;

    // Returns the counters accumulated since the last call and zeroes them
    RequestStats snapshotAndReset(RequestCategory category) noexcept;
    // Same counters without resetting them
    RequestStats peek(RequestCategory category) const noexcept;

private:
    struct Counter {
        std::atomic<std::uint64_t> count{0};
        std::atomic<std::uint64_t> totalNanos{0};
    };
    std::array<Counter, 3> counters_;
};

} // namespace faultline::metrics
