#pragma once

#include <faultline/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace faultline::metrics {

// Aggregate jiffies of the "cpu" line of /proc/stat
struct CpuTimes {
    std::uint64_t idle = 0;
    std::uint64_t total = 0;
};

struct UsageTotals {
    std::uint64_t total = 0;
    std::uint64_t used = 0;
    double percent = 0.0;
};

struct NetworkCounters {
    std::uint64_t bytesSent = 0;
    std::uint64_t bytesRecv = 0;
};

struct SystemSnapshot {
    std::string timestamp;
    double cpuPercent = 0.0;
    UsageTotals memory;
    UsageTotals disk;
    NetworkCounters network;
};

std::optional<CpuTimes> parseCpuLine(std::string_view line);

// Busy share of the interval between two readings, 0 when no time passed
double cpuPercentBetween(const CpuTimes& before, const CpuTimes& after);

// Uses MemTotal and MemAvailable; used = total - available, in bytes
Result<UsageTotals> parseMeminfo(std::istream& in);

// Sums every interface of /proc/net/dev
Result<NetworkCounters> parseNetDev(std::istream& in);

/**
 * @brief Host CPU, memory, disk and network counters read from procfs.
 *
 * sample() blocks for the CPU window and must run on the worker pool.
 */
class SystemMetricsSampler {
public:
    explicit SystemMetricsSampler(std::filesystem::path procRoot = "/proc",
                                  std::filesystem::path diskPath = "/");

    Result<SystemSnapshot> sample(std::chrono::milliseconds cpuWindow) const;

private:
    Result<CpuTimes> readCpu() const;

    std::filesystem::path procRoot_;
    std::filesystem::path diskPath_;
};

nlohmann::json systemSnapshotToJson(const SystemSnapshot& snapshot);

} // namespace faultline::metrics
