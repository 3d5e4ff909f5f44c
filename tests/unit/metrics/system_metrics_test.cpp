#include <gtest/gtest.h>

#include <faultline/metrics/system_metrics.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

using namespace faultline;
using namespace faultline::metrics;
namespace fs = std::filesystem;

namespace {

const char* kMeminfo = "MemTotal:       16000000 kB\n"
                       "MemFree:         2000000 kB\n"
                       "MemAvailable:   12000000 kB\n"
                       "Buffers:          100000 kB\n";

const char* kNetDev =
    "Inter-|   Receive                                                |  Transmit\n"
    " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs "
    "drop fifo colls carrier compressed\n"
    "    lo:    1000      10    0    0    0     0          0         0     1000      10    0    "
    "0    0     0       0          0\n"
    "  eth0:  500000     400    0    0    0     0          0         0   250000     300    0    "
    "0    0     0       0          0\n";

} // namespace

TEST(SystemMetricsTest, ParsesAggregateCpuLine) {
    auto t = parseCpuLine("cpu  100 5 50 800 20 3 2 0 0 0");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->idle, 820u);
    EXPECT_EQ(t->total, 980u);

    EXPECT_FALSE(parseCpuLine("cpu0 1 2 3 4").has_value());
    EXPECT_FALSE(parseCpuLine("intr 12345").has_value());
    EXPECT_FALSE(parseCpuLine("cpu  12").has_value());
}

TEST(SystemMetricsTest, CpuPercentIsBusyShareOfInterval) {
    CpuTimes before{800, 1000};
    CpuTimes after{850, 1200};
    EXPECT_DOUBLE_EQ(cpuPercentBetween(before, after), 75.0);
    EXPECT_DOUBLE_EQ(cpuPercentBetween(before, before), 0.0);
    // Counter wrap or reset reads as idle rather than a bogus value
    EXPECT_DOUBLE_EQ(cpuPercentBetween(after, before), 0.0);
}

TEST(SystemMetricsTest, MemoryUsedIsTotalMinusAvailable) {
    std::istringstream in(kMeminfo);
    auto mem = parseMeminfo(in);
    ASSERT_TRUE(mem);
    EXPECT_EQ(mem.value().total, 16000000ull * 1024);
    EXPECT_EQ(mem.value().used, 4000000ull * 1024);
    EXPECT_DOUBLE_EQ(mem.value().percent, 25.0);

    std::istringstream partial("MemTotal: 100 kB\n");
    EXPECT_FALSE(parseMeminfo(partial));
}

TEST(SystemMetricsTest, NetworkCountersSumAllInterfaces) {
    std::istringstream in(kNetDev);
    auto net = parseNetDev(in);
    ASSERT_TRUE(net);
    EXPECT_EQ(net.value().bytesRecv, 501000u);
    EXPECT_EQ(net.value().bytesSent, 251000u);

    std::istringstream headerOnly("Inter-| Receive\n face |bytes\n");
    EXPECT_FALSE(parseNetDev(headerOnly));
}

TEST(SystemMetricsTest, SamplerReadsProcTree) {
    std::random_device rd;
    const auto root = fs::temp_directory_path() / ("faultline_proc_" + std::to_string(rd()));
    fs::create_directories(root / "net");
    std::ofstream(root / "stat") << "cpu  100 0 100 800 0 0 0 0 0 0\ncpu0 1 1 1 1\n";
    std::ofstream(root / "meminfo") << kMeminfo;
    std::ofstream(root / "net" / "dev") << kNetDev;

    SystemMetricsSampler sampler(root, root);
    auto snap = sampler.sample(std::chrono::milliseconds(0));
    ASSERT_TRUE(snap) << snap.error().message;
    EXPECT_DOUBLE_EQ(snap.value().cpuPercent, 0.0);
    EXPECT_DOUBLE_EQ(snap.value().memory.percent, 25.0);
    EXPECT_GT(snap.value().disk.total, 0u);
    EXPECT_EQ(snap.value().network.bytesSent, 251000u);

    auto j = systemSnapshotToJson(snap.value());
    EXPECT_TRUE(j.contains("timestamp"));
    EXPECT_EQ(j["memory"]["used"], 4000000ull * 1024);
    EXPECT_EQ(j["network"]["bytes_recv"], 501000u);
    EXPECT_TRUE(j["disk"].contains("percent"));

    fs::remove(root / "meminfo");
    auto missing = sampler.sample(std::chrono::milliseconds(0));
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    std::error_code ec;
    fs::remove_all(root, ec);
}
