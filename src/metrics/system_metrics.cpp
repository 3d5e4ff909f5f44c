#include <faultline/core/ids.h>
#include <faultline/metrics/system_metrics.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <thread>

namespace faultline::metrics {

namespace {

double percentOf(std::uint64_t part, std::uint64_t whole) {
    if (whole == 0)
        return 0.0;
    const double pct = static_cast<double>(part) * 100.0 / static_cast<double>(whole);
    return std::round(pct * 10.0) / 10.0;
}

} // namespace

std::optional<CpuTimes> parseCpuLine(std::string_view line) {
    if (line.rfind("cpu ", 0) != 0)
        return std::nullopt;
    std::istringstream iss(std::string(line.substr(4)));
    std::uint64_t user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0, softirq = 0,
                  steal = 0;
    if (!(iss >> user >> nice >> system >> idle))
        return std::nullopt;
    // Older kernels stop after idle
    iss >> iowait >> irq >> softirq >> steal;
    CpuTimes t;
    t.idle = idle + iowait;
    t.total = user + nice + system + idle + iowait + irq + softirq + steal;
    return t;
}

double cpuPercentBetween(const CpuTimes& before, const CpuTimes& after) {
    if (after.total <= before.total || after.idle < before.idle)
        return 0.0;
    const auto dTotal = after.total - before.total;
    const auto dIdle = std::min(after.idle - before.idle, dTotal);
    return percentOf(dTotal - dIdle, dTotal);
}

Result<UsageTotals> parseMeminfo(std::istream& in) {
    std::optional<std::uint64_t> totalKb;
    std::optional<std::uint64_t> availableKb;
    std::string line;
    while (std::getline(in, line) && !(totalKb && availableKb)) {
        std::istringstream iss(line);
        std::string label;
        std::uint64_t kb = 0;
        if (!(iss >> label >> kb))
            continue;
        if (label == "MemTotal:")
            totalKb = kb;
        else if (label == "MemAvailable:")
            availableKb = kb;
    }
    if (!totalKb || !availableKb)
        return Error{ErrorCode::InvalidArgument, "meminfo lacks MemTotal or MemAvailable"};

    UsageTotals mem;
    mem.total = *totalKb * 1024;
    mem.used = (*totalKb - std::min(*availableKb, *totalKb)) * 1024;
    mem.percent = percentOf(mem.used, mem.total);
    return mem;
}

Result<NetworkCounters> parseNetDev(std::istream& in) {
    NetworkCounters out;
    std::string line;
    bool sawInterface = false;
    while (std::getline(in, line)) {
        // "  eth0: rx_bytes rx_packets ... (8 receive fields) tx_bytes ..."
        const auto colon = line.find(':');
        if (colon == std::string::npos)
            continue;
        std::istringstream iss(line.substr(colon + 1));
        std::uint64_t fields[9] = {};
        bool ok = true;
        for (auto& f : fields) {
            if (!(iss >> f)) {
                ok = false;
                break;
            }
        }
        if (!ok)
            continue;
        out.bytesRecv += fields[0];
        out.bytesSent += fields[8];
        sawInterface = true;
    }
    if (!sawInterface)
        return Error{ErrorCode::InvalidArgument, "no interfaces in net/dev"};
    return out;
}

SystemMetricsSampler::SystemMetricsSampler(std::filesystem::path procRoot,
                                           std::filesystem::path diskPath)
    : procRoot_(std::move(procRoot)), diskPath_(std::move(diskPath)) {}

Result<CpuTimes> SystemMetricsSampler::readCpu() const {
    std::ifstream in(procRoot_ / "stat");
    std::string line;
    if (!in.is_open() || !std::getline(in, line))
        return Error{ErrorCode::NotFound, "cannot read " + (procRoot_ / "stat").string()};
    auto t = parseCpuLine(line);
    if (!t)
        return Error{ErrorCode::InvalidArgument, "unexpected cpu line: " + line};
    return *t;
}

Result<SystemSnapshot> SystemMetricsSampler::sample(std::chrono::milliseconds cpuWindow) const {
    SystemSnapshot snap;
    snap.timestamp = isoTimestamp(std::chrono::system_clock::now());

    auto before = readCpu();
    if (!before)
        return before.error();
    if (cpuWindow.count() > 0)
        std::this_thread::sleep_for(cpuWindow);
    auto after = readCpu();
    if (!after)
        return after.error();
    snap.cpuPercent = cpuPercentBetween(before.value(), after.value());

    std::ifstream meminfo(procRoot_ / "meminfo");
    if (!meminfo.is_open())
        return Error{ErrorCode::NotFound, "cannot read " + (procRoot_ / "meminfo").string()};
    auto mem = parseMeminfo(meminfo);
    if (!mem)
        return mem.error();
    snap.memory = mem.value();

    std::error_code ec;
    auto space = std::filesystem::space(diskPath_, ec);
    if (ec) {
        return Error{ErrorCode::InternalError,
                     "disk usage of " + diskPath_.string() + ": " + ec.message()};
    }
    snap.disk.total = space.capacity;
    snap.disk.used = space.capacity - space.free;
    snap.disk.percent = percentOf(snap.disk.used, snap.disk.total);

    // Network counters are optional inside containers without a netns view
    std::ifstream netdev(procRoot_ / "net" / "dev");
    if (netdev.is_open()) {
        auto net = parseNetDev(netdev);
        if (net)
            snap.network = net.value();
        else
            spdlog::debug("[SystemMetrics] {}", net.error().message);
    }
    return snap;
}

nlohmann::json systemSnapshotToJson(const SystemSnapshot& s) {
    auto usage = [](const UsageTotals& u) {
        return nlohmann::json{{"total", u.total}, {"used", u.used}, {"percent", u.percent}};
    };
    return nlohmann::json{
        {"timestamp", s.timestamp},
        {"cpu_percent", s.cpuPercent},
        {"memory", usage(s.memory)},
        {"disk", usage(s.disk)},
        {"network", {{"bytes_sent", s.network.bytesSent}, {"bytes_recv", s.network.bytesRecv}}}};
}

} // namespace faultline::metrics
