#include <faultline/benchmark/benchmark_json.h>

namespace faultline::benchmark {

using nlohmann::json;

namespace {

// Keys used by the dashboard for the detailed section
const char* detailKey(StoreId id) {
    return id == StoreId::MongoDB ? "mongo" : "cassandra";
}

json statsToJson(const LatencyStats& s) {
    return json{{"count", s.count}, {"mean", s.mean}, {"p50", s.p50}, {"p95", s.p95},
                {"max", s.max}};
}

json storeToJson(const StoreBenchmarkResult& r) {
    json latencies = json::object();
    json stats = json::object();
    for (auto op : kAllOps) {
        latencies[opKindName(op)] = r.latency(op);
        stats[opKindName(op)] = statsToJson(r.stats(op));
    }
    json j{{"latencies", std::move(latencies)},
           {"stats", std::move(stats)},
           {"errors", r.errorCount},
           {"errorMessages", r.errors},
           {"total_operations", r.operationCount},
           {"throughput", r.throughput},
           {"total_time", r.totalTimeSeconds},
           {"batches", r.batches}};
    if (r.failure) {
        j["failure"] = json{{"kind", errorKindName(r.failure->code)},
                            {"message", r.failure->message}};
    }
    return j;
}

} // namespace

json latencyMetricsToJson(const BenchmarkReport& report) {
    json out = json::array();
    for (auto op : kAllOps) {
        json row{{"operation", opKindName(op)}};
        for (auto id : kAllStores)
            row[storeKey(id)] = report.store(id).stats(op).mean;
        out.push_back(std::move(row));
    }
    return out;
}

json throughputMetricsToJson(const BenchmarkReport& report) {
    json out = json::array();
    for (auto id : kAllStores) {
        out.push_back(
            json{{"db", storeDisplayName(id)}, {"throughput", report.store(id).throughput}});
    }
    return out;
}

json benchmarkSummaryToJson(const BenchmarkReport& report) {
    const int errors = report.totalErrors();
    // Failed batches over attempted batches; a store that never started counts as one batch
    int attempted = report.totalBatches();
    for (const auto& s : report.stores) {
        if (s.failure)
            ++attempted;
    }
    return json{{"totalOps", report.config.operationCount},
                {"errors", errors},
                {"errorRate", attempted > 0 ? static_cast<double>(errors) / attempted : 0.0},
                {"batchSize", report.config.batchSize},
                {"consistencyLevel", consistencyLevelName(report.config.consistencyLevel)},
                {"testType", testTypeName(report.config.testType)}};
}

json benchmarkDetailsToJson(const BenchmarkReport& report) {
    json out = json::object();
    for (auto id : kAllStores)
        out[detailKey(id)] = storeToJson(report.store(id));
    return out;
}

} // namespace faultline::benchmark
