#pragma once

#include <faultline/benchmark/benchmark_runner.h>

#include <nlohmann/json.hpp>

namespace faultline::benchmark {

// [{operation, mongodb: mean seconds, cassandra: mean seconds}] per op kind
nlohmann::json latencyMetricsToJson(const BenchmarkReport& report);

// [{db: "MongoDB", throughput}, {db: "Cassandra", throughput}]
nlohmann::json throughputMetricsToJson(const BenchmarkReport& report);

// {totalOps, errors, errorRate, consistencyLevel, testType, batchSize}
nlohmann::json benchmarkSummaryToJson(const BenchmarkReport& report);

// {mongo: {...}, cassandra: {...}} with raw latency series and stats
nlohmann::json benchmarkDetailsToJson(const BenchmarkReport& report);

} // namespace faultline::benchmark
