#pragma once

#include <faultline/benchmark/benchmark_config.h>
#include <faultline/benchmark/latency_stats.h>
#include <faultline/store/store_driver.h>
#include <faultline/store/store_id.h>

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>

namespace faultline::benchmark {

enum class OpKind { Insert = 0, Read = 1, Update = 2 };

inline constexpr std::array<OpKind, 3> kAllOps{OpKind::Insert, OpKind::Read, OpKind::Update};

constexpr const char* opKindName(OpKind op) {
    switch (op) {
        case OpKind::Insert: return "insert";
        case OpKind::Read: return "read";
        case OpKind::Update: return "update";
    }
    return "insert";
}

struct StoreBenchmarkResult {
    StoreId store = StoreId::MongoDB;
    int operationCount = 0;
    // Per-batch wall time in seconds, in batch order
    std::array<std::vector<double>, 3> latencies;
    double throughput = 0.0;
    int errorCount = 0;
    double totalTimeSeconds = 0.0;
    int batches = 0;
    std::vector<std::string> errors;
    // Set when the whole workload could not run
    std::optional<Error> failure;

    const std::vector<double>& latency(OpKind op) const {
        return latencies[static_cast<std::size_t>(op)];
    }
    LatencyStats stats(OpKind op) const { return computeLatencyStats(latency(op)); }
};

struct BenchmarkReport {
    BenchmarkConfig config;
    std::array<StoreBenchmarkResult, 2> stores;

    const StoreBenchmarkResult& store(StoreId id) const { return stores[storeIndex(id)]; }
    int totalErrors() const;
    int totalBatches() const;
};

/**
 * @brief Runs the same workload against both stores concurrently.
 *
 * Each store's workload is a sibling coroutine on the scheduler: drop table,
 * create table, generate records, then per batch a timed insert of the whole
 * batch, a timed find of ACTIVE records and a timed update of every batch
 * record. The first failing call ends its batch.
 *
 * Both stores share one benchmark table, so runs are serialized: while a run
 * is active run() fails with ErrorCode::BenchmarkBusy.
 */
class PerformanceBenchmarkRunner {
public:
    PerformanceBenchmarkRunner(std::array<std::shared_ptr<store::IAsyncStoreDriver>, 2> drivers,
                               std::string table, std::optional<uint64_t> seed = std::nullopt);

    boost::asio::awaitable<Result<BenchmarkReport>> run(BenchmarkConfig config);

    bool running() const { return running_.load(); }

    // Drops the benchmark table of both stores
    boost::asio::awaitable<std::array<Result<void>, 2>> cleanup();

    const std::string& table() const { return table_; }

private:
    boost::asio::awaitable<Result<StoreBenchmarkResult>>
    runStore(StoreId id, BenchmarkConfig config, std::uint64_t seed);

    std::array<std::shared_ptr<store::IAsyncStoreDriver>, 2> drivers_;
    std::string table_;
    std::optional<uint64_t> seed_;
    std::atomic<bool> running_{false};
};

} // namespace faultline::benchmark
