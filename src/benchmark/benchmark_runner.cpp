#include <faultline/benchmark/benchmark_runner.h>
#include <faultline/benchmark/record_generator.h>
#include <faultline/core/async.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <random>

namespace faultline::benchmark {

namespace asio = boost::asio;
using Clock = std::chrono::steady_clock;

namespace {

double secondsSince(Clock::time_point t0) {
    return std::chrono::duration<double>(Clock::now() - t0).count();
}

// Clears the run flag when the run coroutine finishes or is destroyed
class RunGuard {
public:
    explicit RunGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~RunGuard() { flag_.store(false); }
    RunGuard(const RunGuard&) = delete;
    RunGuard& operator=(const RunGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

int BenchmarkReport::totalErrors() const {
    int n = 0;
    for (const auto& s : stores)
        n += s.errorCount;
    return n;
}

int BenchmarkReport::totalBatches() const {
    int n = 0;
    for (const auto& s : stores)
        n += s.batches;
    return n;
}

PerformanceBenchmarkRunner::PerformanceBenchmarkRunner(
    std::array<std::shared_ptr<store::IAsyncStoreDriver>, 2> drivers, std::string table,
    std::optional<uint64_t> seed)
    : drivers_(std::move(drivers)), table_(std::move(table)), seed_(seed) {}

asio::awaitable<Result<StoreBenchmarkResult>>
PerformanceBenchmarkRunner::runStore(StoreId id, BenchmarkConfig config, std::uint64_t seed) {
    const char* name = storeDisplayName(id);
    auto driver = drivers_[storeIndex(id)];
    if (!driver)
        co_return Error{ErrorCode::StoreError, std::string(name) + " driver not configured"};

    StoreBenchmarkResult r;
    r.store = id;
    r.operationCount = config.operationCount;
    const store::CallContext ctx{consistencyLevelName(config.consistencyLevel)};

    if (auto c = co_await driver->connect(); !c)
        co_return Error{ErrorCode::StoreError, std::string(name) + " connect: " + c.error().message};
    if (auto d = co_await driver->dropTable(table_); !d)
        spdlog::warn("[PerformanceBenchmarkRunner] {} teardown failed: {}", name, d.error().message);
    if (auto e = co_await driver->ensureTable(table_); !e) {
        co_return Error{ErrorCode::StoreError,
                        std::string(name) + " create table: " + e.error().message};
    }

    std::mt19937_64 rng(seed);
    auto records = generateRecords(config.operationCount, rng);

    auto fail = [&](OpKind op, const Error& err) {
        ++r.errorCount;
        r.errors.push_back(std::string(opKindName(op)) + ": " + err.message);
        spdlog::error("[PerformanceBenchmarkRunner] {} {} error: {}", name, opKindName(op),
                      err.message);
    };

    const std::size_t batch = static_cast<std::size_t>(config.batchSize);
    const auto start = Clock::now();
    for (std::size_t off = 0; off < records.size(); off += batch) {
        const auto end = std::min(off + batch, records.size());
        ++r.batches;

        auto t0 = Clock::now();
        bool ok = true;
        for (std::size_t i = off; i < end && ok; ++i) {
            auto ins = co_await driver->insert(table_, records[i], ctx);
            if (!ins) {
                fail(OpKind::Insert, ins.error());
                ok = false;
            }
        }
        if (!ok)
            continue;
        r.latencies[static_cast<std::size_t>(OpKind::Insert)].push_back(secondsSince(t0));

        if (config.readsEnabled()) {
            t0 = Clock::now();
            const store::Document activeFilter{{"status", "ACTIVE"}};
            auto found = co_await driver->find(table_, activeFilter, ctx);
            if (!found) {
                fail(OpKind::Read, found.error());
                continue;
            }
            r.latencies[static_cast<std::size_t>(OpKind::Read)].push_back(secondsSince(t0));
        }

        if (config.updatesEnabled()) {
            t0 = Clock::now();
            for (std::size_t i = off; i < end && ok; ++i) {
                const store::Document idFilter{{"id", records[i]["id"]}};
                const store::Document updatedStatus{{"status", "UPDATED"}};
                auto upd = co_await driver->update(table_, idFilter, updatedStatus, ctx);
                if (!upd) {
                    fail(OpKind::Update, upd.error());
                    ok = false;
                }
            }
            if (!ok)
                continue;
            r.latencies[static_cast<std::size_t>(OpKind::Update)].push_back(secondsSince(t0));
        }
    }
    r.totalTimeSeconds = secondsSince(start);
    r.throughput =
        r.totalTimeSeconds > 0 ? static_cast<double>(config.operationCount) / r.totalTimeSeconds
                               : 0.0;

    if (auto d = co_await driver->dropTable(table_); !d)
        spdlog::warn("[PerformanceBenchmarkRunner] {} teardown failed: {}", name, d.error().message);

    spdlog::info("[PerformanceBenchmarkRunner] {}: {} ops in {:.3f}s ({:.1f} ops/s, {} errors)",
                 name, config.operationCount, r.totalTimeSeconds, r.throughput, r.errorCount);
    co_return r;
}

asio::awaitable<Result<BenchmarkReport>> PerformanceBenchmarkRunner::run(BenchmarkConfig config) {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        spdlog::warn("[PerformanceBenchmarkRunner] rejected run: another run is active");
        co_return Error{ErrorCode::BenchmarkBusy, "a benchmark run is already in progress"};
    }
    RunGuard guard(running_);

    BenchmarkReport report;
    report.config = config;

    std::uint64_t base = seed_ ? *seed_ : std::random_device{}();
    std::vector<asio::awaitable<Result<StoreBenchmarkResult>>> tasks;
    for (auto id : kAllStores)
        tasks.push_back(runStore(id, config, base + storeIndex(id)));

    spdlog::info("[PerformanceBenchmarkRunner] starting: {} ops, batch {}, {} / {}",
                 config.operationCount, config.batchSize, testTypeName(config.testType),
                 consistencyLevelName(config.consistencyLevel));
    auto results = co_await whenAll(std::move(tasks));

    for (auto id : kAllStores) {
        auto& slot = results[storeIndex(id)];
        if (slot) {
            report.stores[storeIndex(id)] = std::move(slot).value();
            continue;
        }
        StoreBenchmarkResult failed;
        failed.store = id;
        failed.operationCount = config.operationCount;
        failed.errorCount = 1;
        failed.errors.push_back(slot.error().message);
        failed.failure = slot.error();
        spdlog::error("[PerformanceBenchmarkRunner] {} workload failed: {}", storeDisplayName(id),
                      slot.error().message);
        report.stores[storeIndex(id)] = std::move(failed);
    }
    co_return report;
}

asio::awaitable<std::array<Result<void>, 2>> PerformanceBenchmarkRunner::cleanup() {
    std::array<Result<void>, 2> out;
    for (auto id : kAllStores) {
        auto& driver = drivers_[storeIndex(id)];
        if (!driver) {
            out[storeIndex(id)] = Error{ErrorCode::StoreError, "driver not configured"};
            continue;
        }
        out[storeIndex(id)] = co_await driver->dropTable(table_);
        if (!out[storeIndex(id)]) {
            spdlog::warn("[PerformanceBenchmarkRunner] {} cleanup failed: {}",
                         storeDisplayName(id), out[storeIndex(id)].error().message);
        }
    }
    co_return out;
}

} // namespace faultline::benchmark
