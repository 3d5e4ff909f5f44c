#include <gtest/gtest.h>

#include <faultline/benchmark/benchmark_json.h>
#include <faultline/benchmark/benchmark_runner.h>

#include "../../common/async_test_utils.h"
#include "../../common/scripted_store_driver.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

using namespace faultline;
using namespace faultline::benchmark;
using faultline::test::runAwaitable;
using faultline::test::ScriptedStoreDriver;
namespace asio = boost::asio;
using Clock = std::chrono::steady_clock;

class BenchmarkRunnerTest : public ::testing::Test {
protected:
    BenchmarkReport run(BenchmarkConfig cfg) {
        PerformanceBenchmarkRunner runner({mongo_, cassandra_}, "performance_test", 1234);
        auto report = runAwaitable(io_, runner.run(cfg));
        EXPECT_TRUE(report) << report.error().message;
        return std::move(report).value();
    }

    static BenchmarkConfig config(int ops, int batch, TestType type = TestType::Mixed) {
        BenchmarkConfig cfg;
        cfg.operationCount = ops;
        cfg.batchSize = batch;
        cfg.testType = type;
        return cfg;
    }

    boost::asio::io_context io_;
    std::shared_ptr<ScriptedStoreDriver> mongo_ = std::make_shared<ScriptedStoreDriver>();
    std::shared_ptr<ScriptedStoreDriver> cassandra_ = std::make_shared<ScriptedStoreDriver>();
};

TEST_F(BenchmarkRunnerTest, OversizedBatchRunsOnce) {
    auto report = run(config(5, 100));
    for (auto id : kAllStores) {
        const auto& s = report.store(id);
        EXPECT_EQ(s.batches, 1);
        EXPECT_EQ(s.errorCount, 0);
        EXPECT_EQ(s.latency(OpKind::Insert).size(), 1u);
        EXPECT_EQ(s.latency(OpKind::Read).size(), 1u);
        EXPECT_EQ(s.latency(OpKind::Update).size(), 1u);
    }
    EXPECT_EQ(mongo_->calls("insert"), 5);
    EXPECT_EQ(mongo_->calls("update"), 5);
    EXPECT_EQ(mongo_->calls("find"), 1);
}

TEST_F(BenchmarkRunnerTest, BatchesCoverEveryRecord) {
    auto report = run(config(25, 10));
    EXPECT_EQ(report.store(StoreId::MongoDB).batches, 3);
    EXPECT_EQ(report.store(StoreId::Cassandra).batches, 3);
    EXPECT_EQ(cassandra_->calls("insert"), 25);
    EXPECT_EQ(report.totalBatches(), 6);
}

TEST_F(BenchmarkRunnerTest, ThroughputIsOperationsOverTotalTime) {
    auto report = run(config(40, 8));
    for (auto id : kAllStores) {
        const auto& s = report.store(id);
        ASSERT_GT(s.totalTimeSeconds, 0.0);
        EXPECT_NEAR(s.throughput * s.totalTimeSeconds, 40.0, 1e-6);
    }
}

TEST_F(BenchmarkRunnerTest, WriteOnlySkipsReadsAndUpdates) {
    auto report = run(config(10, 5, TestType::Write));
    EXPECT_EQ(mongo_->calls("find"), 0);
    EXPECT_EQ(mongo_->calls("update"), 0);
    EXPECT_TRUE(report.store(StoreId::MongoDB).latency(OpKind::Read).empty());
    EXPECT_EQ(report.store(StoreId::MongoDB).latency(OpKind::Insert).size(), 2u);
}

TEST_F(BenchmarkRunnerTest, ReadOnlySkipsUpdates) {
    run(config(10, 5, TestType::Read));
    EXPECT_EQ(cassandra_->calls("find"), 2);
    EXPECT_EQ(cassandra_->calls("update"), 0);
}

TEST_F(BenchmarkRunnerTest, FirstFailureEndsItsBatch) {
    mongo_->setHook([](const std::string& op, int call) -> std::optional<Error> {
        if (op == "insert" && call == 3)
            return Error{ErrorCode::StoreError, "write conflict"};
        return std::nullopt;
    });
    auto report = run(config(6, 2));
    const auto& m = report.store(StoreId::MongoDB);
    EXPECT_EQ(m.batches, 3);
    EXPECT_EQ(m.errorCount, 1);
    ASSERT_EQ(m.errors.size(), 1u);
    EXPECT_EQ(m.errors[0], "insert: write conflict");
    // The failing batch skipped its remaining insert and its read/update phases
    EXPECT_EQ(mongo_->calls("insert"), 5);
    EXPECT_EQ(m.latency(OpKind::Insert).size(), 2u);
    EXPECT_EQ(m.latency(OpKind::Update).size(), 2u);
    EXPECT_EQ(report.store(StoreId::Cassandra).errorCount, 0);
}

TEST_F(BenchmarkRunnerTest, StoreThatCannotConnectIsReportedNotFatal) {
    cassandra_->setHook([](const std::string& op, int) -> std::optional<Error> {
        if (op == "connect")
            return Error{ErrorCode::NetworkError, "connection refused"};
        return std::nullopt;
    });
    auto report = run(config(5, 100));
    const auto& c = report.store(StoreId::Cassandra);
    ASSERT_TRUE(c.failure.has_value());
    EXPECT_EQ(c.failure->code, ErrorCode::StoreError);
    EXPECT_EQ(c.errorCount, 1);
    EXPECT_FALSE(report.store(StoreId::MongoDB).failure.has_value());
    EXPECT_EQ(report.store(StoreId::MongoDB).batches, 1);

    auto summary = benchmarkSummaryToJson(report);
    EXPECT_EQ(summary["errors"], 1);
    EXPECT_DOUBLE_EQ(summary["errorRate"].get<double>(), 0.5);
    EXPECT_TRUE(benchmarkDetailsToJson(report)["cassandra"].contains("failure"));
}

TEST_F(BenchmarkRunnerTest, ThrowingDriverOnlyFailsItsStore) {
    mongo_->throwOn("ensureTable");
    auto report = run(config(4, 2));
    ASSERT_TRUE(report.store(StoreId::MongoDB).failure.has_value());
    EXPECT_EQ(report.store(StoreId::MongoDB).failure->code, ErrorCode::InternalError);
    EXPECT_EQ(report.store(StoreId::Cassandra).batches, 2);
}

TEST_F(BenchmarkRunnerTest, ConsistencyLevelReachesDriver) {
    auto cfg = config(2, 2);
    cfg.consistencyLevel = ConsistencyLevel::Strong;
    run(cfg);
    EXPECT_EQ(mongo_->lastConsistency, "strong");
}

TEST_F(BenchmarkRunnerTest, TableIsDroppedAfterRun) {
    run(config(3, 3));
    EXPECT_FALSE(mongo_->backing()->hasTable("performance_test"));
    EXPECT_EQ(mongo_->calls("dropTable"), 2);
}

TEST_F(BenchmarkRunnerTest, CleanupReportsPerStore) {
    cassandra_->setHook([](const std::string& op, int) -> std::optional<Error> {
        if (op == "dropTable")
            return Error{ErrorCode::StoreError, "keyspace unavailable"};
        return std::nullopt;
    });
    PerformanceBenchmarkRunner runner({mongo_, cassandra_}, "performance_test");
    auto out = runAwaitable(io_, runner.cleanup());
    EXPECT_TRUE(out[storeIndex(StoreId::MongoDB)]);
    ASSERT_FALSE(out[storeIndex(StoreId::Cassandra)]);
    EXPECT_EQ(out[storeIndex(StoreId::Cassandra)].error().message, "keyspace unavailable");
}

TEST_F(BenchmarkRunnerTest, JsonMetricsListBothStores) {
    auto report = run(config(4, 2));
    auto latency = latencyMetricsToJson(report);
    ASSERT_EQ(latency.size(), 3u);
    EXPECT_EQ(latency[0]["operation"], "insert");
    EXPECT_TRUE(latency[0].contains("mongodb"));
    EXPECT_TRUE(latency[0].contains("cassandra"));

    auto throughput = throughputMetricsToJson(report);
    ASSERT_EQ(throughput.size(), 2u);
    EXPECT_EQ(throughput[0]["db"], "MongoDB");
    EXPECT_EQ(throughput[1]["db"], "Cassandra");

    auto summary = benchmarkSummaryToJson(report);
    EXPECT_EQ(summary["totalOps"], 4);
    EXPECT_EQ(summary["consistencyLevel"], "eventual");
    EXPECT_EQ(summary["testType"], "mixed");
    EXPECT_DOUBLE_EQ(summary["errorRate"].get<double>(), 0.0);
}

TEST_F(BenchmarkRunnerTest, SchedulerKeepsTickingDuringLongRun) {
    PerformanceBenchmarkRunner runner({mongo_, cassandra_}, "performance_test", 99);
    bool finished = false;
    std::vector<Clock::time_point> marks{Clock::now()};

    asio::co_spawn(
        io_,
        [&]() -> asio::awaitable<void> {
            asio::steady_timer timer(io_);
            while (!finished) {
                timer.expires_after(std::chrono::milliseconds(50));
                co_await timer.async_wait(asio::use_awaitable);
                marks.push_back(Clock::now());
            }
        },
        asio::detached);

    auto report = runAwaitable(io_, [&]() -> asio::awaitable<Result<BenchmarkReport>> {
        auto r = co_await runner.run(config(10000, 1000));
        finished = true;
        marks.push_back(Clock::now());
        co_return r;
    }());
    ASSERT_TRUE(report);
    EXPECT_EQ(report.value().totalErrors(), 0);

    ASSERT_GE(marks.size(), 3u);
    Clock::duration widest{0};
    for (std::size_t i = 1; i < marks.size(); ++i)
        widest = std::max(widest, marks[i] - marks[i - 1]);
    EXPECT_LT(widest, std::chrono::milliseconds(500))
        << "timer starved for "
        << std::chrono::duration_cast<std::chrono::milliseconds>(widest).count() << " ms";
}

TEST_F(BenchmarkRunnerTest, StoresRunSideBySide) {
    PerformanceBenchmarkRunner runner({mongo_, cassandra_}, "performance_test", 5);
    const auto t0 = Clock::now();
    auto report = runAwaitable(io_, runner.run(config(2000, 100)));
    const double wall = std::chrono::duration<double>(Clock::now() - t0).count();
    ASSERT_TRUE(report);

    const double mongo = report.value().store(StoreId::MongoDB).totalTimeSeconds;
    const double cassandra = report.value().store(StoreId::Cassandra).totalTimeSeconds;
    ASSERT_GT(mongo, 0.0);
    ASSERT_GT(cassandra, 0.0);
    EXPECT_LT(wall, 0.8 * (mongo + cassandra));
    EXPECT_LT(wall, 1.3 * std::max(mongo, cassandra) + 0.05);
}

TEST_F(BenchmarkRunnerTest, OverlappingRunIsRejected) {
    PerformanceBenchmarkRunner runner({mongo_, cassandra_}, "performance_test", 11);
    std::optional<Result<BenchmarkReport>> first;
    std::optional<Result<BenchmarkReport>> second;

    asio::co_spawn(
        io_,
        [&]() -> asio::awaitable<void> { first.emplace(co_await runner.run(config(200, 20))); },
        asio::detached);
    asio::co_spawn(
        io_,
        [&]() -> asio::awaitable<void> {
            EXPECT_TRUE(runner.running());
            second.emplace(co_await runner.run(config(10, 5)));
        },
        asio::detached);
    io_.run();

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(*first);
    EXPECT_EQ(first->value().store(StoreId::MongoDB).batches, 10);
    ASSERT_FALSE(*second);
    EXPECT_EQ(second->error().code, ErrorCode::BenchmarkBusy);
    EXPECT_FALSE(runner.running());
    EXPECT_FALSE(mongo_->backing()->hasTable("performance_test"));

    // The flag is released, so a later run goes through
    auto again = runAwaitable(io_, runner.run(config(10, 5)));
    EXPECT_TRUE(again);
}
