#include <gtest/gtest.h>

#include <faultline/app/service.h>

#include "../../common/async_test_utils.h"
#include "../../common/fake_orchestrator.h"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <filesystem>
#include <optional>
#include <random>

using namespace faultline;
using namespace faultline::api;
using faultline::test::FakeOrchestrator;
using faultline::test::runAwaitable;
using nlohmann::json;
namespace fs = std::filesystem;

class ApiControllersTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        reportDir_ = fs::temp_directory_path() / ("faultline_api_" + std::to_string(rd()));

        config::ServiceConfig cfg;
        cfg.server.bindAddress = "127.0.0.1";
        cfg.server.port = 0;
        cfg.server.workerThreads = 2;
        cfg.scenario.tickInterval = std::chrono::milliseconds(5);
        cfg.scenario.probeTimeout = std::chrono::milliseconds(500);
        cfg.scenario.recoveryCeilingTicks = 5;
        cfg.reports.directory = reportDir_;
        cfg.dashboard.cpuWindow = std::chrono::milliseconds(10);

        auto fake = std::make_unique<FakeOrchestrator>();
        fake_ = fake.get();
        service_ = std::make_unique<app::Service>(cfg, std::move(fake));
    }

    void TearDown() override {
        service_.reset();
        std::error_code ec;
        fs::remove_all(reportDir_, ec);
    }

    Response call(http::verb method, const std::string& target, const std::string& body = "") {
        Request req{method, target, 11};
        req.body() = body;
        req.prepare_payload();
        return runAwaitable(service_->scheduler(), service_->router().dispatch(req));
    }

    static json bodyOf(const Response& res) { return json::parse(res.body()); }

    fs::path reportDir_;
    FakeOrchestrator* fake_ = nullptr;
    std::unique_ptr<app::Service> service_;
};

TEST_F(ApiControllersTest, HealthReportsMode) {
    auto res = call(http::verb::get, "/api/health");
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = bodyOf(res);
    EXPECT_EQ(body["status"], "ok");
    EXPECT_EQ(body["mode"], "live");
    EXPECT_EQ(body["activeScenarios"], 0);
}

TEST_F(ApiControllersTest, SimulateNodeFailure) {
    auto res = call(http::verb::post, "/api/failure/simulate",
                    R"({"failureType":"node","targetNode":"mongo1","duration":2})");
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = bodyOf(res);
    EXPECT_EQ(body["success"], true);
    EXPECT_EQ(body["summary"]["failureType"], "node");
    EXPECT_EQ(body["summary"]["mongodbDowntime"], 2);
    EXPECT_EQ(body["summary"]["cassandraDowntime"], 0);
    EXPECT_EQ(body["availabilityMetrics"].size(), 2u);
    EXPECT_EQ(body["recoveryMetrics"].size(), 1u);
    EXPECT_EQ(body["detailedResults"]["outcome"], "Success");
    EXPECT_TRUE(fake_->isRunning("mongo1"));
}

TEST_F(ApiControllersTest, SimulateNetworkPartition) {
    auto res = call(http::verb::post, "/api/failure/simulate",
                    R"({"failureType":"network","targetNode":"cassandra1,cassandra2","duration":1})");
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = bodyOf(res);
    EXPECT_EQ(body["availabilityMetrics"][0]["partition_active"], true);
    EXPECT_EQ(body["detailedResults"]["network"], "distributed_db_network");
    EXPECT_TRUE(fake_->isAttached("cassandra2", "distributed_db_network"));
}

TEST_F(ApiControllersTest, SimulateRejectsUnsupportedType) {
    auto res = call(http::verb::post, "/api/failure/simulate", R"({"failureType":"disk"})");
    EXPECT_EQ(res.result(), http::status::bad_request);
    auto body = bodyOf(res);
    EXPECT_EQ(body["error"], "Unsupported failure type: disk");
    EXPECT_EQ(body["errorKind"], "InvalidArgument");
}

TEST_F(ApiControllersTest, SimulateRejectsMalformedBody) {
    EXPECT_EQ(call(http::verb::post, "/api/failure/simulate", "{not json").result(),
              http::status::bad_request);
    EXPECT_EQ(call(http::verb::post, "/api/failure/simulate", R"({"duration":"long"})").result(),
              http::status::bad_request);
}

TEST_F(ApiControllersTest, SimulateRejectsDurationBeyondIntRange) {
    // 2^32 + 5 would narrow to a valid 5 second scenario
    auto res = call(http::verb::post, "/api/failure/simulate",
                    R"({"targetNode":"mongo1","duration":4294967301})");
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(bodyOf(res)["error"], "duration must be between 1 and 300 seconds");
    EXPECT_TRUE(fake_->calls().empty());
}

TEST_F(ApiControllersTest, SimulateRejectsNodeNamesOutsideContainerGrammar) {
    for (const char* target : {"mongo1/../../images", "mongo1?force=1", "mongo1#x", "-mongo1",
                               "mongo1,..", "cassandra1 /stop"}) {
        json body{{"targetNode", target}, {"duration", 1}};
        auto res = call(http::verb::post, "/api/failure/simulate", body.dump());
        EXPECT_EQ(res.result(), http::status::bad_request) << target;
        EXPECT_EQ(bodyOf(res)["errorKind"], "InvalidArgument") << target;
    }
    EXPECT_TRUE(fake_->calls().empty());
}

TEST_F(ApiControllersTest, SimulateUnknownNodeIsUnprocessable) {
    auto res = call(http::verb::post, "/api/failure/simulate",
                    R"({"targetNode":"mongo42","duration":1})");
    EXPECT_EQ(res.result(), http::status::unprocessable_entity);
    auto body = bodyOf(res);
    EXPECT_EQ(body["errorKind"], "ResolutionError");
    EXPECT_EQ(body["detailedResults"]["outcome"], "Failed");
    EXPECT_TRUE(fake_->calls().empty());
}

TEST_F(ApiControllersTest, ContainerUptimesPerNode) {
    auto res = call(http::verb::get, "/api/failure/container-uptimes?names=mongo1,ghost");
    ASSERT_EQ(res.result(), http::status::ok);
    auto up = bodyOf(res)["uptimes"];
    EXPECT_GE(up["mongo1"]["seconds"].get<long long>(), 7100);
    EXPECT_GE(up["mongo1"]["hours"].get<double>(), 1.9);
    EXPECT_EQ(up["mongo1"]["status"], "running");
    EXPECT_TRUE(up["ghost"].contains("error"));
}

TEST_F(ApiControllersTest, ContainerUptimesRejectsPathCharacters) {
    for (const char* names : {"mongo1,..%2Fimages%2Fjson", "mongo1%3Fsize%3D1", "mongo1%23",
                              "..", "mongo%2F1"}) {
        auto res = call(http::verb::get, std::string("/api/failure/container-uptimes?names=") +
                                             names);
        EXPECT_EQ(res.result(), http::status::bad_request) << names;
        EXPECT_EQ(bodyOf(res)["errorKind"], "InvalidArgument") << names;
    }
}

TEST_F(ApiControllersTest, ContainerUptimesNeedsNames) {
    auto res = call(http::verb::get, "/api/failure/container-uptimes");
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(bodyOf(res)["error"], "No container names provided");
}

TEST_F(ApiControllersTest, StopRestoresStoppedNodes) {
    ASSERT_TRUE(service_->infrastructure().stop("mongo2"));
    auto res = call(http::verb::post, "/api/failure/stop");
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = bodyOf(res);
    EXPECT_EQ(body["restored"], json::array({"mongo2"}));
    EXPECT_EQ(body["cancelled"], 0);
    EXPECT_EQ(body["message"], "Restoration complete");
    EXPECT_TRUE(fake_->isRunning("mongo2"));
}

TEST_F(ApiControllersTest, CapAnalysisClassifiesStores) {
    auto body = bodyOf(call(http::verb::get, "/api/failure/cap-analysis"));
    EXPECT_EQ(body["mongodb"]["capClassification"], "CP");
    EXPECT_EQ(body["cassandra"]["capClassification"], "AP");
}

TEST_F(ApiControllersTest, PerformanceRunSavesReport) {
    auto res = call(http::verb::post, "/api/performance/run",
                    R"({"operationCount":20,"batchSize":10,"testType":"mixed"})");
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = bodyOf(res);
    EXPECT_EQ(body["success"], true);
    EXPECT_EQ(body["summary"]["totalOps"], 20);
    EXPECT_EQ(body["latencyMetrics"].size(), 3u);
    EXPECT_EQ(body["throughputMetrics"].size(), 2u);
    EXPECT_EQ(body["detailedResults"]["mongo"]["batches"], 2);
    ASSERT_TRUE(body.contains("report"));
    const auto name = body["report"].get<std::string>();

    auto list = bodyOf(call(http::verb::get, "/api/report"));
    EXPECT_EQ(list.size(), 2u);

    auto latest = call(http::verb::get, "/api/report/latest");
    ASSERT_EQ(latest.result(), http::status::ok);
    EXPECT_TRUE(bodyOf(latest).contains("latest_report"));

    auto file = call(http::verb::get, "/api/report/" + name);
    ASSERT_EQ(file.result(), http::status::ok);
    EXPECT_EQ(file[http::field::content_type], "text/markdown; charset=utf-8");
    EXPECT_NE(file.body().find("## Throughput"), std::string::npos);
}

TEST_F(ApiControllersTest, OverlappingPerformanceRunsConflict) {
    std::vector<Request> requests;
    for (const char* body : {R"({"operationCount":400,"batchSize":20})",
                             R"({"operationCount":10,"batchSize":5})"}) {
        Request req{http::verb::post, "/api/performance/run", 11};
        req.body() = body;
        req.prepare_payload();
        requests.push_back(std::move(req));
    }
    std::vector<std::optional<Response>> responses(requests.size());
    auto& io = service_->scheduler();
    for (std::size_t i = 0; i < requests.size(); ++i) {
        boost::asio::co_spawn(
            io,
            [this, &requests, &responses, i]() -> boost::asio::awaitable<void> {
                responses[i].emplace(co_await service_->router().dispatch(requests[i]));
            },
            boost::asio::detached);
    }
    io.restart();
    io.run();

    ASSERT_TRUE(responses[0] && responses[1]);
    EXPECT_EQ(responses[0]->result(), http::status::ok);
    ASSERT_EQ(responses[1]->result(), http::status::conflict);
    EXPECT_EQ(bodyOf(*responses[1])["errorKind"], "BenchmarkBusy");

    // Exactly one report pair was written
    EXPECT_EQ(bodyOf(call(http::verb::get, "/api/report")).size(), 2u);
}

TEST_F(ApiControllersTest, PerformanceRunRejectsBadConfig) {
    auto res = call(http::verb::post, "/api/performance/run", R"({"batchSize":5000})");
    EXPECT_EQ(res.result(), http::status::bad_request);
}

TEST_F(ApiControllersTest, ReportEndpointsWithoutReports) {
    EXPECT_EQ(bodyOf(call(http::verb::get, "/api/report/")), json::array());
    EXPECT_EQ(call(http::verb::get, "/api/report/latest").result(), http::status::not_found);
    EXPECT_EQ(call(http::verb::get, "/api/report/..%2Fetc").result(), http::status::not_found);
}

TEST_F(ApiControllersTest, CleanupDropsBenchmarkTables) {
    auto res = call(http::verb::post, "/api/performance/cleanup");
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = bodyOf(res);
    EXPECT_EQ(body["stores"]["mongodb"], "ok");
    EXPECT_EQ(body["stores"]["cassandra"], "ok");
}

TEST_F(ApiControllersTest, RequestMetricsByCategory) {
    service_->requestMetrics().record(metrics::RequestCategory::Mongo,
                                      std::chrono::milliseconds(4));
    auto one = bodyOf(call(http::verb::get, "/api/metrics/requests?db=mongo"));
    EXPECT_EQ(one["throughput"], 1);
    EXPECT_DOUBLE_EQ(one["avgLatency"].get<double>(), 0.004);

    auto all = bodyOf(call(http::verb::get, "/api/metrics/requests"));
    EXPECT_TRUE(all.contains("mongo"));
    EXPECT_TRUE(all.contains("cassandra"));
    EXPECT_TRUE(all.contains("general"));
    EXPECT_EQ(all["mongo"]["throughput"], 0);

    EXPECT_EQ(call(http::verb::get, "/api/metrics/requests?db=redis").result(),
              http::status::bad_request);
}

TEST_F(ApiControllersTest, DashboardSummaryAggregatesEveryPart) {
    ASSERT_TRUE(fake_->stopNode("cassandra2"));

    auto res = call(http::verb::get, "/api/dashboard/summary");
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = bodyOf(res);
    EXPECT_EQ(body["controller"]["status"], "ok");
    EXPECT_EQ(body["controller"]["mode"], "live");

    EXPECT_EQ(body["mongo"]["status"], "ok");
    EXPECT_EQ(body["mongo"]["reachable"], true);
    EXPECT_EQ(body["mongo"]["runningNodes"], 3);
    EXPECT_EQ(body["mongo"]["nodes"]["mongo1"], "running");

    EXPECT_EQ(body["cassandra"]["status"], "degraded");
    EXPECT_EQ(body["cassandra"]["runningNodes"], 2);
    EXPECT_EQ(body["cassandra"]["totalNodes"], 3);

    ASSERT_TRUE(body["uptimes"].is_object());
    EXPECT_TRUE(body["uptimes"].contains("mongo1"));
    EXPECT_FALSE(body["uptimes"].contains("cassandra1"));

    const auto& live = body["liveMetrics"];
    EXPECT_TRUE(live["cpu_percent"].is_number());
    EXPECT_TRUE(live["memory_percent"].is_number());
    EXPECT_TRUE(live["mongo"].contains("throughput"));
    EXPECT_TRUE(live["cassandra"].contains("avg_latency"));
}

TEST_F(ApiControllersTest, LiveSystemMetrics) {
    auto res = call(http::verb::get, "/api/report/metrics/live");
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = bodyOf(res);
    EXPECT_TRUE(body.contains("timestamp"));
    EXPECT_TRUE(body["cpu_percent"].is_number());
    EXPECT_GT(body["memory"]["total"].get<std::uint64_t>(), 0u);
    EXPECT_TRUE(body["disk"].contains("percent"));
}

TEST_F(ApiControllersTest, LatencyTestAgainstOneStore) {
    auto res = call(http::verb::get, "/api/performance/test-latency?db=mongo");
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = bodyOf(res);
    EXPECT_EQ(body["db"], "mongo");
    EXPECT_EQ(body["status"], "success");
    EXPECT_TRUE(body["latency"].is_number());
    EXPECT_GE(body["test_duration"].get<double>(), 0.0);

    auto cassandra = call(http::verb::get, "/api/performance/test-latency?db=cassandra");
    ASSERT_EQ(cassandra.result(), http::status::ok);
    EXPECT_EQ(bodyOf(cassandra)["status"], "success");

    EXPECT_EQ(call(http::verb::get, "/api/performance/test-latency?db=redis").result(),
              http::status::bad_request);
    EXPECT_EQ(call(http::verb::get, "/api/performance/test-latency").result(),
              http::status::bad_request);
}

TEST(DashboardLiveMetricsTest, MissingSampleFieldsBecomeZero) {
    metrics::RequestMetrics requests;
    auto out = normalizeLiveMetrics(json::object(), requests);
    EXPECT_EQ(out["cpu_percent"], 0);
    EXPECT_EQ(out["memory_percent"], 0);
    EXPECT_TRUE(out["timestamp"].is_null());
    EXPECT_EQ(out["mongo"]["throughput"], 0);
}

TEST_F(ApiControllersTest, UnreachableStoreIsDegradedNotFatal) {
    service_->embeddedStore(StoreId::MongoDB)->setOnline(false);

    auto res = call(http::verb::get, "/api/dashboard/summary");
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = bodyOf(res);
    EXPECT_EQ(body["mongo"]["reachable"], false);
    EXPECT_EQ(body["mongo"]["status"], "degraded");
    EXPECT_TRUE(body["mongo"].contains("error"));
    EXPECT_EQ(body["cassandra"]["status"], "ok");

    auto latency = call(http::verb::get, "/api/performance/test-latency?db=mongodb");
    ASSERT_EQ(latency.result(), http::status::ok);
    auto lb = bodyOf(latency);
    EXPECT_EQ(lb["status"], "error");
    EXPECT_TRUE(lb["latency"].is_null());
    EXPECT_TRUE(lb.contains("error"));
}
