#pragma once

#include <faultline/api/dashboard_controller.h>
#include <faultline/api/failure_controller.h>
#include <faultline/api/http_server.h>
#include <faultline/api/performance_controller.h>
#include <faultline/api/report_controller.h>
#include <faultline/api/router.h>
#include <faultline/api/system_controller.h>
#include <faultline/benchmark/benchmark_runner.h>
#include <faultline/config/config.h>
#include <faultline/core/worker_pool.h>
#include <faultline/infra/infrastructure_controller.h>
#include <faultline/infra/node_lock_registry.h>
#include <faultline/metrics/request_metrics.h>
#include <faultline/metrics/system_metrics.h>
#include <faultline/report/report_sink.h>
#include <faultline/scenario/failure_scenario_runner.h>
#include <faultline/scenario/scenario_registry.h>
#include <faultline/store/driver_factory.h>
#include <faultline/store/store_probe.h>

#include <array>
#include <memory>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

namespace faultline::app {

/**
 * @brief Owns every long-lived handle of the process and wires them together.
 *
 * The scheduler io_context is driven by the thread that calls run(); blocking
 * work goes to the worker pool. Without an injected orchestrator the Docker
 * backend from the configuration is used.
 *
 * Throws std::runtime_error when a configured store backend cannot be built.
 */
class Service {
public:
    explicit Service(config::ServiceConfig config,
                     std::unique_ptr<infra::IOrchestrator> orchestrator = nullptr);
    ~Service();

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    // Binds the HTTP listener and installs SIGINT/SIGTERM handling
    Result<void> start();

    // Runs the scheduler on the calling thread until requestStop()
    void run();

    // Safe to call from any thread
    void requestStop();

    uint16_t port() const { return server_.port(); }
    boost::asio::io_context& scheduler() { return scheduler_; }
    const api::Router& router() const { return router_; }
    infra::InfrastructureController& infrastructure() { return infra_; }
    metrics::RequestMetrics& requestMetrics() { return metrics_; }
    const config::ServiceConfig& config() const { return config_; }
    // Embedded backing store of @p id, null when the store is external
    const std::shared_ptr<store::MemoryStore>& embeddedStore(StoreId id) const {
        return stores_.embedded[storeIndex(id)];
    }

private:
    static std::unique_ptr<infra::IOrchestrator>
    makeOrchestrator(const config::ServiceConfig& config,
                     std::unique_ptr<infra::IOrchestrator> injected);

    config::ServiceConfig config_;
    boost::asio::io_context scheduler_;
    WorkerPool pool_;

    infra::InfrastructureController infra_;
    infra::NodeLockRegistry locks_;
    scenario::ScenarioRegistry registry_;
    metrics::RequestMetrics metrics_;

    static store::StoreDriverSet makeStores(const config::ServiceConfig& config,
                                            boost::asio::any_io_executor pool);

    metrics::SystemMetricsSampler sampler_;
    store::StoreDriverSet stores_;
    std::array<std::shared_ptr<store::StoreProbe>, 2> probes_;

    scenario::FailureScenarioRunner scenarioRunner_;
    benchmark::PerformanceBenchmarkRunner benchmarkRunner_;
    report::FileReportSink reports_;

    api::FailureController failureApi_;
    api::PerformanceController performanceApi_;
    api::ReportController reportApi_;
    api::SystemController systemApi_;
    api::DashboardController dashboardApi_;
    api::Router router_;
    api::HttpServer server_;

    boost::asio::signal_set signals_;
    bool stopped_ = false;
};

} // namespace faultline::app
