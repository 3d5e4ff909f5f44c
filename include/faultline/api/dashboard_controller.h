#pragma once

#include <faultline/api/router.h>
#include <faultline/infra/infrastructure_controller.h>
#include <faultline/metrics/request_metrics.h>
#include <faultline/metrics/system_metrics.h>
#include <faultline/scenario/scenario_registry.h>
#include <faultline/store/store_driver.h>
#include <faultline/store/store_probe.h>

#include <array>
#include <chrono>
#include <memory>
#include <vector>

#include <boost/asio/any_io_executor.hpp>

namespace faultline::api {

/**
 * @brief Read-only views for the dashboard.
 *
 * GET /api/dashboard/summary gathers controller health, per-store status,
 * container uptimes and live host metrics concurrently. A part that fails or
 * exceeds its timeout is replaced by an error entry; the others are returned
 * as usual.
 */
class DashboardController {
public:
    struct Options {
        // Interval between the two CPU readings of a live sample
        std::chrono::milliseconds cpuWindow{500};
        std::chrono::milliseconds partTimeout{5000};
    };

    DashboardController(infra::InfrastructureController& infra,
                        scenario::ScenarioRegistry& registry, metrics::RequestMetrics& metrics,
                        const metrics::SystemMetricsSampler& sampler,
                        std::array<std::shared_ptr<store::IAsyncStoreDriver>, 2> drivers,
                        std::array<std::shared_ptr<store::StoreProbe>, 2> probes,
                        std::array<std::vector<NodeId>, 2> storeNodes, Options options,
                        boost::asio::any_io_executor pool);

    void registerRoutes(Router& router);

    boost::asio::awaitable<Response> summary(const Request& req, const RouteParams& params);
    boost::asio::awaitable<Response> liveMetrics(const Request& req, const RouteParams& params);
    boost::asio::awaitable<Response> testLatency(const Request& req, const RouteParams& params);

private:
    boost::asio::awaitable<Result<nlohmann::json>> controllerHealth();
    boost::asio::awaitable<Result<nlohmann::json>> storeStatus(StoreId id);
    boost::asio::awaitable<Result<nlohmann::json>> uptimes();
    boost::asio::awaitable<Result<nlohmann::json>> sampleSystem();

    infra::InfrastructureController& infra_;
    scenario::ScenarioRegistry& registry_;
    metrics::RequestMetrics& metrics_;
    const metrics::SystemMetricsSampler& sampler_;
    std::array<std::shared_ptr<store::IAsyncStoreDriver>, 2> drivers_;
    std::array<std::shared_ptr<store::StoreProbe>, 2> probes_;
    std::array<std::vector<NodeId>, 2> storeNodes_;
    Options options_;
    boost::asio::any_io_executor pool_;
};

// Flattens a live sample plus request counters into the summary's liveMetrics
nlohmann::json normalizeLiveMetrics(const nlohmann::json& live,
                                    const metrics::RequestMetrics& requests);

} // namespace faultline::api
