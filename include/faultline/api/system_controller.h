#pragma once

#include <faultline/api/router.h>
#include <faultline/infra/infrastructure_controller.h>
#include <faultline/metrics/request_metrics.h>
#include <faultline/scenario/scenario_registry.h>

#include <boost/asio/any_io_executor.hpp>

namespace faultline::api {

// /api/health and /api/metrics/requests
class SystemController {
public:
    SystemController(infra::InfrastructureController& infra, scenario::ScenarioRegistry& registry,
                     metrics::RequestMetrics& metrics, boost::asio::any_io_executor pool);

    void registerRoutes(Router& router);

    boost::asio::awaitable<Response> health(const Request& req, const RouteParams& params);
    boost::asio::awaitable<Response> requestStats(const Request& req, const RouteParams& params);

private:
    infra::InfrastructureController& infra_;
    scenario::ScenarioRegistry& registry_;
    metrics::RequestMetrics& metrics_;
    boost::asio::any_io_executor pool_;
};

} // namespace faultline::api
