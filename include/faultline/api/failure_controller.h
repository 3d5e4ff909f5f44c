#pragma once

#include <faultline/api/router.h>
#include <faultline/infra/infrastructure_controller.h>
#include <faultline/scenario/failure_scenario_runner.h>
#include <faultline/scenario/scenario_registry.h>

#include <vector>

#include <boost/asio/any_io_executor.hpp>

namespace faultline::api {

// /api/failure/*: scenario execution, uptimes, emergency stop, CAP scorecard
class FailureController {
public:
    FailureController(scenario::FailureScenarioRunner& runner, scenario::ScenarioRegistry& registry,
                      infra::InfrastructureController& infra, std::vector<NodeId> knownNodes,
                      boost::asio::any_io_executor pool);

    void registerRoutes(Router& router);

    boost::asio::awaitable<Response> simulate(const Request& req, const RouteParams& params);
    boost::asio::awaitable<Response> containerUptimes(const Request& req,
                                                      const RouteParams& params);
    boost::asio::awaitable<Response> stop(const Request& req, const RouteParams& params);
    boost::asio::awaitable<Response> capAnalysis(const Request& req, const RouteParams& params);

    static nlohmann::json capScorecard();

private:
    scenario::FailureScenarioRunner& runner_;
    scenario::ScenarioRegistry& registry_;
    infra::InfrastructureController& infra_;
    std::vector<NodeId> knownNodes_;
    boost::asio::any_io_executor pool_;
};

// Parses {failureType, targetNode, duration, testOperations} with the
// dashboard defaults (node, mongo1, 30, true)
Result<scenario::Scenario> scenarioFromJson(const nlohmann::json& body, int maxDurationSeconds);

// {seconds, hours, status} or {error}
nlohmann::json uptimeToJson(const Result<infra::UptimeInfo>& uptime);

} // namespace faultline::api
