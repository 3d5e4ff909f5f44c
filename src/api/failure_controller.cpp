#include <faultline/api/failure_controller.h>
#include <faultline/core/json_fields.h>
#include <faultline/scenario/scenario_json.h>

#include <spdlog/spdlog.h>

#include <cmath>

namespace faultline::api {

namespace asio = boost::asio;
using nlohmann::json;

Result<scenario::Scenario> scenarioFromJson(const json& body, int maxDurationSeconds) {
    if (!body.is_object())
        return Error{ErrorCode::InvalidArgument, "request body must be a JSON object"};

    std::string failureType = "node";
    std::string targetNode = "mongo1";
    int duration = 30;
    bool testOperations = true;

    if (auto it = body.find("failureType"); it != body.end()) {
        if (!it->is_string())
            return Error{ErrorCode::InvalidArgument, "failureType must be a string"};
        failureType = it->get<std::string>();
    }
    if (auto it = body.find("targetNode"); it != body.end()) {
        if (!it->is_string())
            return Error{ErrorCode::InvalidArgument, "targetNode must be a string"};
        targetNode = it->get<std::string>();
    }
    if (auto it = body.find("duration"); it != body.end()) {
        auto parsed = readBoundedInt(*it, "duration", 1, maxDurationSeconds, "seconds");
        if (!parsed)
            return parsed.error();
        duration = parsed.value();
    }
    if (auto it = body.find("testOperations"); it != body.end()) {
        if (!it->is_boolean())
            return Error{ErrorCode::InvalidArgument, "testOperations must be a boolean"};
        testOperations = it->get<bool>();
    }

    auto kind = scenario::failureKindFromString(failureType);
    if (!kind)
        return Error{ErrorCode::InvalidArgument, "Unsupported failure type: " + failureType};
    return scenario::makeScenario(*kind, targetNode, duration, testOperations, maxDurationSeconds);
}

FailureController::FailureController(scenario::FailureScenarioRunner& runner,
                                     scenario::ScenarioRegistry& registry,
                                     infra::InfrastructureController& infra,
                                     std::vector<NodeId> knownNodes, asio::any_io_executor pool)
    : runner_(runner),
      registry_(registry),
      infra_(infra),
      knownNodes_(std::move(knownNodes)),
      pool_(std::move(pool)) {}

void FailureController::registerRoutes(Router& router) {
    router.add(http::verb::post, "/api/failure/simulate",
               [this](const Request& req, const RouteParams& p) { return simulate(req, p); });
    router.add(http::verb::get, "/api/failure/container-uptimes",
               [this](const Request& req, const RouteParams& p) {
                   return containerUptimes(req, p);
               });
    router.add(http::verb::post, "/api/failure/stop",
               [this](const Request& req, const RouteParams& p) { return stop(req, p); });
    router.add(http::verb::get, "/api/failure/cap-analysis",
               [this](const Request& req, const RouteParams& p) { return capAnalysis(req, p); });
}

asio::awaitable<Response> FailureController::simulate(const Request& req, const RouteParams&) {
    auto body = req.body().empty() ? json::object() : json::parse(req.body(), nullptr, false);
    if (body.is_discarded()) {
        co_return errorResponse(Error{ErrorCode::InvalidArgument, "malformed JSON body"},
                                req.version());
    }
    auto parsed = scenarioFromJson(body, runner_.config().maxDurationSeconds);
    if (!parsed)
        co_return errorResponse(parsed.error(), req.version());

    auto registration = registry_.add();
    auto result = co_await runner_.run(std::move(parsed).value(), registration->token());
    registration.reset();

    auto detailed = scenario::resultToJson(result);
    if (result.failure) {
        co_return errorResponse(Error{result.failure->kind, result.failure->message},
                                json{{"detailedResults", std::move(detailed)}}, req.version());
    }

    json out{{"success", result.success},
             {"summary", scenario::summaryToJson(result)},
             {"recoveryMetrics", scenario::recoveryToJson(result)},
             {"availabilityMetrics", scenario::availabilityToJson(result)},
             {"detailedResults", std::move(detailed)}};
    co_return jsonResponse(http::status::ok, out, req.version());
}

json uptimeToJson(const Result<infra::UptimeInfo>& up) {
    if (!up)
        return json{{"error", up.error().message}};
    const auto secs = up.value().seconds;
    return json{{"seconds", secs},
                {"hours", std::round(static_cast<double>(secs) / 36.0) / 100.0},
                {"status", up.value().status}};
}

asio::awaitable<Response> FailureController::containerUptimes(const Request& req,
                                                              const RouteParams& params) {
    auto names = scenario::splitNodeList(params.param("names").value_or(""));
    if (names.empty()) {
        co_return errorResponse(Error{ErrorCode::InvalidArgument, "No container names provided"},
                                req.version());
    }
    for (const auto& name : names) {
        if (!infra::isValidNodeName(name)) {
            co_return errorResponse(
                Error{ErrorCode::InvalidArgument, "invalid container name: " + name},
                req.version());
        }
    }

    auto& infra = infra_;
    json uptimes = json::object();
    for (const auto& name : names) {
        auto fn = [&infra, name] { return infra.uptime(name); };
        auto up = co_await offload<infra::UptimeInfo>(pool_, std::move(fn));
        uptimes[name] = uptimeToJson(up);
    }
    co_return jsonResponse(http::status::ok, json{{"uptimes", std::move(uptimes)}}, req.version());
}

asio::awaitable<Response> FailureController::stop(const Request& req, const RouteParams&) {
    const auto cancelled = registry_.cancelAll();

    auto& infra = infra_;
    auto mode = co_await offload<infra::InfraMode>(
        pool_, [&infra] { return Result<infra::InfraMode>(infra.mode()); });
    const bool synthetic = mode && mode.value() == infra::InfraMode::Synthetic;

    json restored = json::array();
    for (const auto& node : knownNodes_) {
        auto statusFn = [&infra, node] { return Result<infra::NodeState>(infra.status(node)); };
        auto state = co_await offload<infra::NodeState>(pool_, std::move(statusFn));
        if (!state || state.value() != infra::NodeState::Stopped)
            continue;
        auto startFn = [&infra, node] { return infra.start(node); };
        auto started = co_await offload<void>(pool_, std::move(startFn));
        if (started) {
            restored.push_back(node);
        } else {
            spdlog::warn("[FailureController] Failed to restore {}: {}", node,
                         started.error().message);
        }
    }

    json out{{"message", synthetic ? "Synthetic mode: simulated nodes restored"
                                   : "Restoration complete"},
             {"restored", std::move(restored)},
             {"cancelled", cancelled}};
    co_return jsonResponse(http::status::ok, out, req.version());
}

json FailureController::capScorecard() {
    return json{
        {"mongodb",
         {{"consistency", {{"level", "Strong"}, {"description", "ACID transactions"}, {"score", 90}}},
          {"availability",
           {{"level", "High"}, {"description", "Automatic failover"}, {"score", 75}}},
          {"partitionTolerance",
           {{"level", "High"}, {"description", "Replica sets"}, {"score", 85}}},
          {"capClassification", "CP"}}},
        {"cassandra",
         {{"consistency",
           {{"level", "Tunable"}, {"description", "Configurable consistency"}, {"score", 60}}},
          {"availability",
           {{"level", "Very High"}, {"description", "No single point of failure"}, {"score", 95}}},
          {"partitionTolerance",
           {{"level", "Very High"}, {"description", "Designed for partitions"}, {"score", 95}}},
          {"capClassification", "AP"}}}};
}

asio::awaitable<Response> FailureController::capAnalysis(const Request& req, const RouteParams&) {
    co_return jsonResponse(http::status::ok, capScorecard(), req.version());
}

} // namespace faultline::api
