#include <faultline/api/system_controller.h>
#include <faultline/core/async.h>

namespace faultline::api {

namespace asio = boost::asio;
using nlohmann::json;

SystemController::SystemController(infra::InfrastructureController& infra,
                                   scenario::ScenarioRegistry& registry,
                                   metrics::RequestMetrics& metrics, asio::any_io_executor pool)
    : infra_(infra), registry_(registry), metrics_(metrics), pool_(std::move(pool)) {}

void SystemController::registerRoutes(Router& router) {
    router.add(http::verb::get, "/api/health",
               [this](const Request& req, const RouteParams& p) { return health(req, p); });
    router.add(http::verb::get, "/api/metrics/requests",
               [this](const Request& req, const RouteParams& p) { return requestStats(req, p); });
}

asio::awaitable<Response> SystemController::health(const Request& req, const RouteParams&) {
    auto& infra = infra_;
    auto mode = co_await offload<infra::InfraMode>(
        pool_, [&infra] { return Result<infra::InfraMode>(infra.mode()); });
    json out{{"status", "ok"},
             {"mode", mode ? infra::infraModeName(mode.value()) : "unknown"},
             {"activeScenarios", registry_.active()}};
    co_return jsonResponse(http::status::ok, out, req.version());
}

asio::awaitable<Response> SystemController::requestStats(const Request& req,
                                                         const RouteParams& params) {
    auto statsJson = [this](metrics::RequestCategory c) {
        auto s = metrics_.snapshotAndReset(c);
        return json{{"throughput", s.throughput}, {"avgLatency", s.avgLatency}};
    };

    if (auto db = params.param("db")) {
        auto category = metrics::categoryFromString(*db);
        if (!category) {
            co_return errorResponse(
                Error{ErrorCode::InvalidArgument, "db must be one of mongo, cassandra, general"},
                req.version());
        }
        co_return jsonResponse(http::status::ok, statsJson(*category), req.version());
    }

    json out = json::object();
    for (auto c : metrics::kAllCategories)
        out[metrics::categoryName(c)] = statsJson(c);
    co_return jsonResponse(http::status::ok, out, req.version());
}

} // namespace faultline::api
