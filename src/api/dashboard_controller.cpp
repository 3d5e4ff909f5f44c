#include <faultline/api/dashboard_controller.h>
#include <faultline/api/failure_controller.h>
#include <faultline/core/async.h>

#include <spdlog/spdlog.h>

#include <cmath>

namespace faultline::api {

namespace asio = boost::asio;
using nlohmann::json;

namespace {

std::optional<StoreId> storeFromDbParam(const std::string& db) {
    if (db == "mongo" || db == "mongodb")
        return StoreId::MongoDB;
    if (db == "cassandra")
        return StoreId::Cassandra;
    return std::nullopt;
}

json errorPart(const Error& e) {
    return json{{"status", "error"}, {"message", e.message}};
}

} // namespace

json normalizeLiveMetrics(const json& live, const metrics::RequestMetrics& requests) {
    auto number = [](const json& obj, const char* key) -> json {
        if (obj.is_object() && obj.contains(key) && obj[key].is_number())
            return obj[key];
        return 0;
    };
    json memory = live.is_object() && live.contains("memory") ? live["memory"] : json::object();
    auto store = [&requests](metrics::RequestCategory c) {
        auto s = requests.peek(c);
        return json{{"throughput", s.throughput}, {"avg_latency", s.avgLatency}};
    };
    return json{{"timestamp", live.is_object() && live.contains("timestamp") ? live["timestamp"]
                                                                            : json(nullptr)},
                {"cpu_percent", number(live, "cpu_percent")},
                {"memory_percent", number(memory, "percent")},
                {"mongo", store(metrics::RequestCategory::Mongo)},
                {"cassandra", store(metrics::RequestCategory::Cassandra)}};
}

DashboardController::DashboardController(
    infra::InfrastructureController& infra, scenario::ScenarioRegistry& registry,
    metrics::RequestMetrics& metrics, const metrics::SystemMetricsSampler& sampler,
    std::array<std::shared_ptr<store::IAsyncStoreDriver>, 2> drivers,
    std::array<std::shared_ptr<store::StoreProbe>, 2> probes,
    std::array<std::vector<NodeId>, 2> storeNodes, Options options, asio::any_io_executor pool)
    : infra_(infra), registry_(registry), metrics_(metrics), sampler_(sampler),
      drivers_(std::move(drivers)), probes_(std::move(probes)), storeNodes_(std::move(storeNodes)),
      options_(options), pool_(std::move(pool)) {}

void DashboardController::registerRoutes(Router& router) {
    router.add(http::verb::get, "/api/dashboard/summary",
               [this](const Request& req, const RouteParams& p) { return summary(req, p); });
    router.add(http::verb::get, "/api/report/metrics/live",
               [this](const Request& req, const RouteParams& p) { return liveMetrics(req, p); });
    router.add(http::verb::get, "/api/performance/test-latency",
               [this](const Request& req, const RouteParams& p) { return testLatency(req, p); });
}

asio::awaitable<Result<json>> DashboardController::controllerHealth() {
    auto& infra = infra_;
    auto mode = co_await offload<infra::InfraMode>(
        pool_, [&infra] { return Result<infra::InfraMode>(infra.mode()); }, options_.partTimeout);
    if (!mode)
        co_return mode.error();
    co_return json{{"status", "ok"},
                   {"mode", infra::infraModeName(mode.value())},
                   {"activeScenarios", registry_.active()}};
}

asio::awaitable<Result<json>> DashboardController::storeStatus(StoreId id) {
    const auto idx = storeIndex(id);
    auto& infra = infra_;
    auto fn = [&infra, names = storeNodes_[idx]] {
        json out = json::object();
        for (const auto& n : names)
            out[n] = infra::nodeStateName(infra.status(n));
        return Result<json>(std::move(out));
    };
    auto states = co_await offload<json>(pool_, std::move(fn), options_.partTimeout);
    if (!states)
        co_return states.error();

    std::size_t running = 0;
    for (const auto& state : states.value()) {
        if (state == infra::nodeStateName(infra::NodeState::Running))
            ++running;
    }

    Result<void> reachable = Error{ErrorCode::StoreError, "driver not configured"};
    if (drivers_[idx])
        reachable = co_await withTimeout<void>(drivers_[idx]->connect(), options_.partTimeout);

    const auto total = storeNodes_[idx].size();
    const char* status = "down";
    if (reachable && running == total)
        status = "ok";
    else if (reachable || running > 0)
        status = "degraded";

    json out{{"store", storeDisplayName(id)},
             {"status", status},
             {"reachable", static_cast<bool>(reachable)},
             {"runningNodes", running},
             {"totalNodes", total},
             {"nodes", std::move(states).value()}};
    if (!reachable)
        out["error"] = reachable.error().message;
    co_return out;
}

asio::awaitable<Result<json>> DashboardController::uptimes() {
    auto& infra = infra_;
    auto fn = [&infra, names = storeNodes_[storeIndex(StoreId::MongoDB)]] {
        json out = json::object();
        for (const auto& n : names)
            out[n] = uptimeToJson(infra.uptime(n));
        return Result<json>(std::move(out));
    };
    co_return co_await offload<json>(pool_, std::move(fn), options_.partTimeout);
}

asio::awaitable<Result<json>> DashboardController::sampleSystem() {
    const auto& sampler = sampler_;
    co_return co_await offload<json>(
        pool_,
        [&sampler, window = options_.cpuWindow]() -> Result<json> {
            auto snap = sampler.sample(window);
            if (!snap)
                return snap.error();
            return metrics::systemSnapshotToJson(snap.value());
        },
        options_.partTimeout + options_.cpuWindow);
}

asio::awaitable<Response> DashboardController::summary(const Request& req, const RouteParams&) {
    enum Part { Controller, Mongo, Cassandra, Uptimes, Live };
    std::vector<asio::awaitable<Result<json>>> parts;
    parts.push_back(controllerHealth());
    parts.push_back(storeStatus(StoreId::MongoDB));
    parts.push_back(storeStatus(StoreId::Cassandra));
    parts.push_back(uptimes());
    parts.push_back(sampleSystem());
    auto results = co_await whenAll(std::move(parts));

    auto orError = [&results](Part p) {
        auto& r = results[p];
        if (r)
            return std::move(r).value();
        spdlog::warn("[DashboardController] summary part {} failed: {}", static_cast<int>(p),
                     r.error().message);
        return errorPart(r.error());
    };
    auto orEmpty = [&results](Part p) {
        auto& r = results[p];
        if (r)
            return std::move(r).value();
        spdlog::warn("[DashboardController] summary part {} failed: {}", static_cast<int>(p),
                     r.error().message);
        return json::object();
    };

    json out{{"controller", orError(Controller)},
             {"mongo", orError(Mongo)},
             {"cassandra", orError(Cassandra)},
             {"uptimes", orEmpty(Uptimes)},
             {"liveMetrics", normalizeLiveMetrics(orEmpty(Live), metrics_)}};
    co_return jsonResponse(http::status::ok, out, req.version());
}

asio::awaitable<Response> DashboardController::liveMetrics(const Request& req,
                                                           const RouteParams&) {
    auto live = co_await sampleSystem();
    if (!live) {
        spdlog::error("[DashboardController] live metrics failed: {}", live.error().message);
        co_return errorResponse(Error{ErrorCode::InternalError, "Failed to retrieve live metrics: " +
                                                                    live.error().message},
                                req.version());
    }
    co_return jsonResponse(http::status::ok, live.value(), req.version());
}

asio::awaitable<Response> DashboardController::testLatency(const Request& req,
                                                           const RouteParams& params) {
    auto db = params.param("db");
    if (!db) {
        co_return errorResponse(Error{ErrorCode::InvalidArgument, "db is required"},
                                req.version());
    }
    auto id = storeFromDbParam(*db);
    if (!id) {
        co_return errorResponse(
            Error{ErrorCode::InvalidArgument, "db must be one of mongo, cassandra"},
            req.version());
    }
    auto& probe = probes_[storeIndex(*id)];
    if (!probe) {
        co_return errorResponse(Error{ErrorCode::StoreError, "no probe for " + *db},
                                req.version());
    }

    const auto start = std::chrono::steady_clock::now();
    auto sample = co_await probe->probe();
    const double took =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    json out{{"db", *db},
             {"latency", sample.latencyMs ? json(*sample.latencyMs / 1000.0) : json(nullptr)},
             {"test_duration", std::round(took * 10000.0) / 10000.0},
             {"status", sample.success ? "success" : "error"}};
    if (sample.error)
        out["error"] = *sample.error;
    spdlog::info("[DashboardController] latency test for {}: {}", *db, out["latency"].dump());
    co_return jsonResponse(http::status::ok, out, req.version());
}

} // namespace faultline::api
