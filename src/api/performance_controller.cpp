#include <faultline/api/performance_controller.h>
#include <faultline/benchmark/benchmark_json.h>
#include <faultline/core/ids.h>

#include <spdlog/spdlog.h>

namespace faultline::api {

namespace asio = boost::asio;
using nlohmann::json;

PerformanceController::PerformanceController(benchmark::PerformanceBenchmarkRunner& runner,
                                             report::IReportSink& sink)
    : runner_(runner), sink_(sink) {}

void PerformanceController::registerRoutes(Router& router) {
    router.add(http::verb::post, "/api/performance/run",
               [this](const Request& req, const RouteParams& p) { return run(req, p); });
    router.add(http::verb::post, "/api/performance/cleanup",
               [this](const Request& req, const RouteParams& p) { return cleanup(req, p); });
}

asio::awaitable<Response> PerformanceController::run(const Request& req, const RouteParams&) {
    auto body = req.body().empty() ? json(nullptr) : json::parse(req.body(), nullptr, false);
    if (body.is_discarded()) {
        co_return errorResponse(Error{ErrorCode::InvalidArgument, "malformed JSON body"},
                                req.version());
    }
    auto config = benchmark::benchmarkConfigFromJson(body);
    if (!config)
        co_return errorResponse(config.error(), req.version());

    auto ran = co_await runner_.run(config.value());
    if (!ran)
        co_return errorResponse(ran.error(), req.version());
    const auto& report = ran.value();

    auto summary = benchmark::benchmarkSummaryToJson(report);
    auto latency = benchmark::latencyMetricsToJson(report);
    auto throughput = benchmark::throughputMetricsToJson(report);
    auto details = benchmark::benchmarkDetailsToJson(report);

    bool success = true;
    for (const auto& s : report.stores) {
        if (s.failure)
            success = false;
    }

    json out{{"success", success},
             {"summary", summary},
             {"latencyMetrics", latency},
             {"throughputMetrics", throughput},
             {"detailedResults", details}};

    const auto stamp = reportTimestamp(std::chrono::system_clock::now());
    auto saved = sink_.save("performance", stamp, summary,
                            {report::ReportSeries{"Latency", latency},
                             report::ReportSeries{"Throughput", throughput}},
                            details);
    if (saved) {
        out["report"] = saved.value().markdown.filename().string();
    } else {
        spdlog::error("[PerformanceController] saving report failed: {}", saved.error().message);
        out["reportError"] = saved.error().message;
    }
    co_return jsonResponse(http::status::ok, out, req.version());
}

asio::awaitable<Response> PerformanceController::cleanup(const Request& req, const RouteParams&) {
    if (runner_.running()) {
        co_return errorResponse(
            Error{ErrorCode::BenchmarkBusy, "cannot clean up while a benchmark run is active"},
            req.version());
    }
    auto results = co_await runner_.cleanup();
    json stores = json::object();
    bool allOk = true;
    for (auto id : kAllStores) {
        const auto& r = results[storeIndex(id)];
        if (r) {
            stores[storeKey(id)] = "ok";
        } else {
            allOk = false;
            stores[storeKey(id)] = r.error().message;
        }
    }
    json out{{"status", allOk ? "Cleaned successfully" : "Cleanup finished with errors"},
             {"stores", std::move(stores)}};
    co_return jsonResponse(http::status::ok, out, req.version());
}

} // namespace faultline::api
