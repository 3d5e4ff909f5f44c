#pragma once

#include <faultline/api/router.h>
#include <faultline/benchmark/benchmark_runner.h>
#include <faultline/report/report_sink.h>

namespace faultline::api {

// /api/performance/*: benchmark runs and table cleanup
class PerformanceController {
public:
    PerformanceController(benchmark::PerformanceBenchmarkRunner& runner, report::IReportSink& sink);

    void registerRoutes(Router& router);

    boost::asio::awaitable<Response> run(const Request& req, const RouteParams& params);
    boost::asio::awaitable<Response> cleanup(const Request& req, const RouteParams& params);

private:
    benchmark::PerformanceBenchmarkRunner& runner_;
    report::IReportSink& sink_;
};

} // namespace faultline::api
