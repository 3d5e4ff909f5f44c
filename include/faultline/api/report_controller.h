#pragma once

#include <faultline/api/router.h>
#include <faultline/report/report_sink.h>

namespace faultline::api {

// /api/report/*: saved benchmark reports
class ReportController {
public:
    explicit ReportController(report::FileReportSink& sink);

    void registerRoutes(Router& router);

    boost::asio::awaitable<Response> list(const Request& req, const RouteParams& params);
    boost::asio::awaitable<Response> latest(const Request& req, const RouteParams& params);
    boost::asio::awaitable<Response> fetch(const Request& req, const RouteParams& params);

private:
    report::FileReportSink& sink_;
};

} // namespace faultline::api
