#include <faultline/api/report_controller.h>

namespace faultline::api {

namespace asio = boost::asio;
using nlohmann::json;

namespace {

std::string contentTypeFor(const std::string& name) {
    auto ends = [&](const std::string& ext) {
        return name.size() >= ext.size() && name.compare(name.size() - ext.size(), ext.size(), ext) == 0;
    };
    if (ends(".json"))
        return "application/json; charset=utf-8";
    if (ends(".md"))
        return "text/markdown; charset=utf-8";
    return "text/plain; charset=utf-8";
}

} // namespace

ReportController::ReportController(report::FileReportSink& sink) : sink_(sink) {}

void ReportController::registerRoutes(Router& router) {
    auto listHandler = [this](const Request& req, const RouteParams& p) { return list(req, p); };
    router.add(http::verb::get, "/api/report", listHandler);
    router.add(http::verb::get, "/api/report/", listHandler);
    router.add(http::verb::get, "/api/report/latest",
               [this](const Request& req, const RouteParams& p) { return latest(req, p); });
    router.addPrefix(http::verb::get, "/api/report/",
                     [this](const Request& req, const RouteParams& p) { return fetch(req, p); });
}

asio::awaitable<Response> ReportController::list(const Request& req, const RouteParams&) {
    auto names = sink_.list();
    if (!names)
        co_return errorResponse(names.error(), req.version());
    co_return jsonResponse(http::status::ok, json(names.value()), req.version());
}

asio::awaitable<Response> ReportController::latest(const Request& req, const RouteParams&) {
    auto latest = sink_.latest();
    if (!latest)
        co_return errorResponse(latest.error(), req.version());
    co_return jsonResponse(http::status::ok, json{{"latest_report", latest.value().string()}},
                           req.version());
}

asio::awaitable<Response> ReportController::fetch(const Request& req, const RouteParams& params) {
    auto contents = sink_.read(params.tail);
    if (!contents)
        co_return errorResponse(contents.error(), req.version());
    co_return textResponse(http::status::ok, std::move(contents).value(),
                           contentTypeFor(params.tail), req.version());
}

} // namespace faultline::api
