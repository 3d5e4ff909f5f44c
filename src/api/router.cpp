#include <faultline/api/router.h>

#include <spdlog/spdlog.h>

namespace faultline::api {

namespace asio = boost::asio;

void Router::add(http::verb method, std::string path, Handler handler) {
    routes_.push_back(Route{method, std::move(path), false, std::move(handler)});
}

void Router::addPrefix(http::verb method, std::string prefix, Handler handler) {
    routes_.push_back(Route{method, std::move(prefix), true, std::move(handler)});
}

const Router::Route* Router::match(http::verb method, const std::string& path,
                                   bool& pathKnown) const {
    pathKnown = false;
    for (const auto& r : routes_) {
        if (!r.prefix && r.path == path) {
            pathKnown = true;
            if (r.method == method)
                return &r;
        }
    }
    const Route* best = nullptr;
    for (const auto& r : routes_) {
        if (!r.prefix || path.size() <= r.path.size() || path.compare(0, r.path.size(), r.path) != 0)
            continue;
        pathKnown = true;
        if (r.method == method && (!best || r.path.size() > best->path.size()))
            best = &r;
    }
    return best;
}

asio::awaitable<Response> Router::dispatch(const Request& req) const {
    if (req.method() == http::verb::options) {
        Response res{http::status::no_content, req.version()};
        applyCors(res);
        res.set(http::field::access_control_max_age, "86400");
        co_return res;
    }

    RouteParams params;
    const auto path = splitTarget(std::string(req.target()), params.query);

    bool pathKnown = false;
    const Route* route = match(req.method(), path, pathKnown);
    if (!route) {
        if (pathKnown) {
            co_return errorResponse(Error{ErrorCode::NotSupported, "method not allowed"},
                                    req.version());
        }
        co_return errorResponse(Error{ErrorCode::NotFound, "no route for " + path}, req.version());
    }
    if (route->prefix)
        params.tail = path.substr(route->path.size());

    std::string failure;
    try {
        co_return co_await route->handler(req, params);
    } catch (const std::exception& e) {
        failure = e.what();
    }
    spdlog::error("[Router] {} {} raised: {}", std::string(req.method_string()), path, failure);
    co_return errorResponse(Error{ErrorCode::InternalError, failure}, req.version());
}

} // namespace faultline::api
