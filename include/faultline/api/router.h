#pragma once

#include <faultline/api/http_types.h>

#include <functional>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>

namespace faultline::api {

using Handler = std::function<boost::asio::awaitable<Response>(const Request&, const RouteParams&)>;

/**
 * @brief Method + path dispatch table.
 *
 * Exact routes win over prefix routes; among prefixes the longest wins. A
 * handler that throws is answered with a JSON InternalError.
 */
class Router {
public:
    void add(http::verb method, std::string path, Handler handler);
    // Matches @p prefix followed by anything; the remainder is RouteParams::tail
    void addPrefix(http::verb method, std::string prefix, Handler handler);

    boost::asio::awaitable<Response> dispatch(const Request& req) const;

private:
    struct Route {
        http::verb method;
        std::string path;
        bool prefix;
        Handler handler;
    };

    const Route* match(http::verb method, const std::string& path, bool& pathKnown) const;

    std::vector<Route> routes_;
};

} // namespace faultline::api
