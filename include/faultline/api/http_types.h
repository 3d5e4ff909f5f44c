#pragma once

#include <faultline/core/types.h>

#include <map>
#include <optional>
#include <string>

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace faultline::api {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// Path remainder after a prefix route plus decoded query parameters
struct RouteParams {
    std::string tail;
    std::map<std::string, std::string> query;

    std::optional<std::string> param(const std::string& key) const {
        auto it = query.find(key);
        if (it == query.end())
            return std::nullopt;
        return it->second;
    }
};

http::status httpStatusFor(ErrorCode code);

Response jsonResponse(http::status status, const nlohmann::json& body, unsigned version = 11);

// {success: false, error, errorKind} with the status mapped from the code
Response errorResponse(const Error& error, unsigned version = 11);
Response errorResponse(const Error& error, const nlohmann::json& extra, unsigned version = 11);

Response textResponse(http::status status, std::string body, const std::string& contentType,
                      unsigned version = 11);

void applyCors(Response& res);

std::string percentDecode(const std::string& in);

// Splits "/path?x=1&y=2" into path and decoded parameters
std::string splitTarget(const std::string& target, std::map<std::string, std::string>& query);

} // namespace faultline::api
