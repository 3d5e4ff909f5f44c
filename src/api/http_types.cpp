#include <faultline/api/http_types.h>

#include <boost/algorithm/string.hpp>

#include <cctype>
#include <vector>

namespace faultline::api {

http::status httpStatusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return http::status::ok;
        case ErrorCode::InvalidArgument: return http::status::bad_request;
        case ErrorCode::NotFound: return http::status::not_found;
        case ErrorCode::NodeBusy:
        case ErrorCode::BenchmarkBusy: return http::status::conflict;
        case ErrorCode::ResolutionError:
        case ErrorCode::NetworkUnresolved: return http::status::unprocessable_entity;
        case ErrorCode::NotSupported: return http::status::method_not_allowed;
        case ErrorCode::OrchestratorUnavailable:
        case ErrorCode::StoreError: return http::status::service_unavailable;
        default: return http::status::internal_server_error;
    }
}

void applyCors(Response& res) {
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
}

Response textResponse(http::status status, std::string body, const std::string& contentType,
                      unsigned version) {
    Response res{status, version};
    res.set(http::field::server, "faultline");
    res.set(http::field::content_type, contentType);
    applyCors(res);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

Response jsonResponse(http::status status, const nlohmann::json& body, unsigned version) {
    return textResponse(status, body.dump(), "application/json; charset=utf-8", version);
}

Response errorResponse(const Error& error, unsigned version) {
    return errorResponse(error, nlohmann::json::object(), version);
}

Response errorResponse(const Error& error, const nlohmann::json& extra, unsigned version) {
    nlohmann::json body{{"success", false},
                        {"error", error.message},
                        {"errorKind", errorKindName(error.code)}};
    if (extra.is_object())
        body.update(extra);
    return jsonResponse(httpStatusFor(error.code), body, version);
}

std::string percentDecode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '+') {
            out += ' ';
        } else if (in[i] == '%' && i + 2 < in.size() && std::isxdigit(static_cast<unsigned char>(in[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
            out += static_cast<char>(std::stoi(in.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += in[i];
        }
    }
    return out;
}

std::string splitTarget(const std::string& target, std::map<std::string, std::string>& query) {
    auto pos = target.find('?');
    if (pos == std::string::npos)
        return target;
    auto q = target.substr(pos + 1);
    std::vector<std::string> parts;
    boost::split(parts, q, boost::is_any_of("&"));
    for (auto& p : parts) {
        if (p.empty())
            continue;
        auto eq = p.find('=');
        if (eq == std::string::npos) {
            query[percentDecode(p)] = "";
            continue;
        }
        query[percentDecode(p.substr(0, eq))] = percentDecode(p.substr(eq + 1));
    }
    return target.substr(0, pos);
}

} // namespace faultline::api
