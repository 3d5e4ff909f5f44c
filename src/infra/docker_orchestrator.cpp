// Copyright (c) 2025 Faultline Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <faultline/infra/docker_orchestrator.h>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <ctime>
#include <future>
#include <iomanip>
#include <sstream>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

namespace faultline::infra {

namespace asio = boost::asio;
namespace http = boost::beast::http;
using local_stream = asio::local::stream_protocol;

namespace {

constexpr const char* kApiPrefix = "/v1.41";

asio::awaitable<DockerReply> exchange(std::string socketPath, http::request<http::string_body> req,
                                      std::chrono::milliseconds timeout) {
    auto ex = co_await asio::this_coro::executor;
    local_stream::socket socket(ex);
    asio::steady_timer deadline(ex);
    deadline.expires_after(timeout);
    deadline.async_wait([&socket](const boost::system::error_code& ec) {
        if (!ec) {
            boost::system::error_code ignored;
            socket.close(ignored);
        }
    });

    co_await socket.async_connect(local_stream::endpoint(socketPath), asio::use_awaitable);
    co_await http::async_write(socket, req, asio::use_awaitable);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    co_await http::async_read(socket, buffer, res, asio::use_awaitable);
    deadline.cancel();

    boost::system::error_code ec;
    socket.shutdown(local_stream::socket::shutdown_both, ec);
    co_return DockerReply{res.result_int(), std::move(res.body())};
}

std::string daemonMessage(const DockerReply& reply) {
    auto doc = nlohmann::json::parse(reply.body, nullptr, false);
    if (doc.is_object() && doc.contains("message") && doc["message"].is_string())
        return doc["message"].get<std::string>();
    return "HTTP " + std::to_string(reply.status);
}

Error replyError(const DockerReply& reply, const std::string& what) {
    auto code = reply.status == 404 ? ErrorCode::NotFound : ErrorCode::NetworkError;
    return Error{code, what + ": " + daemonMessage(reply)};
}

} // namespace

std::optional<TimePoint> parseDockerTime(const std::string& text) {
    if (text.empty() || text.rfind("0001-01-01", 0) == 0)
        return std::nullopt;
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail())
        return std::nullopt;
    auto secs = timegm(&tm);
    if (secs < 0)
        return std::nullopt;
    return std::chrono::system_clock::from_time_t(secs);
}

DockerOrchestrator::DockerOrchestrator(std::filesystem::path socketPath,
                                       std::chrono::milliseconds requestTimeout,
                                       int stopTimeoutSeconds)
    : socketPath_(std::move(socketPath)),
      requestTimeout_(requestTimeout),
      stopTimeoutSeconds_(stopTimeoutSeconds) {}

Result<DockerReply> DockerOrchestrator::request(http::verb verb, const std::string& target,
                                                const std::optional<std::string>& body,
                                                std::chrono::milliseconds extra) {
    http::request<http::string_body> req{verb, std::string(kApiPrefix) + target, 11};
    req.set(http::field::host, "localhost");
    req.set(http::field::user_agent, "faultline");
    if (body) {
        req.set(http::field::content_type, "application/json");
        req.body() = *body;
    }
    req.prepare_payload();

    asio::io_context ioc;
    auto fut = asio::co_spawn(ioc, exchange(socketPath_.string(), std::move(req), requestTimeout_ + extra),
                              asio::use_future);
    ioc.run();
    try {
        return fut.get();
    } catch (const boost::system::system_error& e) {
        if (e.code() == asio::error::operation_aborted || e.code() == asio::error::bad_descriptor) {
            return Error{ErrorCode::Timeout, "docker request " + target + " timed out"};
        }
        return Error{ErrorCode::NetworkError, "docker request " + target + ": " + e.what()};
    } catch (const std::exception& e) {
        return Error{ErrorCode::NetworkError, "docker request " + target + ": " + e.what()};
    }
}

Result<void> DockerOrchestrator::ping() {
    auto reply = request(http::verb::get, "/_ping");
    if (!reply)
        return Error{ErrorCode::OrchestratorUnavailable, reply.error().message};
    if (reply.value().status != 200)
        return Error{ErrorCode::OrchestratorUnavailable, daemonMessage(reply.value())};
    return Result<void>();
}

Result<NodeStatus> DockerOrchestrator::parseContainer(const NodeId& node,
                                                      const nlohmann::json& doc) {
    if (!doc.is_object())
        return Error{ErrorCode::InvalidArgument, "container inspect body is not an object"};

    NodeStatus status;
    status.nodeId = node;
    const auto state = doc.value("State", nlohmann::json::object());
    if (state.is_object()) {
        bool running = state.value("Running", false);
        status.state = running ? NodeState::Running : NodeState::Stopped;
        status.rawStatus = state.value("Status", running ? "running" : "exited");
        if (running)
            status.startedAt = parseDockerTime(state.value("StartedAt", ""));
    }
    const auto settings = doc.value("NetworkSettings", nlohmann::json::object());
    if (settings.is_object()) {
        const auto networks = settings.value("Networks", nlohmann::json::object());
        if (networks.is_object()) {
            for (auto it = networks.begin(); it != networks.end(); ++it)
                status.networks.insert(it.key());
        }
    }
    return status;
}

Result<NodeStatus> DockerOrchestrator::inspectNode(const NodeId& node) {
    if (!isValidNodeName(node))
        return Error{ErrorCode::InvalidArgument, "invalid container name: " + node};
    auto reply = request(http::verb::get, "/containers/" + node + "/json");
    if (!reply)
        return reply.error();
    if (reply.value().status != 200)
        return replyError(reply.value(), "inspect " + node);
    auto doc = nlohmann::json::parse(reply.value().body, nullptr, false);
    if (doc.is_discarded())
        return Error{ErrorCode::NetworkError, "inspect " + node + ": malformed response"};
    return parseContainer(node, doc);
}

Result<void> DockerOrchestrator::stopNode(const NodeId& node) {
    if (!isValidNodeName(node))
        return Error{ErrorCode::InvalidArgument, "invalid container name: " + node};
    auto reply = request(http::verb::post,
                         "/containers/" + node + "/stop?t=" + std::to_string(stopTimeoutSeconds_),
                         std::nullopt, std::chrono::seconds(stopTimeoutSeconds_));
    if (!reply)
        return reply.error();
    // 304: already stopped
    if (reply.value().status != 204 && reply.value().status != 304)
        return replyError(reply.value(), "stop " + node);
    spdlog::info("[DockerOrchestrator] stopped container {}", node);
    return Result<void>();
}

Result<void> DockerOrchestrator::startNode(const NodeId& node) {
    if (!isValidNodeName(node))
        return Error{ErrorCode::InvalidArgument, "invalid container name: " + node};
    auto reply = request(http::verb::post, "/containers/" + node + "/start");
    if (!reply)
        return reply.error();
    if (reply.value().status != 204 && reply.value().status != 304)
        return replyError(reply.value(), "start " + node);
    spdlog::info("[DockerOrchestrator] started container {}", node);
    return Result<void>();
}

Result<NetworkInfo> DockerOrchestrator::inspectNetwork(const std::string& nameOrId) {
    if (!isValidNodeName(nameOrId))
        return Error{ErrorCode::InvalidArgument, "invalid network name: " + nameOrId};
    auto reply = request(http::verb::get, "/networks/" + nameOrId);
    if (!reply)
        return reply.error();
    if (reply.value().status != 200)
        return replyError(reply.value(), "inspect network " + nameOrId);
    auto doc = nlohmann::json::parse(reply.value().body, nullptr, false);
    if (!doc.is_object())
        return Error{ErrorCode::NetworkError, "inspect network " + nameOrId + ": malformed response"};
    return NetworkInfo{doc.value("Id", nameOrId), doc.value("Name", nameOrId)};
}

Result<void> DockerOrchestrator::disconnectNode(const NetworkInfo& network, const NodeId& node) {
    nlohmann::json body{{"Container", node}, {"Force", true}};
    auto reply = request(http::verb::post, "/networks/" + network.id + "/disconnect", body.dump());
    if (!reply)
        return reply.error();
    if (reply.value().status != 200)
        return replyError(reply.value(), "disconnect " + node + " from " + network.name);
    return Result<void>();
}

Result<void> DockerOrchestrator::connectNode(const NetworkInfo& network, const NodeId& node) {
    nlohmann::json body{{"Container", node}};
    auto reply = request(http::verb::post, "/networks/" + network.id + "/connect", body.dump());
    if (!reply)
        return reply.error();
    if (reply.value().status != 200)
        return replyError(reply.value(), "connect " + node + " to " + network.name);
    return Result<void>();
}

} // namespace faultline::infra
