// Copyright (c) 2025 Faultline Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <faultline/api/http_server.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>

#include <spdlog/spdlog.h>

#include <chrono>

namespace faultline::api {

namespace asio = boost::asio;
namespace beast = boost::beast;

HttpServer::HttpServer(asio::io_context& ioc, const Router& router,
                       metrics::RequestMetrics& metrics, Config cfg)
    : ioc_(ioc), acceptor_(ioc), router_(router), metrics_(metrics), cfg_(std::move(cfg)) {}

Result<void> HttpServer::start() {
    beast::error_code ec;
    const tcp::endpoint ep{asio::ip::make_address(cfg_.bindAddress, ec), cfg_.bindPort};
    if (ec)
        return Error{ErrorCode::InvalidArgument, "Invalid bind address: " + ec.message()};
    acceptor_.open(ep.protocol(), ec);
    if (ec)
        return Error{ErrorCode::NetworkError, "acceptor open failed: " + ec.message()};
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    acceptor_.bind(ep, ec);
    if (ec)
        return Error{ErrorCode::NetworkError, "bind failed: " + ec.message()};
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec)
        return Error{ErrorCode::NetworkError, "listen failed: " + ec.message()};

    boundPort_ = acceptor_.local_endpoint().port();
    spdlog::info("[HttpServer] listening on {}:{}", cfg_.bindAddress, boundPort_);
    asio::co_spawn(ioc_, acceptLoop(), asio::detached);
    return Result<void>();
}

void HttpServer::stop() {
    stopping_.store(true);
    beast::error_code ec;
    acceptor_.close(ec);
}

asio::awaitable<void> HttpServer::acceptLoop() {
    while (!stopping_.load()) {
        beast::error_code ec;
        tcp::socket socket = co_await acceptor_.async_accept(
            asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            if (ec == asio::error::operation_aborted || stopping_.load())
                break;
            spdlog::warn("[HttpServer] accept error: {}", ec.message());
            continue;
        }
        asio::co_spawn(ioc_, session(std::move(socket)), asio::detached);
    }
    spdlog::debug("[HttpServer] accept loop finished");
}

asio::awaitable<void> HttpServer::session(tcp::socket socket) {
    beast::flat_buffer buffer;
    for (;;) {
        beast::error_code ec;
        Request req;
        co_await http::async_read(socket, buffer, req,
                                  asio::redirect_error(asio::use_awaitable, ec));
        if (ec == http::error::end_of_stream)
            break;
        if (ec) {
            spdlog::debug("[HttpServer] read error: {}", ec.message());
            break;
        }

        const auto started = std::chrono::steady_clock::now();
        Response res = co_await router_.dispatch(req);
        std::map<std::string, std::string> ignored;
        metrics_.record(metrics::categorize(splitTarget(std::string(req.target()), ignored)),
                        std::chrono::steady_clock::now() - started);

        res.keep_alive(req.keep_alive());
        spdlog::debug("[HttpServer] {} {} -> {}", std::string(req.method_string()),
                      std::string(req.target()), res.result_int());
        co_await http::async_write(socket, res, asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            spdlog::debug("[HttpServer] write error: {}", ec.message());
            break;
        }
        if (!res.keep_alive())
            break;
    }
    beast::error_code ec;
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace faultline::api
