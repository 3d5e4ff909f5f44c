// Copyright (c) 2025 Faultline Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <faultline/api/router.h>
#include <faultline/core/types.h>
#include <faultline/metrics/request_metrics.h>

#include <atomic>
#include <cstdint>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace faultline::api {

using tcp = boost::asio::ip::tcp;

/**
 * @brief HTTP/1.1 server on the scheduler io_context.
 *
 * One coroutine accepts connections; each connection runs its own session
 * coroutine with keep-alive. Every request is timed into RequestMetrics.
 */
class HttpServer {
public:
    struct Config {
        std::string bindAddress = "0.0.0.0";
        uint16_t bindPort = 8000;
    };

    HttpServer(boost::asio::io_context& ioc, const Router& router,
               metrics::RequestMetrics& metrics, Config cfg);

    // Binds, listens and spawns the accept loop; returns once listening
    Result<void> start();
    void stop();

    // Port actually bound (differs from the configured one when that is 0)
    uint16_t port() const { return boundPort_; }

private:
    boost::asio::awaitable<void> acceptLoop();
    boost::asio::awaitable<void> session(tcp::socket socket);

    boost::asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    const Router& router_;
    metrics::RequestMetrics& metrics_;
    Config cfg_;
    uint16_t boundPort_ = 0;
    std::atomic<bool> stopping_{false};
};

} // namespace faultline::api
