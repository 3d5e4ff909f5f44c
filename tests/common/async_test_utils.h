#pragma once

#include <exception>
#include <optional>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

namespace faultline::test {

// Drives @p op to completion on @p io from the calling thread.
template <typename T> T runAwaitable(boost::asio::io_context& io, boost::asio::awaitable<T> op) {
    std::optional<T> out;
    std::exception_ptr error;
    boost::asio::co_spawn(
        io,
        [&out, op = std::move(op)]() mutable -> boost::asio::awaitable<void> {
            out.emplace(co_await std::move(op));
        },
        [&error](std::exception_ptr e) { error = e; });
    io.restart();
    io.run();
    if (error)
        std::rethrow_exception(error);
    return std::move(*out);
}

inline void runAwaitable(boost::asio::io_context& io, boost::asio::awaitable<void> op) {
    std::exception_ptr error;
    boost::asio::co_spawn(io, std::move(op), [&error](std::exception_ptr e) { error = e; });
    io.restart();
    io.run();
    if (error)
        std::rethrow_exception(error);
}

} // namespace faultline::test
