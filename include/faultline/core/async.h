// Copyright (c) 2025 Faultline Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <faultline/core/types.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

// Coroutine helpers for the cooperative scheduler.
//
// All helpers assume the awaiting coroutine runs on an executor driven by a
// single thread; completion state is only touched from that executor.

namespace faultline {

// Shared stop flag threaded through every tick wait of a scenario.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const noexcept { flag_->store(true, std::memory_order_release); }
    bool cancelled() const noexcept { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

namespace detail {

inline Error exceptionToError(std::exception_ptr ep) {
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    } catch (...) {
        return Error{ErrorCode::InternalError, "non-standard exception"};
    }
}

template <typename T> struct CompletionState {
    explicit CompletionState(boost::asio::any_io_executor ex) : timer(std::move(ex)) {}

    boost::asio::steady_timer timer;
    std::optional<Result<T>> result;
    bool abandoned = false;
};

} // namespace detail

/**
 * @brief Run a blocking callable on @p pool and await its Result.
 *
 * The callable must return Result<T>. Exceptions escaping it are turned into
 * ErrorCode::InternalError. If @p timeout elapses first the awaiting coroutine
 * resumes with ErrorCode::Timeout and the late result is discarded.
 */
template <typename T, typename F>
boost::asio::awaitable<Result<T>> offload(boost::asio::any_io_executor pool, F fn,
                                          std::optional<std::chrono::milliseconds> timeout = {}) {
    auto home = co_await boost::asio::this_coro::executor;
    auto state = std::make_shared<detail::CompletionState<T>>(home);
    if (timeout) {
        state->timer.expires_after(*timeout);
    } else {
        state->timer.expires_at(boost::asio::steady_timer::time_point::max());
    }

    boost::asio::post(pool, [state, home, fn = std::move(fn)]() mutable {
        std::optional<Result<T>> out;
        try {
            out.emplace(fn());
        } catch (...) {
            out.emplace(detail::exceptionToError(std::current_exception()));
        }
        boost::asio::post(home, [state, out = std::move(out)]() mutable {
            if (state->abandoned)
                return;
            state->result = std::move(out);
            state->timer.cancel();
        });
    });

    boost::system::error_code ec;
    co_await state->timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (!state->result) {
        state->abandoned = true;
        co_return Error{ErrorCode::Timeout, "blocking call exceeded " +
                                                std::to_string(timeout ? timeout->count() : 0) +
                                                " ms"};
    }
    co_return std::move(*state->result);
}

/**
 * @brief Await an asynchronous operation with an upper bound.
 */
template <typename T>
boost::asio::awaitable<Result<T>> withTimeout(boost::asio::awaitable<Result<T>> op,
                                              std::chrono::milliseconds timeout) {
    auto home = co_await boost::asio::this_coro::executor;
    auto state = std::make_shared<detail::CompletionState<T>>(home);
    state->timer.expires_after(timeout);

    boost::asio::co_spawn(
        home,
        [state, op = std::move(op)]() mutable -> boost::asio::awaitable<void> {
            std::optional<Result<T>> out;
            try {
                out.emplace(co_await std::move(op));
            } catch (...) {
                out.emplace(detail::exceptionToError(std::current_exception()));
            }
            if (state->abandoned)
                co_return;
            state->result = std::move(out);
            state->timer.cancel();
        },
        boost::asio::detached);

    boost::system::error_code ec;
    co_await state->timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (!state->result) {
        state->abandoned = true;
        co_return Error{ErrorCode::Timeout,
                        "operation exceeded " + std::to_string(timeout.count()) + " ms"};
    }
    co_return std::move(*state->result);
}

/**
 * @brief Run sibling tasks concurrently and collect every outcome.
 *
 * Results keep the order of @p tasks. An exception in one sibling becomes an
 * InternalError for that slot only; the others run to completion.
 */
template <typename T>
boost::asio::awaitable<std::vector<Result<T>>>
whenAll(std::vector<boost::asio::awaitable<Result<T>>> tasks) {
    struct JoinState {
        explicit JoinState(boost::asio::any_io_executor ex, std::size_t n)
            : timer(std::move(ex)), slots(n), remaining(n) {}
        boost::asio::steady_timer timer;
        std::vector<std::optional<Result<T>>> slots;
        std::size_t remaining;
    };

    auto home = co_await boost::asio::this_coro::executor;
    auto state = std::make_shared<JoinState>(home, tasks.size());
    state->timer.expires_at(boost::asio::steady_timer::time_point::max());

    for (std::size_t i = 0; i < tasks.size(); ++i) {
        boost::asio::co_spawn(
            home,
            [state, i, task = std::move(tasks[i])]() mutable -> boost::asio::awaitable<void> {
                try {
                    state->slots[i].emplace(co_await std::move(task));
                } catch (...) {
                    state->slots[i].emplace(detail::exceptionToError(std::current_exception()));
                }
                if (--state->remaining == 0)
                    state->timer.cancel();
            },
            boost::asio::detached);
    }

    if (state->remaining > 0) {
        boost::system::error_code ec;
        co_await state->timer.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    std::vector<Result<T>> out;
    out.reserve(state->slots.size());
    for (auto& slot : state->slots) {
        out.push_back(std::move(*slot));
    }
    co_return out;
}

/**
 * @brief Sleep until @p deadline, waking early when @p token is cancelled.
 *
 * @return false if the wait ended because of cancellation.
 */
inline boost::asio::awaitable<bool> waitUntil(std::chrono::steady_clock::time_point deadline,
                                              CancellationToken token) {
    constexpr auto kSlice = std::chrono::milliseconds(50);
    auto ex = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer(ex);
    while (!token.cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            co_return true;
        timer.expires_after(std::min<std::chrono::steady_clock::duration>(deadline - now, kSlice));
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    co_return false;
}

} // namespace faultline
