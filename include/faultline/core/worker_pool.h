// Copyright (c) 2025 Faultline Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace faultline {

/**
 * @brief Bounded thread pool for calls that block.
 *
 * Store drivers without a native asynchronous API and every orchestrator call
 * are dispatched here so the cooperative scheduler never waits on them. The
 * pool owns its own io_context, run by a fixed number of threads.
 */
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads = 4);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    boost::asio::any_io_executor executor() const { return io_.get_executor(); }

    void stop();

    std::size_t threads() const noexcept { return active_.load(std::memory_order_relaxed); }

private:
    mutable boost::asio::io_context io_;
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;
    std::optional<WorkGuard> guard_;
    std::vector<std::thread> threads_;
    std::atomic<std::size_t> active_{0};
};

} // namespace faultline
