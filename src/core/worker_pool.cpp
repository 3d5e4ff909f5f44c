// Copyright (c) 2025 Faultline Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <faultline/core/worker_pool.h>

#include <spdlog/spdlog.h>

#include <system_error>

namespace faultline {

WorkerPool::WorkerPool(std::size_t threads) : io_(static_cast<int>(threads == 0 ? 1 : threads)) {
    if (threads == 0)
        threads = 1;
    guard_.emplace(boost::asio::make_work_guard(io_));
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        active_.fetch_add(1, std::memory_order_relaxed);
        threads_.emplace_back([this, i]() {
            spdlog::trace("[WorkerPool] thread {} starting", i);
            try {
                io_.run();
            } catch (const std::exception& e) {
                spdlog::warn("[WorkerPool] thread {} exited: {}", i, e.what());
            }
            active_.fetch_sub(1, std::memory_order_relaxed);
        });
    }
    spdlog::info("[WorkerPool] started with {} threads", threads_.size());
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::stop() {
    // Order matters: release the guard first, then stop the io_context
    if (guard_) {
        guard_->reset();
        guard_.reset();
    }
    if (!io_.stopped()) {
        io_.stop();
    }

    for (std::size_t i = 0; i < threads_.size(); ++i) {
        auto& t = threads_[i];
        if (t.joinable()) {
            try {
                t.join();
            } catch (const std::system_error& e) {
                spdlog::warn("[WorkerPool] thread {} join failed: {}", i, e.what());
            }
        }
    }
    if (!threads_.empty()) {
        spdlog::debug("[WorkerPool] all {} threads joined", threads_.size());
    }
    threads_.clear();
}

} // namespace faultline
