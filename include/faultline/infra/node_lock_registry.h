#pragma once

#include <faultline/core/types.h>

#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace faultline::infra {

class NodeLockRegistry;

// Exclusive hold on a set of nodes; released on destruction.
class NodeLease {
public:
    NodeLease() = default;
    NodeLease(NodeLease&& other) noexcept;
    NodeLease& operator=(NodeLease&& other) noexcept;
    NodeLease(const NodeLease&) = delete;
    NodeLease& operator=(const NodeLease&) = delete;
    ~NodeLease();

    const std::vector<NodeId>& nodes() const { return nodes_; }
    void release();

private:
    friend class NodeLockRegistry;
    NodeLease(NodeLockRegistry* owner, std::vector<NodeId> nodes)
        : owner_(owner), nodes_(std::move(nodes)) {}

    NodeLockRegistry* owner_ = nullptr;
    std::vector<NodeId> nodes_;
};

/**
 * @brief Per-node mutual exclusion between concurrent scenarios.
 *
 * Acquisition is all-or-nothing and never waits.
 */
class NodeLockRegistry {
public:
    // NodeBusy names the first node already held
    Result<NodeLease> tryAcquire(const std::vector<NodeId>& nodes);

    bool isHeld(const NodeId& node) const;
    std::size_t heldCount() const;

private:
    friend class NodeLease;
    void release(const std::vector<NodeId>& nodes);

    mutable std::mutex mutex_;
    std::set<NodeId> held_;
};

} // namespace faultline::infra
