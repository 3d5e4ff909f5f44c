#include <faultline/infra/node_lock_registry.h>

#include <spdlog/spdlog.h>

namespace faultline::infra {

NodeLease::NodeLease(NodeLease&& other) noexcept
    : owner_(other.owner_), nodes_(std::move(other.nodes_)) {
    other.owner_ = nullptr;
    other.nodes_.clear();
}

NodeLease& NodeLease::operator=(NodeLease&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        nodes_ = std::move(other.nodes_);
        other.owner_ = nullptr;
        other.nodes_.clear();
    }
    return *this;
}

NodeLease::~NodeLease() {
    release();
}

void NodeLease::release() {
    if (owner_) {
        owner_->release(nodes_);
        owner_ = nullptr;
        nodes_.clear();
    }
}

Result<NodeLease> NodeLockRegistry::tryAcquire(const std::vector<NodeId>& nodes) {
    std::lock_guard<std::mutex> lk(mutex_);
    for (const auto& n : nodes) {
        if (held_.count(n)) {
            spdlog::warn("[NodeLockRegistry] {} is held by another scenario", n);
            return Error{ErrorCode::NodeBusy, "node " + n + " is held by another scenario"};
        }
    }
    held_.insert(nodes.begin(), nodes.end());
    return NodeLease(this, nodes);
}

bool NodeLockRegistry::isHeld(const NodeId& node) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return held_.count(node) != 0;
}

std::size_t NodeLockRegistry::heldCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return held_.size();
}

void NodeLockRegistry::release(const std::vector<NodeId>& nodes) {
    std::lock_guard<std::mutex> lk(mutex_);
    for (const auto& n : nodes)
        held_.erase(n);
}

} // namespace faultline::infra
