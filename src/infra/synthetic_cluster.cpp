#include <faultline/infra/synthetic_cluster.h>

#include <spdlog/spdlog.h>

namespace faultline::infra {

SyntheticCluster::SyntheticCluster(std::string wellKnownNetwork, std::optional<uint32_t> seed)
    : network_(std::move(wellKnownNetwork)), rng_(seed ? *seed : std::random_device{}()) {}

int SyntheticCluster::uniform(int lo, int hi) {
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(rng_);
}

SyntheticCluster::SimNode& SyntheticCluster::nodeLocked(const NodeId& node) {
    auto it = nodes_.find(node);
    if (it != nodes_.end())
        return it->second;

    SimNode sim;
    sim.networks.insert(network_);
    sim.startedAt = std::chrono::system_clock::now() - std::chrono::seconds(uniform(3600, 3600 * 72));
    return nodes_.emplace(node, std::move(sim)).first->second;
}

Result<void> SyntheticCluster::ping() {
    return Result<void>();
}

Result<NodeStatus> SyntheticCluster::inspectNode(const NodeId& node) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto& sim = nodeLocked(node);
    const bool booting = sim.running && sim.bootReadsRemaining > 0;
    if (booting)
        --sim.bootReadsRemaining;

    NodeStatus status;
    status.nodeId = node;
    status.state = (sim.running && !booting) ? NodeState::Running : NodeState::Stopped;
    status.networks = sim.networks;
    status.rawStatus = "synthetic";
    if (sim.running)
        status.startedAt = sim.startedAt;
    return status;
}

Result<void> SyntheticCluster::stopNode(const NodeId& node) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto& sim = nodeLocked(node);
    sim.running = false;
    sim.bootReadsRemaining = 0;
    spdlog::debug("[SyntheticCluster] stopped {}", node);
    return Result<void>();
}

Result<void> SyntheticCluster::startNode(const NodeId& node) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto& sim = nodeLocked(node);
    if (!sim.running) {
        sim.running = true;
        sim.bootReadsRemaining = uniform(1, 3);
        sim.startedAt = std::chrono::system_clock::now();
        spdlog::debug("[SyntheticCluster] started {} (boot reads {})", node,
                      sim.bootReadsRemaining);
    }
    return Result<void>();
}

Result<NetworkInfo> SyntheticCluster::inspectNetwork(const std::string& nameOrId) {
    if (nameOrId != network_) {
        return Error{ErrorCode::NotFound, "synthetic network '" + nameOrId + "' does not exist"};
    }
    return NetworkInfo{"synthetic-" + network_, network_};
}

Result<void> SyntheticCluster::disconnectNode(const NetworkInfo& network, const NodeId& node) {
    std::lock_guard<std::mutex> lk(mutex_);
    nodeLocked(node).networks.erase(network.name);
    return Result<void>();
}

Result<void> SyntheticCluster::connectNode(const NetworkInfo& network, const NodeId& node) {
    std::lock_guard<std::mutex> lk(mutex_);
    nodeLocked(node).networks.insert(network.name);
    return Result<void>();
}

} // namespace faultline::infra
