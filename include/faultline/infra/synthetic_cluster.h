#pragma once

#include <faultline/infra/orchestrator.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace faultline::infra {

/**
 * @brief In-process stand-in for the orchestrator when none is reachable.
 *
 * Nodes are created on first reference, running and attached to the
 * well-known network, with a random uptime between one hour and three days.
 * A restarted node reports Stopped for 1-3 status reads before it is Running.
 * Results produced from this backend are non-authoritative.
 */
class SyntheticCluster final : public IOrchestrator {
public:
    explicit SyntheticCluster(std::string wellKnownNetwork,
                              std::optional<uint32_t> seed = std::nullopt);

    Result<void> ping() override;
    Result<NodeStatus> inspectNode(const NodeId& node) override;
    Result<void> stopNode(const NodeId& node) override;
    Result<void> startNode(const NodeId& node) override;
    Result<NetworkInfo> inspectNetwork(const std::string& nameOrId) override;
    Result<void> disconnectNode(const NetworkInfo& network, const NodeId& node) override;
    Result<void> connectNode(const NetworkInfo& network, const NodeId& node) override;

private:
    struct SimNode {
        bool running = true;
        int bootReadsRemaining = 0;
        std::set<NetworkId> networks;
        TimePoint startedAt;
    };

    SimNode& nodeLocked(const NodeId& node);
    int uniform(int lo, int hi);

    std::string network_;
    std::mutex mutex_;
    std::mt19937 rng_;
    std::map<NodeId, SimNode> nodes_;
};

} // namespace faultline::infra
