#pragma once

#include <faultline/config/config.h>
#include <faultline/infra/orchestrator.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace faultline::infra {

enum class InfraMode { Live, Synthetic };

constexpr const char* infraModeName(InfraMode m) {
    return m == InfraMode::Live ? "live" : "synthetic";
}

struct UptimeInfo {
    std::int64_t seconds = 0;
    std::string status;
};

/**
 * @brief Node and network manipulation for the failure scenarios.
 *
 * All methods block and are safe to call from several worker threads. The
 * backend is pinged once, on first use; if it does not answer (or no backend
 * was supplied) the controller serves a SyntheticCluster for the rest of its
 * lifetime.
 */
class InfrastructureController {
public:
    InfrastructureController(std::unique_ptr<IOrchestrator> backend,
                             config::InfrastructureConfig config);
    ~InfrastructureController();

    InfrastructureController(const InfrastructureController&) = delete;
    InfrastructureController& operator=(const InfrastructureController&) = delete;

    InfraMode mode();
    bool isSynthetic() { return mode() == InfraMode::Synthetic; }

    Result<void> stop(const NodeId& node);
    Result<void> start(const NodeId& node);
    NodeState status(const NodeId& node);
    Result<NodeStatus> inspect(const NodeId& node);

    /**
     * @brief Detach @p node from @p network and verify it no longer lists it.
     *
     * A node that is already detached is left alone.
     * @return PartitionVerificationFailed when the node still lists the network
     */
    Result<void> disconnect(const NodeId& node, const NetworkId& network);
    Result<void> connect(const NodeId& node, const NetworkId& network);

    Result<UptimeInfo> uptime(const NodeId& node);

    // NotFound when the node does not exist
    Result<void> resolveNode(const NodeId& node);

    /**
     * @brief Pick the network to partition @p targets from.
     *
     * Tries the configured well-known network, then the first network listed
     * by the first target. Nothing is modified.
     */
    Result<NetworkId> resolveNetwork(const std::vector<NodeId>& targets);

private:
    IOrchestrator& backend();
    Result<NetworkInfo> lookupNetwork(const NetworkId& network);

    std::unique_ptr<IOrchestrator> live_;
    std::unique_ptr<IOrchestrator> synthetic_;
    config::InfrastructureConfig config_;
    std::once_flag modeOnce_;
    std::atomic<bool> syntheticMode_{false};
};

} // namespace faultline::infra
