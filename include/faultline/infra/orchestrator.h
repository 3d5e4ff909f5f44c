#pragma once

#include <faultline/core/types.h>

#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace faultline::infra {

enum class NodeState { Running, Stopped, Unknown };

constexpr const char* nodeStateName(NodeState s) {
    switch (s) {
        case NodeState::Running: return "running";
        case NodeState::Stopped: return "stopped";
        case NodeState::Unknown: return "unknown";
    }
    return "unknown";
}

/**
 * @brief Container and network name grammar: [a-zA-Z0-9][a-zA-Z0-9_.-]*
 *
 * Names end up in orchestrator request paths, so anything outside the grammar
 * is rejected before a request is built.
 */
inline bool isValidNodeName(std::string_view name) {
    auto alnum = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    };
    if (name.empty() || !alnum(name.front()))
        return false;
    for (char c : name) {
        if (!alnum(c) && c != '_' && c != '.' && c != '-')
            return false;
    }
    return true;
}

// Live view of one node; never cached across ticks.
struct NodeStatus {
    NodeId nodeId;
    NodeState state = NodeState::Unknown;
    std::set<NetworkId> networks;
    // Backend-specific status text ("running", "exited", "synthetic", ...)
    std::string rawStatus;
    std::optional<TimePoint> startedAt;
};

struct NetworkInfo {
    std::string id;
    NetworkId name;
};

/**
 * @brief Backend that can manipulate the nodes of both clusters.
 *
 * Implementations are called from worker-pool threads and must be safe for
 * concurrent use. Every call blocks until the backend answers.
 */
class IOrchestrator {
public:
    virtual ~IOrchestrator() = default;

    // Reachability check performed once, at first use.
    virtual Result<void> ping() = 0;

    virtual Result<NodeStatus> inspectNode(const NodeId& node) = 0;
    virtual Result<void> stopNode(const NodeId& node) = 0;
    virtual Result<void> startNode(const NodeId& node) = 0;

    virtual Result<NetworkInfo> inspectNetwork(const std::string& nameOrId) = 0;
    virtual Result<void> disconnectNode(const NetworkInfo& network, const NodeId& node) = 0;
    virtual Result<void> connectNode(const NetworkInfo& network, const NodeId& node) = 0;
};

} // namespace faultline::infra
