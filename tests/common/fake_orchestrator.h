#pragma once

#include <faultline/infra/orchestrator.h>

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace faultline::test {

// Scripted in-memory orchestrator. Every mutating call is appended to calls().
class FakeOrchestrator : public infra::IOrchestrator {
public:
    struct Node {
        bool running = true;
        std::set<NetworkId> networks;
        // Status reads that still report Stopped after a start
        int bootPolls = 0;
        TimePoint startedAt = std::chrono::system_clock::now() - std::chrono::hours(2);
    };

    explicit FakeOrchestrator(std::vector<NodeId> nodes = {"mongo1", "mongo2", "mongo3",
                                                           "cassandra1", "cassandra2",
                                                           "cassandra3"},
                              NetworkId network = "distributed_db_network") {
        networks_.insert(network);
        for (auto& n : nodes) {
            Node node;
            node.networks.insert(network);
            nodes_.emplace(std::move(n), std::move(node));
        }
    }

    // --- scripting ---
    bool pingFails = false;
    std::set<NodeId> failStop;
    std::set<NodeId> failStart;
    std::set<NodeId> failDisconnect;
    std::set<NodeId> failConnect;
    // Disconnect reports success but the node stays attached
    std::set<NodeId> stickyDisconnect;
    // Started nodes never report Running
    std::set<NodeId> neverRecover;
    int bootPollsAfterStart = 0;

    void removeNetwork(const NetworkId& n) {
        std::lock_guard<std::mutex> lk(mutex_);
        networks_.erase(n);
    }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return calls_;
    }

    bool isRunning(const NodeId& n) const {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = nodes_.find(n);
        return it != nodes_.end() && it->second.running;
    }

    bool isAttached(const NodeId& n, const NetworkId& net) const {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = nodes_.find(n);
        return it != nodes_.end() && it->second.networks.count(net) != 0;
    }

    int pingCount() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return pings_;
    }

    // --- IOrchestrator ---
    Result<void> ping() override {
        std::lock_guard<std::mutex> lk(mutex_);
        ++pings_;
        if (pingFails)
            return Error{ErrorCode::OrchestratorUnavailable, "daemon unreachable"};
        return Result<void>();
    }

    Result<infra::NodeStatus> inspectNode(const NodeId& node) override {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = nodes_.find(node);
        if (it == nodes_.end())
            return Error{ErrorCode::NotFound, "No such container: " + node};
        auto& n = it->second;
        infra::NodeStatus st;
        st.nodeId = node;
        bool booting = n.running && (n.bootPolls > 0 || neverRecover.count(node));
        if (n.running && n.bootPolls > 0)
            --n.bootPolls;
        st.state = n.running && !booting ? infra::NodeState::Running : infra::NodeState::Stopped;
        st.rawStatus = n.running ? "running" : "exited";
        st.networks = n.networks;
        if (n.running)
            st.startedAt = n.startedAt;
        return st;
    }

    Result<void> stopNode(const NodeId& node) override {
        std::lock_guard<std::mutex> lk(mutex_);
        calls_.push_back("stop:" + node);
        if (failStop.count(node))
            return Error{ErrorCode::NetworkError, "stop refused for " + node};
        auto it = nodes_.find(node);
        if (it == nodes_.end())
            return Error{ErrorCode::NotFound, "No such container: " + node};
        it->second.running = false;
        return Result<void>();
    }

    Result<void> startNode(const NodeId& node) override {
        std::lock_guard<std::mutex> lk(mutex_);
        calls_.push_back("start:" + node);
        if (failStart.count(node))
            return Error{ErrorCode::NetworkError, "start refused for " + node};
        auto it = nodes_.find(node);
        if (it == nodes_.end())
            return Error{ErrorCode::NotFound, "No such container: " + node};
        if (!it->second.running) {
            it->second.running = true;
            it->second.bootPolls = bootPollsAfterStart;
            it->second.startedAt = std::chrono::system_clock::now();
        }
        return Result<void>();
    }

    Result<infra::NetworkInfo> inspectNetwork(const std::string& nameOrId) override {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!networks_.count(nameOrId))
            return Error{ErrorCode::NotFound, "network " + nameOrId + " not found"};
        return infra::NetworkInfo{"id-" + nameOrId, nameOrId};
    }

    Result<void> disconnectNode(const infra::NetworkInfo& network, const NodeId& node) override {
        std::lock_guard<std::mutex> lk(mutex_);
        calls_.push_back("disconnect:" + node);
        if (failDisconnect.count(node))
            return Error{ErrorCode::NetworkError, "disconnect refused for " + node};
        if (!stickyDisconnect.count(node))
            nodes_[node].networks.erase(network.name);
        return Result<void>();
    }

    Result<void> connectNode(const infra::NetworkInfo& network, const NodeId& node) override {
        std::lock_guard<std::mutex> lk(mutex_);
        calls_.push_back("connect:" + node);
        if (failConnect.count(node))
            return Error{ErrorCode::NetworkError, "connect refused for " + node};
        nodes_[node].networks.insert(network.name);
        return Result<void>();
    }

private:
    mutable std::mutex mutex_;
    std::map<NodeId, Node> nodes_;
    std::set<NetworkId> networks_;
    std::vector<std::string> calls_;
    int pings_ = 0;
};

} // namespace faultline::test
