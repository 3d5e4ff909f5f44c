#include <faultline/infra/infrastructure_controller.h>
#include <faultline/infra/synthetic_cluster.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace faultline::infra {

InfrastructureController::InfrastructureController(std::unique_ptr<IOrchestrator> backend,
                                                   config::InfrastructureConfig config)
    : live_(std::move(backend)), config_(std::move(config)) {}

InfrastructureController::~InfrastructureController() = default;

IOrchestrator& InfrastructureController::backend() {
    std::call_once(modeOnce_, [this] {
        bool useSynthetic = config_.forceSynthetic || !live_;
        if (!useSynthetic) {
            auto pinged = live_->ping();
            if (!pinged) {
                spdlog::warn("[InfrastructureController] orchestrator unreachable ({}), "
                             "switching to synthetic mode",
                             pinged.error().message);
                useSynthetic = true;
            }
        }
        if (useSynthetic) {
            synthetic_ = std::make_unique<SyntheticCluster>(config_.wellKnownNetwork,
                                                            config_.syntheticSeed);
            syntheticMode_.store(true, std::memory_order_release);
            spdlog::info("[InfrastructureController] running in synthetic mode");
        } else {
            spdlog::info("[InfrastructureController] orchestrator reachable, live mode");
        }
    });
    if (syntheticMode_.load(std::memory_order_acquire))
        return *synthetic_;
    return *live_;
}

InfraMode InfrastructureController::mode() {
    backend();
    return syntheticMode_.load(std::memory_order_acquire) ? InfraMode::Synthetic
                                                          : InfraMode::Live;
}

Result<void> InfrastructureController::stop(const NodeId& node) {
    auto r = backend().stopNode(node);
    if (!r)
        spdlog::error("[InfrastructureController] stop {} failed: {}", node, r.error().message);
    return r;
}

Result<void> InfrastructureController::start(const NodeId& node) {
    auto r = backend().startNode(node);
    if (!r)
        spdlog::error("[InfrastructureController] start {} failed: {}", node, r.error().message);
    return r;
}

NodeState InfrastructureController::status(const NodeId& node) {
    auto r = backend().inspectNode(node);
    if (!r) {
        spdlog::debug("[InfrastructureController] status {} unknown: {}", node, r.error().message);
        return NodeState::Unknown;
    }
    return r.value().state;
}

Result<NodeStatus> InfrastructureController::inspect(const NodeId& node) {
    return backend().inspectNode(node);
}

Result<NetworkInfo> InfrastructureController::lookupNetwork(const NetworkId& network) {
    return backend().inspectNetwork(network);
}

Result<void> InfrastructureController::disconnect(const NodeId& node, const NetworkId& network) {
    auto net = lookupNetwork(network);
    if (!net)
        return net.error();

    auto before = backend().inspectNode(node);
    if (!before)
        return before.error();
    if (before.value().networks.count(net.value().name) == 0) {
        spdlog::debug("[InfrastructureController] {} already detached from {}", node, network);
        return Result<void>();
    }

    if (auto r = backend().disconnectNode(net.value(), node); !r)
        return r;

    auto after = backend().inspectNode(node);
    if (!after)
        return after.error();
    if (after.value().networks.count(net.value().name) != 0) {
        return Error{ErrorCode::PartitionVerificationFailed,
                     node + " still attached to " + net.value().name};
    }
    spdlog::info("[InfrastructureController] {} isolated from {}", node, net.value().name);
    return Result<void>();
}

Result<void> InfrastructureController::connect(const NodeId& node, const NetworkId& network) {
    auto net = lookupNetwork(network);
    if (!net)
        return net.error();

    auto before = backend().inspectNode(node);
    if (!before)
        return before.error();
    if (before.value().networks.count(net.value().name) != 0)
        return Result<void>();

    if (auto r = backend().connectNode(net.value(), node); !r)
        return r;

    auto after = backend().inspectNode(node);
    if (!after)
        return after.error();
    if (after.value().networks.count(net.value().name) == 0) {
        return Error{ErrorCode::PartitionVerificationFailed,
                     node + " not attached to " + net.value().name + " after reconnect"};
    }
    spdlog::info("[InfrastructureController] {} reconnected to {}", node, net.value().name);
    return Result<void>();
}

Result<UptimeInfo> InfrastructureController::uptime(const NodeId& node) {
    auto r = backend().inspectNode(node);
    if (!r)
        return r.error();
    const auto& st = r.value();
    if (!st.startedAt)
        return Error{ErrorCode::NotFound, "No start time"};
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - *st.startedAt);
    return UptimeInfo{std::max<std::int64_t>(0, elapsed.count()), st.rawStatus};
}

Result<void> InfrastructureController::resolveNode(const NodeId& node) {
    auto r = backend().inspectNode(node);
    if (!r)
        return Error{r.error().code, "node " + node + " not resolvable: " + r.error().message};
    return Result<void>();
}

Result<NetworkId> InfrastructureController::resolveNetwork(const std::vector<NodeId>& targets) {
    auto wellKnown = lookupNetwork(config_.wellKnownNetwork);
    if (wellKnown)
        return wellKnown.value().name;

    spdlog::warn("[InfrastructureController] network {} not found ({}), trying first target",
                 config_.wellKnownNetwork, wellKnown.error().message);
    if (targets.empty())
        return Error{ErrorCode::NetworkUnresolved, "no targets to derive a network from"};

    auto first = backend().inspectNode(targets.front());
    if (!first) {
        return Error{ErrorCode::NetworkUnresolved,
                     "could not inspect " + targets.front() + ": " + first.error().message};
    }
    if (first.value().networks.empty())
        return Error{ErrorCode::NetworkUnresolved, targets.front() + " is attached to no network"};

    const auto& candidate = *first.value().networks.begin();
    auto net = lookupNetwork(candidate);
    if (!net) {
        return Error{ErrorCode::NetworkUnresolved,
                     "network " + candidate + " not usable: " + net.error().message};
    }
    spdlog::info("[InfrastructureController] using network {} from {}", net.value().name,
                 targets.front());
    return net.value().name;
}

} // namespace faultline::infra
