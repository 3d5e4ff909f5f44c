#pragma once

#include <faultline/config/config.h>
#include <faultline/core/async.h>
#include <faultline/infra/infrastructure_controller.h>
#include <faultline/infra/node_lock_registry.h>
#include <faultline/scenario/scenario.h>
#include <faultline/store/store_probe.h>

#include <array>
#include <memory>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

namespace faultline::scenario {

/**
 * @brief Drives one failure scenario through its state machine.
 *
 * Idle -> Preparing -> Injecting -> Monitoring -> Restoring -> RecoveryWatch
 * -> Completed. Resolution and injection failures short-circuit to
 * Completed(Failed) before and after rollback respectively; every other error
 * is recorded in the result.
 *
 * run() must be awaited on the scheduler. Orchestrator calls are dispatched to
 * the worker pool. The runner keeps no state between runs, so one instance
 * can serve concurrent scenarios on disjoint nodes.
 */
class FailureScenarioRunner {
public:
    FailureScenarioRunner(infra::InfrastructureController& infra, infra::NodeLockRegistry& locks,
                          std::array<std::shared_ptr<store::StoreProbe>, 2> probes,
                          std::array<std::string, 2> nodeMatch, config::ScenarioConfig config,
                          boost::asio::any_io_executor pool);

    boost::asio::awaitable<ScenarioResult> run(Scenario scenario, CancellationToken token);

    // Stores whose node pattern matches at least one target
    std::array<bool, 2> targetedStores(const std::vector<NodeId>& targets) const;

    const config::ScenarioConfig& config() const { return config_; }

private:
    struct RunContext;

    boost::asio::awaitable<bool> prepare(RunContext& ctx);
    boost::asio::awaitable<bool> inject(RunContext& ctx);
    boost::asio::awaitable<void> monitor(RunContext& ctx);
    boost::asio::awaitable<void> restore(RunContext& ctx);
    boost::asio::awaitable<void> watchRecovery(RunContext& ctx);
    void complete(RunContext& ctx);

    boost::asio::awaitable<Result<void>> mutate(FailureKind kind, const NodeId& node,
                                                const NetworkId& network, bool undo);

    infra::InfrastructureController& infra_;
    infra::NodeLockRegistry& locks_;
    std::array<std::shared_ptr<store::StoreProbe>, 2> probes_;
    std::array<std::string, 2> nodeMatch_;
    config::ScenarioConfig config_;
    boost::asio::any_io_executor pool_;
};

} // namespace faultline::scenario
