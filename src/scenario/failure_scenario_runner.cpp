#include <faultline/scenario/failure_scenario_runner.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace faultline::scenario {

namespace asio = boost::asio;
using Clock = std::chrono::steady_clock;

struct FailureScenarioRunner::RunContext {
    ScenarioResult result;
    CancellationToken token;
    infra::NodeLease lease;
    NetworkId network;
    // Nodes already stopped or detached, in injection order
    std::vector<NodeId> mutated;

    void transition(ScenarioState next) {
        auto prev = result.states.empty() ? ScenarioState::Idle : result.states.back();
        spdlog::info("[FailureScenarioRunner] {} -> {}", scenarioStateName(prev),
                     scenarioStateName(next));
        result.states.push_back(next);
    }

    void fail(ErrorCode kind, std::string message) {
        spdlog::error("[FailureScenarioRunner] {}: {}", errorKindName(kind), message);
        result.failure = ScenarioFailure{kind, std::move(message)};
    }
};

namespace {

asio::awaitable<Result<store::ProbeSample>> probeOnce(std::shared_ptr<store::StoreProbe> probe) {
    co_return co_await probe->probe();
}

} // namespace

FailureScenarioRunner::FailureScenarioRunner(
    infra::InfrastructureController& infra, infra::NodeLockRegistry& locks,
    std::array<std::shared_ptr<store::StoreProbe>, 2> probes, std::array<std::string, 2> nodeMatch,
    config::ScenarioConfig config, asio::any_io_executor pool)
    : infra_(infra),
      locks_(locks),
      probes_(std::move(probes)),
      nodeMatch_(std::move(nodeMatch)),
      config_(std::move(config)),
      pool_(std::move(pool)) {}

std::array<bool, 2> FailureScenarioRunner::targetedStores(const std::vector<NodeId>& targets) const {
    std::array<bool, 2> out{false, false};
    for (auto id : kAllStores) {
        const auto& pattern = nodeMatch_[storeIndex(id)];
        out[storeIndex(id)] = std::any_of(targets.begin(), targets.end(), [&](const NodeId& n) {
            return n.find(pattern) != std::string::npos;
        });
    }
    return out;
}

asio::awaitable<Result<void>> FailureScenarioRunner::mutate(FailureKind kind, const NodeId& node,
                                                            const NetworkId& network, bool undo) {
    auto& infra = infra_;
    if (kind == FailureKind::NodeFailure) {
        if (undo) {
            auto fn = [&infra, node] { return infra.start(node); };
            co_return co_await offload<void>(pool_, std::move(fn));
        }
        auto fn = [&infra, node] { return infra.stop(node); };
        co_return co_await offload<void>(pool_, std::move(fn));
    }
    if (undo) {
        auto fn = [&infra, node, network] { return infra.connect(node, network); };
        co_return co_await offload<void>(pool_, std::move(fn));
    }
    auto fn = [&infra, node, network] { return infra.disconnect(node, network); };
    co_return co_await offload<void>(pool_, std::move(fn));
}

asio::awaitable<ScenarioResult> FailureScenarioRunner::run(Scenario scenario,
                                                           CancellationToken token) {
    RunContext ctx;
    ctx.token = std::move(token);
    ctx.result.scenario = std::move(scenario);
    ctx.result.states.push_back(ScenarioState::Idle);
    ctx.result.targetedStores = targetedStores(ctx.result.scenario.targets);

    spdlog::info("[FailureScenarioRunner] starting {} scenario on [{}] for {}s",
                 failureKindName(ctx.result.scenario.kind),
                 fmt::join(ctx.result.scenario.targets, ","),
                 ctx.result.scenario.durationSeconds);

    ctx.transition(ScenarioState::Preparing);
    if (co_await prepare(ctx)) {
        ctx.transition(ScenarioState::Injecting);
        if (co_await inject(ctx)) {
            ctx.transition(ScenarioState::Monitoring);
            co_await monitor(ctx);
            ctx.transition(ScenarioState::Restoring);
            co_await restore(ctx);
            if (ctx.result.scenario.kind == FailureKind::NodeFailure) {
                ctx.transition(ScenarioState::RecoveryWatch);
                co_await watchRecovery(ctx);
            }
        }
    }
    ctx.transition(ScenarioState::Completed);
    complete(ctx);
    ctx.lease.release();
    co_return std::move(ctx.result);
}

asio::awaitable<bool> FailureScenarioRunner::prepare(RunContext& ctx) {
    auto& infra = infra_;
    const auto& sc = ctx.result.scenario;

    if (auto v = validateScenario(sc, config_.maxDurationSeconds); !v) {
        ctx.fail(ErrorCode::InvalidArgument, v.error().message);
        co_return false;
    }

    auto mode = co_await offload<infra::InfraMode>(
        pool_, [&infra] { return Result<infra::InfraMode>(infra.mode()); });
    if (mode)
        ctx.result.mode = mode.value();

    auto lease = locks_.tryAcquire(sc.targets);
    if (!lease) {
        ctx.fail(ErrorCode::NodeBusy, lease.error().message);
        co_return false;
    }
    ctx.lease = std::move(lease).value();

    for (const auto& node : sc.targets) {
        auto fn = [&infra, node] { return infra.resolveNode(node); };
        auto resolved = co_await offload<void>(pool_, std::move(fn));
        if (!resolved) {
            ctx.fail(ErrorCode::ResolutionError, resolved.error().message);
            co_return false;
        }
    }

    if (sc.kind == FailureKind::NetworkPartition) {
        auto targets = sc.targets;
        auto fn = [&infra, targets] { return infra.resolveNetwork(targets); };
        auto network = co_await offload<NetworkId>(pool_, std::move(fn));
        if (!network) {
            ctx.fail(ErrorCode::NetworkUnresolved, network.error().message);
            co_return false;
        }
        ctx.network = network.value();
        ctx.result.network = ctx.network;
    }
    co_return true;
}

asio::awaitable<bool> FailureScenarioRunner::inject(RunContext& ctx) {
    const auto kind = ctx.result.scenario.kind;
    for (const auto& node : ctx.result.scenario.targets) {
        auto r = co_await mutate(kind, node, ctx.network, false);
        if (r) {
            ctx.mutated.push_back(node);
            continue;
        }

        // All-or-nothing: undo what was already applied, newest first
        for (auto it = ctx.mutated.rbegin(); it != ctx.mutated.rend(); ++it) {
            auto undone = co_await mutate(kind, *it, ctx.network, true);
            if (!undone) {
                ctx.result.errors.push_back(
                    Error{ErrorCode::RestorationError,
                          "rollback of " + *it + " failed: " + undone.error().message});
            } else {
                spdlog::info("[FailureScenarioRunner] rolled back {}", *it);
            }
        }
        ctx.mutated.clear();
        ctx.fail(ErrorCode::InjectionError, "injection on " + node + " failed: " + r.error().message);
        co_return false;
    }
    co_return true;
}

asio::awaitable<void> FailureScenarioRunner::monitor(RunContext& ctx) {
    auto& res = ctx.result;
    const auto& sc = res.scenario;
    const char* injected =
        sc.kind == FailureKind::NodeFailure ? "node down" : "network partition";

    const auto started = Clock::now();
    for (int tick = 0; tick < sc.durationSeconds; ++tick) {
        if (ctx.token.cancelled()) {
            res.cancelled = true;
            break;
        }
        const auto deadline = Clock::now() + config_.tickInterval;

        std::vector<StoreId> probed;
        std::vector<asio::awaitable<Result<store::ProbeSample>>> tasks;
        if (sc.testOperations) {
            for (auto id : kAllStores) {
                if (probes_[storeIndex(id)]) {
                    probed.push_back(id);
                    tasks.push_back(probeOnce(probes_[storeIndex(id)]));
                }
            }
        }
        auto outcomes = co_await whenAll(std::move(tasks));

        for (auto id : kAllStores) {
            AvailabilitySample sample;
            sample.tick = tick;
            sample.store = id;
            auto pos = std::find(probed.begin(), probed.end(), id);
            if (pos != probed.end()) {
                const auto& got = outcomes[static_cast<std::size_t>(pos - probed.begin())];
                if (got) {
                    sample.success = got.value().success;
                    sample.latencyMs = got.value().latencyMs;
                    sample.error = got.value().error;
                } else {
                    sample.error = got.error().message;
                }
            } else {
                sample.probed = false;
                sample.success = true;
            }
            if (res.targetedStores[storeIndex(id)]) {
                sample.success = false;
                sample.latencyMs.reset();
                sample.error = injected;
            }
            if (!sample.success)
                sample.errorKind = ErrorCode::ProbeError;
            res.availability[storeIndex(id)].push_back(std::move(sample));
        }

        if (!co_await waitUntil(deadline, ctx.token)) {
            res.cancelled = true;
            break;
        }
    }
    res.actualDurationSeconds =
        std::chrono::duration<double>(Clock::now() - started).count();
    if (res.cancelled) {
        spdlog::warn("[FailureScenarioRunner] cancelled after {} ticks",
                     res.availability[0].size());
        res.errors.push_back(Error{ErrorCode::OperationCancelled, "cancelled"});
    }
}

asio::awaitable<void> FailureScenarioRunner::restore(RunContext& ctx) {
    const auto kind = ctx.result.scenario.kind;
    for (const auto& node : ctx.mutated) {
        auto r = co_await mutate(kind, node, ctx.network, true);
        if (!r) {
            ctx.result.errors.push_back(Error{ErrorCode::RestorationError,
                                              "restoring " + node + " failed: " + r.error().message});
            spdlog::error("[FailureScenarioRunner] {}", ctx.result.errors.back().message);
        }
    }
}

asio::awaitable<void> FailureScenarioRunner::watchRecovery(RunContext& ctx) {
    auto& res = ctx.result;
    auto& infra = infra_;
    if (res.cancelled) {
        res.recoveryComplete = false;
        co_return;
    }

    const int ceiling = config_.recoveryCeilingTicks;
    for (int tick = 0; tick < ceiling; ++tick) {
        if (!co_await waitUntil(Clock::now() + config_.tickInterval, CancellationToken{}))
            break;

        RecoverySample sample;
        sample.tick = tick;
        bool allRunning = true;
        for (const auto& node : ctx.mutated) {
            auto fn = [&infra, node] { return Result<infra::NodeState>(infra.status(node)); };
            auto st = co_await offload<infra::NodeState>(pool_, std::move(fn));
            const bool running = st && st.value() == infra::NodeState::Running;
            if (!running) {
                allRunning = false;
                for (auto id : kAllStores) {
                    if (node.find(nodeMatch_[storeIndex(id)]) != std::string::npos)
                        sample.storeOnline[storeIndex(id)] = false;
                }
            }
        }
        res.recovery.push_back(sample);

        if (allRunning) {
            res.recoveryTimeSeconds = tick + 1;
            res.recoveryComplete = true;
            spdlog::info("[FailureScenarioRunner] targets recovered in {} ticks", tick + 1);
            co_return;
        }
    }

    res.recoveryTimeSeconds = ceiling;
    res.recoveryComplete = false;
    res.errors.push_back(Error{ErrorCode::RecoveryTimeout,
                               "recovery ceiling of " + std::to_string(ceiling) + " ticks reached"});
    spdlog::warn("[FailureScenarioRunner] {}", res.errors.back().message);
}

void FailureScenarioRunner::complete(RunContext& ctx) {
    auto& res = ctx.result;
    if (res.failure) {
        res.outcome = Outcome::Failed;
    } else if (res.errors.empty() && res.recoveryComplete && !res.cancelled) {
        res.outcome = Outcome::Success;
    } else {
        res.outcome = Outcome::PartialFailure;
    }
    res.success = res.outcome == Outcome::Success;
    spdlog::info("[FailureScenarioRunner] completed: {} ({} errors)", outcomeName(res.outcome),
                 res.errors.size());
}

} // namespace faultline::scenario
