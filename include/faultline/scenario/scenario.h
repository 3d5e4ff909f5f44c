#pragma once

#include <faultline/core/types.h>
#include <faultline/infra/infrastructure_controller.h>
#include <faultline/store/store_id.h>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace faultline::scenario {

enum class FailureKind { NodeFailure, NetworkPartition };

enum class ScenarioState {
    Idle,
    Preparing,
    Injecting,
    Monitoring,
    Restoring,
    RecoveryWatch,
    Completed
};

enum class Outcome { Success, PartialFailure, Failed };

constexpr const char* failureKindName(FailureKind k) {
    return k == FailureKind::NodeFailure ? "node" : "network";
}

constexpr const char* scenarioStateName(ScenarioState s) {
    switch (s) {
        case ScenarioState::Idle: return "Idle";
        case ScenarioState::Preparing: return "Preparing";
        case ScenarioState::Injecting: return "Injecting";
        case ScenarioState::Monitoring: return "Monitoring";
        case ScenarioState::Restoring: return "Restoring";
        case ScenarioState::RecoveryWatch: return "RecoveryWatch";
        case ScenarioState::Completed: return "Completed";
    }
    return "Unknown";
}

constexpr const char* outcomeName(Outcome o) {
    switch (o) {
        case Outcome::Success: return "Success";
        case Outcome::PartialFailure: return "PartialFailure";
        case Outcome::Failed: return "Failed";
    }
    return "Failed";
}

std::optional<FailureKind> failureKindFromString(std::string_view text);

// Immutable once accepted by makeScenario()
struct Scenario {
    FailureKind kind = FailureKind::NodeFailure;
    std::vector<NodeId> targets;
    int durationSeconds = 30;
    bool testOperations = true;
};

/**
 * @brief Build a validated scenario from request fields.
 *
 * @param targetList comma separated node names; blanks and duplicates are
 *        dropped, first occurrence wins
 * @return InvalidArgument for an empty target list, a name outside the
 *         container-name grammar or a duration outside [1, maxDurationSeconds]
 */
Result<Scenario> makeScenario(FailureKind kind, std::string_view targetList, int durationSeconds,
                              bool testOperations, int maxDurationSeconds);

Result<void> validateScenario(const Scenario& scenario, int maxDurationSeconds);

std::vector<NodeId> splitNodeList(std::string_view list);

struct AvailabilitySample {
    int tick = 0;
    StoreId store = StoreId::MongoDB;
    bool success = false;
    std::optional<double> latencyMs;
    std::optional<std::string> error;
    // ProbeError on every failed sample
    std::optional<ErrorCode> errorKind;
    // false when the store was not contacted this tick
    bool probed = true;
};

struct RecoverySample {
    int tick = 0;
    std::array<bool, 2> storeOnline{true, true};
};

struct ScenarioFailure {
    ErrorCode kind = ErrorCode::Unknown;
    std::string message;
};

struct ScenarioResult {
    Scenario scenario;
    double actualDurationSeconds = 0.0;
    int recoveryTimeSeconds = 0;
    bool recoveryComplete = true;
    std::array<std::vector<AvailabilitySample>, 2> availability;
    std::vector<RecoverySample> recovery;
    int dataLoss = 0;
    infra::InfraMode mode = infra::InfraMode::Live;
    bool success = false;
    Outcome outcome = Outcome::Failed;
    // Non-fatal problems: RestorationError, RecoveryTimeout, OperationCancelled
    std::vector<Error> errors;
    std::optional<ScenarioFailure> failure;
    std::vector<ScenarioState> states;
    std::array<bool, 2> targetedStores{false, false};
    std::optional<NetworkId> network;
    bool cancelled = false;

    const std::vector<AvailabilitySample>& series(StoreId id) const {
        return availability[storeIndex(id)];
    }
    // Failed samples of @p id, one per second of logical time
    int downtimeSeconds(StoreId id) const;
};

} // namespace faultline::scenario
