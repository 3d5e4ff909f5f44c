#include <faultline/config/config_helpers.h>
#include <faultline/scenario/scenario.h>

#include <algorithm>

namespace faultline::scenario {

std::optional<FailureKind> failureKindFromString(std::string_view text) {
    if (text == "node")
        return FailureKind::NodeFailure;
    if (text == "network")
        return FailureKind::NetworkPartition;
    return std::nullopt;
}

std::vector<NodeId> splitNodeList(std::string_view list) {
    std::vector<NodeId> out;
    std::size_t pos = 0;
    while (pos <= list.size()) {
        auto comma = list.find(',', pos);
        if (comma == std::string_view::npos)
            comma = list.size();
        std::string item(list.substr(pos, comma - pos));
        config::trim(item);
        if (!item.empty() && std::find(out.begin(), out.end(), item) == out.end())
            out.push_back(std::move(item));
        pos = comma + 1;
    }
    return out;
}

Result<void> validateScenario(const Scenario& scenario, int maxDurationSeconds) {
    if (scenario.targets.empty())
        return Error{ErrorCode::InvalidArgument, "targetNode must name at least one node"};
    for (const auto& node : scenario.targets) {
        if (!infra::isValidNodeName(node))
            return Error{ErrorCode::InvalidArgument, "invalid node name: " + node};
    }
    if (scenario.durationSeconds < 1 || scenario.durationSeconds > maxDurationSeconds) {
        return Error{ErrorCode::InvalidArgument, "duration must be between 1 and " +
                                                     std::to_string(maxDurationSeconds) +
                                                     " seconds"};
    }
    return Result<void>();
}

Result<Scenario> makeScenario(FailureKind kind, std::string_view targetList, int durationSeconds,
                              bool testOperations, int maxDurationSeconds) {
    Scenario s;
    s.kind = kind;
    s.targets = splitNodeList(targetList);
    s.durationSeconds = durationSeconds;
    s.testOperations = testOperations;
    if (auto v = validateScenario(s, maxDurationSeconds); !v)
        return v.error();
    return s;
}

int ScenarioResult::downtimeSeconds(StoreId id) const {
    const auto& s = series(id);
    return static_cast<int>(
        std::count_if(s.begin(), s.end(), [](const AvailabilitySample& a) { return !a.success; }));
}

} // namespace faultline::scenario
