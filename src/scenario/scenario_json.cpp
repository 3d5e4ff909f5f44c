#include <faultline/scenario/scenario_json.h>

#include <algorithm>
#include <cmath>

namespace faultline::scenario {

using nlohmann::json;

namespace {

std::string tickLabel(int tick) {
    return std::to_string(tick) + "s";
}

json sampleToJson(const AvailabilitySample& s) {
    json j{{"success", s.success}, {"probed", s.probed}};
    j["latency"] = s.latencyMs ? json(*s.latencyMs) : json(nullptr);
    j["error"] = s.error ? json(*s.error) : json(nullptr);
    if (s.errorKind)
        j["errorKind"] = errorKindName(*s.errorKind);
    return j;
}

std::string joinTargets(const std::vector<NodeId>& targets) {
    std::string out;
    for (const auto& t : targets) {
        if (!out.empty())
            out += ',';
        out += t;
    }
    return out;
}

json errorsToJson(const std::vector<Error>& errors) {
    json out = json::array();
    for (const auto& e : errors)
        out.push_back(json{{"kind", errorKindName(e.code)}, {"message", e.message}});
    return out;
}

} // namespace

json availabilityToJson(const ScenarioResult& result) {
    json out = json::array();
    const auto& mongo = result.series(StoreId::MongoDB);
    const auto& cass = result.series(StoreId::Cassandra);
    const auto n = std::min(mongo.size(), cass.size());
    for (std::size_t i = 0; i < n; ++i) {
        json entry{{"time", tickLabel(mongo[i].tick)},
                   {storeKey(StoreId::MongoDB), sampleToJson(mongo[i])},
                   {storeKey(StoreId::Cassandra), sampleToJson(cass[i])}};
        if (result.scenario.kind == FailureKind::NetworkPartition)
            entry["partition_active"] = true;
        out.push_back(std::move(entry));
    }
    return out;
}

json recoveryToJson(const ScenarioResult& result) {
    json out = json::array();
    for (const auto& r : result.recovery) {
        json entry{{"time", tickLabel(r.tick)}};
        for (auto id : kAllStores)
            entry[storeKey(id)] = r.storeOnline[storeIndex(id)] ? 100 : 0;
        out.push_back(std::move(entry));
    }
    return out;
}

json summaryToJson(const ScenarioResult& result) {
    return json{
        {"failureType", failureKindName(result.scenario.kind)},
        {"targetNode", joinTargets(result.scenario.targets)},
        {"duration", result.scenario.durationSeconds},
        {"mongodbDowntime", result.downtimeSeconds(StoreId::MongoDB)},
        {"cassandraDowntime", result.downtimeSeconds(StoreId::Cassandra)},
        {"dataLossMongo", result.dataLoss},
        {"dataLossCassandra", result.dataLoss},
        {"recoveryTime", result.recoveryTimeSeconds},
        {"recoveryComplete", result.recoveryComplete},
        {"mode", infra::infraModeName(result.mode)},
        {"outcome", outcomeName(result.outcome)}};
}

json resultToJson(const ScenarioResult& result) {
    json states = json::array();
    for (auto s : result.states)
        states.push_back(scenarioStateName(s));

    json j{{"failureType", failureKindName(result.scenario.kind)},
           {"targets", result.scenario.targets},
           {"failureDuration", result.scenario.durationSeconds},
           {"testOperations", result.scenario.testOperations},
           {"actualDuration", std::round(result.actualDurationSeconds * 100.0) / 100.0},
           {"recoveryTime", result.recoveryTimeSeconds},
           {"recoveryComplete", result.recoveryComplete},
           {"availabilityMetrics", availabilityToJson(result)},
           {"recoveryMetrics", recoveryToJson(result)},
           {"dataLoss", result.dataLoss},
           {"mode", infra::infraModeName(result.mode)},
           {"success", result.success},
           {"outcome", outcomeName(result.outcome)},
           {"errors", errorsToJson(result.errors)},
           {"cancelled", result.cancelled},
           {"states", std::move(states)}};
    if (result.network)
        j["network"] = *result.network;
    if (result.failure) {
        j["failure"] = json{{"kind", errorKindName(result.failure->kind)},
                            {"message", result.failure->message}};
    }
    return j;
}

} // namespace faultline::scenario
