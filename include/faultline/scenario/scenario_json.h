#pragma once

#include <faultline/scenario/scenario.h>

#include <nlohmann/json.hpp>

namespace faultline::scenario {

// [{time: "0s", mongodb: {success, latency, error, probed}, cassandra: {...}}, ...]
nlohmann::json availabilityToJson(const ScenarioResult& result);

// [{time: "0s", mongodb: 100|0, cassandra: 100|0}, ...]
nlohmann::json recoveryToJson(const ScenarioResult& result);

// Dashboard summary: per-store downtime, recovery time, data loss and mode
nlohmann::json summaryToJson(const ScenarioResult& result);

// Full result, including the state trace and error list
nlohmann::json resultToJson(const ScenarioResult& result);

} // namespace faultline::scenario
