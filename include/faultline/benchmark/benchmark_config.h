#pragma once

#include <faultline/core/types.h>

#include <optional>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace faultline::benchmark {

enum class ConsistencyLevel { Eventual, Strong, Session };
enum class TestType { Mixed, Read, Write, Update };

constexpr const char* consistencyLevelName(ConsistencyLevel c) {
    switch (c) {
        case ConsistencyLevel::Eventual: return "eventual";
        case ConsistencyLevel::Strong: return "strong";
        case ConsistencyLevel::Session: return "session";
    }
    return "eventual";
}

constexpr const char* testTypeName(TestType t) {
    switch (t) {
        case TestType::Mixed: return "mixed";
        case TestType::Read: return "read";
        case TestType::Write: return "write";
        case TestType::Update: return "update";
    }
    return "mixed";
}

std::optional<ConsistencyLevel> consistencyLevelFromString(std::string_view text);
std::optional<TestType> testTypeFromString(std::string_view text);

struct BenchmarkConfig {
    int operationCount = 1000;
    int batchSize = 100;
    ConsistencyLevel consistencyLevel = ConsistencyLevel::Eventual;
    TestType testType = TestType::Mixed;

    bool readsEnabled() const { return testType == TestType::Mixed || testType == TestType::Read; }
    bool updatesEnabled() const {
        return testType == TestType::Mixed || testType == TestType::Update;
    }
};

inline constexpr int kMaxOperationCount = 10000;
inline constexpr int kMaxBatchSize = 1000;

// InvalidArgument when a field is out of range
Result<void> validateBenchmarkConfig(const BenchmarkConfig& config);

// Reads operationCount, batchSize, consistencyLevel and testType; absent
// fields keep their defaults
Result<BenchmarkConfig> benchmarkConfigFromJson(const nlohmann::json& body);

} // namespace faultline::benchmark
