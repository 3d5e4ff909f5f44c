#include <faultline/benchmark/benchmark_config.h>
#include <faultline/core/json_fields.h>

#include <nlohmann/json.hpp>

namespace faultline::benchmark {

std::optional<ConsistencyLevel> consistencyLevelFromString(std::string_view text) {
    for (auto c : {ConsistencyLevel::Eventual, ConsistencyLevel::Strong, ConsistencyLevel::Session}) {
        if (text == consistencyLevelName(c))
            return c;
    }
    return std::nullopt;
}

std::optional<TestType> testTypeFromString(std::string_view text) {
    for (auto t : {TestType::Mixed, TestType::Read, TestType::Write, TestType::Update}) {
        if (text == testTypeName(t))
            return t;
    }
    return std::nullopt;
}

Result<void> validateBenchmarkConfig(const BenchmarkConfig& config) {
    if (config.operationCount < 1 || config.operationCount > kMaxOperationCount) {
        return Error{ErrorCode::InvalidArgument,
                     "operationCount must be between 1 and " + std::to_string(kMaxOperationCount)};
    }
    if (config.batchSize < 1 || config.batchSize > kMaxBatchSize) {
        return Error{ErrorCode::InvalidArgument,
                     "batchSize must be between 1 and " + std::to_string(kMaxBatchSize)};
    }
    return Result<void>();
}

Result<BenchmarkConfig> benchmarkConfigFromJson(const nlohmann::json& body) {
    BenchmarkConfig config;
    if (body.is_null())
        return config;
    if (!body.is_object())
        return Error{ErrorCode::InvalidArgument, "request body must be a JSON object"};

    if (auto it = body.find("operationCount"); it != body.end()) {
        auto parsed = readBoundedInt(*it, "operationCount", 1, kMaxOperationCount);
        if (!parsed)
            return parsed.error();
        config.operationCount = parsed.value();
    }
    if (auto it = body.find("batchSize"); it != body.end()) {
        auto parsed = readBoundedInt(*it, "batchSize", 1, kMaxBatchSize);
        if (!parsed)
            return parsed.error();
        config.batchSize = parsed.value();
    }
    if (auto it = body.find("consistencyLevel"); it != body.end()) {
        auto level = it->is_string() ? consistencyLevelFromString(it->get<std::string>())
                                     : std::nullopt;
        if (!level)
            return Error{ErrorCode::InvalidArgument,
                         "consistencyLevel must be one of eventual, strong, session"};
        config.consistencyLevel = *level;
    }
    if (auto it = body.find("testType"); it != body.end()) {
        auto type = it->is_string() ? testTypeFromString(it->get<std::string>()) : std::nullopt;
        if (!type)
            return Error{ErrorCode::InvalidArgument,
                         "testType must be one of mixed, read, write, update"};
        config.testType = *type;
    }
    if (auto v = validateBenchmarkConfig(config); !v)
        return v.error();
    return config;
}

} // namespace faultline::benchmark
