#pragma once

#include <faultline/config/config_helpers.h>
#include <faultline/core/types.h>
#include <faultline/store/store_id.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace faultline::config {

struct ServerConfig {
    std::string bindAddress = "0.0.0.0";
    uint16_t port = 8000;
    std::size_t workerThreads = 4;
};

struct StoreConfig {
    // Node names containing this substring belong to the store
    std::string nodeMatch;
    std::vector<NodeId> nodes;
    // Artificial per-call latency of the embedded store, for standalone runs
    std::chrono::milliseconds simulatedLatency{0};
    // "memory" for the embedded store, otherwise the store's own name
    std::string backend = "memory";
    // MongoDB connection URI or comma-separated Cassandra contact points
    std::string endpoint;
    // MongoDB database or Cassandra keyspace
    std::string database = "faultline";
    int replicationFactor = 3;
};

struct InfrastructureConfig {
    std::filesystem::path dockerSocket = "/var/run/docker.sock";
    std::string wellKnownNetwork = "distributed_db_network";
    int stopTimeoutSeconds = 5;
    std::chrono::milliseconds requestTimeout{5000};
    bool forceSynthetic = false;
    std::optional<uint32_t> syntheticSeed;
};

struct ScenarioConfig {
    int maxDurationSeconds = 300;
    std::chrono::milliseconds tickInterval{1000};
    int recoveryCeilingTicks = 10;
    std::chrono::milliseconds probeTimeout{2000};
    std::string probeTable = "failure_monitor";
};

struct BenchmarkConfigDefaults {
    std::string table = "performance_test";
    std::chrono::milliseconds operationTimeout{30000};
};

struct ReportConfig {
    std::filesystem::path directory = "logs/performance_reports";
};

struct DashboardConfig {
    std::chrono::milliseconds cpuWindow{500};
    std::chrono::milliseconds partTimeout{5000};
};

struct LoggingConfig {
    std::string level = "info";
    std::filesystem::path file;
};

struct ServiceConfig {
    ServerConfig server;
    InfrastructureConfig infrastructure;
    std::array<StoreConfig, 2> stores{
        StoreConfig{"mongo", {"mongo1", "mongo2", "mongo3"}, std::chrono::milliseconds{0},
                    "memory", "mongodb://mongo1:27017,mongo2:27017,mongo3:27017/?replicaSet=rs0"},
        StoreConfig{"cassandra", {"cassandra1", "cassandra2", "cassandra3"},
                    std::chrono::milliseconds{0}, "memory", "cassandra1,cassandra2,cassandra3"}};
    ScenarioConfig scenario;
    BenchmarkConfigDefaults benchmark;
    ReportConfig reports;
    DashboardConfig dashboard;
    LoggingConfig logging;

    const StoreConfig& store(StoreId id) const { return stores[storeIndex(id)]; }
    StoreConfig& store(StoreId id) { return stores[storeIndex(id)]; }

    // Every node of both stores, in configuration order
    std::vector<NodeId> knownNodes() const;
};

// Apply parsed sections on top of the values already in @p config.
void applySections(const SectionMap& sections, ServiceConfig& config);

// Load a config file over the defaults. A missing file is not an error.
Result<ServiceConfig> loadConfig(const std::filesystem::path& path);

// FAULTLINE_DOCKER_SOCKET, FAULTLINE_PORT, FAULTLINE_REPORT_DIR, FAULTLINE_SYNTHETIC
void applyEnvironment(ServiceConfig& config);

Result<void> validate(const ServiceConfig& config);

} // namespace faultline::config
