#include <faultline/config/config.h>

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace faultline::config {

namespace {

const std::string* find(const SectionMap& sections, const std::string& section,
                        const std::string& key) {
    auto s = sections.find(section);
    if (s == sections.end())
        return nullptr;
    auto k = s->second.find(key);
    if (k == s->second.end())
        return nullptr;
    return &k->second;
}

template <typename Int>
void readInt(const SectionMap& sections, const std::string& section, const std::string& key,
             Int& out) {
    if (const auto* v = find(sections, section, key)) {
        try {
            out = static_cast<Int>(std::stoll(*v));
        } catch (const std::exception&) {
            spdlog::warn("[Config] ignoring non-numeric {}.{} = '{}'", section, key, *v);
        }
    }
}

void readMs(const SectionMap& sections, const std::string& section, const std::string& key,
            std::chrono::milliseconds& out) {
    long long ms = out.count();
    readInt(sections, section, key, ms);
    out = std::chrono::milliseconds(ms);
}

void readString(const SectionMap& sections, const std::string& section, const std::string& key,
                std::string& out) {
    if (const auto* v = find(sections, section, key))
        out = *v;
}

} // namespace

std::vector<NodeId> ServiceConfig::knownNodes() const {
    std::vector<NodeId> out;
    for (const auto& s : stores) {
        out.insert(out.end(), s.nodes.begin(), s.nodes.end());
    }
    return out;
}

void applySections(const SectionMap& sections, ServiceConfig& config) {
    readString(sections, "server", "bind_address", config.server.bindAddress);
    readInt(sections, "server", "port", config.server.port);
    readInt(sections, "server", "worker_threads", config.server.workerThreads);

    auto& infra = config.infrastructure;
    if (const auto* v = find(sections, "infrastructure", "docker_socket"))
        infra.dockerSocket = expand_tilde(*v);
    readString(sections, "infrastructure", "network", infra.wellKnownNetwork);
    readInt(sections, "infrastructure", "stop_timeout_s", infra.stopTimeoutSeconds);
    readMs(sections, "infrastructure", "request_timeout_ms", infra.requestTimeout);
    if (const auto* v = find(sections, "infrastructure", "synthetic"))
        infra.forceSynthetic = parse_bool(*v, infra.forceSynthetic);
    if (find(sections, "infrastructure", "synthetic_seed")) {
        uint32_t seed = 0;
        readInt(sections, "infrastructure", "synthetic_seed", seed);
        infra.syntheticSeed = seed;
    }

    for (auto id : kAllStores) {
        auto& store = config.store(id);
        const std::string prefix = storeKey(id);
        if (const auto* v = find(sections, "stores", prefix + "_nodes"))
            store.nodes = parse_list(*v);
        readString(sections, "stores", prefix + "_match", store.nodeMatch);
        readMs(sections, "stores", prefix + "_latency_ms", store.simulatedLatency);
        readString(sections, "stores", prefix + "_backend", store.backend);
        readString(sections, "stores", prefix + "_database", store.database);
        readInt(sections, "stores", prefix + "_replication_factor", store.replicationFactor);
    }
    readString(sections, "stores", "mongodb_uri", config.store(StoreId::MongoDB).endpoint);
    readString(sections, "stores", "cassandra_contact_points",
               config.store(StoreId::Cassandra).endpoint);

    auto& sc = config.scenario;
    readInt(sections, "scenario", "max_duration_s", sc.maxDurationSeconds);
    readMs(sections, "scenario", "tick_interval_ms", sc.tickInterval);
    readInt(sections, "scenario", "recovery_ceiling", sc.recoveryCeilingTicks);
    readMs(sections, "scenario", "probe_timeout_ms", sc.probeTimeout);
    readString(sections, "scenario", "probe_table", sc.probeTable);

    readString(sections, "benchmark", "table", config.benchmark.table);
    readMs(sections, "benchmark", "op_timeout_ms", config.benchmark.operationTimeout);

    if (const auto* v = find(sections, "reports", "dir"))
        config.reports.directory = expand_tilde(*v);

    readMs(sections, "dashboard", "cpu_window_ms", config.dashboard.cpuWindow);
    readMs(sections, "dashboard", "part_timeout_ms", config.dashboard.partTimeout);

    readString(sections, "logging", "level", config.logging.level);
    if (const auto* v = find(sections, "logging", "file"))
        config.logging.file = expand_tilde(*v);
}

Result<ServiceConfig> loadConfig(const std::filesystem::path& path) {
    ServiceConfig config;
    if (path.empty() || !std::filesystem::exists(path)) {
        spdlog::debug("[Config] no config file at '{}', using defaults", path.string());
        return config;
    }
    auto parsed = parse_toml_sections(path);
    if (!parsed) {
        return parsed.error();
    }
    applySections(parsed.value(), config);
    spdlog::info("[Config] loaded {}", path.string());
    return config;
}

void applyEnvironment(ServiceConfig& config) {
    if (const char* v = std::getenv("FAULTLINE_DOCKER_SOCKET"); v && *v) {
        config.infrastructure.dockerSocket = v;
    }
    if (const char* v = std::getenv("FAULTLINE_PORT"); v && *v) {
        try {
            config.server.port = static_cast<uint16_t>(std::stoul(v));
        } catch (const std::exception&) {
            spdlog::warn("[Config] ignoring invalid FAULTLINE_PORT='{}'", v);
        }
    }
    if (const char* v = std::getenv("FAULTLINE_REPORT_DIR"); v && *v) {
        config.reports.directory = expand_tilde(v);
    }
    if (const char* v = std::getenv("FAULTLINE_SYNTHETIC"); v && *v) {
        config.infrastructure.forceSynthetic =
            parse_bool(v, config.infrastructure.forceSynthetic);
    }
}

Result<void> validate(const ServiceConfig& config) {
    if (config.server.workerThreads == 0)
        return Error{ErrorCode::InvalidArgument, "server.worker_threads must be at least 1"};
    if (config.scenario.maxDurationSeconds < 1)
        return Error{ErrorCode::InvalidArgument, "scenario.max_duration_s must be at least 1"};
    if (config.scenario.tickInterval.count() <= 0)
        return Error{ErrorCode::InvalidArgument, "scenario.tick_interval_ms must be positive"};
    if (config.scenario.recoveryCeilingTicks < 1)
        return Error{ErrorCode::InvalidArgument, "scenario.recovery_ceiling must be at least 1"};
    if (config.scenario.probeTimeout.count() <= 0)
        return Error{ErrorCode::InvalidArgument, "scenario.probe_timeout_ms must be positive"};
    for (auto id : kAllStores) {
        if (config.store(id).nodeMatch.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         std::string("stores.") + storeKey(id) + "_match must not be empty"};
        }
    }
    if (config.store(StoreId::MongoDB).nodeMatch == config.store(StoreId::Cassandra).nodeMatch)
        return Error{ErrorCode::InvalidArgument, "store node patterns must differ"};
    for (auto id : kAllStores) {
        const auto& s = config.store(id);
        const std::string key = std::string("stores.") + storeKey(id);
        if (s.backend != "memory" && s.backend != storeKey(id)) {
            return Error{ErrorCode::InvalidArgument,
                         key + "_backend must be \"memory\" or \"" + storeKey(id) + "\""};
        }
        if (s.backend != "memory" && s.endpoint.empty())
            return Error{ErrorCode::InvalidArgument, key + " endpoint must not be empty"};
        if (s.replicationFactor < 1)
            return Error{ErrorCode::InvalidArgument, key + "_replication_factor must be at least 1"};
    }
    if (config.dashboard.cpuWindow.count() < 0 || config.dashboard.partTimeout.count() <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     "dashboard.cpu_window_ms must be >= 0 and part_timeout_ms positive"};
    }
    return Result<void>();
}

} // namespace faultline::config
