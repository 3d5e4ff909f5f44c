#include <faultline/store/driver_factory.h>
#include <faultline/store/offloading_driver.h>

#include <spdlog/spdlog.h>

#include <functional>
#include <stdexcept>

#ifdef FAULTLINE_HAVE_MONGOCXX
#include <faultline/store/mongo_driver.h>
#endif
#ifdef FAULTLINE_HAVE_CASSANDRA
#include <faultline/store/cassandra_driver.h>
#endif

namespace faultline::store {

namespace {

Error notBuiltWith(StoreId id, const char* option) {
    return Error{ErrorCode::NotSupported, std::string("this build has no ") + storeDisplayName(id) +
                                              " client; rebuild with " + option + "=ON"};
}

[[maybe_unused]] Result<std::shared_ptr<IStoreDriver>>
guardedConstruct(const std::function<std::shared_ptr<IStoreDriver>()>& construct) {
    try {
        return construct();
    } catch (const std::invalid_argument& e) {
        return Error{ErrorCode::InvalidArgument, e.what()};
    }
}

Result<std::shared_ptr<IStoreDriver>> makeExternal(StoreId id, const config::StoreConfig& sc,
                                                   const config::ServiceConfig& config) {
    if (id == StoreId::MongoDB) {
#ifdef FAULTLINE_HAVE_MONGOCXX
        return guardedConstruct(
            [&] { return std::make_shared<MongoStoreDriver>(sc.endpoint, sc.database); });
#else
        return notBuiltWith(id, "FAULTLINE_WITH_MONGODB");
#endif
    }
#ifdef FAULTLINE_HAVE_CASSANDRA
    return guardedConstruct([&] {
        return std::make_shared<CassandraStoreDriver>(sc.endpoint, sc.database,
                                                      sc.replicationFactor,
                                                      config.infrastructure.requestTimeout);
    });
#else
    (void)sc;
    (void)config;
    return notBuiltWith(id, "FAULTLINE_WITH_CASSANDRA");
#endif
}

} // namespace

bool backendCompiledIn(std::string_view backend) {
    if (backend == "memory")
        return true;
#ifdef FAULTLINE_HAVE_MONGOCXX
    if (backend == storeKey(StoreId::MongoDB))
        return true;
#endif
#ifdef FAULTLINE_HAVE_CASSANDRA
    if (backend == storeKey(StoreId::Cassandra))
        return true;
#endif
    return false;
}

Result<StoreDriverSet> makeStoreDrivers(const config::ServiceConfig& config,
                                        boost::asio::any_io_executor pool) {
    StoreDriverSet set;
    const auto timeout = config.benchmark.operationTimeout;
    for (auto id : kAllStores) {
        const auto& sc = config.store(id);
        const auto idx = storeIndex(id);
        if (sc.backend == "memory") {
            auto embedded = std::make_shared<MemoryStore>(storeDisplayName(id), sc.simulatedLatency);
            set.embedded[idx] = embedded;
            if (id == StoreId::MongoDB)
                set.drivers[idx] = std::make_shared<AsyncMemoryStore>(embedded);
            else
                set.drivers[idx] = std::make_shared<OffloadingStoreDriver>(embedded, pool, timeout);
            spdlog::info("[StoreDrivers] {} served by the embedded store", storeDisplayName(id));
            continue;
        }
        if (sc.backend != storeKey(id)) {
            return Error{ErrorCode::InvalidArgument, std::string("unknown backend '") + sc.backend +
                                                         "' for " + storeDisplayName(id)};
        }
        auto external = makeExternal(id, sc, config);
        if (!external)
            return external.error();
        set.drivers[idx] =
            std::make_shared<OffloadingStoreDriver>(std::move(external).value(), pool, timeout);
        spdlog::info("[StoreDrivers] {} backend at {}", storeDisplayName(id), sc.endpoint);
    }
    return set;
}

} // namespace faultline::store
