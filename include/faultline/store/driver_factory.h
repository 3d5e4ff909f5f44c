#pragma once

#include <faultline/config/config.h>
#include <faultline/store/memory_store.h>
#include <faultline/store/store_driver.h>

#include <array>
#include <memory>
#include <string_view>

#include <boost/asio/any_io_executor.hpp>

namespace faultline::store {

// True when this build links the client library for @p backend ("memory" always is)
bool backendCompiledIn(std::string_view backend);

struct StoreDriverSet {
    std::array<std::shared_ptr<IAsyncStoreDriver>, 2> drivers;
    // Backing store of each "memory" backend, null for external ones
    std::array<std::shared_ptr<MemoryStore>, 2> embedded;
};

/**
 * @brief Build the driver of each store from the [stores] configuration.
 *
 * The embedded MongoDB-like store is awaited directly on the scheduler; the
 * embedded Cassandra-like store and both external drivers block and are
 * wrapped in an OffloadingStoreDriver on @p pool.
 *
 * @return NotSupported when a backend was requested that this build lacks
 */
Result<StoreDriverSet> makeStoreDrivers(const config::ServiceConfig& config,
                                        boost::asio::any_io_executor pool);

} // namespace faultline::store
