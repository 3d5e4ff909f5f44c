#pragma once

#include <faultline/store/store_driver.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace faultline::store {

/**
 * @brief Cassandra driver built on the DataStax C/C++ driver.
 *
 * Every table has the columns (id, name, status, type, body): id is the
 * partition key and is taken from "id" or "_id"; body holds the whole document
 * as JSON. Filters may use the id, name, status and type columns only.
 * Updates read the matching rows and write them back with the patch applied.
 *
 * Consistency levels map to ONE ("eventual"), LOCAL_QUORUM ("session") and
 * QUORUM ("strong"). Calls block; use it through an OffloadingStoreDriver.
 *
 * Only available when built with FAULTLINE_WITH_CASSANDRA.
 */
class CassandraStoreDriver final : public IStoreDriver {
public:
    // Throws std::invalid_argument when @p keyspace is not a plain CQL identifier
    CassandraStoreDriver(std::string contactPoints, std::string keyspace, int replicationFactor,
                         std::chrono::milliseconds requestTimeout);
    ~CassandraStoreDriver() override;

    Result<void> connect() override;
    Result<void> ensureTable(const std::string& table) override;
    Result<void> dropTable(const std::string& table) override;
    Result<void> insert(const std::string& table, const Document& doc,
                        const CallContext& ctx) override;
    Result<std::vector<Document>> find(const std::string& table, const Document& filter,
                                       const CallContext& ctx) override;
    Result<std::size_t> update(const std::string& table, const Document& filter,
                               const Document& patch, const CallContext& ctx) override;
    Result<std::size_t> remove(const std::string& table, const Document& filter,
                               const CallContext& ctx) override;

private:
    struct Impl;

    std::mutex connectMutex_;
    std::unique_ptr<Impl> impl_;
};

} // namespace faultline::store
