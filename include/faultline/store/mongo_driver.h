#pragma once

#include <faultline/store/store_driver.h>

#include <memory>
#include <string>

namespace faultline::store {

/**
 * @brief MongoDB replica-set driver built on mongocxx.
 *
 * Tables map to collections of one database. Every call checks a client out
 * of a connection pool and blocks until the server answers, so the driver is
 * used through an OffloadingStoreDriver.
 *
 * Consistency levels: "strong" writes with majority concern and reads from
 * the primary; "session" writes with majority concern and prefers the
 * primary; "eventual" writes with w:1 and prefers secondaries.
 *
 * Only available when built with FAULTLINE_WITH_MONGODB.
 */
class MongoStoreDriver final : public IStoreDriver {
public:
    // Throws std::invalid_argument on a malformed URI
    MongoStoreDriver(const std::string& uri, std::string database);
    ~MongoStoreDriver() override;

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
    std::unique_ptr<Impl> impl_;
};

} // namespace faultline::store
