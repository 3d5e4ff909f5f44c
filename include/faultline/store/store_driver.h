#pragma once

#include <faultline/core/types.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

namespace faultline::store {

using Document = nlohmann::json;

// Per-call options forwarded to the store driver.
struct CallContext {
    std::string consistencyLevel = "eventual";
};

/**
 * @brief Blocking document-store driver.
 *
 * Calls may block for network I/O. They must never be made on the scheduler
 * thread; wrap the driver in an OffloadingStoreDriver instead.
 */
class IStoreDriver {
public:
    virtual ~IStoreDriver() = default;

    virtual Result<void> connect() = 0;
    virtual Result<void> ensureTable(const std::string& table) = 0;
    virtual Result<void> dropTable(const std::string& table) = 0;

    virtual Result<void> insert(const std::string& table, const Document& doc,
                                const CallContext& ctx) = 0;
    virtual Result<std::vector<Document>> find(const std::string& table, const Document& filter,
                                               const CallContext& ctx) = 0;
    // Returns the number of documents modified
    virtual Result<std::size_t> update(const std::string& table, const Document& filter,
                                       const Document& patch, const CallContext& ctx) = 0;
    // Returns the number of documents deleted
    virtual Result<std::size_t> remove(const std::string& table, const Document& filter,
                                       const CallContext& ctx) = 0;
};

/**
 * @brief Non-blocking document-store driver awaited on the scheduler.
 */
class IAsyncStoreDriver {
public:
    virtual ~IAsyncStoreDriver() = default;

    virtual boost::asio::awaitable<Result<void>> connect() = 0;
    virtual boost::asio::awaitable<Result<void>> ensureTable(std::string table) = 0;
    virtual boost::asio::awaitable<Result<void>> dropTable(std::string table) = 0;

    virtual boost::asio::awaitable<Result<void>> insert(std::string table, Document doc,
                                                        CallContext ctx) = 0;
    virtual boost::asio::awaitable<Result<std::vector<Document>>>
    find(std::string table, Document filter, CallContext ctx) = 0;
    virtual boost::asio::awaitable<Result<std::size_t>>
    update(std::string table, Document filter, Document patch, CallContext ctx) = 0;
    virtual boost::asio::awaitable<Result<std::size_t>>
    remove(std::string table, Document filter, CallContext ctx) = 0;
};

} // namespace faultline::store
