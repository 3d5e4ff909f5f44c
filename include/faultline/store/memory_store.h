#pragma once

#include <faultline/store/store_driver.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace faultline::store {

/**
 * @brief Embedded thread-safe document store.
 *
 * Used when the service runs without external clusters, and by tests. Tables
 * are created on demand by ensureTable(); writing to a missing table fails the
 * way a real store rejects an unknown table. Documents match a filter when
 * every filter field is present with an equal value.
 */
class MemoryStore final : public IStoreDriver {
public:
    explicit MemoryStore(std::string name,
                         std::chrono::milliseconds latency = std::chrono::milliseconds{0});

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

    // While offline every call fails with ErrorCode::StoreError
    void setOnline(bool online) { online_.store(online); }
    bool online() const { return online_.load(); }

    std::size_t size(const std::string& table) const;
    bool hasTable(const std::string& table) const;
    const std::string& name() const { return name_; }
    std::chrono::milliseconds latency() const { return latency_; }

    // Non-blocking variants used by AsyncMemoryStore
    Result<void> ensureTableNow(const std::string& table);
    Result<void> dropTableNow(const std::string& table);
    Result<void> insertNow(const std::string& table, const Document& doc);
    Result<std::vector<Document>> findNow(const std::string& table, const Document& filter) const;
    Result<std::size_t> updateNow(const std::string& table, const Document& filter,
                                  const Document& patch);
    Result<std::size_t> removeNow(const std::string& table, const Document& filter);

    static bool matches(const Document& doc, const Document& filter);

private:
    Result<void> checkOnline() const;
    void simulateLatency() const;

    std::string name_;
    std::chrono::milliseconds latency_;
    std::atomic<bool> online_{true};
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<Document>> tables_;
};

/**
 * @brief Awaitable facade over a MemoryStore.
 *
 * Latency is simulated with a timer on the calling executor, so the scheduler
 * thread is never blocked. With no latency each call still yields once.
 */
class AsyncMemoryStore final : public IAsyncStoreDriver {
public:
    explicit AsyncMemoryStore(std::shared_ptr<MemoryStore> store);

    boost::asio::awaitable<Result<void>> connect() override;
    boost::asio::awaitable<Result<void>> ensureTable(std::string table) override;
    boost::asio::awaitable<Result<void>> dropTable(std::string table) override;
    boost::asio::awaitable<Result<void>> insert(std::string table, Document doc,
                                                CallContext ctx) override;
    boost::asio::awaitable<Result<std::vector<Document>>> find(std::string table, Document filter,
                                                               CallContext ctx) override;
    boost::asio::awaitable<Result<std::size_t>> update(std::string table, Document filter,
                                                       Document patch, CallContext ctx) override;
    boost::asio::awaitable<Result<std::size_t>> remove(std::string table, Document filter,
                                                       CallContext ctx) override;

    const std::shared_ptr<MemoryStore>& store() const { return store_; }

private:
    boost::asio::awaitable<void> delay() const;

    std::shared_ptr<MemoryStore> store_;
};

} // namespace faultline::store
