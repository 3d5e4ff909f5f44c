#include <faultline/store/memory_store.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace faultline::store {

namespace asio = boost::asio;

MemoryStore::MemoryStore(std::string name, std::chrono::milliseconds latency)
    : name_(std::move(name)), latency_(latency) {}

bool MemoryStore::matches(const Document& doc, const Document& filter) {
    if (!filter.is_object())
        return false;
    for (auto it = filter.begin(); it != filter.end(); ++it) {
        auto field = doc.find(it.key());
        if (field == doc.end() || *field != it.value())
            return false;
    }
    return true;
}

Result<void> MemoryStore::checkOnline() const {
    if (!online_.load())
        return Error{ErrorCode::StoreError, name_ + " is offline"};
    return Result<void>();
}

void MemoryStore::simulateLatency() const {
    if (latency_.count() > 0)
        std::this_thread::sleep_for(latency_);
}

Result<void> MemoryStore::connect() {
    simulateLatency();
    if (auto r = checkOnline(); !r)
        return r;
    spdlog::debug("[MemoryStore] {} connected", name_);
    return Result<void>();
}

Result<void> MemoryStore::ensureTable(const std::string& table) {
    simulateLatency();
    return ensureTableNow(table);
}

Result<void> MemoryStore::dropTable(const std::string& table) {
    simulateLatency();
    return dropTableNow(table);
}

Result<void> MemoryStore::insert(const std::string& table, const Document& doc,
                                 const CallContext&) {
    simulateLatency();
    return insertNow(table, doc);
}

Result<std::vector<Document>> MemoryStore::find(const std::string& table, const Document& filter,
                                                const CallContext&) {
    simulateLatency();
    return findNow(table, filter);
}

Result<std::size_t> MemoryStore::update(const std::string& table, const Document& filter,
                                        const Document& patch, const CallContext&) {
    simulateLatency();
    return updateNow(table, filter, patch);
}

Result<std::size_t> MemoryStore::remove(const std::string& table, const Document& filter,
                                        const CallContext&) {
    simulateLatency();
    return removeNow(table, filter);
}

Result<void> MemoryStore::ensureTableNow(const std::string& table) {
    if (auto r = checkOnline(); !r)
        return r;
    std::lock_guard<std::mutex> lk(mutex_);
    tables_.try_emplace(table);
    return Result<void>();
}

Result<void> MemoryStore::dropTableNow(const std::string& table) {
    if (auto r = checkOnline(); !r)
        return r;
    std::lock_guard<std::mutex> lk(mutex_);
    tables_.erase(table);
    return Result<void>();
}

Result<void> MemoryStore::insertNow(const std::string& table, const Document& doc) {
    if (auto r = checkOnline(); !r)
        return r;
    if (!doc.is_object())
        return Error{ErrorCode::InvalidArgument, "document must be an object"};
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = tables_.find(table);
    if (it == tables_.end())
        return Error{ErrorCode::NotFound, "table " + table + " does not exist"};
    it->second.push_back(doc);
    return Result<void>();
}

Result<std::vector<Document>> MemoryStore::findNow(const std::string& table,
                                                   const Document& filter) const {
    if (auto r = checkOnline(); !r)
        return r.error();
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = tables_.find(table);
    if (it == tables_.end())
        return Error{ErrorCode::NotFound, "table " + table + " does not exist"};
    std::vector<Document> out;
    for (const auto& doc : it->second) {
        if (matches(doc, filter))
            out.push_back(doc);
    }
    return out;
}

Result<std::size_t> MemoryStore::updateNow(const std::string& table, const Document& filter,
                                           const Document& patch) {
    if (auto r = checkOnline(); !r)
        return r.error();
    if (!patch.is_object())
        return Error{ErrorCode::InvalidArgument, "patch must be an object"};
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = tables_.find(table);
    if (it == tables_.end())
        return Error{ErrorCode::NotFound, "table " + table + " does not exist"};
    std::size_t modified = 0;
    for (auto& doc : it->second) {
        if (matches(doc, filter)) {
            doc.update(patch);
            ++modified;
        }
    }
    return modified;
}

Result<std::size_t> MemoryStore::removeNow(const std::string& table, const Document& filter) {
    if (auto r = checkOnline(); !r)
        return r.error();
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = tables_.find(table);
    if (it == tables_.end())
        return Error{ErrorCode::NotFound, "table " + table + " does not exist"};
    auto& docs = it->second;
    const auto before = docs.size();
    docs.erase(std::remove_if(docs.begin(), docs.end(),
                              [&](const Document& doc) { return matches(doc, filter); }),
               docs.end());
    return before - docs.size();
}

std::size_t MemoryStore::size(const std::string& table) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = tables_.find(table);
    return it == tables_.end() ? 0 : it->second.size();
}

bool MemoryStore::hasTable(const std::string& table) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return tables_.count(table) != 0;
}

AsyncMemoryStore::AsyncMemoryStore(std::shared_ptr<MemoryStore> store) : store_(std::move(store)) {}

asio::awaitable<void> AsyncMemoryStore::delay() const {
    // Every call suspends at least once so siblings and timers on the
    // scheduler get a turn between calls
    if (store_->latency().count() <= 0) {
        co_await asio::post(co_await asio::this_coro::executor, asio::use_awaitable);
        co_return;
    }
    asio::steady_timer timer(co_await asio::this_coro::executor);
    timer.expires_after(store_->latency());
    boost::system::error_code ec;
    co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
}

asio::awaitable<Result<void>> AsyncMemoryStore::connect() {
    co_await delay();
    if (!store_->online())
        co_return Error{ErrorCode::StoreError, store_->name() + " is offline"};
    co_return Result<void>();
}

asio::awaitable<Result<void>> AsyncMemoryStore::ensureTable(std::string table) {
    co_await delay();
    co_return store_->ensureTableNow(table);
}

asio::awaitable<Result<void>> AsyncMemoryStore::dropTable(std::string table) {
    co_await delay();
    co_return store_->dropTableNow(table);
}

asio::awaitable<Result<void>> AsyncMemoryStore::insert(std::string table, Document doc,
                                                       CallContext) {
    co_await delay();
    co_return store_->insertNow(table, doc);
}

asio::awaitable<Result<std::vector<Document>>> AsyncMemoryStore::find(std::string table,
                                                                      Document filter,
                                                                      CallContext) {
    co_await delay();
    co_return store_->findNow(table, filter);
}

asio::awaitable<Result<std::size_t>> AsyncMemoryStore::update(std::string table, Document filter,
                                                              Document patch, CallContext) {
    co_await delay();
    co_return store_->updateNow(table, filter, patch);
}

asio::awaitable<Result<std::size_t>> AsyncMemoryStore::remove(std::string table, Document filter,
                                                              CallContext) {
    co_await delay();
    co_return store_->removeNow(table, filter);
}

} // namespace faultline::store
