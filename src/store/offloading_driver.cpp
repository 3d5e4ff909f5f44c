#include <faultline/core/async.h>
#include <faultline/store/offloading_driver.h>

namespace faultline::store {

namespace asio = boost::asio;

OffloadingStoreDriver::OffloadingStoreDriver(std::shared_ptr<IStoreDriver> driver,
                                             asio::any_io_executor pool,
                                             std::chrono::milliseconds callTimeout)
    : driver_(std::move(driver)), pool_(std::move(pool)), timeout_(callTimeout) {}

asio::awaitable<Result<void>> OffloadingStoreDriver::connect() {
    auto fn = [d = driver_] { return d->connect(); };
    co_return co_await offload<void>(pool_, std::move(fn), timeout_);
}

asio::awaitable<Result<void>> OffloadingStoreDriver::ensureTable(std::string table) {
    auto fn = [d = driver_, table = std::move(table)] { return d->ensureTable(table); };
    co_return co_await offload<void>(pool_, std::move(fn), timeout_);
}

asio::awaitable<Result<void>> OffloadingStoreDriver::dropTable(std::string table) {
    auto fn = [d = driver_, table = std::move(table)] { return d->dropTable(table); };
    co_return co_await offload<void>(pool_, std::move(fn), timeout_);
}

asio::awaitable<Result<void>> OffloadingStoreDriver::insert(std::string table, Document doc,
                                                            CallContext ctx) {
    auto fn = [d = driver_, table = std::move(table), doc = std::move(doc),
               ctx = std::move(ctx)] { return d->insert(table, doc, ctx); };
    co_return co_await offload<void>(pool_, std::move(fn), timeout_);
}

asio::awaitable<Result<std::vector<Document>>>
OffloadingStoreDriver::find(std::string table, Document filter, CallContext ctx) {
    auto fn = [d = driver_, table = std::move(table), filter = std::move(filter),
               ctx = std::move(ctx)] { return d->find(table, filter, ctx); };
    co_return co_await offload<std::vector<Document>>(pool_, std::move(fn), timeout_);
}

asio::awaitable<Result<std::size_t>> OffloadingStoreDriver::update(std::string table,
                                                                   Document filter,
                                                                   Document patch,
                                                                   CallContext ctx) {
    auto fn = [d = driver_, table = std::move(table), filter = std::move(filter),
               patch = std::move(patch), ctx = std::move(ctx)] {
        return d->update(table, filter, patch, ctx);
    };
    co_return co_await offload<std::size_t>(pool_, std::move(fn), timeout_);
}

asio::awaitable<Result<std::size_t>> OffloadingStoreDriver::remove(std::string table,
                                                                   Document filter,
                                                                   CallContext ctx) {
    auto fn = [d = driver_, table = std::move(table), filter = std::move(filter),
               ctx = std::move(ctx)] { return d->remove(table, filter, ctx); };
    co_return co_await offload<std::size_t>(pool_, std::move(fn), timeout_);
}

} // namespace faultline::store
