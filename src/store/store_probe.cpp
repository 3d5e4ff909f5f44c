#include <faultline/core/async.h>
#include <faultline/store/store_probe.h>

#include <spdlog/spdlog.h>

#include <cmath>

namespace faultline::store {

namespace asio = boost::asio;

namespace {

// Heartbeat insert followed by a read of the same document.
asio::awaitable<Result<void>> roundTrip(std::shared_ptr<IAsyncStoreDriver> driver,
                                        std::string table, bool ensure) {
    if (ensure) {
        auto created = co_await driver->ensureTable(table);
        if (!created)
            co_return created.error();
    }
    const auto now = std::chrono::system_clock::now();
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    Document heartbeat{{"_id", "hb_" + std::to_string(ms)}, {"ts", ms}};

    const CallContext ctx{};
    auto written = co_await driver->insert(table, heartbeat, ctx);
    if (!written)
        co_return written.error();

    Document byId{{"_id", heartbeat["_id"]}};
    auto read = co_await driver->find(table, byId, ctx);
    if (!read)
        co_return read.error();

    // The sample is already decided; a failed delete only leaves one stale heartbeat
    auto removed = co_await driver->remove(table, std::move(byId), ctx);
    if (!removed)
        spdlog::debug("[StoreProbe] heartbeat cleanup in {} failed: {}", table,
                      removed.error().message);
    co_return Result<void>();
}

} // namespace

StoreProbe::StoreProbe(StoreId store, std::shared_ptr<IAsyncStoreDriver> driver, std::string table,
                       std::chrono::milliseconds timeout)
    : store_(store), driver_(std::move(driver)), table_(std::move(table)), timeout_(timeout) {}

asio::awaitable<ProbeSample> StoreProbe::probe() {
    ProbeSample sample;
    const auto start = std::chrono::steady_clock::now();
    try {
        auto r = co_await withTimeout<void>(roundTrip(driver_, table_, !tableReady_), timeout_);
        if (r) {
            tableReady_ = true;
            const std::chrono::duration<double, std::milli> elapsed =
                std::chrono::steady_clock::now() - start;
            sample.success = true;
            sample.latencyMs = std::round(elapsed.count() * 100.0) / 100.0;
        } else {
            sample.error = r.error().message;
        }
    } catch (const std::exception& e) {
        sample.error = e.what();
    }
    if (!sample.success) {
        spdlog::debug("[StoreProbe] {} probe failed: {}", storeDisplayName(store_),
                      sample.error.value_or("unknown"));
    }
    co_return sample;
}

} // namespace faultline::store
