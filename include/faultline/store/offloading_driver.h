#pragma once

#include <faultline/store/store_driver.h>

#include <chrono>
#include <memory>

#include <boost/asio/any_io_executor.hpp>

namespace faultline::store {

/**
 * @brief Presents a blocking driver as an IAsyncStoreDriver.
 *
 * Every call is posted to the worker pool and awaited; a call that outlives
 * @p callTimeout resolves to ErrorCode::Timeout while the worker finishes it
 * in the background.
 */
class OffloadingStoreDriver final : public IAsyncStoreDriver {
public:
    OffloadingStoreDriver(std::shared_ptr<IStoreDriver> driver, boost::asio::any_io_executor pool,
                          std::chrono::milliseconds callTimeout);

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

private:
    std::shared_ptr<IStoreDriver> driver_;
    boost::asio::any_io_executor pool_;
    std::chrono::milliseconds timeout_;
};

} // namespace faultline::store
