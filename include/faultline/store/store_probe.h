#pragma once

#include <faultline/store/store_driver.h>
#include <faultline/store/store_id.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/awaitable.hpp>

namespace faultline::store {

struct ProbeSample {
    bool success = false;
    std::optional<double> latencyMs;
    std::optional<std::string> error;
};

/**
 * @brief Single bounded write+read against a store's probe table.
 *
 * probe() never throws: failures and timeouts are reported in the sample.
 */
class StoreProbe {
public:
    StoreProbe(StoreId store, std::shared_ptr<IAsyncStoreDriver> driver, std::string table,
               std::chrono::milliseconds timeout);

    boost::asio::awaitable<ProbeSample> probe();

    StoreId store() const { return store_; }
    const std::string& table() const { return table_; }

private:
    StoreId store_;
    std::shared_ptr<IAsyncStoreDriver> driver_;
    std::string table_;
    std::chrono::milliseconds timeout_;
    bool tableReady_ = false;
};

} // namespace faultline::store
