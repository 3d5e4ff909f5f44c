#include <gtest/gtest.h>

#include <faultline/store/memory_store.h>
#include <faultline/store/store_probe.h>

#include "../../common/async_test_utils.h"
#include "../../common/scripted_store_driver.h"

using namespace faultline;
using namespace faultline::store;
using faultline::test::runAwaitable;
using faultline::test::ScriptedStoreDriver;

TEST(StoreProbeTest, SuccessfulRoundTripReportsLatency) {
    boost::asio::io_context io;
    auto backing = std::make_shared<MemoryStore>("mongodb");
    StoreProbe probe(StoreId::MongoDB, std::make_shared<AsyncMemoryStore>(backing),
                     "failure_monitor", std::chrono::milliseconds(500));

    auto sample = runAwaitable(io, probe.probe());
    EXPECT_TRUE(sample.success);
    ASSERT_TRUE(sample.latencyMs.has_value());
    EXPECT_GE(*sample.latencyMs, 0.0);
    EXPECT_FALSE(sample.error.has_value());
    EXPECT_TRUE(backing->hasTable("failure_monitor"));
    EXPECT_EQ(backing->size("failure_monitor"), 0u);
}

TEST(StoreProbeTest, TableIsCreatedOnlyUntilFirstSuccess) {
    boost::asio::io_context io;
    auto driver = std::make_shared<ScriptedStoreDriver>();
    StoreProbe probe(StoreId::Cassandra, driver, "failure_monitor", std::chrono::milliseconds(500));

    EXPECT_TRUE(runAwaitable(io, probe.probe()).success);
    EXPECT_TRUE(runAwaitable(io, probe.probe()).success);
    EXPECT_EQ(driver->calls("ensureTable"), 1);
    EXPECT_EQ(driver->calls("insert"), 2);
    EXPECT_EQ(driver->calls("find"), 2);
    EXPECT_EQ(driver->calls("remove"), 2);
}

TEST(StoreProbeTest, HeartbeatsDoNotAccumulate) {
    boost::asio::io_context io;
    auto driver = std::make_shared<ScriptedStoreDriver>();
    StoreProbe probe(StoreId::MongoDB, driver, "failure_monitor", std::chrono::milliseconds(500));

    for (int i = 0; i < 50; ++i)
        ASSERT_TRUE(runAwaitable(io, probe.probe()).success);
    EXPECT_EQ(driver->backing()->size("failure_monitor"), 0u);
}

TEST(StoreProbeTest, FailedCleanupKeepsSampleSuccessful) {
    boost::asio::io_context io;
    auto driver = std::make_shared<ScriptedStoreDriver>();
    driver->setHook([](const std::string& op, int) -> std::optional<Error> {
        if (op == "remove")
            return Error{ErrorCode::StoreError, "delete rejected"};
        return std::nullopt;
    });
    StoreProbe probe(StoreId::Cassandra, driver, "failure_monitor", std::chrono::milliseconds(500));

    auto sample = runAwaitable(io, probe.probe());
    EXPECT_TRUE(sample.success);
    EXPECT_FALSE(sample.error.has_value());
    EXPECT_EQ(driver->backing()->size("failure_monitor"), 1u);
}

TEST(StoreProbeTest, FailedWriteIsReportedNotThrown) {
    boost::asio::io_context io;
    auto driver = std::make_shared<ScriptedStoreDriver>();
    driver->setHook([](const std::string& op, int) -> std::optional<Error> {
        if (op == "insert")
            return Error{ErrorCode::StoreError, "write rejected"};
        return std::nullopt;
    });
    StoreProbe probe(StoreId::MongoDB, driver, "failure_monitor", std::chrono::milliseconds(500));

    auto sample = runAwaitable(io, probe.probe());
    EXPECT_FALSE(sample.success);
    EXPECT_FALSE(sample.latencyMs.has_value());
    EXPECT_EQ(sample.error.value_or(""), "write rejected");
    EXPECT_EQ(driver->calls("find"), 0);
}

TEST(StoreProbeTest, DriverExceptionBecomesFailedSample) {
    boost::asio::io_context io;
    auto driver = std::make_shared<ScriptedStoreDriver>();
    driver->throwOn("find");
    StoreProbe probe(StoreId::MongoDB, driver, "failure_monitor", std::chrono::milliseconds(500));

    auto sample = runAwaitable(io, probe.probe());
    EXPECT_FALSE(sample.success);
    ASSERT_TRUE(sample.error.has_value());
    EXPECT_NE(sample.error->find("exploded"), std::string::npos);
}

TEST(StoreProbeTest, SlowStoreTimesOut) {
    boost::asio::io_context io;
    auto backing = std::make_shared<MemoryStore>("mongodb", std::chrono::milliseconds(200));
    StoreProbe probe(StoreId::MongoDB, std::make_shared<AsyncMemoryStore>(backing),
                     "failure_monitor", std::chrono::milliseconds(50));

    const auto start = std::chrono::steady_clock::now();
    auto sample = runAwaitable(io, probe.probe());
    EXPECT_FALSE(sample.success);
    ASSERT_TRUE(sample.error.has_value());
    EXPECT_NE(sample.error->find("exceeded"), std::string::npos);
    // runAwaitable drains the abandoned round trip too, so only check the sample
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
}
