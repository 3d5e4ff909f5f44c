#include <gtest/gtest.h>

#include <faultline/core/worker_pool.h>
#include <faultline/store/memory_store.h>
#include <faultline/store/offloading_driver.h>

#include "../../common/async_test_utils.h"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

using namespace faultline;
using namespace faultline::store;
using faultline::test::runAwaitable;

TEST(MemoryStoreTest, InsertRequiresExistingTable) {
    MemoryStore store("mongodb");
    auto r = store.insert("t", Document{{"id", 1}}, CallContext{});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);

    ASSERT_TRUE(store.ensureTable("t"));
    ASSERT_TRUE(store.insert("t", Document{{"id", 1}}, CallContext{}));
    EXPECT_EQ(store.size("t"), 1u);
}

TEST(MemoryStoreTest, FindMatchesEveryFilterField) {
    MemoryStore store("cassandra");
    ASSERT_TRUE(store.ensureTable("t"));
    ASSERT_TRUE(store.insert("t", Document{{"id", 1}, {"status", "ACTIVE"}}, CallContext{}));
    ASSERT_TRUE(store.insert("t", Document{{"id", 2}, {"status", "INACTIVE"}}, CallContext{}));
    ASSERT_TRUE(store.insert("t", Document{{"id", 3}, {"status", "ACTIVE"}}, CallContext{}));

    auto active = store.find("t", Document{{"status", "ACTIVE"}}, CallContext{});
    ASSERT_TRUE(active);
    EXPECT_EQ(active.value().size(), 2u);

    auto one = store.find("t", Document{{"status", "ACTIVE"}, {"id", 3}}, CallContext{});
    ASSERT_TRUE(one);
    ASSERT_EQ(one.value().size(), 1u);
    EXPECT_EQ(one.value()[0]["id"], 3);

    auto all = store.find("t", Document::object(), CallContext{});
    ASSERT_TRUE(all);
    EXPECT_EQ(all.value().size(), 3u);
}

TEST(MemoryStoreTest, UpdatePatchesMatchingDocuments) {
    MemoryStore store("mongodb");
    ASSERT_TRUE(store.ensureTable("t"));
    ASSERT_TRUE(store.insert("t", Document{{"id", 1}, {"status", "ACTIVE"}}, CallContext{}));
    auto n = store.update("t", Document{{"id", 1}}, Document{{"status", "UPDATED"}}, CallContext{});
    ASSERT_TRUE(n);
    EXPECT_EQ(n.value(), 1u);
    auto found = store.find("t", Document{{"status", "UPDATED"}}, CallContext{});
    ASSERT_TRUE(found);
    EXPECT_EQ(found.value().size(), 1u);
}

TEST(MemoryStoreTest, RemoveDeletesMatchingDocuments) {
    MemoryStore store("cassandra");
    ASSERT_TRUE(store.ensureTable("t"));
    for (int i = 0; i < 4; ++i)
        ASSERT_TRUE(store.insert("t", Document{{"id", i}, {"even", i % 2 == 0}}, CallContext{}));

    auto n = store.remove("t", Document{{"even", true}}, CallContext{});
    ASSERT_TRUE(n);
    EXPECT_EQ(n.value(), 2u);
    EXPECT_EQ(store.size("t"), 2u);

    auto none = store.remove("t", Document{{"id", 99}}, CallContext{});
    ASSERT_TRUE(none);
    EXPECT_EQ(none.value(), 0u);

    auto missing = store.remove("nope", Document::object(), CallContext{});
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST(MemoryStoreTest, OfflineStoreRejectsCalls) {
    MemoryStore store("mongodb");
    store.setOnline(false);
    auto r = store.connect();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::StoreError);
    EXPECT_FALSE(store.ensureTable("t"));
    store.setOnline(true);
    EXPECT_TRUE(store.ensureTable("t"));
}

TEST(MemoryStoreTest, DropRemovesTable) {
    MemoryStore store("mongodb");
    ASSERT_TRUE(store.ensureTable("t"));
    ASSERT_TRUE(store.dropTable("t"));
    EXPECT_FALSE(store.hasTable("t"));
    // Dropping a missing table is not an error
    EXPECT_TRUE(store.dropTable("t"));
}

TEST(AsyncMemoryStoreTest, AwaitableCallsReachBackingStore) {
    boost::asio::io_context io;
    auto backing = std::make_shared<MemoryStore>("mongodb", std::chrono::milliseconds(2));
    AsyncMemoryStore driver(backing);

    ASSERT_TRUE(runAwaitable(io, driver.ensureTable("t")));
    ASSERT_TRUE(runAwaitable(io, driver.insert("t", Document{{"id", 7}}, CallContext{})));
    auto found = runAwaitable(io, driver.find("t", Document{{"id", 7}}, CallContext{}));
    ASSERT_TRUE(found);
    EXPECT_EQ(found.value().size(), 1u);
    EXPECT_EQ(backing->size("t"), 1u);
}

TEST(AsyncMemoryStoreTest, ZeroLatencyCallsInterleave) {
    boost::asio::io_context io;
    auto backing = std::make_shared<MemoryStore>("mongodb");
    AsyncMemoryStore driver(backing);
    ASSERT_TRUE(runAwaitable(io, driver.ensureTable("t")));

    std::size_t seenByOther = 0;
    boost::asio::co_spawn(
        io,
        [&]() -> boost::asio::awaitable<void> {
            for (int i = 0; i < 100; ++i) {
                const Document doc{{"id", i}};
                const CallContext ctx{};
                EXPECT_TRUE(co_await driver.insert("t", doc, ctx));
            }
        },
        boost::asio::detached);
    boost::asio::co_spawn(
        io, [&]() -> boost::asio::awaitable<void> {
            seenByOther = backing->size("t");
            co_return;
        },
        boost::asio::detached);
    io.restart();
    io.run();

    EXPECT_LT(seenByOther, 100u);
    EXPECT_EQ(backing->size("t"), 100u);
}

TEST(OffloadingStoreDriverTest, BlockingDriverRunsOnPool) {
    boost::asio::io_context io;
    WorkerPool pool(2);
    auto backing = std::make_shared<MemoryStore>("cassandra");
    OffloadingStoreDriver driver(backing, pool.executor(), std::chrono::milliseconds(1000));

    ASSERT_TRUE(runAwaitable(io, driver.connect()));
    ASSERT_TRUE(runAwaitable(io, driver.ensureTable("t")));
    ASSERT_TRUE(runAwaitable(io, driver.insert("t", Document{{"id", 1}}, CallContext{})));
    auto n = runAwaitable(io, driver.update("t", Document{{"id", 1}}, Document{{"v", 2}},
                                            CallContext{}));
    ASSERT_TRUE(n);
    EXPECT_EQ(n.value(), 1u);
}

TEST(OffloadingStoreDriverTest, SlowCallTimesOut) {
    boost::asio::io_context io;
    WorkerPool pool(1);
    auto backing = std::make_shared<MemoryStore>("cassandra", std::chrono::milliseconds(300));
    OffloadingStoreDriver driver(backing, pool.executor(), std::chrono::milliseconds(20));

    auto r = runAwaitable(io, driver.connect());
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
}
