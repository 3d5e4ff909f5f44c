#include <gtest/gtest.h>

#include <faultline/infra/node_lock_registry.h>

using namespace faultline;
using namespace faultline::infra;

TEST(NodeLockRegistryTest, AcquisitionIsAllOrNothing) {
    NodeLockRegistry registry;
    auto first = registry.tryAcquire({"mongo1", "mongo2"});
    ASSERT_TRUE(first);

    auto second = registry.tryAcquire({"mongo3", "mongo2"});
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, ErrorCode::NodeBusy);
    EXPECT_FALSE(registry.isHeld("mongo3"));
    EXPECT_EQ(registry.heldCount(), 2u);
}

TEST(NodeLockRegistryTest, LeaseReleasesOnDestruction) {
    NodeLockRegistry registry;
    {
        auto lease = registry.tryAcquire({"cassandra1"});
        ASSERT_TRUE(lease);
        EXPECT_TRUE(registry.isHeld("cassandra1"));
    }
    EXPECT_FALSE(registry.isHeld("cassandra1"));
    EXPECT_TRUE(registry.tryAcquire({"cassandra1"}));
}

TEST(NodeLockRegistryTest, MovedLeaseReleasesOnce) {
    NodeLockRegistry registry;
    auto acquired = registry.tryAcquire({"mongo1"});
    ASSERT_TRUE(acquired);
    NodeLease lease = std::move(acquired).value();
    NodeLease moved = std::move(lease);
    EXPECT_TRUE(lease.nodes().empty());
    EXPECT_EQ(moved.nodes().size(), 1u);
    EXPECT_TRUE(registry.isHeld("mongo1"));
    moved.release();
    EXPECT_EQ(registry.heldCount(), 0u);
}

TEST(NodeLockRegistryTest, DisjointScenariosCoexist) {
    NodeLockRegistry registry;
    auto a = registry.tryAcquire({"mongo1"});
    auto b = registry.tryAcquire({"cassandra1"});
    EXPECT_TRUE(a);
    EXPECT_TRUE(b);
    EXPECT_EQ(registry.heldCount(), 2u);
}
