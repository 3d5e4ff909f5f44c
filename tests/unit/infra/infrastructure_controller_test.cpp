#include <gtest/gtest.h>

#include <faultline/infra/infrastructure_controller.h>

#include "../../common/fake_orchestrator.h"

using namespace faultline;
using namespace faultline::infra;
using faultline::test::FakeOrchestrator;

class InfrastructureControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto fake = std::make_unique<FakeOrchestrator>();
        fake_ = fake.get();
        cfg_.syntheticSeed = 11;
        controller_ = std::make_unique<InfrastructureController>(std::move(fake), cfg_);
    }

    config::InfrastructureConfig cfg_;
    FakeOrchestrator* fake_ = nullptr;
    std::unique_ptr<InfrastructureController> controller_;
};

TEST_F(InfrastructureControllerTest, ReachableOrchestratorIsLive) {
    EXPECT_EQ(controller_->mode(), InfraMode::Live);
    EXPECT_FALSE(controller_->isSynthetic());
    // Mode is decided once
    controller_->mode();
    EXPECT_EQ(fake_->pingCount(), 1);
}

TEST_F(InfrastructureControllerTest, FailedPingSelectsSyntheticMode) {
    fake_->pingFails = true;
    EXPECT_EQ(controller_->mode(), InfraMode::Synthetic);
    ASSERT_TRUE(controller_->stop("mongo1"));
    EXPECT_TRUE(fake_->calls().empty());
    EXPECT_TRUE(fake_->isRunning("mongo1"));
}

TEST(InfrastructureControllerModeTest, MissingBackendIsSynthetic) {
    InfrastructureController controller(nullptr, config::InfrastructureConfig{});
    EXPECT_EQ(controller.mode(), InfraMode::Synthetic);
    EXPECT_STREQ(infraModeName(controller.mode()), "synthetic");
}

TEST(InfrastructureControllerModeTest, ForcedSyntheticSkipsPing) {
    auto fake = std::make_unique<FakeOrchestrator>();
    auto* raw = fake.get();
    config::InfrastructureConfig cfg;
    cfg.forceSynthetic = true;
    InfrastructureController controller(std::move(fake), cfg);
    EXPECT_TRUE(controller.isSynthetic());
    EXPECT_EQ(raw->pingCount(), 0);
}

TEST_F(InfrastructureControllerTest, StopAndStartChangeStatus) {
    ASSERT_TRUE(controller_->stop("mongo2"));
    EXPECT_EQ(controller_->status("mongo2"), NodeState::Stopped);
    ASSERT_TRUE(controller_->start("mongo2"));
    EXPECT_EQ(controller_->status("mongo2"), NodeState::Running);
}

TEST_F(InfrastructureControllerTest, UnknownNodeStatusIsUnknown) {
    EXPECT_EQ(controller_->status("nope"), NodeState::Unknown);
    auto r = controller_->resolveNode("nope");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}

TEST_F(InfrastructureControllerTest, DisconnectIsVerifiedAndIdempotent) {
    ASSERT_TRUE(controller_->disconnect("mongo1", "distributed_db_network"));
    EXPECT_FALSE(fake_->isAttached("mongo1", "distributed_db_network"));
    // Already detached: no second call
    ASSERT_TRUE(controller_->disconnect("mongo1", "distributed_db_network"));
    EXPECT_EQ(fake_->calls(), (std::vector<std::string>{"disconnect:mongo1"}));

    ASSERT_TRUE(controller_->connect("mongo1", "distributed_db_network"));
    ASSERT_TRUE(controller_->connect("mongo1", "distributed_db_network"));
    EXPECT_EQ(fake_->calls(),
              (std::vector<std::string>{"disconnect:mongo1", "connect:mongo1"}));
}

TEST_F(InfrastructureControllerTest, StickyDisconnectFailsVerification) {
    fake_->stickyDisconnect.insert("cassandra1");
    auto r = controller_->disconnect("cassandra1", "distributed_db_network");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::PartitionVerificationFailed);
}

TEST_F(InfrastructureControllerTest, ResolveNetworkPrefersWellKnown) {
    auto net = controller_->resolveNetwork({"mongo1"});
    ASSERT_TRUE(net);
    EXPECT_EQ(net.value(), "distributed_db_network");
}

TEST_F(InfrastructureControllerTest, ResolveNetworkFailsWithoutUsableNetwork) {
    fake_->removeNetwork("distributed_db_network");
    auto net = controller_->resolveNetwork({"mongo1"});
    ASSERT_FALSE(net);
    EXPECT_EQ(net.error().code, ErrorCode::NetworkUnresolved);

    auto none = controller_->resolveNetwork({});
    ASSERT_FALSE(none);
    EXPECT_EQ(none.error().code, ErrorCode::NetworkUnresolved);
}

TEST_F(InfrastructureControllerTest, UptimeReportsElapsedSeconds) {
    auto up = controller_->uptime("mongo3");
    ASSERT_TRUE(up);
    EXPECT_GE(up.value().seconds, 7100);
    EXPECT_EQ(up.value().status, "running");

    ASSERT_TRUE(controller_->stop("mongo3"));
    auto stopped = controller_->uptime("mongo3");
    ASSERT_FALSE(stopped);
    EXPECT_EQ(stopped.error().message, "No start time");
}
