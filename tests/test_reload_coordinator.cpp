#include <gtest/gtest.h>

#include "fake_backend.hpp"
#include "reload_coordinator.hpp"

#include <memory>
#include <mutex>
#include <vector>

using gateway::ConfigError;
using gateway::ConnectorConfig;
using gateway::ReloadCoordinator;
using gateway_test::FakeBackendFactory;
using gateway_test::FakeScript;
using gateway_test::StdioConnector;

class ReloadCoordinatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    factory_.Set("alpha", FakeScript{{"search"}});
    factory_.Set("beta", FakeScript{{"read"}});
    connectors_ = {StdioConnector("alpha")};
    coordinator_ = std::make_unique<ReloadCoordinator>(
        [this]() {
          std::lock_guard<std::mutex> lock(mu_);
          if (fail_load_) throw ConfigError("connectors must be an array");
          return connectors_;
        },
        factory_.Factory(), &state_);
    state_.Initialize({}, "WARN", 100);
    coordinator_->LoadInitial();
  }

  void SetConnectors(std::vector<ConnectorConfig> connectors) {
    std::lock_guard<std::mutex> lock(mu_);
    connectors_ = std::move(connectors);
  }

  void FailLoads() {
    std::lock_guard<std::mutex> lock(mu_);
    fail_load_ = true;
  }

  FakeBackendFactory factory_;
  gateway::RuntimeStateManager state_;
  std::mutex mu_;
  std::vector<ConnectorConfig> connectors_;
  bool fail_load_ = false;
  std::unique_ptr<ReloadCoordinator> coordinator_;
};

TEST_F(ReloadCoordinatorTest, InitialGenerationIsPreloaded) {
  auto snap = coordinator_->Current();
  ASSERT_NE(snap, nullptr);
  auto summaries = snap->aggregator->Summaries();
  ASSERT_EQ(summaries.size(), 1u);
  EXPECT_TRUE(summaries[0].healthy);
}

TEST_F(ReloadCoordinatorTest, UnchangedConfigReportsNoChanges) {
  auto before = coordinator_->Current();
  for (int i = 0; i < 2; i++) {
    auto r = coordinator_->Reload();
    EXPECT_TRUE(r.success);
    EXPECT_TRUE(r.reloaded_connectors.empty());
    EXPECT_TRUE(r.failed_connectors.empty());
    EXPECT_EQ(r.message, "No changes detected");
  }
  EXPECT_EQ(coordinator_->Current(), before);
}

TEST_F(ReloadCoordinatorTest, AddedConnectorIsReloaded) {
  SetConnectors({StdioConnector("alpha"), StdioConnector("beta")});
  auto r = coordinator_->Reload();
  EXPECT_TRUE(r.success);
  EXPECT_EQ(r.reloaded_connectors, (std::vector<std::string>{"beta"}));
  EXPECT_TRUE(r.failed_connectors.empty());

  auto tools = coordinator_->Current()->aggregator->GetAggregatedTools();
  EXPECT_EQ(tools.size(), 2u);
  EXPECT_EQ(state_.Snapshot()["connectors"].size(), 2u);
}

TEST_F(ReloadCoordinatorTest, RemovedAndModifiedAreReported) {
  auto modified = StdioConnector("alpha", "other-command");
  SetConnectors({modified});
  auto r = coordinator_->Reload();
  EXPECT_EQ(r.reloaded_connectors, (std::vector<std::string>{"alpha"}));
  EXPECT_NE(r.message.find("modified=alpha"), std::string::npos);

  SetConnectors({});
  r = coordinator_->Reload();
  EXPECT_EQ(r.reloaded_connectors, (std::vector<std::string>{"alpha"}));
  EXPECT_NE(r.message.find("removed=alpha"), std::string::npos);
  EXPECT_TRUE(coordinator_->Current()->aggregator->GetAggregatedTools().empty());
}

TEST_F(ReloadCoordinatorTest, UnhealthyNewConnectorIsListedAsFailed) {
  FakeScript broken;
  broken.fail_start = true;
  factory_.Set("gamma", broken);
  SetConnectors({StdioConnector("alpha"), StdioConnector("gamma")});
  auto r = coordinator_->Reload();
  EXPECT_TRUE(r.success);
  EXPECT_EQ(r.reloaded_connectors, (std::vector<std::string>{"gamma"}));
  EXPECT_EQ(r.failed_connectors, (std::vector<std::string>{"gamma"}));
}

TEST_F(ReloadCoordinatorTest, LoaderFailureKeepsCurrentGeneration) {
  auto before = coordinator_->Current();
  FailLoads();
  auto r = coordinator_->Reload();
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.message, "connectors must be an array");
  EXPECT_EQ(coordinator_->Current(), before);
  EXPECT_EQ(before->aggregator->GetAggregatedTools().size(), 1u);
}

TEST_F(ReloadCoordinatorTest, InFlightSnapshotOutlivesReload) {
  auto held = coordinator_->Current();
  SetConnectors({StdioConnector("beta")});
  ASSERT_TRUE(coordinator_->Reload().success);
  EXPECT_NE(coordinator_->Current(), held);

  auto r = held->router->RouteToolCall("alpha__search", nlohmann::json::object());
  EXPECT_TRUE(r.success);
  EXPECT_FALSE(coordinator_->Current()->router->RouteToolCall("alpha__search", nlohmann::json::object()).success);
}

TEST(ConnectorDiffTest, ClassifiesChanges) {
  auto a = StdioConnector("a");
  auto b = StdioConnector("b");
  auto b2 = StdioConnector("b", "changed");
  auto c = StdioConnector("c");
  auto diff = gateway::DiffConnectors({a, b}, {b2, c});
  EXPECT_EQ(diff.added, (std::vector<std::string>{"c"}));
  EXPECT_EQ(diff.removed, (std::vector<std::string>{"a"}));
  EXPECT_EQ(diff.modified, (std::vector<std::string>{"b"}));
  EXPECT_EQ(diff.Union(), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_TRUE(gateway::DiffConnectors({a}, {a}).Empty());
}
