#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Router.hpp"
#include "ErrorHandler.hpp"
#include "mocks/FakeDriver.hpp"

using namespace graphlink;
using namespace graphlink::testing;
using ::testing::ElementsAre;

class RouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = std::make_shared<FakeDriverProvider>(log_);
        factory_ = std::make_unique<DriverFactory>(provider_);
        sessions_ = std::make_unique<SessionManager>(
            std::make_unique<FakeDriver>("bolt+routing://core1:7687", log_));
    }

    Router makeRouter(ServerSelector& selector) {
        return Router(state_, *sessions_, *factory_, selector);
    }

    // A routing-enabled state as discovery would leave it, before any switch
    void enableRouting(std::vector<std::string> writers, std::vector<std::string> readers) {
        state_.enabled = true;
        state_.table.writeServers = std::move(writers);
        state_.table.readServers = std::move(readers);
        state_.routingConfig = DriverConfig().withCredentials("neo4j", "secret");
    }

    std::shared_ptr<FakeLog> log_ = std::make_shared<FakeLog>();
    std::shared_ptr<FakeDriverProvider> provider_;
    std::unique_ptr<DriverFactory> factory_;
    std::unique_ptr<SessionManager> sessions_;
    RoutingState state_;
};

TEST_F(RouterTest, DisabledRoutingDoesNothing) {
    ScriptedSelector selector({0});
    auto router = makeRouter(selector);

    EXPECT_FALSE(router.checkUpdateServerBoltRouting("MATCH (n) RETURN n"));
    EXPECT_FALSE(router.checkUpdateServerBoltRouting("CREATE (n)", AccessMode::Write));

    EXPECT_EQ(state_.lastMode, AccessMode::Unset);
    EXPECT_EQ(provider_->log().driversBuilt(), 0u);
    EXPECT_EQ(sessions_->driver().uri(), "bolt+routing://core1:7687");
}

// Discovery
TEST_F(RouterTest, DiscoverPopulatesTableAndForcesWrite) {
    provider_->log().handler = clusterHandler({"A:7687"}, {"B:7687", "C:7687"});
    ScriptedSelector selector({0});
    auto router = makeRouter(selector);

    router.discover(DriverConfig().withCredentials("neo4j", "secret"));

    EXPECT_TRUE(state_.enabled);
    EXPECT_THAT(state_.table.writeServers, ElementsAre("A:7687"));
    EXPECT_THAT(state_.table.readServers, ElementsAre("B:7687", "C:7687"));
    EXPECT_EQ(state_.lastMode, AccessMode::Write);
    EXPECT_EQ(state_.routingConfig.user, "neo4j");

    EXPECT_EQ(sessions_->driver().uri(), "bolt://A:7687");
    EXPECT_FALSE(sessions_->hasSession());
    EXPECT_THAT(provider_->log().boltDrivers, ElementsAre("bolt://A:7687"));
    EXPECT_EQ(provider_->log().boltConfigs.at(0).password, "secret");
}

TEST_F(RouterTest, DiscoverRunsProcedureWithEmptyParameters) {
    provider_->log().handler = clusterHandler({"A:7687"}, {"B:7687"});
    ScriptedSelector selector({0});
    auto router = makeRouter(selector);

    router.discover(DriverConfig());

    ASSERT_EQ(provider_->log().runs.size(), 1u);
    const auto& call = provider_->log().runs[0];
    EXPECT_EQ(call.driver, "bolt+routing://core1:7687");
    EXPECT_EQ(call.statement, "CALL dbms.routing.getRoutingTable({})");
    EXPECT_TRUE(call.parameters.is_object());
    EXPECT_TRUE(call.parameters.empty());
}

TEST_F(RouterTest, DiscoveryDriverErrorIsDiscoveryError) {
    provider_->log().handler = [](const FakeLog::Call&) -> Result {
        throw DriverError("Neo.ClientError.Procedure.ProcedureNotFound", "no such procedure");
    };
    ScriptedSelector selector({0});
    auto router = makeRouter(selector);

    try {
        router.discover(DriverConfig());
        FAIL() << "discover() should fail";
    } catch (const RoutingDiscoveryError& e) {
        EXPECT_THAT(e.what(), ::testing::HasSubstr("Neo.ClientError.Procedure.ProcedureNotFound"));
    }
    EXPECT_FALSE(state_.enabled);
    EXPECT_EQ(state_.lastMode, AccessMode::Unset);
}

TEST_F(RouterTest, MalformedTableIsDiscoveryError) {
    provider_->log().handler = [](const FakeLog::Call&) { return Result(); };
    ScriptedSelector selector({0});
    auto router = makeRouter(selector);

    EXPECT_THROW(router.discover(DriverConfig()), RoutingDiscoveryError);
    EXPECT_FALSE(state_.enabled);
}

TEST_F(RouterTest, NoWritersAtDiscoveryIsExhausted) {
    provider_->log().handler = clusterHandler({}, {"B:7687"});
    ScriptedSelector selector({0});
    auto router = makeRouter(selector);

    EXPECT_THROW(router.discover(DriverConfig()), RoutingExhaustedError);
    EXPECT_EQ(state_.lastMode, AccessMode::Unset);
    EXPECT_EQ(sessions_->driver().uri(), "bolt+routing://core1:7687");
}

// Switching
TEST_F(RouterTest, ReadStatementSwitchesToReader) {
    enableRouting({"A:7687"}, {"B:7687", "C:7687"});
    state_.lastMode = AccessMode::Write;
    ScriptedSelector selector({1});
    auto router = makeRouter(selector);

    EXPECT_TRUE(router.checkUpdateServerBoltRouting("MATCH (n) RETURN n"));

    EXPECT_EQ(state_.lastMode, AccessMode::Read);
    EXPECT_EQ(sessions_->driver().uri(), "bolt://C:7687");
    EXPECT_EQ(provider_->log().boltConfigs.at(0).user, "neo4j");
}

TEST_F(RouterTest, TwoReadsSwitchOnce) {
    enableRouting({"A:7687"}, {"B:7687", "C:7687"});
    state_.lastMode = AccessMode::Write;
    ScriptedSelector selector({0});
    auto router = makeRouter(selector);

    EXPECT_TRUE(router.checkUpdateServerBoltRouting("MATCH (n) RETURN n"));
    EXPECT_FALSE(router.checkUpdateServerBoltRouting("MATCH (m) RETURN count(m)"));

    EXPECT_EQ(provider_->log().driversBuilt(), 1u);
}

TEST_F(RouterTest, WriteWhileOnWriterStays) {
    enableRouting({"A:7687"}, {"B:7687"});
    state_.lastMode = AccessMode::Write;
    ScriptedSelector selector({0});
    auto router = makeRouter(selector);

    EXPECT_FALSE(router.checkUpdateServerBoltRouting("CREATE (n)"));
    EXPECT_FALSE(router.checkUpdateServerBoltRouting("MATCH (n) RETURN n", AccessMode::Write));

    EXPECT_EQ(provider_->log().driversBuilt(), 0u);
}

TEST_F(RouterTest, ForcedWriteAfterReadSwitchesBack) {
    enableRouting({"A:7687"}, {"B:7687"});
    state_.lastMode = AccessMode::Read;
    ScriptedSelector selector({0});
    auto router = makeRouter(selector);

    EXPECT_TRUE(router.checkUpdateServerBoltRouting("MATCH (n) RETURN n", AccessMode::Write));

    EXPECT_EQ(state_.lastMode, AccessMode::Write);
    EXPECT_EQ(sessions_->driver().uri(), "bolt://A:7687");
}

TEST_F(RouterTest, ForcedModeWithoutStatement) {
    enableRouting({"A:7687"}, {"B:7687"});
    ScriptedSelector selector({0});
    auto router = makeRouter(selector);

    EXPECT_TRUE(router.checkUpdateServerBoltRouting(std::nullopt, AccessMode::Read));
    EXPECT_EQ(state_.lastMode, AccessMode::Read);

    EXPECT_FALSE(router.checkUpdateServerBoltRouting(std::nullopt));
    EXPECT_EQ(state_.lastMode, AccessMode::Read);
}

TEST_F(RouterTest, SwitchDropsHeldSession) {
    enableRouting({"A:7687"}, {"B:7687"});
    state_.lastMode = AccessMode::Write;
    sessions_->ensureSession();
    ScriptedSelector selector({0});
    auto router = makeRouter(selector);

    router.checkUpdateServerBoltRouting("MATCH (n) RETURN n");

    EXPECT_FALSE(sessions_->hasSession());
}

TEST_F(RouterTest, EmptyReadPoolKeepsState) {
    enableRouting({"A:7687"}, {});
    state_.lastMode = AccessMode::Write;
    sessions_->ensureSession();
    ScriptedSelector selector({0});
    auto router = makeRouter(selector);

    EXPECT_THROW(router.checkUpdateServerBoltRouting("MATCH (n) RETURN n"), RoutingExhaustedError);

    EXPECT_EQ(state_.lastMode, AccessMode::Write);
    EXPECT_TRUE(sessions_->hasSession());
    EXPECT_EQ(sessions_->driver().uri(), "bolt+routing://core1:7687");
    EXPECT_EQ(provider_->log().driversBuilt(), 0u);
}

TEST_F(RouterTest, DiscoveryWithoutSessionIsDiscoveryError) {
    log_->noSession = true;
    ScriptedSelector selector({0});
    auto router = makeRouter(selector);

    try {
        router.discover(DriverConfig());
        FAIL() << "discover() should fail";
    } catch (const RoutingDiscoveryError& e) {
        EXPECT_THAT(e.what(), ::testing::HasSubstr("returned no session"));
    }
    EXPECT_FALSE(state_.enabled);
    EXPECT_TRUE(log_->runs.empty());
}
