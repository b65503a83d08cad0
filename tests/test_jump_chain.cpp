#include <gtest/gtest.h>
#include <ssh/jump_chain.hpp>
#include "fakes.hpp"

static HostConfig host(const std::string& name) {
    HostConfig h;
    h.name = name;
    h.host = name + ".example.net";
    h.user = "ops";
    return h;
}

class JumpChainTest : public ::testing::Test {
protected:
    std::shared_ptr<EventLog> log = std::make_shared<EventLog>();
    FakeDialer dialer{log};
};

TEST_F(JumpChainTest, RouteIsJumpsThenTarget) {
    HostConfig target = host("a");
    target.jump = {host("j1"), host("j2")};

    auto route = JumpChain::route_for(target);
    ASSERT_EQ(route.size(), 3u);
    EXPECT_EQ(route[0].name, "j1");
    EXPECT_EQ(route[1].name, "j2");
    EXPECT_EQ(route[2].name, "a");
    EXPECT_TRUE(route[2].jump.empty());
}

TEST_F(JumpChainTest, DialsInOrderAndClosesInReverse) {
    HostConfig target = host("a");
    target.jump = {host("j1")};

    JumpChain chain(JumpChain::route_for(target), dialer);
    ASSERT_TRUE(chain.connect().is_ok());
    EXPECT_TRUE(chain.is_connected());
    EXPECT_EQ(chain.size(), 2u);
    EXPECT_EQ(chain.target()->name(), "a");

    ASSERT_TRUE(chain.close().is_ok());
    EXPECT_FALSE(chain.is_connected());

    std::vector<std::string> expected = {
        "dial j1 via direct",
        "dial a via j1",
        "close a",
        "close j1",
    };
    EXPECT_EQ(log->snapshot(), expected);
    EXPECT_EQ(log->live_count(), 0);
}

TEST_F(JumpChainTest, NoJumpsDialsTargetDirectly) {
    JumpChain chain(JumpChain::route_for(host("solo")), dialer);
    ASSERT_TRUE(chain.connect().is_ok());
    EXPECT_EQ(chain.size(), 1u);
    EXPECT_EQ(log->snapshot().front(), "dial solo via direct");
}

TEST_F(JumpChainTest, FailedHopClosesEverythingOpened) {
    HostConfig target = host("a");
    target.jump = {host("j1"), host("j2"), host("j3")};
    dialer.fail_hosts = {"j3"};

    JumpChain chain(JumpChain::route_for(target), dialer);
    auto r = chain.connect();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::HOP_FAILED);
    EXPECT_NE(r.error.find("hop 3 (j3)"), std::string::npos);
    EXPECT_NE(r.error.find("connection refused"), std::string::npos);

    ASSERT_TRUE(chain.last_failure().has_value());
    EXPECT_EQ(chain.last_failure()->index, 2u);
    EXPECT_EQ(chain.last_failure()->name, "j3");

    EXPECT_EQ(log->live_count(), 0);
    EXPECT_FALSE(chain.is_connected());
    EXPECT_EQ(chain.size(), 0u);

    std::vector<std::string> expected = {
        "dial j1 via direct",
        "dial j2 via j1",
        "dial j3 via j2",
        "close j2",
        "close j1",
    };
    EXPECT_EQ(log->snapshot(), expected);
}

TEST_F(JumpChainTest, FirstHopFailureOpensNothing) {
    HostConfig target = host("a");
    target.jump = {host("j1")};
    dialer.fail_hosts = {"j1"};

    JumpChain chain(JumpChain::route_for(target), dialer);
    auto r = chain.connect();
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("hop 1 (j1)"), std::string::npos);
    EXPECT_EQ(log->snapshot().size(), 1u);
    EXPECT_EQ(log->live_count(), 0);
}

TEST_F(JumpChainTest, CloseIsIdempotent) {
    HostConfig target = host("a");
    target.jump = {host("j1")};

    JumpChain chain(JumpChain::route_for(target), dialer);
    ASSERT_TRUE(chain.connect().is_ok());
    EXPECT_TRUE(chain.close().is_ok());
    EXPECT_TRUE(chain.close().is_ok());
    EXPECT_EQ(log->snapshot().size(), 4u);
}

TEST_F(JumpChainTest, CloseAttemptsEveryHopAndJoinsErrors) {
    HostConfig target = host("a");
    target.jump = {host("j1"), host("j2")};
    dialer.fail_close_hosts = {"a", "j1"};

    JumpChain chain(JumpChain::route_for(target), dialer);
    ASSERT_TRUE(chain.connect().is_ok());

    auto r = chain.close();
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("hop 3 (a)"), std::string::npos);
    EXPECT_NE(r.error.find("; "), std::string::npos);
    EXPECT_NE(r.error.find("hop 1 (j1)"), std::string::npos);
    EXPECT_EQ(log->live_count(), 0);
}

TEST_F(JumpChainTest, DestructorClosesOpenChain) {
    {
        JumpChain chain(JumpChain::route_for(host("solo")), dialer);
        ASSERT_TRUE(chain.connect().is_ok());
    }
    EXPECT_EQ(log->live_count(), 0);
    EXPECT_EQ(log->snapshot().back(), "close solo");
}

TEST_F(JumpChainTest, SessionRequiresConnection) {
    JumpChain chain(JumpChain::route_for(host("solo")), dialer);
    auto s = chain.open_session();
    ASSERT_TRUE(s.is_err());
    EXPECT_EQ(s.code, ErrorCode::CONNECTION);

    ASSERT_TRUE(chain.connect().is_ok());
    EXPECT_TRUE(chain.open_session().is_ok());
}
