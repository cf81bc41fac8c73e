#include "vaulttrade/service/SessionService.hpp"

#include <gtest/gtest.h>

namespace vaulttrade::service {
namespace {

class SessionServiceTest : public ::testing::Test {
protected:
    std::chrono::system_clock::time_point now{std::chrono::hours(24 * 365)};
    SessionService sessions{std::chrono::seconds(60), [this] { return now; }};
};

TEST_F(SessionServiceTest, IssuedTokenIdentifiesItsUser) {
    auto info = sessions.issue("alice");
    EXPECT_EQ(info.user, "alice");
    EXPECT_EQ(info.token.size(), 64u);
    EXPECT_EQ(info.expiresAt, now + std::chrono::seconds(60));

    EXPECT_EQ(sessions.userForToken(info.token), "alice");
    EXPECT_TRUE(sessions.validate("alice", info.token));
    EXPECT_FALSE(sessions.validate("bob", info.token));
    EXPECT_FALSE(sessions.validate("alice", ""));
    EXPECT_FALSE(sessions.validate("", info.token));
}

TEST_F(SessionServiceTest, TokensExpireAfterTtl) {
    auto info = sessions.issue("alice");
    now += std::chrono::seconds(59);
    EXPECT_TRUE(sessions.validate("alice", info.token));
    now += std::chrono::seconds(1);
    EXPECT_FALSE(sessions.validate("alice", info.token));
    EXPECT_EQ(sessions.activeCount(), 0u);
}

TEST_F(SessionServiceTest, RevokeEndsSession) {
    auto first = sessions.issue("alice");
    auto second = sessions.issue("alice");
    EXPECT_NE(first.token, second.token);

    sessions.revoke(first.token);
    EXPECT_FALSE(sessions.validate("alice", first.token));
    EXPECT_TRUE(sessions.validate("alice", second.token));
    sessions.revoke("");
    EXPECT_EQ(sessions.activeCount(), 1u);
}

} // namespace
} // namespace vaulttrade::service
