#include "TestSupport.hpp"

#include "vaulttrade/rpc/LocalRpcChannel.hpp"
#include "vaulttrade/util/JsonUtil.hpp"

#include <gtest/gtest.h>

namespace vaulttrade::rpc {
namespace {

using namespace std::chrono_literals;

TEST(RpcChannelTest, StampsRequestsWithItsScope) {
    fixtures::CannedChannel channel{1337};
    channel.next = util::parseJson(R"({"ok":true,"channel":1337,"balance":5})");

    auto reply = channel.call(boost::json::object{{"type", "getAccount"}, {"channel", 9}}, 10ms);
    EXPECT_EQ(channel.lastRequest.at("channel").as_int64(), 1337);
    ASSERT_TRUE(reply.ok);
    EXPECT_EQ(reply.errorClass, util::ErrorClass::none);
    EXPECT_EQ(reply.body.at("balance").as_int64(), 5);
}

TEST(RpcChannelTest, SilenceIsATimeout) {
    fixtures::CannedChannel channel{1337};
    auto reply = channel.call(boost::json::object{{"type", "login"}}, 10ms);
    EXPECT_FALSE(reply.ok);
    EXPECT_TRUE(reply.timedOut());
    EXPECT_EQ(reply.error, "Timeout");
}

TEST(RpcChannelTest, ForeignScopeRepliesAreDiscarded) {
    fixtures::CannedChannel channel{1337};
    channel.next = util::parseJson(R"({"ok":true,"channel":1444})");
    EXPECT_TRUE(channel.call(boost::json::object{{"type", "login"}}, 10ms).timedOut());

    channel.next = util::parseJson(R"({"ok":true})");
    EXPECT_TRUE(channel.call(boost::json::object{{"type", "login"}}, 10ms).timedOut());

    channel.next = util::parseJson(R"("ok")");
    EXPECT_TRUE(channel.call(boost::json::object{{"type", "login"}}, 10ms).timedOut());
}

TEST(RpcChannelTest, FailureWithoutClassIsInternal) {
    fixtures::CannedChannel channel{1337};
    channel.next = util::parseJson(R"({"ok":false,"channel":1337,"error":"boom"})");
    auto reply = channel.call(boost::json::object{{"type", "login"}}, 10ms);
    EXPECT_FALSE(reply.ok);
    EXPECT_EQ(reply.error, "boom");
    EXPECT_EQ(reply.errorClass, util::ErrorClass::internal);
    EXPECT_FALSE(reply.timedOut());
}

TEST(RpcChannelTest, FailureClassIsCarriedThrough) {
    auto reply = Reply::fromJson(
        util::parseJson(R"({"ok":false,"error":"Insufficient funds","errorClass":"insufficientResource"})"));
    EXPECT_EQ(reply.errorClass, util::ErrorClass::insufficientResource);

    auto unknown = Reply::fromJson(util::parseJson(R"({"ok":false,"errorClass":"cosmic"})"));
    EXPECT_EQ(unknown.errorClass, util::ErrorClass::internal);
    EXPECT_EQ(unknown.error, "Unknown error");
}

TEST(RpcChannelTest, LocalChannelDispatchesInProcess) {
    fixtures::MarketHarness market;
    market.openAccount("alice", "1111", 25);

    LocalRpcChannel channel{fixtures::kLedgerChannel, market.ledgerRpc};
    auto reply = channel.call(boost::json::object{{"type", "login"}, {"user", "alice"}, {"pin", "1111"}}, 10ms);
    ASSERT_TRUE(reply.ok) << reply.error;
    EXPECT_EQ(reply.body.at("balance").as_int64(), 25);
}

TEST(RpcChannelTest, WrongChannelLooksLikeSilenceToTheCaller) {
    fixtures::MarketHarness market;
    market.openAccount("alice", "1111", 25);

    LocalRpcChannel stray{4242, market.ledgerRpc};
    auto reply = stray.call(boost::json::object{{"type", "login"}, {"user", "alice"}, {"pin", "1111"}}, 10ms);
    EXPECT_TRUE(reply.timedOut());
}

} // namespace
} // namespace vaulttrade::rpc
