#include "TestSupport.hpp"

#include "vaulttrade/controller/ContainerAdminController.hpp"
#include "vaulttrade/controller/LedgerAdminController.hpp"
#include "vaulttrade/server/HttpServer.hpp"
#include "vaulttrade/server/Router.hpp"
#include "vaulttrade/util/JsonUtil.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <unordered_map>

namespace vaulttrade::server {
namespace {

namespace http = boost::beast::http;

TEST(RouterTest, CapturesDecodedSegmentsAndIgnoresQuery) {
    Router router;
    router.addRoute("post", "/admin/ledger/accounts/:user/adjust", [](RequestContext&) {});

    std::unordered_map<std::string, std::string> params;
    auto handler = router.resolve("POST", "/admin/ledger/accounts/al%20ice/adjust?dry=1", params);
    ASSERT_TRUE(handler != nullptr);
    EXPECT_EQ(params.at("user"), "al ice");

    EXPECT_TRUE(router.resolve("POST", "/admin/ledger/accounts/bob/adjust/", params) != nullptr);
    EXPECT_EQ(params.at("user"), "bob");
}

TEST(RouterTest, UnknownRouteResolvesToNothing) {
    Router router;
    router.addRoute("GET", "/admin/containers", [](RequestContext&) {});

    std::unordered_map<std::string, std::string> params{{"kept", "yes"}};
    EXPECT_TRUE(router.resolve("POST", "/admin/containers", params) == nullptr);
    EXPECT_TRUE(router.resolve("GET", "/admin/containers/extra", params) == nullptr);
    EXPECT_EQ(params.at("kept"), "yes");
}

RequestContext dispatch(Router& router, ServerHooks& hooks, http::verb method, const std::string& target,
                        const std::string& body, const std::string& token) {
    RequestContext ctx;
    ctx.startedAt = std::chrono::steady_clock::now();
    ctx.request.method(method);
    ctx.request.target(target);
    ctx.request.version(11);
    ctx.request.keep_alive(true);
    if (!token.empty()) {
        ctx.request.set("X-Admin-Token", token);
    }
    ctx.request.body() = body;
    ctx.request.prepare_payload();
    ctx.response.version(11);
    ctx.response.keep_alive(true);
    processRequest(router, ctx, hooks);
    return ctx;
}

boost::json::object bodyOf(const RequestContext& ctx) {
    return util::parseJson(ctx.response.body()).as_object();
}

class ProcessRequestTest : public ::testing::Test {
protected:
    ProcessRequestTest() {
        ledgerAdmin.registerRoutes(router);
        containerAdmin.registerRoutes(router);
        market.ledgerRpc.registerRoutes(router);
        router.addRoute("POST", "/ping", [](RequestContext&) {});
        router.addRoute("GET", "/boom", [](RequestContext&) -> void { throw std::runtime_error("kaput"); });

        hooks.onFatal = [this](const util::StorageError&) { ++fatal; };
        hooks.afterRequest = [this] { ++completed; };
    }

    RequestContext run(http::verb method, const std::string& target, const std::string& body = {},
                       const std::string& token = "secret") {
        return dispatch(router, hooks, method, target, body, token);
    }

    fixtures::MarketHarness market;
    controller::LedgerAdminController ledgerAdmin{market.ledger, market.catalog, market.vault, market.bankAudit,
                                                  "secret"};
    controller::ContainerAdminController containerAdmin{market.registry, ""};
    Router router;
    ServerHooks hooks;
    int fatal{0};
    int completed{0};
};

TEST_F(ProcessRequestTest, UnknownRouteIsEnvelopedNotFound) {
    auto ctx = run(http::verb::get, "/nowhere");
    EXPECT_EQ(ctx.response.result(), http::status::not_found);
    auto body = bodyOf(ctx);
    EXPECT_FALSE(body.at("success").as_bool());
    EXPECT_EQ(std::string(body.at("path").as_string()), "/nowhere");
    EXPECT_EQ(std::string(body.at("error").as_object().at("message").as_string()), "Not found");
    EXPECT_EQ(std::string(body.at("error").as_object().at("errorClass").as_string()), "validation");
    EXPECT_EQ(completed, 0);
}

TEST_F(ProcessRequestTest, RpcRepliesSkipTheEnvelope) {
    market.openAccount("alice", "1111", 40);
    auto ctx = run(http::verb::post, "/rpc/ledger",
                   R"({"type":"login","channel":1337,"user":"alice","pin":"1111"})");
    EXPECT_EQ(ctx.response.result(), http::status::ok);
    EXPECT_EQ(ctx.response.find(kEnvelopeHeader), ctx.response.end());
    auto body = bodyOf(ctx);
    EXPECT_TRUE(body.at("ok").as_bool());
    EXPECT_EQ(body.at("channel").as_int64(), 1337);
    EXPECT_EQ(body.at("balance").as_int64(), 40);
    EXPECT_FALSE(body.contains("success"));
}

TEST_F(ProcessRequestTest, AdminRoutesRequireToken) {
    auto missing = run(http::verb::get, "/admin/ledger/accounts", {}, "");
    EXPECT_EQ(missing.response.result(), http::status::unauthorized);
    EXPECT_EQ(std::string(bodyOf(missing).at("error").as_object().at("message").as_string()), "Unauthorized");

    auto wrong = run(http::verb::get, "/admin/ledger/accounts", {}, "guess");
    EXPECT_EQ(wrong.response.result(), http::status::unauthorized);
}

TEST_F(ProcessRequestTest, EmptyTokenDisablesConsole) {
    auto ctx = run(http::verb::get, "/admin/containers");
    EXPECT_EQ(ctx.response.result(), http::status::forbidden);
    auto body = bodyOf(ctx);
    EXPECT_EQ(std::string(body.at("error").as_object().at("message").as_string()), "Admin console disabled");
    EXPECT_EQ(std::string(body.at("error").as_object().at("errorClass").as_string()), "authorization");
}

TEST_F(ProcessRequestTest, AdminSuccessIsEnveloped) {
    market.openAccount("alice", "1111", 40);
    auto ctx = run(http::verb::post, "/admin/ledger/accounts/alice/adjust", R"({"delta":-15})");
    EXPECT_EQ(ctx.response.result(), http::status::ok);
    auto body = bodyOf(ctx);
    EXPECT_TRUE(body.at("success").as_bool());
    EXPECT_EQ(std::string(body.at("path").as_string()), "/admin/ledger/accounts/alice/adjust");
    EXPECT_EQ(body.at("data").as_object().at("balance").as_int64(), 25);
    EXPECT_EQ(market.balanceOf("alice"), 25);
    EXPECT_EQ(completed, 1);
}

TEST_F(ProcessRequestTest, ServiceFailureMapsToStatus) {
    auto ctx = run(http::verb::post, "/admin/ledger/accounts/ghost/approve");
    EXPECT_EQ(ctx.response.result(), http::status::unauthorized);
    EXPECT_EQ(std::string(bodyOf(ctx).at("error").as_object().at("message").as_string()), "No account");

    market.openAccount("alice", "1111", 0);
    auto duplicate = run(http::verb::post, "/admin/ledger/accounts", R"({"user":"alice","pin":"9"})");
    EXPECT_EQ(duplicate.response.result(), http::status::bad_request);
}

TEST_F(ProcessRequestTest, EscapedValidationErrorIsBadRequest) {
    auto ctx = run(http::verb::put, "/admin/ledger/price-config", R"({"elasticity":"x"})");
    EXPECT_EQ(ctx.response.result(), http::status::bad_request);
    EXPECT_EQ(std::string(bodyOf(ctx).at("error").as_object().at("message").as_string()), "Field elasticity must be a number");
    EXPECT_DOUBLE_EQ(market.bankState.catalog.price.elasticity, 1.2);

    auto malformed = run(http::verb::post, "/admin/ledger/accounts", "{nope");
    EXPECT_EQ(malformed.response.result(), http::status::bad_request);
}

TEST_F(ProcessRequestTest, StorageFailureIsFatal) {
    market.bankStore.failSaves = true;
    auto ctx = run(http::verb::post, "/admin/ledger/accounts", R"({"user":"carol","pin":"4242"})");
    EXPECT_EQ(ctx.response.result(), http::status::internal_server_error);
    EXPECT_FALSE(ctx.response.keep_alive());
    EXPECT_EQ(fatal, 1);
    EXPECT_EQ(completed, 0);

    auto body = bodyOf(ctx);
    EXPECT_FALSE(body.at("ok").as_bool());
    EXPECT_EQ(std::string(body.at("error").as_string()), "Storage failure");
}

TEST_F(ProcessRequestTest, OtherExceptionsAreInternal) {
    auto ctx = run(http::verb::get, "/boom");
    EXPECT_EQ(ctx.response.result(), http::status::internal_server_error);
    auto body = bodyOf(ctx);
    EXPECT_EQ(std::string(body.at("error").as_object().at("message").as_string()), "kaput");
    EXPECT_EQ(std::string(body.at("error").as_object().at("errorClass").as_string()), "internal");
    EXPECT_EQ(fatal, 0);
}

TEST_F(ProcessRequestTest, EmptyOkBecomesNoContent) {
    auto ctx = run(http::verb::post, "/ping");
    EXPECT_EQ(ctx.response.result(), http::status::no_content);
    EXPECT_TRUE(ctx.response.body().empty());
    EXPECT_EQ(completed, 1);
}

class ContainerConsoleTest : public ::testing::Test {
protected:
    ContainerConsoleTest() {
        console.registerRoutes(router);
        market.addContainer("alice_chest", 3, 4).receive("widget", 10);
    }

    RequestContext post(const std::string& target, const std::string& body) {
        return dispatch(router, hooks, http::verb::post, target, body, "secret");
    }

    fixtures::MarketHarness market;
    controller::ContainerAdminController console{market.registry, "secret"};
    Router router;
    ServerHooks hooks;
};

TEST_F(ContainerConsoleTest, RemoveTakesGoodsOutOfAChest) {
    auto ctx = post("/admin/containers/alice_chest/remove", R"({"item":"widget","count":6})");
    EXPECT_EQ(ctx.response.result(), http::status::ok);
    EXPECT_EQ(bodyOf(ctx).at("data").as_object().at("removed").as_int64(), 6);
    EXPECT_EQ(market.countOf("alice_chest", "widget"), 4);

    auto drained = post("/admin/containers/alice_chest/remove", R"({"item":"widget","count":9})");
    EXPECT_EQ(bodyOf(drained).at("data").as_object().at("removed").as_int64(), 4);
    EXPECT_TRUE(market.container("alice_chest").list().empty());
}

TEST_F(ContainerConsoleTest, RemoveValidatesItsInput) {
    auto unknown = post("/admin/containers/nowhere/remove", R"({"item":"widget","count":1})");
    EXPECT_EQ(unknown.response.result(), http::status::bad_request);
    EXPECT_EQ(std::string(bodyOf(unknown).at("error").as_object().at("message").as_string()), "Unknown container");

    auto zero = post("/admin/containers/alice_chest/remove", R"({"item":"widget","count":0})");
    EXPECT_EQ(zero.response.result(), http::status::bad_request);
    EXPECT_EQ(market.countOf("alice_chest", "widget"), 10);
}

} // namespace
} // namespace vaulttrade::server
