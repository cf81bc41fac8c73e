#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <regex>
#include <stdexcept>

namespace vaulttrade::workflow {
namespace {

using Fate = fixtures::ScriptedChannel::Fate;

class SettlementWorkflowTest : public ::testing::Test {
protected:
    void SetUp() override {
        market.addContainer("trade_vault");
        market.addContainer("alice_chest").receive("widget", 5);
        market.addContainer("bob_chest");
        ASSERT_TRUE(market.listings.configureVault("trade_vault").success);

        market.openAccount("alice", "1111", 0);
        market.openAccount("bob", "2222", 100);
    }

    std::int64_t listWidgets(std::int64_t units, std::int64_t price = 10) {
        auto id = market.listings.create("alice", "widget", price).listingId;
        EXPECT_EQ(market.listings.addStock(id, "alice", "widget", units, "alice_chest").moved, units);
        return id;
    }

    SettlementResult buy(std::int64_t listingId, std::int64_t count, const std::string& destination = "bob_chest") {
        return market.settlement.purchase(PurchaseRequest{"bob", listingId, count, destination});
    }

    std::int64_t quantityOf(std::int64_t listingId) { return market.listings.find(listingId)->quantity; }

    fixtures::MarketHarness market;
};

TEST_F(SettlementWorkflowTest, SellsOnlyWhatTheVaultHolds) {
    auto id = listWidgets(5);
    ASSERT_EQ(market.container("trade_vault").take("widget", 2), 2);

    auto result = buy(id, 5);
    ASSERT_TRUE(result.settled()) << result.message;
    EXPECT_EQ(result.moved, 3);
    EXPECT_EQ(result.total, 30);
    EXPECT_EQ(result.message, "Purchased 3 for $30");
    EXPECT_EQ(quantityOf(id), 2);
    EXPECT_EQ(market.balanceOf("bob"), 70);
    EXPECT_EQ(market.balanceOf("alice"), 30);
    EXPECT_EQ(market.countOf("bob_chest", "widget"), 3);
    EXPECT_EQ(result.chargeAttempts, 1);
    EXPECT_EQ(market.tradeAudit.findByEvent("listing.purchased").size(), 1u);
}

TEST_F(SettlementWorkflowTest, TimedOutChargeIsRevertedAsAmbiguous) {
    auto id = listWidgets(3);
    market.channel.push(Fate::loseRequest);
    market.channel.push(Fate::loseRequest);

    auto result = buy(id, 3);
    EXPECT_EQ(result.state, SettlementState::reverted);
    EXPECT_EQ(result.errorClass, util::ErrorClass::transportAmbiguity);
    EXPECT_EQ(result.message, "Bank transfer failed: Timeout");
    EXPECT_EQ(result.moved, 3);
    EXPECT_EQ(result.recovered, 3);
    EXPECT_EQ(result.chargeAttempts, 2);
    EXPECT_EQ(market.channel.calls(), 2);

    EXPECT_EQ(quantityOf(id), 3);
    EXPECT_EQ(market.countOf("trade_vault", "widget"), 3);
    EXPECT_EQ(market.countOf("bob_chest", "widget"), 0);
    EXPECT_EQ(market.balanceOf("bob"), 100);
    EXPECT_EQ(market.tradeAudit.findByEvent("settlement.ambiguous").size(), 1u);
    EXPECT_FALSE(market.ledger.findReceipt(result.transactionId).has_value());
}

TEST_F(SettlementWorkflowTest, ThrowingChargeIsTreatedAsATimeout) {
    auto id = listWidgets(3);
    market.channel.onCall = [] { throw std::runtime_error("socket torn down"); };

    auto result = buy(id, 3);
    EXPECT_EQ(result.state, SettlementState::reverted);
    EXPECT_EQ(result.errorClass, util::ErrorClass::transportAmbiguity);
    EXPECT_EQ(result.chargeAttempts, 2);
    EXPECT_EQ(result.recovered, 3);
    EXPECT_EQ(quantityOf(id), 3);
    EXPECT_EQ(market.countOf("trade_vault", "widget"), 3);
    EXPECT_EQ(market.countOf("bob_chest", "widget"), 0);
    EXPECT_EQ(market.balanceOf("bob"), 100);
    EXPECT_EQ(market.tradeAudit.findByEvent("settlement.ambiguous").size(), 1u);
}

TEST_F(SettlementWorkflowTest, RetryAfterLostReplyChargesOnce) {
    auto id = listWidgets(3);
    market.channel.push(Fate::loseReply);

    auto result = buy(id, 3);
    ASSERT_TRUE(result.settled()) << result.message;
    EXPECT_EQ(result.chargeAttempts, 2);
    EXPECT_EQ(market.balanceOf("bob"), 70);
    EXPECT_EQ(market.balanceOf("alice"), 30);
    EXPECT_EQ(quantityOf(id), 0);
    EXPECT_TRUE(market.ledger.findReceipt(result.transactionId).has_value());
}

TEST_F(SettlementWorkflowTest, RejectedChargeMovesGoodsBack) {
    auto id = listWidgets(3, 50);

    auto result = buy(id, 3);
    EXPECT_EQ(result.state, SettlementState::reverted);
    EXPECT_EQ(result.errorClass, util::ErrorClass::insufficientResource);
    EXPECT_EQ(result.message, "Bank transfer failed: Insufficient funds");
    EXPECT_EQ(result.chargeAttempts, 1);
    EXPECT_EQ(quantityOf(id), 3);
    EXPECT_EQ(market.countOf("trade_vault", "widget"), 3);
    EXPECT_EQ(market.balanceOf("bob"), 100);
    EXPECT_EQ(market.tradeAudit.findByEvent("settlement.reverted").size(), 1u);
    EXPECT_TRUE(market.tradeAudit.findByEvent("settlement.ambiguous").empty());
}

TEST_F(SettlementWorkflowTest, UnrecoverableGoodsAreRecordedAndWrittenOff) {
    auto id = listWidgets(3, 50);
    market.channel.onCall = [this] { market.container("bob_chest").take("widget", 2); };

    auto result = buy(id, 3);
    EXPECT_EQ(result.state, SettlementState::chargeFailedUnrecovered);
    EXPECT_EQ(result.errorClass, util::ErrorClass::unrecoveredInconsistency);
    EXPECT_EQ(result.moved, 3);
    EXPECT_EQ(result.recovered, 1);
    EXPECT_EQ(quantityOf(id), 1);
    EXPECT_EQ(market.countOf("trade_vault", "widget"), 1);
    EXPECT_EQ(market.balanceOf("bob"), 100);

    auto records = market.tradeAudit.findByEvent("settlement.unrecovered");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_NE(records[0].message.find("UNRECOVERED buyer=bob"), std::string::npos);
    EXPECT_NE(records[0].message.find("recovered=1"), std::string::npos);
}

TEST_F(SettlementWorkflowTest, FullDestinationFailsDeliveryWithoutCharging) {
    auto id = listWidgets(3);
    market.addContainer("tiny_chest", 1, 64).receive("stone", 64);

    auto result = buy(id, 1, "tiny_chest");
    EXPECT_EQ(result.state, SettlementState::deliveryFailed);
    EXPECT_EQ(result.message, "Delivery failed");
    EXPECT_EQ(market.channel.calls(), 0);
    EXPECT_EQ(quantityOf(id), 3);

    auto missing = buy(id, 1, "nowhere");
    EXPECT_EQ(missing.message, "Delivery failed: Container not found: nowhere");
}

TEST_F(SettlementWorkflowTest, DeliveryIntoTheVaultIsRejected) {
    auto id = listWidgets(3);

    auto result = buy(id, 3, "trade_vault");
    EXPECT_EQ(result.state, SettlementState::quoted);
    EXPECT_EQ(result.errorClass, util::ErrorClass::validation);
    EXPECT_EQ(result.message, "Cannot deliver into the vault");
    EXPECT_EQ(result.moved, 0);
    EXPECT_EQ(market.channel.calls(), 0);
    EXPECT_EQ(market.balanceOf("bob"), 100);
    EXPECT_EQ(quantityOf(id), 3);
    EXPECT_EQ(market.countOf("trade_vault", "widget"), 3);
}

TEST_F(SettlementWorkflowTest, EmptyVaultIsOutOfStock) {
    auto id = listWidgets(3);
    market.container("trade_vault").take("widget", 3);

    auto result = buy(id, 1);
    EXPECT_EQ(result.state, SettlementState::deliveryFailed);
    EXPECT_EQ(result.errorClass, util::ErrorClass::insufficientResource);
    EXPECT_EQ(result.message, "Out of stock");
    EXPECT_EQ(quantityOf(id), 3);
}

TEST_F(SettlementWorkflowTest, RejectsUnavailableListings) {
    auto empty = market.listings.create("alice", "widget", 10).listingId;
    EXPECT_EQ(buy(empty, 1).message, "Not available");
    EXPECT_EQ(buy(empty, 1).errorClass, util::ErrorClass::insufficientResource);
    EXPECT_EQ(buy(42, 1).message, "Not available");
    EXPECT_EQ(buy(42, 1).errorClass, util::ErrorClass::validation);
    EXPECT_EQ(buy(empty, 0).message, "Bad purchase params");
    EXPECT_EQ(buy(0, 1).message, "Bad purchase params");
    EXPECT_EQ(market.channel.calls(), 0);
}

TEST_F(SettlementWorkflowTest, MissingVaultIsReported) {
    auto id = listWidgets(3);
    ASSERT_TRUE(market.registry.remove("trade_vault"));
    EXPECT_EQ(buy(id, 1).message, "Vault not configured");
}

TEST_F(SettlementWorkflowTest, QuotesMarketPriceAlongside) {
    ASSERT_TRUE(market.catalog.setItemPrice("widget", 20).success);
    auto id = listWidgets(5);

    auto result = buy(id, 1);
    ASSERT_TRUE(result.settled());
    EXPECT_EQ(result.unitPrice, 10);
    ASSERT_TRUE(result.marketPrice.has_value());
    EXPECT_EQ(*result.marketPrice,
              service::PricingEngine::computeUnitPrice(20, 5, market.bankState.catalog.price));
}

TEST_F(SettlementWorkflowTest, RemoteNodeAsksTheBankForItsQuote) {
    market.addContainer("bank_vault").receive("widget", 2);
    ASSERT_TRUE(market.catalog.configureVault("bank_vault").success);
    ASSERT_TRUE(market.catalog.setItemPrice("widget", 20).success);
    auto id = listWidgets(5);
    SettlementWorkflow remote{market.listings, market.ledgerClient, market.tradeAudit, nullptr, 1};

    auto result = remote.purchase(PurchaseRequest{"bob", id, 1, "bob_chest"});
    ASSERT_TRUE(result.settled()) << result.message;
    ASSERT_TRUE(result.marketPrice.has_value());
    EXPECT_EQ(*result.marketPrice,
              service::PricingEngine::computeUnitPrice(20, 2, market.bankState.catalog.price));
    EXPECT_EQ(market.channel.calls(), 2);

    ASSERT_TRUE(market.catalog.removeItem("widget").success);
    auto unquoted = remote.purchase(PurchaseRequest{"bob", id, 1, "bob_chest"});
    ASSERT_TRUE(unquoted.settled());
    EXPECT_FALSE(unquoted.marketPrice.has_value());
}

TEST_F(SettlementWorkflowTest, TransactionIdsAreUniquePerAttempt) {
    auto id = listWidgets(2);
    auto first = buy(id, 1);
    auto second = buy(id, 1);
    ASSERT_TRUE(first.settled());
    ASSERT_TRUE(second.settled());

    const std::regex shape{"^1-[0-9]+-[0-9a-f]{8}$"};
    EXPECT_TRUE(std::regex_match(first.transactionId, shape)) << first.transactionId;
    EXPECT_TRUE(std::regex_match(second.transactionId, shape)) << second.transactionId;
    EXPECT_NE(first.transactionId, second.transactionId);
}

TEST_F(SettlementWorkflowTest, StateNamesAreStable) {
    EXPECT_EQ(toString(SettlementState::settled), "settled");
    EXPECT_EQ(toString(SettlementState::chargeFailedUnrecovered), "chargeFailedUnrecovered");
    EXPECT_EQ(toString(SettlementState::reverted), "reverted");
}

} // namespace
} // namespace vaulttrade::workflow
