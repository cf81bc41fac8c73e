#include "TestSupport.hpp"

#include <gtest/gtest.h>

namespace vaulttrade::service {
namespace {

class ListingServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        market.addContainer("alice_chest").receive("widget", 5);
        ASSERT_TRUE(listings.configureVault("trade_vault").success);
    }

    fixtures::MarketHarness market;
    ListingService& listings = market.listings;
};

TEST_F(ListingServiceTest, CreateAssignsIncreasingIds) {
    auto first = listings.create("alice", "widget", 10);
    auto second = listings.create("bob", "gear", 7);
    ASSERT_TRUE(first.success);
    ASSERT_TRUE(second.success);
    EXPECT_EQ(first.listingId, 1);
    EXPECT_EQ(second.listingId, 2);
    EXPECT_EQ(first.message, "Created listing #1");

    auto listing = listings.find(1);
    ASSERT_TRUE(listing.has_value());
    EXPECT_EQ(listing->seller, "alice");
    EXPECT_EQ(listing->quantity, 0);
    EXPECT_EQ(market.tradeState.nextListingId, 3);
}

TEST_F(ListingServiceTest, CreateValidatesInput) {
    EXPECT_EQ(listings.create("alice", "", 10).message, "Item id required");
    EXPECT_EQ(listings.create("alice", "widget", 0).message, "Price > 0 required");
    EXPECT_EQ(listings.create("alice", "widget", 0).errorClass, util::ErrorClass::validation);
    EXPECT_TRUE(listings.list().empty());
}

TEST_F(ListingServiceTest, IdsAreNeverReusedAfterReload) {
    ASSERT_TRUE(listings.create("alice", "widget", 10).success);
    ASSERT_TRUE(listings.create("alice", "widget", 11).success);

    auto reloaded = repository::decodeTradeState(*market.tradeStore.snapshot);
    EXPECT_EQ(reloaded.nextListingId, 3);
    EXPECT_EQ(reloaded.vaultContainer, "trade_vault");
    ASSERT_EQ(reloaded.listings.size(), 2u);
}

TEST_F(ListingServiceTest, AddStockCountsOnlyDeliveredUnits) {
    market.addContainer("trade_vault", 1, 3);
    auto id = listings.create("alice", "widget", 10).listingId;

    auto result = listings.addStock(id, "alice", "widget", 5, "alice_chest");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.moved, 3);
    EXPECT_EQ(result.message, "Deposited 3 (new qty 3)");
    EXPECT_EQ(listings.find(id)->quantity, 3);
    EXPECT_EQ(market.countOf("alice_chest", "widget"), 2);
    EXPECT_EQ(listings.vaultCount("widget"), 3);
}

TEST_F(ListingServiceTest, AddStockWithNothingMovedFails) {
    market.addContainer("trade_vault");
    market.addContainer("empty_chest");
    auto id = listings.create("alice", "widget", 10).listingId;

    auto result = listings.addStock(id, "alice", "widget", 5, "empty_chest");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorClass, util::ErrorClass::insufficientResource);
    EXPECT_EQ(result.message, "No items moved");
    EXPECT_EQ(listings.find(id)->quantity, 0);

    auto missing = listings.addStock(id, "alice", "widget", 5, "no_such_chest");
    EXPECT_EQ(missing.message, "Container not found: no_such_chest");
}

TEST_F(ListingServiceTest, AddStockFromTheVaultItselfIsRejected) {
    market.addContainer("trade_vault").receive("widget", 5);
    auto id = listings.create("alice", "widget", 10).listingId;

    auto result = listings.addStock(id, "alice", "widget", 5, "trade_vault");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorClass, util::ErrorClass::validation);
    EXPECT_EQ(result.message, "Cannot stock from the vault itself");
    EXPECT_EQ(listings.find(id)->quantity, 0);
    EXPECT_EQ(listings.vaultCount("widget"), 5);
}

TEST_F(ListingServiceTest, AddStockChecksOwnershipAndItem) {
    market.addContainer("trade_vault");
    auto id = listings.create("alice", "widget", 10).listingId;

    auto stranger = listings.addStock(id, "mallory", "widget", 1, "alice_chest");
    EXPECT_EQ(stranger.errorClass, util::ErrorClass::authorization);
    EXPECT_EQ(stranger.message, "Not your listing");

    EXPECT_EQ(listings.addStock(id, "alice", "gear", 1, "alice_chest").message, "Item mismatch");
    EXPECT_EQ(listings.addStock(99, "alice", "widget", 1, "alice_chest").message, "Listing not found");
    EXPECT_EQ(listings.addStock(id, "alice", "widget", 0, "alice_chest").message, "Bad stock params");
    EXPECT_EQ(market.countOf("alice_chest", "widget"), 5);
}

TEST_F(ListingServiceTest, AddStockNeedsConfiguredVault) {
    market.tradeState.vaultContainer.clear();
    auto id = listings.create("alice", "widget", 10).listingId;
    EXPECT_EQ(listings.addStock(id, "alice", "widget", 1, "alice_chest").message, "Vault not configured");
    EXPECT_EQ(listings.configureVault("").message, "Container name required");
}

TEST_F(ListingServiceTest, DecrementNeverGoesNegative) {
    market.addContainer("trade_vault");
    auto id = listings.create("alice", "widget", 10).listingId;
    ASSERT_TRUE(listings.addStock(id, "alice", "widget", 4, "alice_chest").success);

    listings.decrement(id, 3, "listing.purchased", "three sold");
    EXPECT_EQ(listings.find(id)->quantity, 1);
    listings.decrement(id, 5, "listing.purchased", "oversold");
    EXPECT_EQ(listings.find(id)->quantity, 0);
    EXPECT_EQ(market.tradeAudit.findByEvent("listing.purchased").size(), 2u);
}

TEST_F(ListingServiceTest, VaultCountIsAbsentWithoutVaultContainer) {
    EXPECT_FALSE(listings.vaultCount("widget").has_value());
    market.addContainer("trade_vault");
    EXPECT_EQ(listings.vaultCount("widget"), 0);
}

} // namespace
} // namespace vaulttrade::service
