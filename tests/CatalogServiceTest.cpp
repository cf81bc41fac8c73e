#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace vaulttrade::service {
namespace {

class CatalogServiceTest : public ::testing::Test {
protected:
    fixtures::MarketHarness market;
    CatalogService& catalog = market.catalog;
};

TEST_F(CatalogServiceTest, SetItemPriceStoresAndPersists) {
    auto result = catalog.setItemPrice("widget", 100);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.message, "Saved");
    EXPECT_EQ(catalog.catalog().items.at("widget").basePrice, 100);

    auto reloaded = repository::decodeBankState(*market.bankStore.snapshot);
    EXPECT_EQ(reloaded.catalog.items.at("widget").basePrice, 100);
    EXPECT_EQ(market.bankAudit.findByEvent("catalog.item").size(), 1u);
}

TEST_F(CatalogServiceTest, SetItemPriceRejectsBadInput) {
    auto unnamed = catalog.setItemPrice("", 10);
    EXPECT_FALSE(unnamed.success);
    EXPECT_EQ(unnamed.errorClass, util::ErrorClass::validation);

    EXPECT_FALSE(catalog.setItemPrice("widget", 0).success);
    EXPECT_FALSE(catalog.setItemPrice("widget", -3).success);
    EXPECT_TRUE(catalog.catalog().items.empty());
    EXPECT_EQ(market.bankStore.saves, 0);
}

TEST_F(CatalogServiceTest, RemoveItem) {
    ASSERT_TRUE(catalog.setItemPrice("widget", 100).success);
    EXPECT_EQ(catalog.removeItem("widget").message, "Removed");
    EXPECT_FALSE(market.pricing.price("widget", 0).has_value());

    auto missing = catalog.removeItem("widget");
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(missing.message, "Unknown item");
}

TEST_F(CatalogServiceTest, PriceConfigUpdatesOnlyGivenFields) {
    CatalogService::PriceConfigUpdate update;
    update.minPrice = 5;
    update.currencySymbol = "E";
    ASSERT_TRUE(catalog.updatePriceConfig(update).success);

    const auto& price = catalog.catalog().price;
    EXPECT_EQ(price.minPrice, 5);
    EXPECT_EQ(price.currencySymbol, "E");
    EXPECT_EQ(price.maxStock, 1000);
    EXPECT_DOUBLE_EQ(price.elasticity, 1.2);
}

TEST_F(CatalogServiceTest, InvalidPriceConfigChangesNothing) {
    CatalogService::PriceConfigUpdate update;
    update.minPrice = 7;
    update.maxStock = 0;
    auto result = catalog.updatePriceConfig(update);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorClass, util::ErrorClass::validation);
    EXPECT_EQ(catalog.catalog().price.minPrice, 1);

    CatalogService::PriceConfigUpdate negative;
    negative.elasticity = -0.5;
    EXPECT_FALSE(catalog.updatePriceConfig(negative).success);

    CatalogService::PriceConfigUpdate notANumber;
    notANumber.elasticity = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(catalog.updatePriceConfig(notANumber).success);
    EXPECT_DOUBLE_EQ(catalog.catalog().price.elasticity, 1.2);
}

TEST_F(CatalogServiceTest, ConfigureVault) {
    EXPECT_FALSE(catalog.configureVault("").success);
    auto result = catalog.configureVault("bank_vault");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.message, "Vault set to bank_vault");
    EXPECT_EQ(catalog.vaultContainer(), "bank_vault");
    EXPECT_EQ(market.bankState.vaultContainer, "bank_vault");
}

TEST_F(CatalogServiceTest, PricingFollowsCatalogEdits) {
    ASSERT_TRUE(catalog.setItemPrice("widget", 100).success);
    EXPECT_EQ(market.pricing.price("widget", 1000), 45);

    CatalogService::PriceConfigUpdate update;
    update.elasticity = 0.0;
    ASSERT_TRUE(catalog.updatePriceConfig(update).success);
    EXPECT_EQ(market.pricing.price("widget", 1000), 100);
}

} // namespace
} // namespace vaulttrade::service
