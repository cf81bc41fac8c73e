#include "vaulttrade/service/PricingEngine.hpp"

#include <gtest/gtest.h>

namespace vaulttrade::service {
namespace {

model::Catalog makeCatalog() {
    model::Catalog catalog;
    catalog.price.maxStock = 1000;
    catalog.price.elasticity = 1.2;
    catalog.price.minPrice = 1;
    catalog.items["widget"] = model::ItemPrice{"widget", 100};
    return catalog;
}

TEST(PricingEngineTest, FullStockHalvesPriceBelowBase) {
    auto catalog = makeCatalog();
    PricingEngine pricing{catalog};
    // 100 / (1 + 1.2) = 45.45
    EXPECT_EQ(pricing.price("widget", 1000), 45);
}

TEST(PricingEngineTest, EmptyVaultQuotesBasePrice) {
    auto catalog = makeCatalog();
    PricingEngine pricing{catalog};
    EXPECT_EQ(pricing.price("widget", 0), 100);
}

TEST(PricingEngineTest, NegativeStockIsTreatedAsEmpty) {
    auto catalog = makeCatalog();
    PricingEngine pricing{catalog};
    EXPECT_EQ(pricing.price("widget", -50), 100);
}

TEST(PricingEngineTest, PriceNeverRisesWithStock) {
    auto catalog = makeCatalog();
    PricingEngine pricing{catalog};
    std::int64_t previous = *pricing.price("widget", 0);
    for (std::int64_t stock = 1; stock <= 5000; stock += 37) {
        const auto current = *pricing.price("widget", stock);
        EXPECT_LE(current, previous) << "stock " << stock;
        EXPECT_GE(current, catalog.price.minPrice);
        previous = current;
    }
}

TEST(PricingEngineTest, MinPriceFloorsDeepDiscounts) {
    auto catalog = makeCatalog();
    catalog.price.minPrice = 60;
    PricingEngine pricing{catalog};
    EXPECT_EQ(pricing.price("widget", 1000), 60);
    EXPECT_EQ(pricing.price("widget", 0), 100);
}

TEST(PricingEngineTest, UnpricedItemsHaveNoQuote) {
    auto catalog = makeCatalog();
    catalog.items["dirt"] = model::ItemPrice{"dirt", 0};
    PricingEngine pricing{catalog};
    EXPECT_FALSE(pricing.price("cobblestone", 10).has_value());
    EXPECT_FALSE(pricing.price("dirt", 10).has_value());
}

TEST(PricingEngineTest, NonPositiveMaxStockFallsBackToDefault) {
    model::PriceConfig config;
    config.maxStock = 0;
    config.elasticity = 1.2;
    config.minPrice = 1;
    EXPECT_EQ(PricingEngine::computeUnitPrice(100, 1000, config), 45);
}

TEST(PricingEngineTest, ZeroElasticityIgnoresStock) {
    model::PriceConfig config;
    config.elasticity = 0.0;
    EXPECT_EQ(PricingEngine::computeUnitPrice(77, 0, config), 77);
    EXPECT_EQ(PricingEngine::computeUnitPrice(77, 100000, config), 77);
}

TEST(PricingEngineTest, ReadsCatalogChangesLive) {
    auto catalog = makeCatalog();
    PricingEngine pricing{catalog};
    catalog.items["widget"].basePrice = 150;
    EXPECT_EQ(pricing.price("widget", 0), 150);
    catalog.price.minPrice = 500;
    EXPECT_EQ(pricing.price("widget", 0), 500);
}

} // namespace
} // namespace vaulttrade::service
