#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace vaulttrade::model {

struct ItemPrice {
    std::string item;
    std::int64_t basePrice{};
};

struct PriceConfig {
    static constexpr std::int64_t kDefaultMaxStock = 1000;

    std::int64_t maxStock{kDefaultMaxStock};
    std::int64_t minPrice{1};
    double elasticity{1.2};
    std::string currencySymbol{"$"};
};

struct Catalog {
    std::map<std::string, ItemPrice> items;
    PriceConfig price;
};

inline std::string formatAmount(std::int64_t amount, const PriceConfig& config) {
    return config.currencySymbol + std::to_string(amount);
}

} // namespace vaulttrade::model
