#include "vaulttrade/service/PricingEngine.hpp"

#include <algorithm>
#include <cmath>

namespace vaulttrade::service {

PricingEngine::PricingEngine(const model::Catalog& catalog)
    : catalog_(catalog) {}

std::optional<std::int64_t> PricingEngine::price(const std::string& item, std::int64_t stock) const {
    auto it = catalog_.items.find(item);
    if (it == catalog_.items.end() || it->second.basePrice <= 0) {
        return std::nullopt;
    }
    return computeUnitPrice(it->second.basePrice, stock, catalog_.price);
}

std::int64_t PricingEngine::computeUnitPrice(std::int64_t basePrice,
                                             std::int64_t stock,
                                             const model::PriceConfig& config) {
    const double maxStock = static_cast<double>(
        config.maxStock > 0 ? config.maxStock : model::PriceConfig::kDefaultMaxStock);
    const double elasticity = std::max(0.0, config.elasticity);
    const double ratio = static_cast<double>(std::max<std::int64_t>(0, stock)) / maxStock;
    const double raw = static_cast<double>(basePrice) / (1.0 + elasticity * ratio);
    const double floorPrice = static_cast<double>(std::max<std::int64_t>(0, config.minPrice));
    return static_cast<std::int64_t>(std::floor(std::max(floorPrice, raw)));
}

} // namespace vaulttrade::service
