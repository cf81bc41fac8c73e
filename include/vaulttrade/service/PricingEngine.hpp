#pragma once

#include "vaulttrade/model/Catalog.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace vaulttrade::service {

// Elastic unit price: base / (1 + elasticity * stock / maxStock), floored,
// never below minPrice. Reads the catalog it is given and nothing else.
class PricingEngine {
public:
    explicit PricingEngine(const model::Catalog& catalog);

    // nullopt when the item has no base price or the base price is <= 0.
    [[nodiscard]] std::optional<std::int64_t> price(const std::string& item, std::int64_t stock) const;

    [[nodiscard]] static std::int64_t computeUnitPrice(std::int64_t basePrice,
                                                       std::int64_t stock,
                                                       const model::PriceConfig& config);

    const model::Catalog& catalog() const noexcept { return catalog_; }

private:
    const model::Catalog& catalog_;
};

} // namespace vaulttrade::service
