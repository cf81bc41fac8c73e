#include "vaulttrade/service/CatalogService.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace vaulttrade::service {
namespace {

CatalogService::Result rejected(std::string message) {
    CatalogService::Result result;
    result.errorClass = util::ErrorClass::validation;
    result.message = std::move(message);
    return result;
}

CatalogService::Result accepted(std::string message) {
    CatalogService::Result result;
    result.success = true;
    result.message = std::move(message);
    return result;
}

} // namespace

CatalogService::CatalogService(model::BankState& state,
                               repository::BankRepository& repository,
                               repository::AuditLog& audit)
    : state_(state)
    , repository_(repository)
    , audit_(audit) {}

CatalogService::Result CatalogService::setItemPrice(const std::string& item, std::int64_t basePrice) {
    if (item.empty()) {
        return rejected("Item id required");
    }
    if (basePrice <= 0) {
        return rejected("Base price must be > 0");
    }
    state_.catalog.items[item] = model::ItemPrice{item, basePrice};
    commit("catalog.item", "Set " + item + " base " + model::formatAmount(basePrice, state_.catalog.price));
    return accepted("Saved");
}

CatalogService::Result CatalogService::removeItem(const std::string& item) {
    if (state_.catalog.items.erase(item) == 0) {
        return rejected("Unknown item");
    }
    commit("catalog.item", "Removed " + item);
    return accepted("Removed");
}

CatalogService::Result CatalogService::updatePriceConfig(const PriceConfigUpdate& update) {
    if (update.maxStock && *update.maxStock <= 0) {
        return rejected("maxStock must be > 0");
    }
    if (update.minPrice && *update.minPrice < 0) {
        return rejected("minPrice must be >= 0");
    }
    if (update.elasticity && (!std::isfinite(*update.elasticity) || *update.elasticity < 0.0)) {
        return rejected("elasticity must be >= 0");
    }
    if (update.currencySymbol && update.currencySymbol->empty()) {
        return rejected("Currency symbol required");
    }

    auto& price = state_.catalog.price;
    if (update.maxStock) {
        price.maxStock = *update.maxStock;
    }
    if (update.minPrice) {
        price.minPrice = *update.minPrice;
    }
    if (update.elasticity) {
        price.elasticity = *update.elasticity;
    }
    if (update.currencySymbol) {
        price.currencySymbol = *update.currencySymbol;
    }

    std::ostringstream oss;
    oss << "Price config maxStock=" << price.maxStock << " minPrice=" << price.minPrice
        << " elasticity=" << price.elasticity << " symbol=" << price.currencySymbol;
    commit("catalog.config", oss.str());
    return accepted("Updated");
}

CatalogService::Result CatalogService::configureVault(const std::string& containerName) {
    if (containerName.empty()) {
        return rejected("Container name required");
    }
    state_.vaultContainer = containerName;
    commit("vault.configured", "Bank vault set to " + containerName);
    return accepted("Vault set to " + containerName);
}

void CatalogService::commit(const std::string& event, const std::string& message) {
    repository_.save(state_);
    audit_.append(event, message);
}

} // namespace vaulttrade::service
