#pragma once

#include "vaulttrade/model/Catalog.hpp"
#include "vaulttrade/model/State.hpp"
#include "vaulttrade/repository/AuditLog.hpp"
#include "vaulttrade/repository/StateRepository.hpp"
#include "vaulttrade/util/Errors.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace vaulttrade::service {

class CatalogService {
public:
    struct Result {
        bool success{false};
        util::ErrorClass errorClass{util::ErrorClass::none};
        std::string message;
    };

    // Absent fields are left unchanged.
    struct PriceConfigUpdate {
        std::optional<std::int64_t> maxStock;
        std::optional<std::int64_t> minPrice;
        std::optional<double> elasticity;
        std::optional<std::string> currencySymbol;
    };

    CatalogService(model::BankState& state,
                   repository::BankRepository& repository,
                   repository::AuditLog& audit);

    Result setItemPrice(const std::string& item, std::int64_t basePrice);
    Result removeItem(const std::string& item);
    Result updatePriceConfig(const PriceConfigUpdate& update);
    Result configureVault(const std::string& containerName);

    const model::Catalog& catalog() const noexcept { return state_.catalog; }
    const std::string& vaultContainer() const noexcept { return state_.vaultContainer; }

private:
    void commit(const std::string& event, const std::string& message);

    model::BankState& state_;
    repository::BankRepository& repository_;
    repository::AuditLog& audit_;
};

} // namespace vaulttrade::service
