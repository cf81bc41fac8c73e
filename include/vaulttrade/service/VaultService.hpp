#pragma once

#include "vaulttrade/inventory/InventoryMover.hpp"
#include "vaulttrade/model/State.hpp"
#include "vaulttrade/repository/AuditLog.hpp"
#include "vaulttrade/service/LedgerService.hpp"
#include "vaulttrade/service/PricingEngine.hpp"
#include "vaulttrade/util/Errors.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vaulttrade::service {

struct PriceQuote {
    std::string item;
    std::int64_t price{};
    std::int64_t stock{};
    std::int64_t base{};
};

struct VaultStockLine {
    std::string item;
    std::int64_t count{};
    std::int64_t price{};
};

// Bank vault operations: goods move between a client container and the bank
// vault, and the account is credited or debited for exactly what moved.
class VaultService {
public:
    struct Result {
        bool success{false};
        util::ErrorClass errorClass{util::ErrorClass::none};
        std::string message;
        std::int64_t moved{};
        std::int64_t amount{};
    };

    VaultService(const model::BankState& state,
                 LedgerService& ledger,
                 const inventory::InventoryMover& mover,
                 const PricingEngine& pricing,
                 repository::AuditLog& audit);

    // Every catalogued item that currently has a price, quoted at live stock.
    std::vector<PriceQuote> getPrices() const;
    // Every priced item physically in the vault.
    std::vector<VaultStockLine> getVaultStock() const;

    Result deposit(const std::string& user, const std::string& chestName);
    Result withdraw(const std::string& user,
                    const std::string& chestName,
                    const std::string& item,
                    std::int64_t count);

    inventory::StockSnapshot vaultSnapshot() const;

private:
    const model::BankState& state_;
    LedgerService& ledger_;
    const inventory::InventoryMover& mover_;
    const PricingEngine& pricing_;
    repository::AuditLog& audit_;
};

} // namespace vaulttrade::service
