#pragma once

#include "vaulttrade/inventory/InventoryMover.hpp"
#include "vaulttrade/model/Listing.hpp"
#include "vaulttrade/model/State.hpp"
#include "vaulttrade/repository/AuditLog.hpp"
#include "vaulttrade/repository/StateRepository.hpp"
#include "vaulttrade/util/Errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vaulttrade::service {

// Seller-owned sell orders backed by the shared trade vault. A listing's
// quantity only grows by what the mover actually delivered into the vault.
class ListingService {
public:
    struct Result {
        bool success{false};
        util::ErrorClass errorClass{util::ErrorClass::none};
        std::string message;
        std::int64_t listingId{};
        std::int64_t moved{};
    };

    ListingService(model::TradeState& state,
                   repository::TradeRepository& repository,
                   repository::AuditLog& audit,
                   const inventory::InventoryMover& mover);

    Result create(const std::string& seller, const std::string& item, std::int64_t unitPrice);
    Result addStock(std::int64_t listingId,
                    const std::string& seller,
                    const std::string& item,
                    std::int64_t count,
                    const std::string& sourceContainer);

    // Lowers quantity by `units` (never below zero) and records `event`.
    void decrement(std::int64_t listingId, std::int64_t units, const std::string& event, const std::string& message);

    Result configureVault(const std::string& containerName);

    std::optional<model::Listing> find(std::int64_t listingId) const;
    const std::vector<model::Listing>& list() const noexcept { return state_.listings; }
    const std::string& vaultContainer() const noexcept { return state_.vaultContainer; }

    // Live physical count of `item` in the vault; nullopt when the vault is missing.
    std::optional<std::int64_t> vaultCount(const std::string& item) const;

    const inventory::InventoryMover& mover() const noexcept { return mover_; }

private:
    model::Listing* lookup(std::int64_t listingId);
    void commit(const std::string& event, const std::string& message);

    model::TradeState& state_;
    repository::TradeRepository& repository_;
    repository::AuditLog& audit_;
    const inventory::InventoryMover& mover_;
};

} // namespace vaulttrade::service
