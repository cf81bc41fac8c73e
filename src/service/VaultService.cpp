#include "vaulttrade/service/VaultService.hpp"
#include "vaulttrade/util/Logging.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace vaulttrade::service {
namespace {

VaultService::Result failure(util::ErrorClass errorClass, std::string message) {
    VaultService::Result result;
    result.errorClass = errorClass;
    result.message = std::move(message);
    return result;
}

} // namespace

VaultService::VaultService(const model::BankState& state,
                           LedgerService& ledger,
                           const inventory::InventoryMover& mover,
                           const PricingEngine& pricing,
                           repository::AuditLog& audit)
    : state_(state)
    , ledger_(ledger)
    , mover_(mover)
    , pricing_(pricing)
    , audit_(audit) {}

inventory::StockSnapshot VaultService::vaultSnapshot() const {
    return mover_.scan(state_.vaultContainer).value_or(inventory::StockSnapshot{});
}

std::vector<PriceQuote> VaultService::getPrices() const {
    const auto stock = vaultSnapshot();
    std::vector<PriceQuote> out;
    for (const auto& [name, record] : state_.catalog.items) {
        auto it = stock.find(name);
        const std::int64_t count = it == stock.end() ? 0 : it->second;
        if (auto price = pricing_.price(name, count)) {
            out.push_back(PriceQuote{name, *price, count, record.basePrice});
        }
    }
    return out;
}

std::vector<VaultStockLine> VaultService::getVaultStock() const {
    std::vector<VaultStockLine> out;
    for (const auto& [name, count] : vaultSnapshot()) {
        if (auto price = pricing_.price(name, count)) {
            out.push_back(VaultStockLine{name, count, *price});
        }
    }
    return out;
}

VaultService::Result VaultService::deposit(const std::string& user, const std::string& chestName) {
    auto account = ledger_.findAccount(user);
    if (!account || !account->approved) {
        return failure(util::ErrorClass::authorization, "No account/Not approved");
    }
    if (state_.vaultContainer.empty()) {
        return failure(util::ErrorClass::validation, "Vault not configured");
    }
    auto* source = mover_.registry().find(chestName);
    if (!source) {
        return failure(util::ErrorClass::validation, "Client chest missing");
    }
    auto* vault = mover_.registry().find(state_.vaultContainer);
    if (!vault) {
        return failure(util::ErrorClass::validation, "Vault missing");
    }
    if (source == vault) {
        return failure(util::ErrorClass::validation, "Client chest is the vault");
    }

    auto stock = inventory::InventoryMover::scan(*vault);
    std::int64_t moved = 0;
    std::int64_t total = 0;
    for (const auto& [slot, stack] : source->list()) {
        if (stack.count <= 0 || state_.catalog.items.count(stack.item) == 0) {
            continue;
        }
        auto& current = stock[stack.item];
        const auto unitPrice = pricing_.price(stack.item, current).value_or(state_.catalog.price.minPrice);
        auto wanted = stack.count;
        if (unitPrice > 0) {
            // Units whose value would not fit in the deposit total stay in the chest.
            wanted = std::min(wanted, (std::numeric_limits<std::int64_t>::max() - total) / unitPrice);
            if (wanted <= 0) {
                continue;
            }
        }
        const auto pushed = mover_.moveSlot(*source, *vault, slot, wanted);
        if (pushed > 0) {
            moved += pushed;
            total += pushed * unitPrice;
            current += pushed;
        }
    }

    if (moved == 0) {
        return failure(util::ErrorClass::insufficientResource, "No priced items or nothing moved");
    }

    Result result;
    result.moved = moved;
    result.amount = total;
    if (total > 0) {
        auto credited = ledger_.credit(account->identity, total,
                                       "deposit of " + std::to_string(moved) + " items from " + chestName);
        if (!credited.ok()) {
            // Goods are already in the vault; the operator has to settle this by hand.
            util::log(util::LogLevel::error, "Deposit by " + account->identity + " moved " + std::to_string(moved) +
                                                 " items but the credit failed: " + credited.message);
            audit_.append("vault.unrecovered", account->identity + " deposited " + std::to_string(moved) +
                                                   " items from " + chestName + " uncredited " +
                                                   std::to_string(total) + ": " + credited.message);
            result.errorClass = util::ErrorClass::unrecoveredInconsistency;
            result.message = "Deposit credit failed: " + credited.message;
            return result;
        }
    }

    result.success = true;
    result.message = "Deposited " + std::to_string(moved) + " items worth " +
                     model::formatAmount(total, state_.catalog.price);
    return result;
}

VaultService::Result VaultService::withdraw(const std::string& user,
                                            const std::string& chestName,
                                            const std::string& item,
                                            std::int64_t count) {
    if (user.empty() || chestName.empty() || item.empty() || count <= 0) {
        return failure(util::ErrorClass::validation, "Invalid request");
    }
    auto account = ledger_.findAccount(user);
    if (!account || !account->approved) {
        return failure(util::ErrorClass::authorization, "No account/Not approved");
    }
    auto* vault = mover_.registry().find(state_.vaultContainer);
    if (!vault) {
        return failure(util::ErrorClass::validation, "Vault missing");
    }
    auto* destination = mover_.registry().find(chestName);
    if (!destination) {
        return failure(util::ErrorClass::validation, "Client chest missing");
    }
    if (destination == vault) {
        return failure(util::ErrorClass::validation, "Client chest is the vault");
    }

    const auto stock = inventory::InventoryMover::scan(*vault);
    auto it = stock.find(item);
    const std::int64_t available = it == stock.end() ? 0 : it->second;
    if (available < count) {
        return failure(util::ErrorClass::insufficientResource, "Not enough stock");
    }
    auto unitPrice = pricing_.price(item, available);
    if (!unitPrice) {
        return failure(util::ErrorClass::validation, "Item not priced");
    }
    if (*unitPrice > 0 && count > std::numeric_limits<std::int64_t>::max() / *unitPrice) {
        return failure(util::ErrorClass::validation, "Withdrawal too large");
    }
    if (account->balance < *unitPrice * count) {
        return failure(util::ErrorClass::insufficientResource, "Insufficient funds");
    }

    const auto moved = mover_.move(*vault, *destination, item, count);
    if (moved == 0) {
        return failure(util::ErrorClass::insufficientResource, "Withdraw failed (nothing moved)");
    }
    if (moved < count) {
        util::log(util::LogLevel::warn, "Partial withdraw for " + account->identity + ": " +
                                            std::to_string(moved) + "/" + std::to_string(count) + " " + item);
    }

    Result result;
    result.moved = moved;
    result.amount = moved * *unitPrice;
    if (result.amount > 0) {
        auto debited = ledger_.debit(account->identity, result.amount,
                                     "withdrew " + std::to_string(moved) + "x " + item);
        if (!debited.ok()) {
            util::log(util::LogLevel::error, "Withdraw by " + account->identity + " delivered " +
                                                 std::to_string(moved) + "x " + item +
                                                 " but the debit failed: " + debited.message);
            audit_.append("vault.unrecovered", account->identity + " withdrew " + std::to_string(moved) + "x " +
                                                   item + " to " + chestName + " undebited " +
                                                   std::to_string(result.amount) + ": " + debited.message);
            result.errorClass = util::ErrorClass::unrecoveredInconsistency;
            result.message = "Withdraw debit failed: " + debited.message;
            return result;
        }
    }

    result.success = true;
    result.message = "Withdrew " + std::to_string(moved) + " x " + item + " for " +
                     model::formatAmount(result.amount, state_.catalog.price);
    return result;
}

} // namespace vaulttrade::service
