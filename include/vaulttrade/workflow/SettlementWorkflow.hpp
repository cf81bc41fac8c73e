#pragma once

#include "vaulttrade/repository/AuditLog.hpp"
#include "vaulttrade/service/LedgerClient.hpp"
#include "vaulttrade/service/ListingService.hpp"
#include "vaulttrade/service/PricingEngine.hpp"
#include "vaulttrade/util/Errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vaulttrade::workflow {

enum class SettlementState {
    quoted,
    delivering,
    charging,
    settled,
    deliveryFailed,
    chargeFailedCompensating,
    chargeFailedUnrecovered,
    reverted,
};

std::string_view toString(SettlementState state) noexcept;

struct PurchaseRequest {
    std::string buyer;
    std::int64_t listingId{};
    std::int64_t count{};
    std::string destination;
};

struct SettlementResult {
    SettlementState state{SettlementState::quoted};
    util::ErrorClass errorClass{util::ErrorClass::none};
    std::string message;
    std::int64_t moved{};
    std::int64_t recovered{};
    std::int64_t total{};
    std::int64_t unitPrice{};
    std::optional<std::int64_t> marketPrice;
    std::string transactionId;
    int chargeAttempts{};

    [[nodiscard]] bool settled() const noexcept { return state == SettlementState::settled; }
};

// Move goods out of the vault, then charge the buyer. A failed or
// ambiguous charge is compensated by moving the goods back; whatever
// cannot be moved back is reported as unrecovered and written to the
// audit log for manual reconciliation.
class SettlementWorkflow {
public:
    SettlementWorkflow(service::ListingService& listings,
                       service::LedgerClient& ledger,
                       repository::AuditLog& audit,
                       const service::PricingEngine* pricing,
                       int chargeRetries = 1);

    SettlementResult purchase(const PurchaseRequest& request);

private:
    std::string nextTransactionId(std::int64_t listingId);
    // Without a local pricing engine the bank is asked for its live quote.
    std::optional<std::int64_t> marketPrice(const std::string& item, std::int64_t vaultStock);
    rpc::Reply charge(const PurchaseRequest& request,
                      const std::string& seller,
                      SettlementResult& result);
    void compensate(const PurchaseRequest& request,
                    const model::Listing& listing,
                    const rpc::Reply& failure,
                    SettlementResult& result);

    service::ListingService& listings_;
    service::LedgerClient& ledger_;
    repository::AuditLog& audit_;
    const service::PricingEngine* pricing_;
    int chargeRetries_;
    std::uint64_t counter_{0};
};

} // namespace vaulttrade::workflow
