#include "vaulttrade/workflow/SettlementWorkflow.hpp"
#include "vaulttrade/model/Catalog.hpp"
#include "vaulttrade/util/JsonUtil.hpp"
#include "vaulttrade/util/Logging.hpp"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>
#include <utility>

namespace vaulttrade::workflow {
namespace {

std::string currency(std::int64_t amount) {
    return model::formatAmount(amount, model::PriceConfig{});
}

void fail(SettlementResult& result, SettlementState state, util::ErrorClass errorClass, std::string message) {
    result.state = state;
    result.errorClass = errorClass;
    result.message = std::move(message);
}

} // namespace

std::string_view toString(SettlementState state) noexcept {
    switch (state) {
    case SettlementState::quoted:
        return "quoted";
    case SettlementState::delivering:
        return "delivering";
    case SettlementState::charging:
        return "charging";
    case SettlementState::settled:
        return "settled";
    case SettlementState::deliveryFailed:
        return "deliveryFailed";
    case SettlementState::chargeFailedCompensating:
        return "chargeFailedCompensating";
    case SettlementState::chargeFailedUnrecovered:
        return "chargeFailedUnrecovered";
    case SettlementState::reverted:
        return "reverted";
    }
    return "unknown";
}

SettlementWorkflow::SettlementWorkflow(service::ListingService& listings,
                                       service::LedgerClient& ledger,
                                       repository::AuditLog& audit,
                                       const service::PricingEngine* pricing,
                                       int chargeRetries)
    : listings_(listings)
    , ledger_(ledger)
    , audit_(audit)
    , pricing_(pricing)
    , chargeRetries_(std::max(0, chargeRetries)) {}

SettlementResult SettlementWorkflow::purchase(const PurchaseRequest& request) {
    SettlementResult result;

    if (request.listingId <= 0 || request.count <= 0) {
        fail(result, SettlementState::quoted, util::ErrorClass::validation, "Bad purchase params");
        return result;
    }
    if (!listings_.vaultContainer().empty() && request.destination == listings_.vaultContainer()) {
        fail(result, SettlementState::quoted, util::ErrorClass::validation, "Cannot deliver into the vault");
        return result;
    }
    auto listing = listings_.find(request.listingId);
    if (!listing) {
        fail(result, SettlementState::quoted, util::ErrorClass::validation, "Not available");
        return result;
    }
    if (listing->quantity <= 0) {
        fail(result, SettlementState::quoted, util::ErrorClass::insufficientResource, "Not available");
        return result;
    }
    result.unitPrice = listing->unitPrice;

    // Availability is re-derived from the vault itself, never from the listing.
    auto have = listings_.vaultCount(listing->item);
    if (!have) {
        fail(result, SettlementState::quoted, util::ErrorClass::validation, "Vault not configured");
        return result;
    }
    result.marketPrice = marketPrice(listing->item, *have);
    if (*have <= 0) {
        fail(result, SettlementState::deliveryFailed, util::ErrorClass::insufficientResource, "Out of stock");
        return result;
    }

    const auto take = std::min({request.count, listing->quantity, *have});
    if (take > std::numeric_limits<std::int64_t>::max() / listing->unitPrice) {
        fail(result, SettlementState::quoted, util::ErrorClass::validation, "Purchase too large");
        return result;
    }

    result.state = SettlementState::delivering;
    auto delivery = listings_.mover().move(listings_.vaultContainer(), request.destination, listing->item, take);
    if (delivery.moved <= 0) {
        fail(result, SettlementState::deliveryFailed, util::ErrorClass::insufficientResource,
             delivery.error ? "Delivery failed: " + *delivery.error : std::string{"Delivery failed"});
        return result;
    }
    result.moved = delivery.moved;
    result.total = result.moved * listing->unitPrice;

    result.state = SettlementState::charging;
    result.transactionId = nextTransactionId(listing->id);
    auto reply = charge(request, listing->seller, result);

    if (reply.ok) {
        result.state = SettlementState::settled;
        result.message = "Purchased " + std::to_string(result.moved) + " for " + currency(result.total);
        listings_.decrement(listing->id, result.moved, "listing.purchased",
                            "Purchase: " + request.buyer + " bought " + std::to_string(result.moved) + " of " +
                                listing->item + " from " + listing->seller + " for " + currency(result.total) +
                                " (listing #" + std::to_string(listing->id) + ") [" + result.transactionId + "]");
        return result;
    }

    compensate(request, *listing, reply, result);
    return result;
}

std::optional<std::int64_t> SettlementWorkflow::marketPrice(const std::string& item, std::int64_t vaultStock) {
    if (pricing_) {
        return pricing_->price(item, vaultStock);
    }
    auto reply = ledger_.getPrices();
    if (!reply.ok) {
        util::log(util::LogLevel::debug, "No market quote for " + item + ": " + reply.error);
        return std::nullopt;
    }
    const auto* prices = reply.body.if_contains("prices");
    if (!prices || !prices->is_object()) {
        return std::nullopt;
    }
    const auto* quote = prices->as_object().if_contains(item);
    if (!quote || !quote->is_object()) {
        return std::nullopt;
    }
    return util::getInt64(quote->as_object(), "price");
}

rpc::Reply SettlementWorkflow::charge(const PurchaseRequest& request,
                                      const std::string& seller,
                                      SettlementResult& result) {
    rpc::Reply reply;
    for (int attempt = 0; attempt <= chargeRetries_; ++attempt) {
        ++result.chargeAttempts;
        try {
            reply = ledger_.transfer(request.buyer, seller, result.total, result.transactionId);
        } catch (const util::StorageError&) {
            throw;
        } catch (const std::exception& ex) {
            // The transfer may or may not have been applied.
            util::log(util::LogLevel::error, "Charge " + result.transactionId + " threw: " + ex.what());
            reply = rpc::Reply::timeout();
        }
        if (!reply.timedOut()) {
            break;
        }
        util::log(util::LogLevel::warn, "Charge " + result.transactionId + " timed out (attempt " +
                                            std::to_string(result.chargeAttempts) + ")");
    }
    return reply;
}

void SettlementWorkflow::compensate(const PurchaseRequest& request,
                                    const model::Listing& listing,
                                    const rpc::Reply& failure,
                                    SettlementResult& result) {
    result.state = SettlementState::chargeFailedCompensating;
    util::log(util::LogLevel::warn, "Charge " + result.transactionId + " failed (" + failure.error +
                                        "); moving " + std::to_string(result.moved) + "x " + listing.item +
                                        " back from " + request.destination);

    auto reversal = listings_.mover().move(request.destination, listings_.vaultContainer(), listing.item, result.moved);
    result.recovered = reversal.moved;
    const auto unrecovered = result.moved - result.recovered;

    if (unrecovered <= 0) {
        result.state = SettlementState::reverted;
        result.errorClass = failure.errorClass;
        result.message = "Bank transfer failed: " + failure.error;
        if (failure.timedOut()) {
            audit_.append("settlement.ambiguous",
                          "Charge " + result.transactionId + " of " + currency(result.total) + " from " +
                              request.buyer + " to " + listing.seller +
                              " timed out; goods returned to vault, check ledger journal");
        } else {
            audit_.append("settlement.reverted", "Purchase by " + request.buyer + " on listing #" +
                                                     std::to_string(listing.id) + " reverted: " + failure.error);
        }
        return;
    }

    result.state = SettlementState::chargeFailedUnrecovered;
    result.errorClass = util::ErrorClass::unrecoveredInconsistency;
    result.message = "Bank transfer failed: " + failure.error + "; " + std::to_string(unrecovered) +
                     " items could not be recovered";

    std::ostringstream record;
    record << "UNRECOVERED buyer=" << request.buyer << " seller=" << listing.seller << " item=" << listing.item
           << " delivered=" << result.moved << " recovered=" << result.recovered
           << " amount=" << currency(result.total) << " txn=" << result.transactionId
           << " listing=#" << listing.id << " cause=" << failure.error;
    util::log(util::LogLevel::error, record.str());
    // Those units have left the vault for good; the listing must not keep claiming them.
    listings_.decrement(listing.id, unrecovered, "settlement.unrecovered", record.str());
}

std::string SettlementWorkflow::nextTransactionId(std::int64_t listingId) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<std::uint32_t> dist;
    std::ostringstream oss;
    oss << listingId << '-' << ++counter_ << '-' << std::hex << std::setw(8) << std::setfill('0') << dist(rng);
    return oss.str();
}

} // namespace vaulttrade::workflow
