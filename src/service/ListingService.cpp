#include "vaulttrade/service/ListingService.hpp"
#include "vaulttrade/util/Logging.hpp"

#include <algorithm>
#include <utility>

namespace vaulttrade::service {
namespace {

ListingService::Result failure(util::ErrorClass errorClass, std::string message) {
    ListingService::Result result;
    result.errorClass = errorClass;
    result.message = std::move(message);
    return result;
}

} // namespace

ListingService::ListingService(model::TradeState& state,
                               repository::TradeRepository& repository,
                               repository::AuditLog& audit,
                               const inventory::InventoryMover& mover)
    : state_(state)
    , repository_(repository)
    , audit_(audit)
    , mover_(mover) {}

ListingService::Result ListingService::create(const std::string& seller,
                                              const std::string& item,
                                              std::int64_t unitPrice) {
    if (item.empty()) {
        return failure(util::ErrorClass::validation, "Item id required");
    }
    if (unitPrice <= 0) {
        return failure(util::ErrorClass::validation, "Price > 0 required");
    }

    model::Listing listing;
    listing.id = state_.nextListingId++;
    listing.seller = seller;
    listing.item = item;
    listing.unitPrice = unitPrice;
    state_.listings.push_back(listing);
    commit("listing.created", "Listing #" + std::to_string(listing.id) + " created by " + seller + ": " + item +
                                  " @ " + std::to_string(unitPrice));

    Result result;
    result.success = true;
    result.listingId = listing.id;
    result.message = "Created listing #" + std::to_string(listing.id);
    return result;
}

ListingService::Result ListingService::addStock(std::int64_t listingId,
                                                const std::string& seller,
                                                const std::string& item,
                                                std::int64_t count,
                                                const std::string& sourceContainer) {
    if (listingId <= 0 || count <= 0) {
        return failure(util::ErrorClass::validation, "Bad stock params");
    }
    auto* listing = lookup(listingId);
    if (!listing) {
        return failure(util::ErrorClass::validation, "Listing not found");
    }
    if (listing->seller != seller) {
        util::log(util::LogLevel::warn, seller + " tried to stock listing #" + std::to_string(listingId) +
                                            " owned by " + listing->seller);
        return failure(util::ErrorClass::authorization, "Not your listing");
    }
    if (listing->item != item) {
        return failure(util::ErrorClass::validation, "Item mismatch");
    }
    if (state_.vaultContainer.empty()) {
        return failure(util::ErrorClass::validation, "Vault not configured");
    }
    if (sourceContainer == state_.vaultContainer) {
        return failure(util::ErrorClass::validation, "Cannot stock from the vault itself");
    }

    auto report = mover_.move(sourceContainer, state_.vaultContainer, listing->item, count);
    if (report.moved <= 0) {
        return failure(util::ErrorClass::insufficientResource, report.error.value_or("No items moved"));
    }

    listing->quantity += report.moved;
    const auto quantity = listing->quantity;
    commit("listing.stocked", "Stock +" + std::to_string(report.moved) + " to listing #" +
                                  std::to_string(listingId) + " by " + seller + " (" + item + ")");

    Result result;
    result.success = true;
    result.listingId = listingId;
    result.moved = report.moved;
    result.message = "Deposited " + std::to_string(report.moved) + " (new qty " + std::to_string(quantity) + ")";
    return result;
}

void ListingService::decrement(std::int64_t listingId,
                               std::int64_t units,
                               const std::string& event,
                               const std::string& message) {
    auto* listing = lookup(listingId);
    if (!listing) {
        util::log(util::LogLevel::error, "Listing #" + std::to_string(listingId) + " vanished before " + event);
        audit_.append(event, message);
        return;
    }
    listing->quantity = std::max<std::int64_t>(0, listing->quantity - std::max<std::int64_t>(0, units));
    commit(event, message);
}

ListingService::Result ListingService::configureVault(const std::string& containerName) {
    if (containerName.empty()) {
        return failure(util::ErrorClass::validation, "Container name required");
    }
    state_.vaultContainer = containerName;
    commit("vault.configured", "Trade vault set to " + containerName);

    Result result;
    result.success = true;
    result.message = "Vault set to " + containerName;
    return result;
}

std::optional<model::Listing> ListingService::find(std::int64_t listingId) const {
    auto it = std::find_if(state_.listings.begin(), state_.listings.end(),
                           [listingId](const model::Listing& listing) { return listing.id == listingId; });
    if (it == state_.listings.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<std::int64_t> ListingService::vaultCount(const std::string& item) const {
    auto stock = mover_.scan(state_.vaultContainer);
    if (!stock) {
        return std::nullopt;
    }
    auto it = stock->find(item);
    return it == stock->end() ? 0 : it->second;
}

model::Listing* ListingService::lookup(std::int64_t listingId) {
    auto it = std::find_if(state_.listings.begin(), state_.listings.end(),
                           [listingId](const model::Listing& listing) { return listing.id == listingId; });
    return it == state_.listings.end() ? nullptr : &*it;
}

void ListingService::commit(const std::string& event, const std::string& message) {
    repository_.save(state_);
    audit_.append(event, message);
}

} // namespace vaulttrade::service
