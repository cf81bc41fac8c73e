#include "vaulttrade/controller/TradeAdminController.hpp"
#include "vaulttrade/controller/ControllerSupport.hpp"
#include "vaulttrade/rpc/Fields.hpp"

#include <utility>

namespace vaulttrade::controller {

TradeAdminController::TradeAdminController(service::ListingService& listings,
                                           repository::AuditLog& audit,
                                           std::string adminToken)
    : listings_(listings)
    , audit_(audit)
    , adminToken_(std::move(adminToken)) {}

void TradeAdminController::registerRoutes(server::Router& router) {
    router.addRoute("GET", "/admin/trade/listings", [this](auto& ctx) {
        if (checkAdminToken(ctx, adminToken_)) {
            handleListings(ctx);
        }
    });
    router.addRoute("PUT", "/admin/trade/vault", [this](auto& ctx) {
        if (checkAdminToken(ctx, adminToken_)) {
            handleConfigureVault(ctx);
        }
    });
    router.addRoute("GET", "/admin/trade/logs", [this](auto& ctx) {
        if (checkAdminToken(ctx, adminToken_)) {
            handleLogs(ctx);
        }
    });
}

void TradeAdminController::handleListings(server::RequestContext& ctx) {
    boost::json::array listings;
    for (const auto& listing : listings_.list()) {
        boost::json::object entry{{"id", listing.id},
                                  {"seller", listing.seller},
                                  {"item", listing.item},
                                  {"price", listing.unitPrice},
                                  {"qty", listing.quantity}};
        // Physical vault count next to the advertised quantity, for reconciliation.
        if (auto inVault = listings_.vaultCount(listing.item)) {
            entry["inVault"] = *inVault;
        }
        listings.push_back(std::move(entry));
    }
    sendJsonResponse(ctx, boost::beast::http::status::ok,
                     boost::json::object{{"vault", listings_.vaultContainer()}, {"listings", std::move(listings)}});
}

void TradeAdminController::handleConfigureVault(server::RequestContext& ctx) {
    auto body = parseBodyObject(ctx);
    auto result = listings_.configureVault(rpc::requireString(body, "container"));
    sendOutcome(ctx, result.success, result.errorClass, result.message);
}

void TradeAdminController::handleLogs(server::RequestContext& ctx) {
    auto limit = queryLimit(ctx, 100, repository::AuditLog::kRecentCapacity);
    sendJsonResponse(ctx, boost::beast::http::status::ok,
                     boost::json::object{{"entries", auditEntriesJson(audit_.recent(limit))}});
}

} // namespace vaulttrade::controller
