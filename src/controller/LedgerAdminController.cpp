#include "vaulttrade/controller/LedgerAdminController.hpp"
#include "vaulttrade/controller/ControllerSupport.hpp"
#include "vaulttrade/rpc/Fields.hpp"
#include "vaulttrade/util/JsonUtil.hpp"

#include <utility>

namespace vaulttrade::controller {
namespace {

boost::json::object priceConfigJson(const model::PriceConfig& config) {
    return boost::json::object{{"maxStock", config.maxStock},
                               {"minPrice", config.minPrice},
                               {"elasticity", config.elasticity},
                               {"currencySymbol", config.currencySymbol}};
}

} // namespace

LedgerAdminController::LedgerAdminController(service::LedgerService& ledger,
                                             service::CatalogService& catalog,
                                             service::VaultService& vault,
                                             repository::AuditLog& audit,
                                             std::string adminToken)
    : ledger_(ledger)
    , catalog_(catalog)
    , vault_(vault)
    , audit_(audit)
    , adminToken_(std::move(adminToken)) {}

void LedgerAdminController::registerRoutes(server::Router& router) {
    addGuardedRoute(router, "POST", "/admin/ledger/accounts", &LedgerAdminController::handleCreateAccount);
    addGuardedRoute(router, "GET", "/admin/ledger/accounts", &LedgerAdminController::handleListAccounts);
    addGuardedRoute(router, "POST", "/admin/ledger/accounts/:user/approve", &LedgerAdminController::handleApprove);
    addGuardedRoute(router, "POST", "/admin/ledger/accounts/:user/adjust", &LedgerAdminController::handleAdjust);
    addGuardedRoute(router, "GET", "/admin/ledger/items", &LedgerAdminController::handleListItems);
    addGuardedRoute(router, "PUT", "/admin/ledger/items", &LedgerAdminController::handleSetItem);
    addGuardedRoute(router, "DELETE", "/admin/ledger/items/:item", &LedgerAdminController::handleRemoveItem);
    addGuardedRoute(router, "GET", "/admin/ledger/price-config", &LedgerAdminController::handleGetPriceConfig);
    addGuardedRoute(router, "PUT", "/admin/ledger/price-config", &LedgerAdminController::handleUpdatePriceConfig);
    addGuardedRoute(router, "PUT", "/admin/ledger/vault", &LedgerAdminController::handleConfigureVault);
    addGuardedRoute(router, "GET", "/admin/ledger/vault/stock", &LedgerAdminController::handleVaultStock);
    addGuardedRoute(router, "GET", "/admin/ledger/logs", &LedgerAdminController::handleLogs);
}

void LedgerAdminController::addGuardedRoute(server::Router& router,
                                            const char* method,
                                            const char* path,
                                            Handler handler) {
    router.addRoute(method, path, [this, handler](server::RequestContext& ctx) {
        if (!checkAdminToken(ctx, adminToken_)) {
            return;
        }
        (this->*handler)(ctx);
    });
}

void LedgerAdminController::handleCreateAccount(server::RequestContext& ctx) {
    auto body = parseBodyObject(ctx);
    auto user = rpc::requireString(body, "user");
    auto pin = rpc::requireString(body, "pin");
    auto result = ledger_.registerAccount(user, pin);
    sendOutcome(ctx, result.ok(), result.errorClass(), result.message);
}

void LedgerAdminController::handleListAccounts(server::RequestContext& ctx) {
    boost::json::array accounts;
    for (const auto& account : ledger_.listAccounts()) {
        accounts.push_back(boost::json::object{{"user", account.identity},
                                               {"approved", account.approved},
                                               {"balance", account.balance}});
    }
    sendJsonResponse(ctx, boost::beast::http::status::ok,
                     boost::json::object{{"accounts", std::move(accounts)}, {"total", ledger_.totalBalance()}});
}

void LedgerAdminController::handleApprove(server::RequestContext& ctx) {
    auto result = ledger_.approve(pathParameter(ctx, "user"));
    sendOutcome(ctx, result.ok(), result.errorClass(), result.message);
}

void LedgerAdminController::handleAdjust(server::RequestContext& ctx) {
    auto body = parseBodyObject(ctx);
    auto delta = rpc::requireInt64(body, "delta");
    auto result = ledger_.adjust(pathParameter(ctx, "user"), delta);
    if (!result.ok()) {
        sendError(ctx, result.errorClass(), result.message);
        return;
    }
    sendJsonResponse(ctx, boost::beast::http::status::ok,
                     boost::json::object{{"message", result.message}, {"balance", result.balance.value_or(0)}});
}

void LedgerAdminController::handleListItems(server::RequestContext& ctx) {
    boost::json::object quotes;
    for (const auto& quote : vault_.getPrices()) {
        quotes[quote.item] = boost::json::object{{"price", quote.price}, {"stock", quote.stock}};
    }
    boost::json::array items;
    for (const auto& [name, record] : catalog_.catalog().items) {
        boost::json::object entry{{"item", name}, {"basePrice", record.basePrice}};
        if (auto it = quotes.find(name); it != quotes.end()) {
            entry["price"] = it->value().as_object().at("price");
            entry["stock"] = it->value().as_object().at("stock");
        }
        items.push_back(std::move(entry));
    }
    sendJsonResponse(ctx, boost::beast::http::status::ok, boost::json::object{{"items", std::move(items)}});
}

void LedgerAdminController::handleSetItem(server::RequestContext& ctx) {
    auto body = parseBodyObject(ctx);
    auto item = rpc::requireString(body, "item");
    auto basePrice = rpc::requireInt64(body, "basePrice");
    auto result = catalog_.setItemPrice(item, basePrice);
    sendOutcome(ctx, result.success, result.errorClass, result.message);
}

void LedgerAdminController::handleRemoveItem(server::RequestContext& ctx) {
    auto result = catalog_.removeItem(pathParameter(ctx, "item"));
    sendOutcome(ctx, result.success, result.errorClass, result.message);
}

void LedgerAdminController::handleGetPriceConfig(server::RequestContext& ctx) {
    sendJsonResponse(ctx, boost::beast::http::status::ok, priceConfigJson(catalog_.catalog().price));
}

void LedgerAdminController::handleUpdatePriceConfig(server::RequestContext& ctx) {
    auto body = parseBodyObject(ctx);
    service::CatalogService::PriceConfigUpdate update;
    if (body.contains("maxStock")) {
        update.maxStock = rpc::requireInt64(body, "maxStock");
    }
    if (body.contains("minPrice")) {
        update.minPrice = rpc::requireInt64(body, "minPrice");
    }
    if (body.contains("elasticity")) {
        update.elasticity = util::getDouble(body, "elasticity");
        if (!update.elasticity) {
            throw util::ValidationError("Field elasticity must be a number");
        }
    }
    if (body.contains("currencySymbol")) {
        update.currencySymbol = rpc::requireString(body, "currencySymbol");
    }

    auto result = catalog_.updatePriceConfig(update);
    if (!result.success) {
        sendError(ctx, result.errorClass, result.message);
        return;
    }
    sendJsonResponse(ctx, boost::beast::http::status::ok, priceConfigJson(catalog_.catalog().price));
}

void LedgerAdminController::handleConfigureVault(server::RequestContext& ctx) {
    auto body = parseBodyObject(ctx);
    auto result = catalog_.configureVault(rpc::requireString(body, "container"));
    sendOutcome(ctx, result.success, result.errorClass, result.message);
}

void LedgerAdminController::handleVaultStock(server::RequestContext& ctx) {
    boost::json::object stock;
    for (const auto& [item, count] : vault_.vaultSnapshot()) {
        stock[item] = count;
    }
    boost::json::object priced;
    for (const auto& line : vault_.getVaultStock()) {
        priced[line.item] = boost::json::object{{"count", line.count}, {"price", line.price}};
    }
    sendJsonResponse(ctx, boost::beast::http::status::ok,
                     boost::json::object{{"container", catalog_.vaultContainer()},
                                         {"contents", std::move(stock)},
                                         {"priced", std::move(priced)}});
}

void LedgerAdminController::handleLogs(server::RequestContext& ctx) {
    auto limit = queryLimit(ctx, 100, repository::AuditLog::kRecentCapacity);
    sendJsonResponse(ctx, boost::beast::http::status::ok,
                     boost::json::object{{"entries", auditEntriesJson(audit_.recent(limit))}});
}

} // namespace vaulttrade::controller
