#pragma once

#include "vaulttrade/repository/AuditLog.hpp"
#include "vaulttrade/server/Router.hpp"
#include "vaulttrade/service/CatalogService.hpp"
#include "vaulttrade/service/LedgerService.hpp"
#include "vaulttrade/service/VaultService.hpp"

#include <string>

namespace vaulttrade::controller {

// Operator console for the bank: accounts, catalog, vault and the audit log.
class LedgerAdminController {
public:
    LedgerAdminController(service::LedgerService& ledger,
                          service::CatalogService& catalog,
                          service::VaultService& vault,
                          repository::AuditLog& audit,
                          std::string adminToken);

    void registerRoutes(server::Router& router);

private:
    using Handler = void (LedgerAdminController::*)(server::RequestContext&);

    void addGuardedRoute(server::Router& router, const char* method, const char* path, Handler handler);

    void handleCreateAccount(server::RequestContext& ctx);
    void handleListAccounts(server::RequestContext& ctx);
    void handleApprove(server::RequestContext& ctx);
    void handleAdjust(server::RequestContext& ctx);
    void handleListItems(server::RequestContext& ctx);
    void handleSetItem(server::RequestContext& ctx);
    void handleRemoveItem(server::RequestContext& ctx);
    void handleGetPriceConfig(server::RequestContext& ctx);
    void handleUpdatePriceConfig(server::RequestContext& ctx);
    void handleConfigureVault(server::RequestContext& ctx);
    void handleVaultStock(server::RequestContext& ctx);
    void handleLogs(server::RequestContext& ctx);

    service::LedgerService& ledger_;
    service::CatalogService& catalog_;
    service::VaultService& vault_;
    repository::AuditLog& audit_;
    std::string adminToken_;
};

} // namespace vaulttrade::controller
