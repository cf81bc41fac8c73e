#pragma once

#include "vaulttrade/repository/AuditLog.hpp"
#include "vaulttrade/server/Router.hpp"
#include "vaulttrade/service/ListingService.hpp"

#include <string>

namespace vaulttrade::controller {

class TradeAdminController {
public:
    TradeAdminController(service::ListingService& listings, repository::AuditLog& audit, std::string adminToken);

    void registerRoutes(server::Router& router);

private:
    void handleListings(server::RequestContext& ctx);
    void handleConfigureVault(server::RequestContext& ctx);
    void handleLogs(server::RequestContext& ctx);

    service::ListingService& listings_;
    repository::AuditLog& audit_;
    std::string adminToken_;
};

} // namespace vaulttrade::controller
