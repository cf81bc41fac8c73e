#pragma once

#include "vaulttrade/inventory/ContainerRegistry.hpp"
#include "vaulttrade/server/Router.hpp"

#include <string>

namespace vaulttrade::controller {

// Simulation surface: inspect the registered containers and put goods into
// or take them out of them, standing in for a player at a chest.
class ContainerAdminController {
public:
    ContainerAdminController(inventory::ContainerRegistry& registry, std::string adminToken);

    void registerRoutes(server::Router& router);

private:
    void handleList(server::RequestContext& ctx);
    void handleInsert(server::RequestContext& ctx);
    void handleRemove(server::RequestContext& ctx);

    inventory::ContainerRegistry& registry_;
    std::string adminToken_;
};

} // namespace vaulttrade::controller
