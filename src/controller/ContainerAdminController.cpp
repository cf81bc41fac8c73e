#include "vaulttrade/controller/ContainerAdminController.hpp"
#include "vaulttrade/controller/ControllerSupport.hpp"
#include "vaulttrade/inventory/SlotContainer.hpp"
#include "vaulttrade/rpc/Fields.hpp"
#include "vaulttrade/util/Logging.hpp"

#include <utility>

namespace vaulttrade::controller {

ContainerAdminController::ContainerAdminController(inventory::ContainerRegistry& registry, std::string adminToken)
    : registry_(registry)
    , adminToken_(std::move(adminToken)) {}

void ContainerAdminController::registerRoutes(server::Router& router) {
    router.addRoute("GET", "/admin/containers", [this](auto& ctx) {
        if (checkAdminToken(ctx, adminToken_)) {
            handleList(ctx);
        }
    });
    router.addRoute("POST", "/admin/containers/:name/insert", [this](auto& ctx) {
        if (checkAdminToken(ctx, adminToken_)) {
            handleInsert(ctx);
        }
    });
    router.addRoute("POST", "/admin/containers/:name/remove", [this](auto& ctx) {
        if (checkAdminToken(ctx, adminToken_)) {
            handleRemove(ctx);
        }
    });
}

void ContainerAdminController::handleList(server::RequestContext& ctx) {
    boost::json::object containers;
    for (const auto& name : registry_.names()) {
        auto* container = registry_.find(name);
        boost::json::array slots;
        for (const auto& [slot, stack] : container->list()) {
            slots.push_back(boost::json::object{{"slot", slot}, {"item", stack.item}, {"count", stack.count}});
        }
        containers[name] = std::move(slots);
    }
    sendJsonResponse(ctx, boost::beast::http::status::ok, boost::json::object{{"containers", std::move(containers)}});
}

void ContainerAdminController::handleInsert(server::RequestContext& ctx) {
    const auto name = pathParameter(ctx, "name");
    auto* container = registry_.find(name);
    if (!container) {
        sendError(ctx, util::ErrorClass::validation, "Unknown container");
        return;
    }

    auto body = parseBodyObject(ctx);
    auto item = rpc::requireString(body, "item");
    auto count = rpc::requireInt64(body, "count");
    if (item.empty() || count <= 0) {
        sendError(ctx, util::ErrorClass::validation, "Item and positive count required");
        return;
    }

    const auto stored = container->receive(item, count);
    util::log(util::LogLevel::info, "Inserted " + std::to_string(stored) + "/" + std::to_string(count) + " " + item +
                                        " into " + name);
    sendJsonResponse(ctx, boost::beast::http::status::ok,
                     boost::json::object{{"container", name}, {"item", item}, {"stored", stored}});
}

void ContainerAdminController::handleRemove(server::RequestContext& ctx) {
    const auto name = pathParameter(ctx, "name");
    auto* container = dynamic_cast<inventory::SlotContainer*>(registry_.find(name));
    if (!container) {
        sendError(ctx, util::ErrorClass::validation, "Unknown container");
        return;
    }

    auto body = parseBodyObject(ctx);
    auto item = rpc::requireString(body, "item");
    auto count = rpc::requireInt64(body, "count");
    if (item.empty() || count <= 0) {
        sendError(ctx, util::ErrorClass::validation, "Item and positive count required");
        return;
    }

    const auto removed = container->take(item, count);
    util::log(util::LogLevel::info, "Removed " + std::to_string(removed) + "/" + std::to_string(count) + " " + item +
                                        " from " + name);
    sendJsonResponse(ctx, boost::beast::http::status::ok,
                     boost::json::object{{"container", name}, {"item", item}, {"removed", removed}});
}

} // namespace vaulttrade::controller
