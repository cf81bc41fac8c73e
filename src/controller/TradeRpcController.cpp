#include "vaulttrade/controller/TradeRpcController.hpp"
#include "vaulttrade/controller/ControllerSupport.hpp"
#include "vaulttrade/util/JsonUtil.hpp"
#include "vaulttrade/util/Logging.hpp"

#include <chrono>

namespace vaulttrade::controller {
namespace {

boost::json::object listingJson(const model::Listing& listing) {
    return boost::json::object{{"id", listing.id},
                               {"seller", listing.seller},
                               {"item", listing.item},
                               {"price", listing.unitPrice},
                               {"qty", listing.quantity}};
}

} // namespace

TradeRpcController::TradeRpcController(service::ListingService& listings,
                                       workflow::SettlementWorkflow& settlement,
                                       service::SessionService& sessions,
                                       service::LedgerClient& ledger,
                                       std::int64_t channel)
    : listings_(listings)
    , settlement_(settlement)
    , sessions_(sessions)
    , ledger_(ledger)
    , channel_(channel) {}

void TradeRpcController::registerRoutes(server::Router& router) {
    router.addRoute("POST", "/rpc/trade", [this](server::RequestContext& ctx) {
        boost::json::value message;
        try {
            message = util::parseJson(ctx.request.body());
        } catch (const std::exception&) {
            sendRpcReply(ctx, rpcError(channel_, util::ErrorClass::validation, "Bad message"));
            return;
        }
        sendRpcReply(ctx, dispatch(message));
    });
}

boost::json::object TradeRpcController::dispatch(const boost::json::value& message) {
    try {
        auto envelope = rpc::trade::decodeRequest(message);
        if (envelope.channel != channel_) {
            util::log(util::LogLevel::warn, "Trade message for channel " + std::to_string(envelope.channel) +
                                                " rejected on channel " + std::to_string(channel_));
            return rpcError(channel_, util::ErrorClass::validation, "Wrong channel");
        }
        return std::visit([this](const auto& request) { return handle(request); }, envelope.request);
    } catch (const util::ValidationError& ex) {
        return rpcError(channel_, util::ErrorClass::validation, ex.what());
    } catch (const util::StorageError&) {
        throw;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"Trade RPC failed: "} + ex.what());
        return rpcError(channel_, util::ErrorClass::internal, ex.what());
    }
}

boost::json::object TradeRpcController::handle(const rpc::trade::Login& request) {
    auto reply = ledger_.login(request.user, request.pin);
    if (!reply.ok) {
        return forward(reply);
    }
    auto session = sessions_.issue(request.user);
    const auto ttl = std::chrono::duration_cast<std::chrono::seconds>(session.expiresAt -
                                                                      std::chrono::system_clock::now());
    auto out = rpcOk(channel_);
    out["approved"] = true;
    out["token"] = session.token;
    out["expiresIn"] = ttl.count();
    return out;
}

boost::json::object TradeRpcController::handle(const rpc::trade::GetBalance& request) {
    if (auto denied = requireSession(request.session)) {
        return *denied;
    }
    auto reply = ledger_.getAccount(request.session.user);
    if (!reply.ok) {
        return forward(reply);
    }
    auto out = rpcOk(channel_);
    out["balance"] = util::getInt64(reply.body, "balance").value_or(0);
    return out;
}

boost::json::object TradeRpcController::handle(const rpc::trade::GetListings&) {
    boost::json::array data;
    for (const auto& listing : listings_.list()) {
        data.push_back(listingJson(listing));
    }
    auto out = rpcOk(channel_);
    out["data"] = std::move(data);
    return out;
}

boost::json::object TradeRpcController::handle(const rpc::trade::CreateListing& request) {
    if (auto denied = requireSession(request.session)) {
        return *denied;
    }
    auto result = listings_.create(request.session.user, request.item, request.price);
    if (!result.success) {
        return rpcError(channel_, result.errorClass, result.message);
    }
    auto out = rpcOk(channel_);
    out["id"] = result.listingId;
    out["message"] = result.message;
    return out;
}

boost::json::object TradeRpcController::handle(const rpc::trade::AddStock& request) {
    if (auto denied = requireSession(request.session)) {
        return *denied;
    }
    auto result = listings_.addStock(request.listingId, request.session.user, request.item, request.count,
                                     request.chestName);
    if (!result.success) {
        return rpcError(channel_, result.errorClass, result.message);
    }
    auto out = rpcOk(channel_);
    out["moved"] = result.moved;
    out["message"] = result.message;
    return out;
}

boost::json::object TradeRpcController::handle(const rpc::trade::Buy& request) {
    if (auto denied = requireSession(request.session)) {
        return *denied;
    }
    workflow::PurchaseRequest purchase{request.session.user, request.listingId, request.count, request.chestName};
    auto result = settlement_.purchase(purchase);

    auto out = result.settled() ? rpcOk(channel_) : rpcError(channel_, result.errorClass, result.message);
    if (result.settled()) {
        out["message"] = result.message;
    }
    out["state"] = workflow::toString(result.state);
    out["moved"] = result.settled() ? result.moved : 0;
    out["total"] = result.settled() ? result.total : 0;
    out["unitPrice"] = result.unitPrice;
    if (result.marketPrice) {
        out["marketPrice"] = *result.marketPrice;
    }
    if (!result.transactionId.empty()) {
        out["transactionId"] = result.transactionId;
    }
    if (result.state == workflow::SettlementState::chargeFailedUnrecovered) {
        out["delivered"] = result.moved;
        out["recovered"] = result.recovered;
    }
    return out;
}

std::optional<boost::json::object> TradeRpcController::requireSession(const rpc::trade::Session& session) {
    if (!sessions_.validate(session.user, session.token)) {
        util::log(util::LogLevel::info, "Trade request without a valid session for " + session.user);
        return rpcError(channel_, util::ErrorClass::authorization, "Not logged in");
    }
    return std::nullopt;
}

boost::json::object TradeRpcController::forward(const rpc::Reply& reply) const {
    auto errorClass = reply.errorClass == util::ErrorClass::none ? util::ErrorClass::internal : reply.errorClass;
    auto message = reply.timedOut() ? std::string{"Bank timeout"} : reply.error;
    return rpcError(channel_, errorClass, message);
}

} // namespace vaulttrade::controller
