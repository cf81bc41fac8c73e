#include "vaulttrade/controller/LedgerRpcController.hpp"
#include "vaulttrade/controller/ControllerSupport.hpp"
#include "vaulttrade/util/JsonUtil.hpp"
#include "vaulttrade/util/Logging.hpp"

#include <utility>

namespace vaulttrade::controller {

LedgerRpcController::LedgerRpcController(service::LedgerService& ledger,
                                         service::VaultService& vault,
                                         std::int64_t channel,
                                         std::string peerKey)
    : ledger_(ledger)
    , vault_(vault)
    , channel_(channel)
    , peerKey_(std::move(peerKey)) {}

void LedgerRpcController::registerRoutes(server::Router& router) {
    router.addRoute("POST", "/rpc/ledger", [this](server::RequestContext& ctx) {
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

boost::json::object LedgerRpcController::dispatch(const boost::json::value& message) {
    try {
        auto envelope = rpc::ledger::decodeRequest(message);
        if (envelope.channel != channel_) {
            util::log(util::LogLevel::warn, "Ledger message for channel " + std::to_string(envelope.channel) +
                                                " rejected on channel " + std::to_string(channel_));
            return rpcError(channel_, util::ErrorClass::validation, "Wrong channel");
        }
        return std::visit([this](const auto& request) { return handle(request); }, envelope.request);
    } catch (const util::ValidationError& ex) {
        return rpcError(channel_, util::ErrorClass::validation, ex.what());
    } catch (const util::StorageError&) {
        throw;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"Ledger RPC failed: "} + ex.what());
        return rpcError(channel_, util::ErrorClass::internal, ex.what());
    }
}

boost::json::object LedgerRpcController::handle(const rpc::ledger::Login& request) {
    auto result = ledger_.authenticate(request.user, request.pin);
    if (!result.ok()) {
        return reject(result);
    }
    auto reply = rpcOk(channel_);
    reply["approved"] = true;
    reply["balance"] = result.balance.value_or(0);
    return reply;
}

boost::json::object LedgerRpcController::handle(const rpc::ledger::CreateAccount& request) {
    auto result = ledger_.registerAccount(request.user, request.pin);
    if (!result.ok()) {
        return reject(result);
    }
    auto reply = rpcOk(channel_);
    reply["message"] = result.message;
    return reply;
}

boost::json::object LedgerRpcController::handle(const rpc::ledger::GetAccount& request) {
    if (auto denied = authorize(request.user, request.auth)) {
        return *denied;
    }
    auto account = ledger_.findAccount(request.user);
    if (!account) {
        return rpcError(channel_, util::ErrorClass::authorization, "No account");
    }
    auto reply = rpcOk(channel_);
    reply["balance"] = account->balance;
    reply["approved"] = account->approved;
    return reply;
}

boost::json::object LedgerRpcController::handle(const rpc::ledger::GetPrices&) {
    boost::json::object prices;
    for (const auto& quote : vault_.getPrices()) {
        prices[quote.item] = boost::json::object{{"price", quote.price}, {"stock", quote.stock}, {"base", quote.base}};
    }
    auto reply = rpcOk(channel_);
    reply["prices"] = std::move(prices);
    return reply;
}

boost::json::object LedgerRpcController::handle(const rpc::ledger::GetVaultStock&) {
    boost::json::object stock;
    for (const auto& line : vault_.getVaultStock()) {
        stock[line.item] = boost::json::object{{"count", line.count}, {"price", line.price}};
    }
    auto reply = rpcOk(channel_);
    reply["stock"] = std::move(stock);
    return reply;
}

boost::json::object LedgerRpcController::handle(const rpc::ledger::DepositFromClientChest& request) {
    if (auto denied = authorize(request.user, request.auth)) {
        return *denied;
    }
    auto result = vault_.deposit(request.user, request.chestName);
    if (!result.success) {
        auto reply = rpcError(channel_, result.errorClass, result.message);
        reply["moved"] = result.moved;
        return reply;
    }
    auto reply = rpcOk(channel_);
    reply["message"] = result.message;
    reply["moved"] = result.moved;
    reply["amount"] = result.amount;
    return reply;
}

boost::json::object LedgerRpcController::handle(const rpc::ledger::WithdrawToClientChest& request) {
    if (auto denied = authorize(request.user, request.auth)) {
        return *denied;
    }
    auto result = vault_.withdraw(request.user, request.chestName, request.item, request.count);
    if (!result.success) {
        auto reply = rpcError(channel_, result.errorClass, result.message);
        reply["moved"] = result.moved;
        return reply;
    }
    auto reply = rpcOk(channel_);
    reply["message"] = result.message;
    reply["moved"] = result.moved;
    reply["amount"] = result.amount;
    return reply;
}

boost::json::object LedgerRpcController::handle(const rpc::ledger::Transfer& request) {
    if (auto denied = authorize(request.from, request.auth)) {
        return *denied;
    }
    auto result = ledger_.transfer(request.from, request.to, request.amount, request.transactionId);
    if (!result.ok()) {
        return reject(result);
    }
    auto reply = rpcOk(channel_);
    reply["message"] = result.message;
    reply["replayed"] = result.replayed;
    if (!request.transactionId.empty()) {
        reply["transactionId"] = request.transactionId;
    }
    return reply;
}

std::optional<boost::json::object> LedgerRpcController::authorize(const std::string& user,
                                                                  const rpc::ledger::Credentials& auth) const {
    if (!auth.peerKey.empty()) {
        if (!peerKey_.empty() && auth.peerKey == peerKey_) {
            return std::nullopt;
        }
        util::log(util::LogLevel::warn, "Rejected peer key acting for " + user);
        return rpcError(channel_, util::ErrorClass::authorization, "Invalid peer key");
    }
    auto account = ledger_.findAccount(user);
    if (!account) {
        return rpcError(channel_, util::ErrorClass::authorization, "No account");
    }
    if (auth.pin.empty() || account->credential != auth.pin) {
        util::log(util::LogLevel::warn, "Rejected PIN for " + account->identity);
        return rpcError(channel_, util::ErrorClass::authorization, "Invalid PIN");
    }
    return std::nullopt;
}

boost::json::object LedgerRpcController::reject(const service::LedgerResult& result) const {
    if (result.errorClass() == util::ErrorClass::authorization) {
        util::log(util::LogLevel::info, "Ledger request rejected: " + result.message);
    }
    return rpcError(channel_, result.errorClass(), result.message);
}

} // namespace vaulttrade::controller
