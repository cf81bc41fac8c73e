#include "vaulttrade/rpc/LedgerMessages.hpp"
#include "vaulttrade/rpc/Fields.hpp"
#include "vaulttrade/util/Errors.hpp"

#include <type_traits>
#include <utility>

namespace vaulttrade::rpc::ledger {
namespace {

template <class>
inline constexpr bool kAlwaysFalse = false;

Credentials decodeCredentials(const boost::json::object& message) {
    Credentials auth;
    auth.pin = optionalString(message, "pin");
    auth.peerKey = optionalString(message, "peerKey");
    return auth;
}

void encodeCredentials(const Credentials& auth, boost::json::object& out) {
    if (!auth.pin.empty()) {
        out["pin"] = auth.pin;
    }
    if (!auth.peerKey.empty()) {
        out["peerKey"] = auth.peerKey;
    }
}

} // namespace

std::string_view typeName(const Request& request) {
    return std::visit(
        [](const auto& message) -> std::string_view {
            using T = std::decay_t<decltype(message)>;
            if constexpr (std::is_same_v<T, Login>) {
                return "login";
            } else if constexpr (std::is_same_v<T, CreateAccount>) {
                return "createAccount";
            } else if constexpr (std::is_same_v<T, GetAccount>) {
                return "getAccount";
            } else if constexpr (std::is_same_v<T, GetPrices>) {
                return "getPrices";
            } else if constexpr (std::is_same_v<T, GetVaultStock>) {
                return "getVaultStock";
            } else if constexpr (std::is_same_v<T, DepositFromClientChest>) {
                return "depositFromClientChest";
            } else if constexpr (std::is_same_v<T, WithdrawToClientChest>) {
                return "withdrawToClientChest";
            } else if constexpr (std::is_same_v<T, Transfer>) {
                return "transfer";
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled ledger request");
            }
        },
        request);
}

Envelope decodeRequest(const boost::json::value& value) {
    const auto& message = requireObject(value);
    Envelope envelope;
    envelope.channel = requireInt64(message, "channel");

    const auto type = requireString(message, "type");
    if (type == "login") {
        envelope.request = Login{requireString(message, "user"), requireString(message, "pin")};
    } else if (type == "createAccount") {
        envelope.request = CreateAccount{requireString(message, "user"), requireString(message, "pin")};
    } else if (type == "getAccount") {
        envelope.request = GetAccount{requireString(message, "user"), decodeCredentials(message)};
    } else if (type == "getPrices") {
        envelope.request = GetPrices{};
    } else if (type == "getVaultStock") {
        envelope.request = GetVaultStock{};
    } else if (type == "depositFromClientChest") {
        envelope.request = DepositFromClientChest{
            requireString(message, "user"), requireString(message, "chestName"), decodeCredentials(message)};
    } else if (type == "withdrawToClientChest") {
        WithdrawToClientChest withdraw;
        withdraw.user = requireString(message, "user");
        withdraw.chestName = requireString(message, "chestName");
        withdraw.item = requireString(message, "item");
        withdraw.count = requireInt64(message, "count");
        withdraw.auth = decodeCredentials(message);
        envelope.request = std::move(withdraw);
    } else if (type == "transfer") {
        Transfer transfer;
        transfer.from = requireString(message, "from");
        transfer.to = requireString(message, "to");
        transfer.amount = requireInt64(message, "amount");
        transfer.transactionId = optionalString(message, "transactionId");
        transfer.auth = decodeCredentials(message);
        envelope.request = std::move(transfer);
    } else {
        throw util::ValidationError("Unknown request");
    }
    return envelope;
}

boost::json::object encodeRequest(const Envelope& envelope) {
    boost::json::object out;
    out["type"] = typeName(envelope.request);
    out["channel"] = envelope.channel;

    std::visit(
        [&out](const auto& message) {
            using T = std::decay_t<decltype(message)>;
            if constexpr (std::is_same_v<T, Login> || std::is_same_v<T, CreateAccount>) {
                out["user"] = message.user;
                out["pin"] = message.pin;
            } else if constexpr (std::is_same_v<T, GetAccount>) {
                out["user"] = message.user;
                encodeCredentials(message.auth, out);
            } else if constexpr (std::is_same_v<T, DepositFromClientChest>) {
                out["user"] = message.user;
                out["chestName"] = message.chestName;
                encodeCredentials(message.auth, out);
            } else if constexpr (std::is_same_v<T, WithdrawToClientChest>) {
                out["user"] = message.user;
                out["chestName"] = message.chestName;
                out["item"] = message.item;
                out["count"] = message.count;
                encodeCredentials(message.auth, out);
            } else if constexpr (std::is_same_v<T, Transfer>) {
                out["from"] = message.from;
                out["to"] = message.to;
                out["amount"] = message.amount;
                if (!message.transactionId.empty()) {
                    out["transactionId"] = message.transactionId;
                }
                encodeCredentials(message.auth, out);
            }
        },
        envelope.request);
    return out;
}

} // namespace vaulttrade::rpc::ledger
