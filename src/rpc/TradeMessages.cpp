#include "vaulttrade/rpc/TradeMessages.hpp"
#include "vaulttrade/rpc/Fields.hpp"
#include "vaulttrade/util/Errors.hpp"

#include <type_traits>
#include <utility>

namespace vaulttrade::rpc::trade {
namespace {

template <class>
inline constexpr bool kAlwaysFalse = false;

Session decodeSession(const boost::json::object& message) {
    return Session{requireString(message, "user"), optionalString(message, "token")};
}

void encodeSession(const Session& session, boost::json::object& out) {
    out["user"] = session.user;
    out["token"] = session.token;
}

} // namespace

std::string_view typeName(const Request& request) {
    return std::visit(
        [](const auto& message) -> std::string_view {
            using T = std::decay_t<decltype(message)>;
            if constexpr (std::is_same_v<T, Login>) {
                return "login";
            } else if constexpr (std::is_same_v<T, GetBalance>) {
                return "getBalance";
            } else if constexpr (std::is_same_v<T, GetListings>) {
                return "getListings";
            } else if constexpr (std::is_same_v<T, CreateListing>) {
                return "createListing";
            } else if constexpr (std::is_same_v<T, AddStock>) {
                return "addStock";
            } else if constexpr (std::is_same_v<T, Buy>) {
                return "buy";
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled trade request");
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
    } else if (type == "getBalance") {
        envelope.request = GetBalance{decodeSession(message)};
    } else if (type == "getListings") {
        envelope.request = GetListings{};
    } else if (type == "createListing") {
        CreateListing create;
        create.session = decodeSession(message);
        create.item = requireString(message, "item");
        create.price = requireInt64(message, "price");
        envelope.request = std::move(create);
    } else if (type == "addStock") {
        AddStock add;
        add.session = decodeSession(message);
        add.listingId = requireInt64(message, "listingId");
        add.item = requireString(message, "item");
        add.count = requireInt64(message, "count");
        add.chestName = requireString(message, "chestName");
        envelope.request = std::move(add);
    } else if (type == "buy") {
        Buy buy;
        buy.session = decodeSession(message);
        buy.listingId = requireInt64(message, "listingId");
        buy.count = requireInt64(message, "count");
        buy.chestName = requireString(message, "chestName");
        envelope.request = std::move(buy);
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
            if constexpr (std::is_same_v<T, Login>) {
                out["user"] = message.user;
                out["pin"] = message.pin;
            } else if constexpr (std::is_same_v<T, GetBalance>) {
                encodeSession(message.session, out);
            } else if constexpr (std::is_same_v<T, CreateListing>) {
                encodeSession(message.session, out);
                out["item"] = message.item;
                out["price"] = message.price;
            } else if constexpr (std::is_same_v<T, AddStock>) {
                encodeSession(message.session, out);
                out["listingId"] = message.listingId;
                out["item"] = message.item;
                out["count"] = message.count;
                out["chestName"] = message.chestName;
            } else if constexpr (std::is_same_v<T, Buy>) {
                encodeSession(message.session, out);
                out["listingId"] = message.listingId;
                out["count"] = message.count;
                out["chestName"] = message.chestName;
            }
        },
        envelope.request);
    return out;
}

} // namespace vaulttrade::rpc::trade
