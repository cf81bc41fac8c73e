#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace vaulttrade::rpc::trade {

inline constexpr std::int64_t kDefaultChannel = 1444;

struct Session {
    std::string user;
    std::string token;
};

struct Login {
    std::string user;
    std::string pin;
};

struct GetBalance {
    Session session;
};

struct GetListings {};

struct CreateListing {
    Session session;
    std::string item;
    std::int64_t price{};
};

struct AddStock {
    Session session;
    std::int64_t listingId{};
    std::string item;
    std::int64_t count{};
    std::string chestName;
};

struct Buy {
    Session session;
    std::int64_t listingId{};
    std::int64_t count{};
    std::string chestName;
};

using Request = std::variant<Login, GetBalance, GetListings, CreateListing, AddStock, Buy>;

struct Envelope {
    std::int64_t channel{kDefaultChannel};
    Request request;
};

std::string_view typeName(const Request& request);

// Throws util::ValidationError on unknown type or malformed fields.
Envelope decodeRequest(const boost::json::value& message);
boost::json::object encodeRequest(const Envelope& envelope);

} // namespace vaulttrade::rpc::trade
