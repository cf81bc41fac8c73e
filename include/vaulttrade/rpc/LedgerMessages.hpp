#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace vaulttrade::rpc::ledger {

inline constexpr std::int64_t kDefaultChannel = 1337;

// Either the account's own PIN or the trusted peer key.
struct Credentials {
    std::string pin;
    std::string peerKey;
};

struct Login {
    std::string user;
    std::string pin;
};

struct CreateAccount {
    std::string user;
    std::string pin;
};

struct GetAccount {
    std::string user;
    Credentials auth;
};

struct GetPrices {};

struct GetVaultStock {};

struct DepositFromClientChest {
    std::string user;
    std::string chestName;
    Credentials auth;
};

struct WithdrawToClientChest {
    std::string user;
    std::string chestName;
    std::string item;
    std::int64_t count{};
    Credentials auth;
};

struct Transfer {
    std::string from;
    std::string to;
    std::int64_t amount{};
    std::string transactionId;
    Credentials auth;
};

using Request = std::variant<Login,
                             CreateAccount,
                             GetAccount,
                             GetPrices,
                             GetVaultStock,
                             DepositFromClientChest,
                             WithdrawToClientChest,
                             Transfer>;

struct Envelope {
    std::int64_t channel{kDefaultChannel};
    Request request;
};

std::string_view typeName(const Request& request);

// Throws util::ValidationError on unknown type or malformed fields.
Envelope decodeRequest(const boost::json::value& message);
boost::json::object encodeRequest(const Envelope& envelope);

} // namespace vaulttrade::rpc::ledger
