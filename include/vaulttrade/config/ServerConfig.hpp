#pragma once

#include "vaulttrade/repository/DatabaseConfig.hpp"
#include "vaulttrade/util/Logging.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace vaulttrade::config {

enum class Role {
    bank,
    trade,
    all
};

enum class StorageBackend {
    file,
    mysql
};

std::string_view toString(Role role) noexcept;
std::optional<Role> parseRole(std::string_view text);

struct ServerConfig {
    static constexpr char kDefaultPath[] = "data/vaulttrade.json";

    Role role{Role::all};
    std::string host{"0.0.0.0"};
    unsigned short port{8080};
    std::int64_t ledgerChannel{1337};
    std::int64_t tradeChannel{1444};
    std::string bankUrl{"http://127.0.0.1:8080"};
    std::chrono::milliseconds rpcTimeout{6000};
    int chargeRetries{1};
    std::string peerKey;
    std::string adminToken;
    std::chrono::seconds sessionTtl{43200};
    util::LogLevel logLevel{util::LogLevel::info};
    std::filesystem::path dataDirectory{"data"};
    StorageBackend storage{StorageBackend::file};
    repository::DatabaseConfig database;
    // Simulated containers, in SlotContainer JSON form.
    boost::json::array containers;

    [[nodiscard]] bool servesBank() const noexcept { return role != Role::trade; }
    [[nodiscard]] bool servesTrade() const noexcept { return role != Role::bank; }
};

// Merges `json` over the defaults. Out-of-range or wrongly typed values keep
// the default and are logged at warn.
ServerConfig parseServerConfig(const boost::json::object& json);

// VAULTTRADE_* overrides, applied after the file.
void applyEnvironment(ServerConfig& config);

// Reads VAULTTRADE_CONFIG or kDefaultPath. A missing file yields the
// defaults; an unreadable or malformed one is a startup error.
ServerConfig loadServerConfig();
ServerConfig loadServerConfig(const std::filesystem::path& path);

} // namespace vaulttrade::config
