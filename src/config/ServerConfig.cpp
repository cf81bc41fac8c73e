#include "vaulttrade/config/ServerConfig.hpp"
#include "vaulttrade/util/JsonUtil.hpp"

#include <cstdlib>
#include <stdexcept>

namespace vaulttrade::config {
namespace {

void warnInvalid(std::string_view key) {
    util::log(util::LogLevel::warn, "Ignoring invalid config value for " + std::string(key) + ", using default");
}

// Positive integer within [min, max], or nullopt with a warning.
std::optional<std::int64_t> boundedInt(const boost::json::object& json,
                                       std::string_view key,
                                       std::int64_t min,
                                       std::int64_t max) {
    if (!json.contains(key)) {
        return std::nullopt;
    }
    auto value = util::getInt64(json, key);
    if (!value || *value < min || *value > max) {
        warnInvalid(key);
        return std::nullopt;
    }
    return value;
}

std::optional<std::int64_t> boundedEnv(const char* name, std::int64_t min, std::int64_t max) {
    const char* raw = std::getenv(name);
    if (!raw) {
        return std::nullopt;
    }
    char* end = nullptr;
    const auto value = std::strtoll(raw, &end, 10);
    if (end == raw || *end != '\0' || value < min || value > max) {
        warnInvalid(name);
        return std::nullopt;
    }
    return value;
}

} // namespace

std::string_view toString(Role role) noexcept {
    switch (role) {
    case Role::bank:
        return "bank";
    case Role::trade:
        return "trade";
    case Role::all:
        return "all";
    }
    return "all";
}

std::optional<Role> parseRole(std::string_view text) {
    if (text == "bank") return Role::bank;
    if (text == "trade") return Role::trade;
    if (text == "all") return Role::all;
    return std::nullopt;
}

ServerConfig parseServerConfig(const boost::json::object& json) {
    ServerConfig config;

    if (auto value = util::getString(json, "role")) {
        if (auto role = parseRole(*value)) {
            config.role = *role;
        } else {
            warnInvalid("role");
        }
    }
    if (auto value = util::getString(json, "host"); value && !value->empty()) config.host = *value;
    if (auto value = boundedInt(json, "port", 1, 65535)) config.port = static_cast<unsigned short>(*value);
    if (auto value = boundedInt(json, "ledgerChannel", 1, 65535)) config.ledgerChannel = *value;
    if (auto value = boundedInt(json, "tradeChannel", 1, 65535)) config.tradeChannel = *value;
    if (auto value = util::getString(json, "bankUrl"); value && !value->empty()) config.bankUrl = *value;
    if (auto value = boundedInt(json, "rpcTimeoutMs", 1, 600000)) config.rpcTimeout = std::chrono::milliseconds(*value);
    if (auto value = boundedInt(json, "chargeRetries", 0, 10)) config.chargeRetries = static_cast<int>(*value);
    if (auto value = util::getString(json, "peerKey")) config.peerKey = *value;
    if (auto value = util::getString(json, "adminToken")) config.adminToken = *value;
    if (auto value = boundedInt(json, "sessionTtlSeconds", 1, 30LL * 24 * 3600)) {
        config.sessionTtl = std::chrono::seconds(*value);
    }
    if (auto value = util::getString(json, "logLevel")) {
        if (auto level = util::parseLogLevel(*value)) {
            config.logLevel = *level;
        } else {
            warnInvalid("logLevel");
        }
    }
    if (auto value = util::getString(json, "dataDirectory"); value && !value->empty()) config.dataDirectory = *value;

    if (auto it = json.if_contains("storage"); it && it->is_object()) {
        const auto& storage = it->as_object();
        if (auto backend = util::getString(storage, "backend")) {
            if (*backend == "mysql") {
                config.storage = StorageBackend::mysql;
            } else if (*backend != "file") {
                warnInvalid("storage.backend");
            }
        }
        if (auto db = storage.if_contains("database"); db && db->is_object()) {
            config.database = repository::loadConfig(db->as_object(), config.database);
        }
    }

    if (auto it = json.if_contains("containers")) {
        if (it->is_array()) {
            config.containers = it->as_array();
        } else {
            warnInvalid("containers");
        }
    }
    return config;
}

void applyEnvironment(ServerConfig& config) {
    if (const char* value = std::getenv("VAULTTRADE_ROLE")) {
        if (auto role = parseRole(value)) {
            config.role = *role;
        } else {
            warnInvalid("VAULTTRADE_ROLE");
        }
    }
    if (const char* value = std::getenv("VAULTTRADE_HOST")) config.host = value;
    if (auto value = boundedEnv("VAULTTRADE_PORT", 1, 65535)) config.port = static_cast<unsigned short>(*value);
    if (const char* value = std::getenv("VAULTTRADE_BANK_URL")) config.bankUrl = value;
    if (auto value = boundedEnv("VAULTTRADE_RPC_TIMEOUT_MS", 1, 600000)) {
        config.rpcTimeout = std::chrono::milliseconds(*value);
    }
    if (const char* value = std::getenv("VAULTTRADE_PEER_KEY")) config.peerKey = value;
    if (const char* value = std::getenv("VAULTTRADE_ADMIN_TOKEN")) config.adminToken = value;
    if (const char* value = std::getenv("VAULTTRADE_LOG_LEVEL")) {
        if (auto level = util::parseLogLevel(value)) {
            config.logLevel = *level;
        } else {
            warnInvalid("VAULTTRADE_LOG_LEVEL");
        }
    }
    if (const char* value = std::getenv("VAULTTRADE_DATA_DIR")) config.dataDirectory = value;
    if (const char* value = std::getenv("VAULTTRADE_STORAGE")) {
        const std::string_view backend{value};
        if (backend == "mysql") {
            config.storage = StorageBackend::mysql;
        } else if (backend == "file") {
            config.storage = StorageBackend::file;
        } else {
            warnInvalid("VAULTTRADE_STORAGE");
        }
    }
    repository::applyEnvironment(config.database);
}

ServerConfig loadServerConfig() {
    const char* path = std::getenv("VAULTTRADE_CONFIG");
    return loadServerConfig(path ? std::filesystem::path(path) : std::filesystem::path(ServerConfig::kDefaultPath));
}

ServerConfig loadServerConfig(const std::filesystem::path& path) {
    ServerConfig config;
    if (std::filesystem::exists(path)) {
        auto json = util::readJsonFile(path.string());
        if (json.is_object()) {
            config = parseServerConfig(json.as_object());
        } else if (!json.is_null()) {
            throw std::runtime_error("config " + path.string() + " must be a JSON object");
        }
    } else {
        util::log(util::LogLevel::info, "No config at " + path.string() + ", using defaults");
    }
    applyEnvironment(config);
    return config;
}

} // namespace vaulttrade::config
