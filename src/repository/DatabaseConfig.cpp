#include "vaulttrade/repository/DatabaseConfig.hpp"
#include "vaulttrade/util/JsonUtil.hpp"

#include <algorithm>
#include <cstdlib>

namespace vaulttrade::repository {

DatabaseConfig loadConfig(const boost::json::object& json, DatabaseConfig base) {
    if (auto value = util::getString(json, "host"); value && !value->empty()) base.host = *value;
    if (auto value = util::getInt64(json, "port"); value && *value > 0 && *value <= 65535) {
        base.port = static_cast<std::uint16_t>(*value);
    }
    if (auto value = util::getString(json, "user"); value && !value->empty()) base.user = *value;
    if (auto value = util::getString(json, "password")) base.password = *value;
    if (auto value = util::getString(json, "database"); value && !value->empty()) base.database = *value;
    if (auto value = util::getString(json, "charset"); value && !value->empty()) base.charset = *value;
    if (auto value = util::getInt64(json, "poolSize"); value && *value > 0) {
        base.poolSize = static_cast<unsigned int>(*value);
    }
    return base;
}

void applyEnvironment(DatabaseConfig& config) {
    if (const char* value = std::getenv("VAULTTRADE_DB_HOST")) config.host = value;
    if (const char* value = std::getenv("VAULTTRADE_DB_PORT")) {
        auto port = std::strtoul(value, nullptr, 10);
        if (port > 0 && port <= 65535) {
            config.port = static_cast<std::uint16_t>(port);
        }
    }
    if (const char* value = std::getenv("VAULTTRADE_DB_USER")) config.user = value;
    if (const char* value = std::getenv("VAULTTRADE_DB_PASSWORD")) config.password = value;
    if (const char* value = std::getenv("VAULTTRADE_DB_NAME")) config.database = value;
    if (const char* value = std::getenv("VAULTTRADE_DB_CHARSET")) config.charset = value;
    if (const char* value = std::getenv("VAULTTRADE_DB_POOL")) {
        config.poolSize = std::max(1u, static_cast<unsigned int>(std::strtoul(value, nullptr, 10)));
    }
}

} // namespace vaulttrade::repository
