#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <string>

namespace vaulttrade::repository {

struct DatabaseConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{33060};
    std::string user{"root"};
    std::string password;
    std::string database{"vaulttrade"};
    std::string charset{"utf8mb4"};
    unsigned int poolSize{2};
};

// Fields missing from `json` keep the values already in `base`.
DatabaseConfig loadConfig(const boost::json::object& json, DatabaseConfig base = {});

// VAULTTRADE_DB_HOST / _PORT / _USER / _PASSWORD / _NAME / _CHARSET / _POOL
void applyEnvironment(DatabaseConfig& config);

} // namespace vaulttrade::repository
