#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vaulttrade::util {

boost::json::value parseJson(const std::string& payload);
std::string stringifyJson(const boost::json::value& value);

boost::json::value readJsonFile(const std::string& path);

// Lenient field readers: absent or wrongly typed fields yield nullopt.
std::optional<std::string> getString(const boost::json::object& object, std::string_view key);
std::optional<std::int64_t> getInt64(const boost::json::object& object, std::string_view key);
std::optional<double> getDouble(const boost::json::object& object, std::string_view key);
std::optional<bool> getBool(const boost::json::object& object, std::string_view key);

} // namespace vaulttrade::util
