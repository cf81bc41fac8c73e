#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace vaulttrade::rpc {

// Strict readers for inbound messages. Each throws util::ValidationError
// naming the offending field.
const boost::json::object& requireObject(const boost::json::value& message);
std::string requireString(const boost::json::object& message, std::string_view key);
std::int64_t requireInt64(const boost::json::object& message, std::string_view key);

// Absent is fine, present-but-wrong-type is not.
std::string optionalString(const boost::json::object& message, std::string_view key);

} // namespace vaulttrade::rpc
