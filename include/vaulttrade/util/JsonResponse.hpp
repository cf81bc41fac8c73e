#pragma once

#include "vaulttrade/util/Errors.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace vaulttrade::util {

std::string formatIsoTimestamp(std::chrono::system_clock::time_point timePoint);
std::string makeIsoTimestamp();

// Admin console envelope: {success, timestamp, path, data}.
boost::json::object makeSuccessResponse(const boost::json::value& data, std::string_view endpoint);

// {success:false, timestamp, path, error:{message, errorClass}}.
boost::json::object makeErrorResponse(std::string_view message,
                                      ErrorClass errorClass,
                                      std::string_view endpoint);

// RPC reply body: {ok:false, error, errorClass}.
boost::json::object makeRpcError(std::string_view message, ErrorClass errorClass);

} // namespace vaulttrade::util
