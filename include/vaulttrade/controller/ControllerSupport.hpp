#pragma once

#include "vaulttrade/repository/AuditLog.hpp"
#include "vaulttrade/server/RequestContext.hpp"
#include "vaulttrade/util/Errors.hpp"

#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace vaulttrade::controller {

void sendJsonResponse(server::RequestContext& ctx,
                      boost::beast::http::status status,
                      const boost::json::value& payload);

// Admin failure body; the server wraps it into the error envelope.
void sendError(server::RequestContext& ctx, util::ErrorClass errorClass, std::string_view message);

// {message} on success, sendError otherwise.
void sendOutcome(server::RequestContext& ctx,
                 bool success,
                 util::ErrorClass errorClass,
                 const std::string& message);

// RPC replies go out verbatim, always HTTP 200.
void sendRpcReply(server::RequestContext& ctx, const boost::json::object& reply);

boost::beast::http::status statusFor(util::ErrorClass errorClass) noexcept;

// Throws util::ValidationError when the body is not a JSON object.
boost::json::object parseBodyObject(const server::RequestContext& ctx);

// Sends the rejection itself and returns false when the X-Admin-Token
// header does not match. An empty configured token disables the console.
bool checkAdminToken(server::RequestContext& ctx, const std::string& adminToken);

std::string pathParameter(const server::RequestContext& ctx, const std::string& name);

// Reads ?limit=N, clamped to [1, max].
std::size_t queryLimit(const server::RequestContext& ctx, std::size_t fallback, std::size_t max);

boost::json::array auditEntriesJson(const std::vector<repository::AuditEntry>& entries);

// Server-side reply stamping for RPC surfaces.
boost::json::object rpcOk(std::int64_t channel);
boost::json::object rpcError(std::int64_t channel, util::ErrorClass errorClass, std::string_view message);

} // namespace vaulttrade::controller
