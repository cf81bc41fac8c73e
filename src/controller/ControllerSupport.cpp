#include "vaulttrade/controller/ControllerSupport.hpp"
#include "vaulttrade/util/JsonResponse.hpp"
#include "vaulttrade/util/JsonUtil.hpp"
#include "vaulttrade/util/Logging.hpp"

#include <algorithm>

namespace vaulttrade::controller {

void sendJsonResponse(server::RequestContext& ctx,
                      boost::beast::http::status status,
                      const boost::json::value& payload) {
    ctx.response.result(status);
    ctx.response.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    ctx.response.body() = util::stringifyJson(payload);
    ctx.response.prepare_payload();
}

void sendError(server::RequestContext& ctx, util::ErrorClass errorClass, std::string_view message) {
    boost::json::object payload{{"message", message}, {"errorClass", util::toString(errorClass)}};
    sendJsonResponse(ctx, statusFor(errorClass), payload);
}

void sendOutcome(server::RequestContext& ctx,
                 bool success,
                 util::ErrorClass errorClass,
                 const std::string& message) {
    if (!success) {
        sendError(ctx, errorClass, message);
        return;
    }
    sendJsonResponse(ctx, boost::beast::http::status::ok, boost::json::object{{"message", message}});
}

void sendRpcReply(server::RequestContext& ctx, const boost::json::object& reply) {
    sendJsonResponse(ctx, boost::beast::http::status::ok, reply);
    ctx.response.set(server::kEnvelopeHeader, "skip");
}

boost::beast::http::status statusFor(util::ErrorClass errorClass) noexcept {
    switch (errorClass) {
    case util::ErrorClass::none:
        return boost::beast::http::status::ok;
    case util::ErrorClass::validation:
        return boost::beast::http::status::bad_request;
    case util::ErrorClass::authorization:
        return boost::beast::http::status::unauthorized;
    case util::ErrorClass::insufficientResource:
        return boost::beast::http::status::conflict;
    case util::ErrorClass::transportAmbiguity:
        return boost::beast::http::status::gateway_timeout;
    case util::ErrorClass::unrecoveredInconsistency:
    case util::ErrorClass::internal:
        return boost::beast::http::status::internal_server_error;
    }
    return boost::beast::http::status::internal_server_error;
}

boost::json::object parseBodyObject(const server::RequestContext& ctx) {
    const auto& body = ctx.request.body();
    if (body.empty()) {
        return {};
    }
    boost::json::value parsed;
    try {
        parsed = util::parseJson(body);
    } catch (const std::exception&) {
        throw util::ValidationError("Malformed JSON body");
    }
    if (!parsed.is_object()) {
        throw util::ValidationError("JSON body must be an object");
    }
    return parsed.as_object();
}

bool checkAdminToken(server::RequestContext& ctx, const std::string& adminToken) {
    if (adminToken.empty()) {
        sendJsonResponse(ctx, boost::beast::http::status::forbidden,
                         boost::json::object{{"message", "Admin console disabled"},
                                             {"errorClass", util::toString(util::ErrorClass::authorization)}});
        return false;
    }
    auto header = ctx.request.find("X-Admin-Token");
    if (header == ctx.request.end() || std::string(header->value()) != adminToken) {
        util::log(util::LogLevel::warn, "Rejected admin request to " + std::string(ctx.request.target()));
        sendError(ctx, util::ErrorClass::authorization, "Unauthorized");
        return false;
    }
    return true;
}

std::string pathParameter(const server::RequestContext& ctx, const std::string& name) {
    auto it = ctx.pathParameters.find(name);
    return it == ctx.pathParameters.end() ? std::string{} : it->second;
}

std::size_t queryLimit(const server::RequestContext& ctx, std::size_t fallback, std::size_t max) {
    const std::string target(ctx.request.target());
    auto pos = target.find("limit=");
    if (pos == std::string::npos || (pos > 0 && target[pos - 1] != '?' && target[pos - 1] != '&')) {
        return fallback;
    }
    std::size_t value = 0;
    bool any = false;
    for (auto i = pos + 6; i < target.size() && target[i] >= '0' && target[i] <= '9'; ++i) {
        value = std::min<std::size_t>(value * 10 + static_cast<std::size_t>(target[i] - '0'), max);
        any = true;
    }
    if (!any) {
        return fallback;
    }
    return std::clamp<std::size_t>(value, 1, max);
}

boost::json::array auditEntriesJson(const std::vector<repository::AuditEntry>& entries) {
    boost::json::array out;
    out.reserve(entries.size());
    for (const auto& entry : entries) {
        out.push_back(boost::json::object{{"timestamp", util::formatIsoTimestamp(entry.at)},
                                          {"event", entry.event},
                                          {"message", entry.message}});
    }
    return out;
}

boost::json::object rpcOk(std::int64_t channel) {
    boost::json::object reply;
    reply["ok"] = true;
    reply["channel"] = channel;
    return reply;
}

boost::json::object rpcError(std::int64_t channel, util::ErrorClass errorClass, std::string_view message) {
    auto reply = util::makeRpcError(message, errorClass);
    reply["channel"] = channel;
    return reply;
}

} // namespace vaulttrade::controller
