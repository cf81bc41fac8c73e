#include "vaulttrade/rpc/RpcChannel.hpp"
#include "vaulttrade/util/JsonUtil.hpp"
#include "vaulttrade/util/Logging.hpp"

namespace vaulttrade::rpc {

Reply Reply::timeout() {
    Reply reply;
    reply.error = "Timeout";
    reply.errorClass = util::ErrorClass::transportAmbiguity;
    return reply;
}

Reply Reply::fromJson(const boost::json::value& value) {
    Reply reply;
    if (!value.is_object()) {
        reply.error = "Malformed reply";
        reply.errorClass = util::ErrorClass::internal;
        return reply;
    }
    reply.body = value.as_object();
    reply.ok = util::getBool(reply.body, "ok").value_or(false);
    if (!reply.ok) {
        reply.error = util::getString(reply.body, "error").value_or("Unknown error");
        auto errorClass = util::getString(reply.body, "errorClass");
        reply.errorClass = errorClass ? util::parseErrorClass(*errorClass).value_or(util::ErrorClass::internal)
                                      : util::ErrorClass::internal;
    }
    return reply;
}

RpcChannel::RpcChannel(std::int64_t scope)
    : scope_(scope) {}

Reply RpcChannel::call(boost::json::object request, std::chrono::milliseconds timeout) {
    request["channel"] = scope_;
    const auto type = util::getString(request, "type").value_or("?");

    auto raw = exchange(request, timeout);
    if (!raw) {
        util::log(util::LogLevel::warn, "RPC " + type + " on channel " + std::to_string(scope_) + " timed out");
        return Reply::timeout();
    }
    if (!raw->is_object()) {
        util::log(util::LogLevel::warn, "RPC " + type + " got a non-object reply; discarded");
        return Reply::timeout();
    }
    auto replyScope = util::getInt64(raw->as_object(), "channel");
    if (!replyScope || *replyScope != scope_) {
        util::log(util::LogLevel::warn, "RPC " + type + " reply on channel " +
                                            (replyScope ? std::to_string(*replyScope) : std::string{"(none)"}) +
                                            " discarded; expected " + std::to_string(scope_));
        return Reply::timeout();
    }
    return Reply::fromJson(*raw);
}

} // namespace vaulttrade::rpc
