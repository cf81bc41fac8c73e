#include "vaulttrade/rpc/Fields.hpp"
#include "vaulttrade/util/Errors.hpp"
#include "vaulttrade/util/JsonUtil.hpp"

namespace vaulttrade::rpc {
namespace {

const boost::json::value* field(const boost::json::object& message, std::string_view key) {
    auto* value = message.if_contains(key);
    if (!value || value->is_null()) {
        return nullptr;
    }
    return value;
}

} // namespace

const boost::json::object& requireObject(const boost::json::value& message) {
    if (!message.is_object()) {
        throw util::ValidationError("Bad message");
    }
    return message.as_object();
}

std::string requireString(const boost::json::object& message, std::string_view key) {
    auto* value = field(message, key);
    if (!value) {
        throw util::ValidationError("Missing field: " + std::string(key));
    }
    if (!value->is_string()) {
        throw util::ValidationError("Field " + std::string(key) + " must be a string");
    }
    return std::string(value->as_string());
}

std::int64_t requireInt64(const boost::json::object& message, std::string_view key) {
    auto* value = field(message, key);
    if (!value) {
        throw util::ValidationError("Missing field: " + std::string(key));
    }
    if (auto number = util::getInt64(message, key)) {
        return *number;
    }
    throw util::ValidationError("Field " + std::string(key) + " must be an integer");
}

std::string optionalString(const boost::json::object& message, std::string_view key) {
    auto* value = field(message, key);
    if (!value) {
        return {};
    }
    if (!value->is_string()) {
        throw util::ValidationError("Field " + std::string(key) + " must be a string");
    }
    return std::string(value->as_string());
}

} // namespace vaulttrade::rpc
