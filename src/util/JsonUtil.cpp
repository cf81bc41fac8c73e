#include "vaulttrade/util/JsonUtil.hpp"

#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>

namespace vaulttrade::util {

boost::json::value parseJson(const std::string& payload) {
    return boost::json::parse(payload);
}

std::string stringifyJson(const boost::json::value& value) {
    return boost::json::serialize(value);
}

boost::json::value readJsonFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (content.empty()) {
        return nullptr;
    }
    return parseJson(content);
}

std::optional<std::string> getString(const boost::json::object& object, std::string_view key) {
    if (auto it = object.if_contains(key); it && it->is_string()) {
        return std::string(it->as_string().c_str(), it->as_string().size());
    }
    return std::nullopt;
}

std::optional<std::int64_t> getInt64(const boost::json::object& object, std::string_view key) {
    auto it = object.if_contains(key);
    if (!it) {
        return std::nullopt;
    }
    if (it->is_int64()) {
        return it->as_int64();
    }
    if (it->is_uint64()) {
        auto value = it->as_uint64();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(value);
    }
    if (it->is_double()) {
        double value = it->as_double();
        if (!std::isfinite(value) || std::floor(value) != value ||
            std::fabs(value) > 9.0e15) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(value);
    }
    return std::nullopt;
}

std::optional<double> getDouble(const boost::json::object& object, std::string_view key) {
    auto it = object.if_contains(key);
    if (!it) {
        return std::nullopt;
    }
    if (it->is_double()) {
        return it->as_double();
    }
    if (it->is_int64()) {
        return static_cast<double>(it->as_int64());
    }
    if (it->is_uint64()) {
        return static_cast<double>(it->as_uint64());
    }
    return std::nullopt;
}

std::optional<bool> getBool(const boost::json::object& object, std::string_view key) {
    if (auto it = object.if_contains(key); it && it->is_bool()) {
        return it->as_bool();
    }
    return std::nullopt;
}

} // namespace vaulttrade::util
