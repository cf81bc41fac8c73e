#include "vaulttrade/rpc/HttpRpcChannel.hpp"
#include "vaulttrade/util/JsonUtil.hpp"
#include "vaulttrade/util/Logging.hpp"

#include <boost/system/system_error.hpp>

#include <stdexcept>
#include <utility>

namespace vaulttrade::rpc {

HttpRpcChannel::HttpRpcChannel(std::int64_t scope, util::HttpClient& client, std::string endpoint)
    : RpcChannel(scope)
    , client_(client)
    , endpoint_(std::move(endpoint)) {}

std::optional<boost::json::value> HttpRpcChannel::exchange(const boost::json::object& request,
                                                           std::chrono::milliseconds timeout) {
    try {
        auto response = client_.fetch("POST", endpoint_, {{"Content-Type", "application/json"}},
                                      util::stringifyJson(request), timeout);
        if (response.result() != boost::beast::http::status::ok) {
            util::log(util::LogLevel::warn, "RPC endpoint " + endpoint_ + " answered HTTP " +
                                                std::to_string(response.result_int()));
            return std::nullopt;
        }
        return util::parseJson(response.body());
    } catch (const boost::system::system_error& ex) {
        util::log(util::LogLevel::warn, "RPC transport to " + endpoint_ + " failed: " + ex.what());
    } catch (const std::invalid_argument& ex) {
        util::log(util::LogLevel::error, "RPC endpoint " + endpoint_ + " is unusable: " + ex.what());
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, "RPC exchange with " + endpoint_ + " failed: " + ex.what());
    }
    return std::nullopt;
}

} // namespace vaulttrade::rpc
