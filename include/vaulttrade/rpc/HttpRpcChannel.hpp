#pragma once

#include "vaulttrade/rpc/RpcChannel.hpp"
#include "vaulttrade/util/HttpClient.hpp"

#include <string>

namespace vaulttrade::rpc {

// POSTs each request as JSON to `endpoint`. Any transport failure,
// timeout or unreadable body counts as "no reply".
class HttpRpcChannel : public RpcChannel {
public:
    HttpRpcChannel(std::int64_t scope, util::HttpClient& client, std::string endpoint);

    const std::string& endpoint() const noexcept { return endpoint_; }

protected:
    std::optional<boost::json::value> exchange(const boost::json::object& request,
                                               std::chrono::milliseconds timeout) override;

private:
    util::HttpClient& client_;
    std::string endpoint_;
};

} // namespace vaulttrade::rpc
