#pragma once

#include "vaulttrade/rpc/RpcChannel.hpp"
#include "vaulttrade/rpc/RpcDispatcher.hpp"

namespace vaulttrade::rpc {

// In-process channel: the dispatcher runs synchronously on the caller's thread.
class LocalRpcChannel : public RpcChannel {
public:
    LocalRpcChannel(std::int64_t scope, RpcDispatcher& dispatcher);

protected:
    std::optional<boost::json::value> exchange(const boost::json::object& request,
                                               std::chrono::milliseconds timeout) override;

private:
    RpcDispatcher& dispatcher_;
};

} // namespace vaulttrade::rpc
