#include "vaulttrade/rpc/LocalRpcChannel.hpp"

namespace vaulttrade::rpc {

LocalRpcChannel::LocalRpcChannel(std::int64_t scope, RpcDispatcher& dispatcher)
    : RpcChannel(scope)
    , dispatcher_(dispatcher) {}

std::optional<boost::json::value> LocalRpcChannel::exchange(const boost::json::object& request,
                                                            std::chrono::milliseconds) {
    // Round-trip through a value copy so the dispatcher sees exactly what a remote peer would.
    return boost::json::value(dispatcher_.dispatch(boost::json::value(request)));
}

} // namespace vaulttrade::rpc
