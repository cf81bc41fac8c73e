#pragma once

#include <boost/json.hpp>

namespace vaulttrade::rpc {

// Server side of an RPC surface: one inbound message in, one reply out.
// Replies always carry the scope they were addressed to.
class RpcDispatcher {
public:
    virtual ~RpcDispatcher() = default;

    virtual boost::json::object dispatch(const boost::json::value& message) = 0;
};

} // namespace vaulttrade::rpc
