#pragma once

#include "vaulttrade/util/Errors.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace vaulttrade::rpc {

struct Reply {
    bool ok{false};
    std::string error;
    util::ErrorClass errorClass{util::ErrorClass::none};
    boost::json::object body;

    [[nodiscard]] bool timedOut() const noexcept { return errorClass == util::ErrorClass::transportAmbiguity; }

    static Reply timeout();
    // Missing errorClass on a failed reply is read as internal.
    static Reply fromJson(const boost::json::value& value);
};

// Request/reply over an unreliable transport. A call that sees no matching
// reply within the timeout yields Reply::timeout(): the remote side may or
// may not have applied the request.
class RpcChannel {
public:
    explicit RpcChannel(std::int64_t scope);
    virtual ~RpcChannel() = default;

    // Stamps `request` with this channel's scope; replies carrying another
    // scope are discarded.
    Reply call(boost::json::object request, std::chrono::milliseconds timeout);

    [[nodiscard]] std::int64_t scope() const noexcept { return scope_; }

protected:
    // nullopt: nothing usable arrived before the deadline.
    virtual std::optional<boost::json::value> exchange(const boost::json::object& request,
                                                       std::chrono::milliseconds timeout) = 0;

private:
    std::int64_t scope_;
};

} // namespace vaulttrade::rpc
