#pragma once

#include "vaulttrade/rpc/RpcChannel.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace vaulttrade::service {

// Trade-side view of the ledger, reached over an RpcChannel. Calls that
// act on someone else's account authenticate with the shared peer key.
class LedgerClient {
public:
    LedgerClient(rpc::RpcChannel& channel, std::string peerKey, std::chrono::milliseconds timeout);

    rpc::Reply login(const std::string& user, const std::string& pin);
    rpc::Reply getAccount(const std::string& user);
    // Live bank quotes; the reply carries `prices` keyed by item.
    rpc::Reply getPrices();
    rpc::Reply transfer(const std::string& from,
                        const std::string& to,
                        std::int64_t amount,
                        const std::string& transactionId);

    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    rpc::RpcChannel& channel_;
    std::string peerKey_;
    std::chrono::milliseconds timeout_;
};

} // namespace vaulttrade::service
