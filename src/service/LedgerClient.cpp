#include "vaulttrade/service/LedgerClient.hpp"
#include "vaulttrade/rpc/LedgerMessages.hpp"

#include <utility>

namespace vaulttrade::service {

LedgerClient::LedgerClient(rpc::RpcChannel& channel, std::string peerKey, std::chrono::milliseconds timeout)
    : channel_(channel)
    , peerKey_(std::move(peerKey))
    , timeout_(timeout) {}

rpc::Reply LedgerClient::login(const std::string& user, const std::string& pin) {
    rpc::ledger::Envelope envelope{channel_.scope(), rpc::ledger::Login{user, pin}};
    return channel_.call(rpc::ledger::encodeRequest(envelope), timeout_);
}

rpc::Reply LedgerClient::getAccount(const std::string& user) {
    rpc::ledger::GetAccount request;
    request.user = user;
    request.auth.peerKey = peerKey_;
    return channel_.call(rpc::ledger::encodeRequest({channel_.scope(), request}), timeout_);
}

rpc::Reply LedgerClient::getPrices() {
    return channel_.call(rpc::ledger::encodeRequest({channel_.scope(), rpc::ledger::GetPrices{}}), timeout_);
}

rpc::Reply LedgerClient::transfer(const std::string& from,
                                  const std::string& to,
                                  std::int64_t amount,
                                  const std::string& transactionId) {
    rpc::ledger::Transfer request;
    request.from = from;
    request.to = to;
    request.amount = amount;
    request.transactionId = transactionId;
    request.auth.peerKey = peerKey_;
    return channel_.call(rpc::ledger::encodeRequest({channel_.scope(), request}), timeout_);
}

} // namespace vaulttrade::service
