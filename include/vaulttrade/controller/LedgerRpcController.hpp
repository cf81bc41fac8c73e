#pragma once

#include "vaulttrade/rpc/LedgerMessages.hpp"
#include "vaulttrade/rpc/RpcDispatcher.hpp"
#include "vaulttrade/server/Router.hpp"
#include "vaulttrade/service/LedgerService.hpp"
#include "vaulttrade/service/VaultService.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace vaulttrade::controller {

// The ledger RPC surface. Served over POST /rpc/ledger and, in a combined
// process, called in-process by the trade side.
class LedgerRpcController : public rpc::RpcDispatcher {
public:
    LedgerRpcController(service::LedgerService& ledger,
                        service::VaultService& vault,
                        std::int64_t channel,
                        std::string peerKey);

    void registerRoutes(server::Router& router);

    // util::StorageError escapes; every other failure becomes an {ok:false} reply.
    boost::json::object dispatch(const boost::json::value& message) override;

private:
    boost::json::object handle(const rpc::ledger::Login& request);
    boost::json::object handle(const rpc::ledger::CreateAccount& request);
    boost::json::object handle(const rpc::ledger::GetAccount& request);
    boost::json::object handle(const rpc::ledger::GetPrices& request);
    boost::json::object handle(const rpc::ledger::GetVaultStock& request);
    boost::json::object handle(const rpc::ledger::DepositFromClientChest& request);
    boost::json::object handle(const rpc::ledger::WithdrawToClientChest& request);
    boost::json::object handle(const rpc::ledger::Transfer& request);

    // Rejection reply, or nullopt when `auth` may act for `user`.
    std::optional<boost::json::object> authorize(const std::string& user, const rpc::ledger::Credentials& auth) const;
    boost::json::object reject(const service::LedgerResult& result) const;

    service::LedgerService& ledger_;
    service::VaultService& vault_;
    std::int64_t channel_;
    std::string peerKey_;
};

} // namespace vaulttrade::controller
