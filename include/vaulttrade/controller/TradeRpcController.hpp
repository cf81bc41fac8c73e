#pragma once

#include "vaulttrade/rpc/RpcDispatcher.hpp"
#include "vaulttrade/rpc/TradeMessages.hpp"
#include "vaulttrade/server/Router.hpp"
#include "vaulttrade/service/LedgerClient.hpp"
#include "vaulttrade/service/ListingService.hpp"
#include "vaulttrade/service/SessionService.hpp"
#include "vaulttrade/workflow/SettlementWorkflow.hpp"

#include <cstdint>
#include <optional>

namespace vaulttrade::controller {

class TradeRpcController : public rpc::RpcDispatcher {
public:
    TradeRpcController(service::ListingService& listings,
                       workflow::SettlementWorkflow& settlement,
                       service::SessionService& sessions,
                       service::LedgerClient& ledger,
                       std::int64_t channel);

    void registerRoutes(server::Router& router);

    boost::json::object dispatch(const boost::json::value& message) override;

private:
    boost::json::object handle(const rpc::trade::Login& request);
    boost::json::object handle(const rpc::trade::GetBalance& request);
    boost::json::object handle(const rpc::trade::GetListings& request);
    boost::json::object handle(const rpc::trade::CreateListing& request);
    boost::json::object handle(const rpc::trade::AddStock& request);
    boost::json::object handle(const rpc::trade::Buy& request);

    std::optional<boost::json::object> requireSession(const rpc::trade::Session& session);
    boost::json::object forward(const rpc::Reply& reply) const;

    service::ListingService& listings_;
    workflow::SettlementWorkflow& settlement_;
    service::SessionService& sessions_;
    service::LedgerClient& ledger_;
    std::int64_t channel_;
};

} // namespace vaulttrade::controller
