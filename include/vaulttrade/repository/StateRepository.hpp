#pragma once

#include "vaulttrade/model/State.hpp"
#include "vaulttrade/repository/SnapshotStore.hpp"

#include <boost/json.hpp>

namespace vaulttrade::repository {

boost::json::value encodeBankState(const model::BankState& state);
// Missing or malformed fields fall back to in-code defaults.
model::BankState decodeBankState(const boost::json::value& json);

boost::json::value encodeTradeState(const model::TradeState& state);
model::TradeState decodeTradeState(const boost::json::value& json);

class BankRepository {
public:
    explicit BankRepository(SnapshotStore& store);

    model::BankState load();
    void save(const model::BankState& state);

private:
    SnapshotStore& store_;
};

class TradeRepository {
public:
    explicit TradeRepository(SnapshotStore& store);

    model::TradeState load();
    void save(const model::TradeState& state);

private:
    SnapshotStore& store_;
};

} // namespace vaulttrade::repository
