#pragma once

#include "vaulttrade/model/Account.hpp"
#include "vaulttrade/model/Catalog.hpp"
#include "vaulttrade/model/Listing.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace vaulttrade::model {

struct BankState {
    static constexpr std::size_t kJournalCapacity = 10000;

    std::map<std::string, Account> accounts;
    Catalog catalog;
    std::string vaultContainer;
    std::deque<TransferReceipt> journal;
    int version{1};
};

struct TradeState {
    std::vector<Listing> listings;
    std::int64_t nextListingId{1};
    std::string vaultContainer;
    int version{1};
};

} // namespace vaulttrade::model
