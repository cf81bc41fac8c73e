#include "vaulttrade/repository/StateRepository.hpp"
#include "vaulttrade/util/JsonUtil.hpp"
#include "vaulttrade/util/Logging.hpp"

#include <algorithm>
#include <chrono>

namespace vaulttrade::repository {
namespace {

std::int64_t toEpochSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochSeconds(std::int64_t seconds) {
    return std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
}

const boost::json::object* objectField(const boost::json::object& parent, std::string_view key) {
    if (auto it = parent.if_contains(key); it && it->is_object()) {
        return &it->as_object();
    }
    return nullptr;
}

const boost::json::array* arrayField(const boost::json::object& parent, std::string_view key) {
    if (auto it = parent.if_contains(key); it && it->is_array()) {
        return &it->as_array();
    }
    return nullptr;
}

void decodePriceConfig(const boost::json::object& json, model::PriceConfig& price) {
    if (auto value = util::getInt64(json, "maxStock"); value && *value > 0) {
        price.maxStock = *value;
    }
    if (auto value = util::getInt64(json, "minPrice"); value && *value >= 0) {
        price.minPrice = *value;
    }
    if (auto value = util::getDouble(json, "elasticity"); value && *value >= 0.0) {
        price.elasticity = *value;
    }
    if (auto value = util::getString(json, "currencySymbol"); value && !value->empty()) {
        price.currencySymbol = *value;
    }
}

} // namespace

boost::json::value encodeBankState(const model::BankState& state) {
    boost::json::object accounts;
    for (const auto& [identity, account] : state.accounts) {
        accounts[identity] = boost::json::object{
            {"pin", account.credential},
            {"approved", account.approved},
            {"balance", account.balance}};
    }

    boost::json::object items;
    for (const auto& [name, item] : state.catalog.items) {
        items[name] = boost::json::object{{"basePrice", item.basePrice}};
    }

    const auto& price = state.catalog.price;
    boost::json::object config{
        {"vaultChest", state.vaultContainer},
        {"price", boost::json::object{
            {"maxStock", price.maxStock},
            {"minPrice", price.minPrice},
            {"elasticity", price.elasticity},
            {"currencySymbol", price.currencySymbol}}}};

    boost::json::array journal;
    for (const auto& receipt : state.journal) {
        journal.push_back(boost::json::object{
            {"id", receipt.transactionId},
            {"from", receipt.from},
            {"to", receipt.to},
            {"amount", receipt.amount},
            {"at", toEpochSeconds(receipt.appliedAt)}});
    }

    return boost::json::object{
        {"version", state.version},
        {"accounts", std::move(accounts)},
        {"items", std::move(items)},
        {"config", std::move(config)},
        {"journal", std::move(journal)}};
}

model::BankState decodeBankState(const boost::json::value& json) {
    model::BankState state;
    if (!json.is_object()) {
        return state;
    }
    const auto& root = json.as_object();

    if (auto version = util::getInt64(root, "version")) {
        state.version = static_cast<int>(*version);
    }

    if (const auto* accounts = objectField(root, "accounts")) {
        for (const auto& [key, value] : *accounts) {
            if (!value.is_object()) {
                util::log(util::LogLevel::warn, "Skipping malformed account record " + std::string(key));
                continue;
            }
            const auto& obj = value.as_object();
            model::Account account;
            account.identity = std::string(key);
            account.credential = util::getString(obj, "pin").value_or("");
            account.approved = util::getBool(obj, "approved").value_or(false);
            account.balance = util::getInt64(obj, "balance").value_or(0);
            if (account.balance < 0) {
                util::log(util::LogLevel::warn, "Clamping negative stored balance of " + account.identity);
                account.balance = 0;
            }
            state.accounts.emplace(account.identity, std::move(account));
        }
    }

    if (const auto* items = objectField(root, "items")) {
        for (const auto& [key, value] : *items) {
            if (!value.is_object()) {
                continue;
            }
            model::ItemPrice item;
            item.item = std::string(key);
            item.basePrice = util::getInt64(value.as_object(), "basePrice").value_or(0);
            state.catalog.items.emplace(item.item, std::move(item));
        }
    }

    if (const auto* config = objectField(root, "config")) {
        state.vaultContainer = util::getString(*config, "vaultChest").value_or("");
        if (const auto* price = objectField(*config, "price")) {
            decodePriceConfig(*price, state.catalog.price);
        }
    }

    if (const auto* journal = arrayField(root, "journal")) {
        for (const auto& entry : *journal) {
            if (!entry.is_object()) {
                continue;
            }
            const auto& obj = entry.as_object();
            model::TransferReceipt receipt;
            receipt.transactionId = util::getString(obj, "id").value_or("");
            if (receipt.transactionId.empty()) {
                continue;
            }
            receipt.from = util::getString(obj, "from").value_or("");
            receipt.to = util::getString(obj, "to").value_or("");
            receipt.amount = util::getInt64(obj, "amount").value_or(0);
            receipt.appliedAt = fromEpochSeconds(util::getInt64(obj, "at").value_or(0));
            state.journal.push_back(std::move(receipt));
        }
        while (state.journal.size() > model::BankState::kJournalCapacity) {
            state.journal.pop_front();
        }
    }

    return state;
}

boost::json::value encodeTradeState(const model::TradeState& state) {
    boost::json::array listings;
    for (const auto& listing : state.listings) {
        listings.push_back(boost::json::object{
            {"id", listing.id},
            {"seller", listing.seller},
            {"item", listing.item},
            {"price", listing.unitPrice},
            {"qty", listing.quantity}});
    }
    return boost::json::object{
        {"version", state.version},
        {"listings", std::move(listings)},
        {"nextId", state.nextListingId},
        {"vaultName", state.vaultContainer}};
}

model::TradeState decodeTradeState(const boost::json::value& json) {
    model::TradeState state;
    if (!json.is_object()) {
        return state;
    }
    const auto& root = json.as_object();

    if (auto version = util::getInt64(root, "version")) {
        state.version = static_cast<int>(*version);
    }
    state.vaultContainer = util::getString(root, "vaultName").value_or("");

    std::int64_t highestId = 0;
    if (const auto* listings = arrayField(root, "listings")) {
        for (const auto& entry : *listings) {
            if (!entry.is_object()) {
                continue;
            }
            const auto& obj = entry.as_object();
            model::Listing listing;
            listing.id = util::getInt64(obj, "id").value_or(0);
            listing.seller = util::getString(obj, "seller").value_or("");
            listing.item = util::getString(obj, "item").value_or("");
            listing.unitPrice = util::getInt64(obj, "price").value_or(0);
            listing.quantity = std::max<std::int64_t>(0, util::getInt64(obj, "qty").value_or(0));
            if (listing.id <= 0 || listing.item.empty()) {
                util::log(util::LogLevel::warn, "Skipping malformed listing record");
                continue;
            }
            highestId = std::max(highestId, listing.id);
            state.listings.push_back(std::move(listing));
        }
    }
    std::sort(state.listings.begin(), state.listings.end(),
              [](const model::Listing& a, const model::Listing& b) { return a.id < b.id; });

    state.nextListingId = std::max(util::getInt64(root, "nextId").value_or(1), highestId + 1);
    return state;
}

BankRepository::BankRepository(SnapshotStore& store)
    : store_(store) {}

model::BankState BankRepository::load() {
    auto snapshot = store_.load();
    if (!snapshot) {
        util::log(util::LogLevel::info, "No bank state at " + store_.describe() + ", starting fresh");
        return model::BankState{};
    }
    auto state = decodeBankState(*snapshot);
    util::log(util::LogLevel::info, "Loaded bank state: " + std::to_string(state.accounts.size()) +
                                        " accounts, " + std::to_string(state.catalog.items.size()) + " items");
    return state;
}

void BankRepository::save(const model::BankState& state) {
    store_.save(encodeBankState(state));
}

TradeRepository::TradeRepository(SnapshotStore& store)
    : store_(store) {}

model::TradeState TradeRepository::load() {
    auto snapshot = store_.load();
    if (!snapshot) {
        util::log(util::LogLevel::info, "No trade state at " + store_.describe() + ", starting fresh");
        return model::TradeState{};
    }
    auto state = decodeTradeState(*snapshot);
    util::log(util::LogLevel::info, "Loaded trade state: " + std::to_string(state.listings.size()) +
                                        " listings, next id " + std::to_string(state.nextListingId));
    return state;
}

void TradeRepository::save(const model::TradeState& state) {
    store_.save(encodeTradeState(state));
}

} // namespace vaulttrade::repository
