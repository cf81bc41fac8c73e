#include "TestSupport.hpp"

#include "vaulttrade/util/Errors.hpp"

#include <memory>
#include <stdexcept>

namespace vaulttrade::fixtures {

void MemorySnapshotStore::save(const boost::json::value& value) {
    if (failSaves) {
        throw util::StorageError("memory", "save refused");
    }
    snapshot = value;
    ++saves;
}

std::optional<boost::json::value> CannedChannel::exchange(const boost::json::object& request,
                                                          std::chrono::milliseconds) {
    lastRequest = request;
    return next;
}

std::optional<boost::json::value> ScriptedChannel::exchange(const boost::json::object& request,
                                                            std::chrono::milliseconds) {
    ++calls_;
    if (onCall) {
        onCall();
    }
    auto fate = Fate::deliver;
    if (!fates_.empty()) {
        fate = fates_.front();
        fates_.pop_front();
    }
    if (fate == Fate::loseRequest) {
        return std::nullopt;
    }
    auto reply = dispatcher_.dispatch(boost::json::value(request));
    if (fate == Fate::loseReply) {
        return std::nullopt;
    }
    return boost::json::value(std::move(reply));
}

MarketHarness::MarketHarness() = default;

inventory::SlotContainer& MarketHarness::addContainer(const std::string& name, int slots, std::int64_t stackLimit) {
    auto& added = registry.add(std::make_unique<inventory::SlotContainer>(name, slots, stackLimit));
    return static_cast<inventory::SlotContainer&>(added);
}

inventory::SlotContainer& MarketHarness::container(const std::string& name) {
    auto* found = registry.find(name);
    if (!found) {
        throw std::out_of_range("no container " + name);
    }
    return static_cast<inventory::SlotContainer&>(*found);
}

std::int64_t MarketHarness::countOf(const std::string& containerName, const std::string& item) {
    auto stock = inventory::InventoryMover::scan(container(containerName));
    auto it = stock.find(item);
    return it == stock.end() ? 0 : it->second;
}

void MarketHarness::openAccount(const std::string& user, const std::string& pin, std::int64_t balance) {
    ledger.registerAccount(user, pin);
    ledger.approve(user);
    if (balance > 0) {
        ledger.adjust(user, balance);
    }
}

std::int64_t MarketHarness::balanceOf(const std::string& user) const {
    auto account = ledger.findAccount(user);
    return account ? account->balance : -1;
}

} // namespace vaulttrade::fixtures
