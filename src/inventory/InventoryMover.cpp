#include "vaulttrade/inventory/InventoryMover.hpp"
#include "vaulttrade/util/Logging.hpp"

#include <algorithm>

namespace vaulttrade::inventory {

InventoryMover::InventoryMover(ContainerRegistry& registry)
    : registry_(registry) {}

std::int64_t InventoryMover::move(Container& source,
                                  Container& destination,
                                  const std::string& item,
                                  std::int64_t requested) const {
    if (requested <= 0 || item.empty() || &source == &destination) {
        return 0;
    }

    std::int64_t remaining = requested;
    for (const auto& [slot, stack] : source.list()) {
        if (remaining <= 0) {
            break;
        }
        if (stack.item != item || stack.count <= 0) {
            continue;
        }
        const auto moved = moveSlot(source, destination, slot, std::min(remaining, stack.count));
        remaining -= moved;
    }
    return requested - remaining;
}

MoveReport InventoryMover::move(const std::string& source,
                                const std::string& destination,
                                const std::string& item,
                                std::int64_t requested) const {
    MoveReport report;
    auto* src = registry_.find(source);
    if (!src) {
        report.error = "Container not found: " + (source.empty() ? std::string{"(unset)"} : source);
        return report;
    }
    auto* dst = registry_.find(destination);
    if (!dst) {
        report.error = "Container not found: " + (destination.empty() ? std::string{"(unset)"} : destination);
        return report;
    }
    if (src == dst) {
        report.error = "Source and destination are the same container";
        return report;
    }
    report.moved = move(*src, *dst, item, requested);
    return report;
}

std::int64_t InventoryMover::moveSlot(Container& source, Container& destination, int slot, std::int64_t count) const {
    if (count <= 0 || &source == &destination) {
        return 0;
    }
    auto moved = source.moveUnits(destination, slot, count);
    if (moved < 0 || moved > count) {
        util::log(util::LogLevel::warn,
                  "Container " + source.name() + " reported " + std::to_string(moved) +
                      " units moved from slot " + std::to_string(slot) + " for a request of " +
                      std::to_string(count));
        moved = std::clamp<std::int64_t>(moved, 0, count);
    }
    return moved;
}

StockSnapshot InventoryMover::scan(const Container& container) {
    StockSnapshot stock;
    for (const auto& [slot, stack] : container.list()) {
        if (!stack.item.empty() && stack.count > 0) {
            stock[stack.item] += stack.count;
        }
    }
    return stock;
}

std::optional<StockSnapshot> InventoryMover::scan(const std::string& container) const {
    auto* found = registry_.find(container);
    if (!found) {
        return std::nullopt;
    }
    return scan(*found);
}

} // namespace vaulttrade::inventory
