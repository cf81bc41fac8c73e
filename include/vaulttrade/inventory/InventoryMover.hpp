#pragma once

#include "vaulttrade/inventory/Container.hpp"
#include "vaulttrade/inventory/ContainerRegistry.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace vaulttrade::inventory {

// item -> units, always recomputed from a live scan.
using StockSnapshot = std::map<std::string, std::int64_t>;

struct MoveReport {
    std::int64_t moved{};
    std::optional<std::string> error;
};

class InventoryMover {
public:
    explicit InventoryMover(ContainerRegistry& registry);

    // Slot-by-slot transfer of up to `requested` units of `item`.
    // A short count is the only failure signal; requested <= 0 or a container
    // moving into itself moves nothing.
    std::int64_t move(Container& source,
                      Container& destination,
                      const std::string& item,
                      std::int64_t requested) const;

    // Same as above with names resolved through the registry. A missing
    // or shared container is reported in `error` with moved == 0.
    MoveReport move(const std::string& source,
                    const std::string& destination,
                    const std::string& item,
                    std::int64_t requested) const;

    // One slot, whatever it holds. Device over-reports are clamped to [0, count].
    std::int64_t moveSlot(Container& source, Container& destination, int slot, std::int64_t count) const;

    static StockSnapshot scan(const Container& container);
    std::optional<StockSnapshot> scan(const std::string& container) const;

    ContainerRegistry& registry() const noexcept { return registry_; }

private:
    ContainerRegistry& registry_;
};

} // namespace vaulttrade::inventory
