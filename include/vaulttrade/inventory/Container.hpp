#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace vaulttrade::inventory {

struct ItemStack {
    std::string item;
    std::int64_t count{};
};

// A physical, slot-addressed inventory. Implementations report what they
// actually did; callers never assume a move fully succeeded.
class Container {
public:
    virtual ~Container() = default;

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;

    // Occupied slots only, keyed by slot index.
    virtual std::map<int, ItemStack> list() const = 0;

    // Moves up to `count` units out of `slot` into `destination`.
    // Returns the units that left this container; moving into itself is 0.
    virtual std::int64_t moveUnits(Container& destination, int slot, std::int64_t count) = 0;

    // Accepts up to `count` units of `item`; returns how many were stored.
    virtual std::int64_t receive(const std::string& item, std::int64_t count) = 0;
};

} // namespace vaulttrade::inventory
