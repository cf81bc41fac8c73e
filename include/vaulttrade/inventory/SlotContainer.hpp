#pragma once

#include "vaulttrade/inventory/Container.hpp"

#include <boost/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vaulttrade::inventory {

// In-process chest model: fixed slot count, per-slot stack limit.
class SlotContainer : public Container {
public:
    static constexpr int kDefaultSlots = 27;
    static constexpr std::int64_t kDefaultStackLimit = 64;

    explicit SlotContainer(std::string name,
                           int slots = kDefaultSlots,
                           std::int64_t stackLimit = kDefaultStackLimit);

    [[nodiscard]] const std::string& name() const noexcept override { return name_; }

    std::map<int, ItemStack> list() const override;
    std::int64_t moveUnits(Container& destination, int slot, std::int64_t count) override;
    std::int64_t receive(const std::string& item, std::int64_t count) override;

    [[nodiscard]] int slotCount() const noexcept { return static_cast<int>(slots_.size()); }
    [[nodiscard]] std::int64_t stackLimit() const noexcept { return stackLimit_; }

    // Removes up to `count` units of `item` from anywhere in the container.
    std::int64_t take(const std::string& item, std::int64_t count);

    boost::json::object toJson() const;
    static SlotContainer fromJson(const boost::json::object& json);

private:
    std::string name_;
    std::int64_t stackLimit_;
    std::vector<std::optional<ItemStack>> slots_;
};

} // namespace vaulttrade::inventory
