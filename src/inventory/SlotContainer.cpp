#include "vaulttrade/inventory/SlotContainer.hpp"
#include "vaulttrade/util/JsonUtil.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace vaulttrade::inventory {

SlotContainer::SlotContainer(std::string name, int slots, std::int64_t stackLimit)
    : name_(std::move(name))
    , stackLimit_(stackLimit > 0 ? stackLimit : kDefaultStackLimit)
    , slots_(static_cast<std::size_t>(std::max(1, slots))) {
    if (name_.empty()) {
        throw std::invalid_argument("container name must not be empty");
    }
}

std::map<int, ItemStack> SlotContainer::list() const {
    std::map<int, ItemStack> out;
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i] && slots_[i]->count > 0) {
            out.emplace(static_cast<int>(i), *slots_[i]);
        }
    }
    return out;
}

std::int64_t SlotContainer::moveUnits(Container& destination, int slot, std::int64_t count) {
    if (&destination == this || count <= 0 || slot < 0 || static_cast<std::size_t>(slot) >= slots_.size()) {
        return 0;
    }
    auto& stack = slots_[static_cast<std::size_t>(slot)];
    if (!stack || stack->count <= 0) {
        return 0;
    }

    const std::string item = stack->item;
    const std::int64_t offered = std::min(count, stack->count);
    const std::int64_t accepted = std::clamp<std::int64_t>(destination.receive(item, offered), 0, offered);

    stack->count -= accepted;
    if (stack->count <= 0) {
        stack.reset();
    }
    return accepted;
}

std::int64_t SlotContainer::receive(const std::string& item, std::int64_t count) {
    if (item.empty() || count <= 0) {
        return 0;
    }
    std::int64_t remaining = count;
    for (auto& slot : slots_) {
        if (remaining == 0) break;
        if (slot && slot->item == item && slot->count < stackLimit_) {
            const auto room = stackLimit_ - slot->count;
            const auto placed = std::min(room, remaining);
            slot->count += placed;
            remaining -= placed;
        }
    }
    for (auto& slot : slots_) {
        if (remaining == 0) break;
        if (!slot) {
            const auto placed = std::min(stackLimit_, remaining);
            slot = ItemStack{item, placed};
            remaining -= placed;
        }
    }
    return count - remaining;
}

std::int64_t SlotContainer::take(const std::string& item, std::int64_t count) {
    std::int64_t remaining = std::max<std::int64_t>(0, count);
    for (auto& slot : slots_) {
        if (remaining == 0) break;
        if (slot && slot->item == item) {
            const auto removed = std::min(remaining, slot->count);
            slot->count -= removed;
            remaining -= removed;
            if (slot->count <= 0) {
                slot.reset();
            }
        }
    }
    return std::max<std::int64_t>(0, count) - remaining;
}

boost::json::object SlotContainer::toJson() const {
    boost::json::array contents;
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i] && slots_[i]->count > 0) {
            contents.push_back(boost::json::object{
                {"slot", static_cast<std::int64_t>(i)},
                {"item", slots_[i]->item},
                {"count", slots_[i]->count}});
        }
    }
    return boost::json::object{
        {"name", name_},
        {"slots", static_cast<std::int64_t>(slots_.size())},
        {"stackLimit", stackLimit_},
        {"contents", std::move(contents)}};
}

SlotContainer SlotContainer::fromJson(const boost::json::object& json) {
    auto name = util::getString(json, "name");
    if (!name || name->empty()) {
        throw std::invalid_argument("container entry missing name");
    }
    const auto slots = util::getInt64(json, "slots").value_or(kDefaultSlots);
    const auto stackLimit = util::getInt64(json, "stackLimit").value_or(kDefaultStackLimit);
    SlotContainer container(*name, static_cast<int>(std::clamp<std::int64_t>(slots, 1, 4096)), stackLimit);

    if (auto it = json.if_contains("contents"); it && it->is_array()) {
        for (const auto& entry : it->as_array()) {
            if (!entry.is_object()) {
                continue;
            }
            const auto& obj = entry.as_object();
            auto item = util::getString(obj, "item");
            auto count = util::getInt64(obj, "count");
            if (!item || item->empty() || !count || *count <= 0) {
                continue;
            }
            auto slot = util::getInt64(obj, "slot");
            if (slot && *slot >= 0 && static_cast<std::size_t>(*slot) < container.slots_.size() &&
                !container.slots_[static_cast<std::size_t>(*slot)]) {
                container.slots_[static_cast<std::size_t>(*slot)] =
                    ItemStack{*item, std::min(*count, container.stackLimit_)};
            } else {
                container.receive(*item, *count);
            }
        }
    }
    return container;
}

} // namespace vaulttrade::inventory
