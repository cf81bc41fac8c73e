#include "vaulttrade/inventory/ContainerRegistry.hpp"
#include "vaulttrade/inventory/SlotContainer.hpp"
#include "vaulttrade/util/Logging.hpp"

#include <stdexcept>
#include <utility>

namespace vaulttrade::inventory {

Container& ContainerRegistry::add(std::unique_ptr<Container> container) {
    if (!container) {
        throw std::invalid_argument("container must not be null");
    }
    const std::string name = container->name();
    auto& slot = containers_[name];
    slot = std::move(container);
    return *slot;
}

bool ContainerRegistry::remove(const std::string& name) {
    return containers_.erase(name) > 0;
}

Container* ContainerRegistry::find(const std::string& name) const {
    if (name.empty()) {
        return nullptr;
    }
    auto it = containers_.find(name);
    return it == containers_.end() ? nullptr : it->second.get();
}

std::vector<std::string> ContainerRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(containers_.size());
    for (const auto& [name, container] : containers_) {
        out.push_back(name);
    }
    return out;
}

boost::json::array ContainerRegistry::snapshot() const {
    boost::json::array out;
    for (const auto& [name, container] : containers_) {
        if (auto* simulated = dynamic_cast<const SlotContainer*>(container.get())) {
            out.push_back(simulated->toJson());
        }
    }
    return out;
}

void ContainerRegistry::restore(const boost::json::array& entries) {
    for (const auto& entry : entries) {
        if (!entry.is_object()) {
            continue;
        }
        try {
            add(std::make_unique<SlotContainer>(SlotContainer::fromJson(entry.as_object())));
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::warn, std::string{"Skipping container entry: "} + ex.what());
        }
    }
}

} // namespace vaulttrade::inventory
