#pragma once

#include "vaulttrade/inventory/Container.hpp"

#include <boost/json.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace vaulttrade::inventory {

// Name -> container lookup. Discovery of real devices happens outside; the
// registry only resolves names the core is handed.
class ContainerRegistry {
public:
    Container& add(std::unique_ptr<Container> container);
    bool remove(const std::string& name);

    Container* find(const std::string& name) const;
    std::vector<std::string> names() const;

    // Simulated containers only; other kinds are skipped.
    boost::json::array snapshot() const;
    void restore(const boost::json::array& entries);

private:
    std::map<std::string, std::unique_ptr<Container>> containers_;
};

} // namespace vaulttrade::inventory
