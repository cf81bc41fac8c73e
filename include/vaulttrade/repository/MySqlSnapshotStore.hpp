#pragma once

#include "vaulttrade/repository/MySqlConnectionPool.hpp"
#include "vaulttrade/repository/SnapshotStore.hpp"

#include <string>

namespace vaulttrade::repository {

// One row per named snapshot in `state_snapshots`.
class MySqlSnapshotStore : public SnapshotStore {
public:
    MySqlSnapshotStore(MySqlConnectionPool& pool, std::string name);

    std::optional<boost::json::value> load() override;
    void save(const boost::json::value& snapshot) override;
    [[nodiscard]] std::string describe() const override;

private:
    void ensureTable();

    MySqlConnectionPool& pool_;
    std::string name_;
    bool tableReady_{false};
};

} // namespace vaulttrade::repository
