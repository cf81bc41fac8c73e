#pragma once

#include <boost/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace vaulttrade::repository {

// Whole-state persistence. Implementations throw util::StorageError on I/O failure.
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    virtual std::optional<boost::json::value> load() = 0;
    virtual void save(const boost::json::value& snapshot) = 0;
    [[nodiscard]] virtual std::string describe() const = 0;
};

class JsonFileSnapshotStore : public SnapshotStore {
public:
    explicit JsonFileSnapshotStore(std::filesystem::path path);

    std::optional<boost::json::value> load() override;
    void save(const boost::json::value& snapshot) override;
    [[nodiscard]] std::string describe() const override { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace vaulttrade::repository
