#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <string>
#include <vector>

namespace vaulttrade::repository {

struct AuditEntry {
    std::chrono::system_clock::time_point at;
    std::string event;
    std::string message;
};

// Append-only record of every mutating operation, one JSON object per line.
// Entries are never rewritten; the newest ones are also kept in memory.
class AuditLog {
public:
    static constexpr std::size_t kRecentCapacity = 800;

    // An empty path keeps the log in memory only.
    explicit AuditLog(std::filesystem::path path = {});

    void append(const std::string& event, const std::string& message);

    std::vector<AuditEntry> recent(std::size_t limit = kRecentCapacity) const;
    std::vector<AuditEntry> findByEvent(const std::string& event) const;

private:
    void loadTail();
    void remember(AuditEntry entry);

    std::filesystem::path path_;
    std::deque<AuditEntry> recent_;
};

} // namespace vaulttrade::repository
