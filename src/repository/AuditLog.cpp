#include "vaulttrade/repository/AuditLog.hpp"
#include "vaulttrade/util/Errors.hpp"
#include "vaulttrade/util/JsonResponse.hpp"
#include "vaulttrade/util/JsonUtil.hpp"
#include "vaulttrade/util/Logging.hpp"

#include <boost/json.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <utility>

namespace vaulttrade::repository {
namespace {

std::int64_t toEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

AuditLog::AuditLog(std::filesystem::path path)
    : path_(std::move(path)) {
    if (!path_.empty()) {
        loadTail();
    }
}

void AuditLog::append(const std::string& event, const std::string& message) {
    AuditEntry entry{std::chrono::system_clock::now(), event, message};

    if (!path_.empty()) {
        std::error_code ec;
        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path(), ec);
        }
        std::ofstream ofs(path_, std::ios::app);
        if (!ofs.is_open()) {
            throw util::StorageError(path_.string(), "cannot open audit log " + path_.string());
        }
        boost::json::object line{
            {"timestamp", util::formatIsoTimestamp(entry.at)},
            {"ms", toEpochMillis(entry.at)},
            {"event", entry.event},
            {"message", entry.message}};
        ofs << util::stringifyJson(line) << '\n';
        ofs.flush();
        if (!ofs) {
            throw util::StorageError(path_.string(), "cannot append to audit log " + path_.string());
        }
    }

    util::log(util::LogLevel::debug, "[audit] " + event + ": " + message);
    remember(std::move(entry));
}

std::vector<AuditEntry> AuditLog::recent(std::size_t limit) const {
    const auto count = std::min(limit, recent_.size());
    return std::vector<AuditEntry>(recent_.end() - static_cast<std::ptrdiff_t>(count), recent_.end());
}

std::vector<AuditEntry> AuditLog::findByEvent(const std::string& event) const {
    std::vector<AuditEntry> out;
    std::copy_if(recent_.begin(), recent_.end(), std::back_inserter(out),
                 [&event](const AuditEntry& entry) { return entry.event == event; });
    return out;
}

void AuditLog::loadTail() {
    std::ifstream ifs(path_);
    if (!ifs.is_open()) {
        return;
    }
    std::string line;
    while (std::getline(ifs, line)) {
        if (line.empty()) {
            continue;
        }
        try {
            auto parsed = util::parseJson(line);
            if (!parsed.is_object()) {
                continue;
            }
            const auto& obj = parsed.as_object();
            AuditEntry entry;
            entry.at = std::chrono::system_clock::time_point{
                std::chrono::milliseconds{util::getInt64(obj, "ms").value_or(0)}};
            entry.event = util::getString(obj, "event").value_or("");
            entry.message = util::getString(obj, "message").value_or("");
            remember(std::move(entry));
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::warn, "Unreadable audit line in " + path_.string() + ": " + ex.what());
        }
    }
}

void AuditLog::remember(AuditEntry entry) {
    recent_.push_back(std::move(entry));
    while (recent_.size() > kRecentCapacity) {
        recent_.pop_front();
    }
}

} // namespace vaulttrade::repository
