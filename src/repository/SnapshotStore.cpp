#include "vaulttrade/repository/SnapshotStore.hpp"
#include "vaulttrade/util/Errors.hpp"
#include "vaulttrade/util/JsonUtil.hpp"
#include "vaulttrade/util/Logging.hpp"

#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace vaulttrade::repository {

JsonFileSnapshotStore::JsonFileSnapshotStore(std::filesystem::path path)
    : path_(std::move(path)) {}

std::optional<boost::json::value> JsonFileSnapshotStore::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return std::nullopt;
    }

    std::ifstream ifs(path_);
    if (!ifs.is_open()) {
        throw util::StorageError(path_.string(), "cannot open snapshot " + path_.string());
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (content.empty()) {
        return std::nullopt;
    }

    try {
        return util::parseJson(content);
    } catch (const std::exception& ex) {
        throw util::StorageError(path_.string(),
                                 "snapshot " + path_.string() + " is corrupt: " + ex.what());
    }
}

void JsonFileSnapshotStore::save(const boost::json::value& snapshot) {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw util::StorageError(path_.string(), "cannot create " + path_.parent_path().string() +
                                                         ": " + ec.message());
        }
    }

    auto temp = path_;
    temp += ".tmp";
    {
        std::ofstream ofs(temp, std::ios::trunc);
        if (!ofs.is_open()) {
            throw util::StorageError(path_.string(), "cannot write " + temp.string());
        }
        ofs << util::stringifyJson(snapshot);
        ofs.flush();
        if (!ofs) {
            throw util::StorageError(path_.string(), "short write to " + temp.string());
        }
    }

    std::filesystem::rename(temp, path_, ec);
    if (ec) {
        throw util::StorageError(path_.string(), "cannot replace " + path_.string() + ": " + ec.message());
    }
    util::log(util::LogLevel::trace, "Saved snapshot " + path_.string());
}

} // namespace vaulttrade::repository
