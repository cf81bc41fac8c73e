#include "vaulttrade/repository/MySqlSnapshotStore.hpp"
#include "vaulttrade/util/Errors.hpp"
#include "vaulttrade/util/JsonUtil.hpp"

#include <mysqlx/xdevapi.h>

#include <utility>

namespace vaulttrade::repository {
namespace {

constexpr const char* kCreateTable =
    "CREATE TABLE IF NOT EXISTS state_snapshots ("
    " name VARCHAR(64) NOT NULL PRIMARY KEY,"
    " payload LONGTEXT NOT NULL,"
    " updated_at TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP ON UPDATE CURRENT_TIMESTAMP"
    ")";

constexpr const char* kUpsert =
    "INSERT INTO state_snapshots (name, payload) VALUES (?, ?) "
    "ON DUPLICATE KEY UPDATE payload = VALUES(payload)";

} // namespace

MySqlSnapshotStore::MySqlSnapshotStore(MySqlConnectionPool& pool, std::string name)
    : pool_(pool)
    , name_(std::move(name)) {}

std::string MySqlSnapshotStore::describe() const {
    return "mysql:" + pool_.schemaName() + ".state_snapshots/" + name_;
}

void MySqlSnapshotStore::ensureTable() {
    if (tableReady_) {
        return;
    }
    pool_.withSession("Create state_snapshots", [](mysqlx::Session& session) {
        session.sql(kCreateTable).execute();
    });
    tableReady_ = true;
}

std::optional<boost::json::value> MySqlSnapshotStore::load() {
    ensureTable();

    std::optional<std::string> payload;
    pool_.withSession("Load snapshot " + name_, [this, &payload](mysqlx::Session& session) {
        mysqlx::Schema schema = session.getSchema(pool_.schemaName());
        mysqlx::Table table = schema.getTable("state_snapshots");
        mysqlx::RowResult rows = table.select("payload")
                                     .where("name = :name")
                                     .bind("name", name_)
                                     .limit(1)
                                     .execute();
        for (mysqlx::Row row : rows) {
            if (!row[0].isNull()) {
                payload = row[0].get<std::string>();
            }
        }
    });

    if (!payload || payload->empty()) {
        return std::nullopt;
    }
    try {
        return util::parseJson(*payload);
    } catch (const std::exception& ex) {
        throw util::StorageError(describe(), "snapshot " + describe() + " is corrupt: " + ex.what());
    }
}

void MySqlSnapshotStore::save(const boost::json::value& snapshot) {
    ensureTable();
    const std::string payload = util::stringifyJson(snapshot);
    pool_.withSession("Save snapshot " + name_, [this, &payload](mysqlx::Session& session) {
        session.sql(kUpsert).bind(name_).bind(payload).execute();
    });
}

} // namespace vaulttrade::repository
