#pragma once

#include "vaulttrade/repository/DatabaseConfig.hpp"

#include <mysqlx/xdevapi.h>

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vaulttrade::repository {

// Bounded set of X DevAPI sessions against one schema. A session whose work
// failed with a driver error is closed rather than returned to the pool.
class MySqlConnectionPool {
public:
    explicit MySqlConnectionPool(DatabaseConfig config);

    // Runs `work` on a pooled session; driver errors surface as util::StorageError.
    void withSession(const std::string& operation, const std::function<void(mysqlx::Session&)>& work);

    const std::string& schemaName() const noexcept { return config_.database; }

private:
    std::unique_ptr<mysqlx::Session> checkout();
    void checkin(std::unique_ptr<mysqlx::Session> session);
    void discard();
    std::unique_ptr<mysqlx::Session> connect();

    DatabaseConfig config_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<mysqlx::Session>> idle_;
    unsigned int open_{};
};

} // namespace vaulttrade::repository
