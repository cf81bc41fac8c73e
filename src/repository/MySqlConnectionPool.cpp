#include "vaulttrade/repository/MySqlConnectionPool.hpp"
#include "vaulttrade/util/Errors.hpp"
#include "vaulttrade/util/Logging.hpp"

#include <stdexcept>
#include <utility>

namespace vaulttrade::repository {

MySqlConnectionPool::MySqlConnectionPool(DatabaseConfig config)
    : config_(std::move(config)) {
    if (config_.host.empty()) {
        config_.host = "127.0.0.1";
    }
    if (config_.database.empty()) {
        throw std::runtime_error("Database name must be provided in configuration");
    }
    if (config_.poolSize == 0) {
        config_.poolSize = 1;
    }
}

std::unique_ptr<mysqlx::Session> MySqlConnectionPool::connect() {
    auto session = std::make_unique<mysqlx::Session>(
        mysqlx::SessionOption::HOST, config_.host,
        mysqlx::SessionOption::PORT, static_cast<unsigned int>(config_.port),
        mysqlx::SessionOption::USER, config_.user,
        mysqlx::SessionOption::PWD, config_.password);
    if (!config_.charset.empty()) {
        session->sql("SET NAMES '" + config_.charset + "'").execute();
    }
    session->sql("CREATE DATABASE IF NOT EXISTS `" + config_.database + "`").execute();
    session->sql("USE `" + config_.database + "`").execute();
    util::log(util::LogLevel::debug, "Opened MySQL session to " + config_.host + "/" + config_.database);
    return session;
}

std::unique_ptr<mysqlx::Session> MySqlConnectionPool::checkout() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return !idle_.empty() || open_ < config_.poolSize; });

    if (!idle_.empty()) {
        auto session = std::move(idle_.back());
        idle_.pop_back();
        return session;
    }

    ++open_;
    lock.unlock();
    try {
        return connect();
    } catch (...) {
        discard();
        throw;
    }
}

void MySqlConnectionPool::checkin(std::unique_ptr<mysqlx::Session> session) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(std::move(session));
    }
    cv_.notify_one();
}

void MySqlConnectionPool::discard() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (open_ > 0) {
            --open_;
        }
    }
    cv_.notify_one();
}

void MySqlConnectionPool::withSession(const std::string& operation,
                                      const std::function<void(mysqlx::Session&)>& work) {
    std::unique_ptr<mysqlx::Session> session;
    try {
        session = checkout();
    } catch (const mysqlx::Error& err) {
        util::log(util::LogLevel::error, "Create MySQL session failed: " + std::string(err.what()));
        throw util::StorageError(config_.database, operation + " failed: " + err.what());
    }

    try {
        work(*session);
    } catch (const mysqlx::Error& err) {
        session.reset();
        discard();
        util::log(util::LogLevel::error, operation + " failed: " + err.what());
        throw util::StorageError(config_.database, operation + " failed: " + err.what());
    } catch (...) {
        checkin(std::move(session));
        throw;
    }
    checkin(std::move(session));
}

} // namespace vaulttrade::repository
