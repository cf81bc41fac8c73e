#include "vaulttrade/service/SessionService.hpp"
#include "vaulttrade/util/Logging.hpp"

#include <iomanip>
#include <limits>
#include <random>
#include <sstream>
#include <utility>

namespace vaulttrade::service {

SessionService::SessionService(std::chrono::seconds ttl, Clock clock)
    : ttl_(ttl)
    , clock_(std::move(clock)) {}

SessionService::SessionInfo SessionService::issue(const std::string& user) {
    const auto current = now();
    purgeExpired(current);

    SessionInfo info;
    info.user = user;
    info.expiresAt = current + ttl_;
    do {
        info.token = generateToken();
    } while (sessions_.find(info.token) != sessions_.end());

    sessions_.emplace(info.token, StoredSession{user, info.expiresAt});
    util::log(util::LogLevel::debug, "Session issued for " + user);
    return info;
}

void SessionService::revoke(const std::string& token) {
    if (token.empty()) {
        return;
    }
    sessions_.erase(token);
}

std::optional<std::string> SessionService::userForToken(const std::string& token) {
    if (token.empty()) {
        return std::nullopt;
    }

    const auto current = now();
    purgeExpired(current);

    auto it = sessions_.find(token);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second.user;
}

bool SessionService::validate(const std::string& user, const std::string& token) {
    auto owner = userForToken(token);
    return owner && !user.empty() && *owner == user;
}

std::chrono::system_clock::time_point SessionService::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

std::string SessionService::generateToken() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned long long> dist(0, std::numeric_limits<unsigned long long>::max());
    std::ostringstream oss;
    oss << std::hex;
    for (int i = 0; i < 4; ++i) {
        oss << std::setw(16) << std::setfill('0') << dist(rng);
    }
    return oss.str();
}

void SessionService::purgeExpired(std::chrono::system_clock::time_point now) {
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second.expiresAt <= now) {
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace vaulttrade::service
