#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace vaulttrade::service {

// Trade-side login sessions. The bank decides who may log in; this only
// remembers which token was handed to which user and for how long.
class SessionService {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    struct SessionInfo {
        std::string token;
        std::string user;
        std::chrono::system_clock::time_point expiresAt;
    };

    explicit SessionService(std::chrono::seconds ttl = std::chrono::hours(12), Clock clock = {});

    SessionInfo issue(const std::string& user);
    void revoke(const std::string& token);

    // The user owning `token`, if the session is still live.
    std::optional<std::string> userForToken(const std::string& token);
    bool validate(const std::string& user, const std::string& token);

    [[nodiscard]] std::size_t activeCount() const noexcept { return sessions_.size(); }

private:
    struct StoredSession {
        std::string user;
        std::chrono::system_clock::time_point expiresAt;
    };

    std::chrono::system_clock::time_point now() const;
    std::string generateToken();
    void purgeExpired(std::chrono::system_clock::time_point now);

    std::chrono::seconds ttl_;
    Clock clock_;
    std::unordered_map<std::string, StoredSession> sessions_;
};

} // namespace vaulttrade::service
