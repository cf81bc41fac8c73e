#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace vaulttrade::model {

struct Account {
    std::string identity;
    std::string credential;
    bool approved{false};
    std::int64_t balance{};
};

struct TransferReceipt {
    std::string transactionId;
    std::string from;
    std::string to;
    std::int64_t amount{};
    std::chrono::system_clock::time_point appliedAt{};
};

} // namespace vaulttrade::model
