#pragma once

#include <cstdint>
#include <string>

namespace vaulttrade::model {

struct Listing {
    std::int64_t id{};
    std::string seller;
    std::string item;
    std::int64_t unitPrice{};
    std::int64_t quantity{};
};

} // namespace vaulttrade::model
