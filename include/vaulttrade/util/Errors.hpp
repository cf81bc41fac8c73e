#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace vaulttrade::util {

enum class ErrorClass {
    none,
    validation,
    authorization,
    insufficientResource,
    transportAmbiguity,
    unrecoveredInconsistency,
    internal,
};

std::string_view toString(ErrorClass errorClass) noexcept;
std::optional<ErrorClass> parseErrorClass(std::string_view text);

// Bad input shape at a boundary. Converted into a rejected reply, never fatal.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Durable state could not be read or written. Fatal to the owning process.
class StorageError : public std::runtime_error {
public:
    StorageError(std::string target, const std::string& message)
        : std::runtime_error(message)
        , target_(std::move(target)) {}

    [[nodiscard]] const std::string& target() const noexcept { return target_; }

private:
    std::string target_;
};

} // namespace vaulttrade::util
