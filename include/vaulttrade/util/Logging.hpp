#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace vaulttrade::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

void initLogging(LogLevel level);
void log(LogLevel level, const std::string& message);

std::optional<LogLevel> parseLogLevel(std::string_view text);

} // namespace vaulttrade::util
