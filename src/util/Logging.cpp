#include "vaulttrade/util/Logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace vaulttrade::util {
namespace {

std::mutex& sinkMutex() {
    static std::mutex m;
    return m;
}

std::atomic<LogLevel>& threshold() {
    static std::atomic<LogLevel> level{LogLevel::info};
    return level;
}

std::string_view levelTag(LogLevel level) {
    switch (level) {
    case LogLevel::trace: return "TRACE";
    case LogLevel::debug: return "DEBUG";
    case LogLevel::info:  return "INFO ";
    case LogLevel::warn:  return "WARN ";
    case LogLevel::error: return "ERROR";
    }
    return "INFO ";
}

// 2024-05-01T12:00:00.123Z
std::string utcStamp(std::chrono::system_clock::time_point now) {
    using namespace std::chrono;
    const auto whole = floor<seconds>(now);
    const auto ms = duration_cast<milliseconds>(now - whole).count();

    const std::time_t t = system_clock::to_time_t(whole);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

} // namespace

void initLogging(LogLevel level) {
    threshold().store(level);
}

std::optional<LogLevel> parseLogLevel(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "trace") return LogLevel::trace;
    if (lowered == "debug") return LogLevel::debug;
    if (lowered == "info") return LogLevel::info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::warn;
    if (lowered == "error") return LogLevel::error;
    return std::nullopt;
}

void log(LogLevel level, const std::string& message) {
    if (level < threshold().load()) {
        return;
    }
    const auto line = utcStamp(std::chrono::system_clock::now()) + " " + std::string(levelTag(level)) + " " + message;

    std::lock_guard lock(sinkMutex());
    std::clog << line << '\n';
    if (level >= LogLevel::warn) {
        std::clog.flush();
    }
}

} // namespace vaulttrade::util
