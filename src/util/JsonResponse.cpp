#include "vaulttrade/util/JsonResponse.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace vaulttrade::util {

std::string formatIsoTimestamp(std::chrono::system_clock::time_point timePoint) {
    const std::time_t time = std::chrono::system_clock::to_time_t(timePoint);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string makeIsoTimestamp() {
    return formatIsoTimestamp(std::chrono::system_clock::now());
}

boost::json::object makeSuccessResponse(const boost::json::value& data, std::string_view endpoint) {
    boost::json::object envelope;
    envelope["success"] = true;
    envelope["timestamp"] = makeIsoTimestamp();
    if (!endpoint.empty()) {
        envelope["path"] = endpoint;
    }
    envelope["data"] = data;
    return envelope;
}

boost::json::object makeErrorResponse(std::string_view message,
                                      ErrorClass errorClass,
                                      std::string_view endpoint) {
    boost::json::object errorObj;
    if (!message.empty()) {
        errorObj["message"] = message;
    }
    errorObj["errorClass"] = toString(errorClass);

    boost::json::object envelope;
    envelope["success"] = false;
    envelope["timestamp"] = makeIsoTimestamp();
    if (!endpoint.empty()) {
        envelope["path"] = endpoint;
    }
    envelope["error"] = std::move(errorObj);
    return envelope;
}

boost::json::object makeRpcError(std::string_view message, ErrorClass errorClass) {
    boost::json::object reply;
    reply["ok"] = false;
    reply["error"] = message;
    reply["errorClass"] = toString(errorClass);
    return reply;
}

} // namespace vaulttrade::util
