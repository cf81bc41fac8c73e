#pragma once

#include <boost/beast/http.hpp>
#include <chrono>
#include <string>
#include <unordered_map>

namespace vaulttrade::server {

// Responses carrying this header are sent as written, without the JSON envelope.
inline constexpr char kEnvelopeHeader[] = "X-Api-Envelope";

struct RequestContext {
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

    HttpRequest request;
    HttpResponse response;
    std::unordered_map<std::string, std::string> pathParameters;
    std::chrono::steady_clock::time_point startedAt;
};

} // namespace vaulttrade::server
