#pragma once

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace vaulttrade::util {

// Blocking HTTP/1.1 client with a hard deadline covering connect, TLS
// handshake, write and read. Transport failures and timeouts throw
// boost::system::system_error.
class HttpClient {
public:
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

    struct Header {
        std::string name;
        std::string value;
    };

    HttpClient();

    HttpResponse fetch(const std::string& method,
                       const std::string& url,
                       const std::vector<Header>& headers,
                       const std::string& body,
                       std::chrono::milliseconds timeout);

private:
    boost::asio::ssl::context sslContext_;
};

} // namespace vaulttrade::util
