#include "vaulttrade/util/HttpClient.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>
#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>

namespace vaulttrade::util {
namespace {
constexpr unsigned kHttpVersion = 11;

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

ParsedUrl parseUrl(const std::string& url) {
    ParsedUrl parsed;
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("URL missing scheme: " + url);
    }
    parsed.scheme = url.substr(0, schemeEnd);
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + parsed.scheme);
    }
    auto hostStart = schemeEnd + 3;
    auto pathPos = url.find('/', hostStart);
    std::string hostPort = pathPos == std::string::npos ? url.substr(hostStart) : url.substr(hostStart, pathPos - hostStart);
    auto colonPos = hostPort.find(':');
    if (colonPos == std::string::npos) {
        parsed.host = hostPort;
        parsed.port = (parsed.scheme == "https") ? "443" : "80";
    } else {
        parsed.host = hostPort.substr(0, colonPos);
        parsed.port = hostPort.substr(colonPos + 1);
    }
    parsed.target = pathPos == std::string::npos ? "/" : url.substr(pathPos);
    if (parsed.target.empty()) {
        parsed.target = "/";
    }
    return parsed;
}

boost::beast::http::verb toVerb(const std::string& method) {
    std::string upper;
    upper.reserve(method.size());
    std::transform(method.begin(), method.end(), std::back_inserter(upper), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (upper == "GET") return boost::beast::http::verb::get;
    if (upper == "POST") return boost::beast::http::verb::post;
    if (upper == "PUT") return boost::beast::http::verb::put;
    if (upper == "DELETE") return boost::beast::http::verb::delete_;
    throw std::invalid_argument("Unsupported HTTP method: " + method);
}

std::string authorityFrom(const ParsedUrl& parsed) {
    if ((parsed.scheme == "http" && parsed.port == "80") ||
        (parsed.scheme == "https" && parsed.port == "443")) {
        return parsed.host;
    }
    return parsed.host + ":" + parsed.port;
}

} // namespace

HttpClient::HttpClient()
    : sslContext_(boost::asio::ssl::context::tls_client) {
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(boost::asio::ssl::verify_none);
}

HttpClient::HttpResponse HttpClient::fetch(const std::string& method,
                                           const std::string& url,
                                           const std::vector<Header>& headers,
                                           const std::string& body,
                                           std::chrono::milliseconds timeout) {
    const ParsedUrl parsed = parseUrl(url);

    HttpRequest request{toVerb(method), parsed.target, kHttpVersion};
    request.set(boost::beast::http::field::host, authorityFrom(parsed));
    for (const auto& header : headers) {
        request.set(header.name, header.value);
    }
    if (!body.empty()) {
        request.body() = body;
    }
    request.prepare_payload();

    // Stream deadlines only apply to asynchronous operations, so the exchange
    // runs as an async chain on a private io_context.
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver(ioc);
    auto results = resolver.resolve(parsed.host, parsed.port);

    boost::system::error_code failure;
    boost::beast::flat_buffer buffer;
    HttpResponse response;

    if (parsed.scheme == "https") {
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(ioc, sslContext_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), parsed.host.c_str())) {
            throw std::runtime_error("Failed to set SNI host name");
        }
        auto& lowest = boost::beast::get_lowest_layer(stream);
        lowest.expires_after(timeout);
        lowest.async_connect(results, [&](boost::system::error_code ec, const auto&) {
            if (ec) {
                failure = ec;
                return;
            }
            stream.async_handshake(boost::asio::ssl::stream_base::client, [&](boost::system::error_code ec) {
                if (ec) {
                    failure = ec;
                    return;
                }
                boost::beast::http::async_write(stream, request, [&](boost::system::error_code ec, std::size_t) {
                    if (ec) {
                        failure = ec;
                        return;
                    }
                    boost::beast::http::async_read(stream, buffer, response,
                                                   [&](boost::system::error_code ec, std::size_t) { failure = ec; });
                });
            });
        });
        ioc.run();
        boost::system::error_code ignored;
        lowest.socket().close(ignored);
    } else {
        boost::beast::tcp_stream stream(ioc);
        stream.expires_after(timeout);
        stream.async_connect(results, [&](boost::system::error_code ec, const auto&) {
            if (ec) {
                failure = ec;
                return;
            }
            boost::beast::http::async_write(stream, request, [&](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    failure = ec;
                    return;
                }
                boost::beast::http::async_read(stream, buffer, response,
                                               [&](boost::system::error_code ec, std::size_t) { failure = ec; });
            });
        });
        ioc.run();
        boost::system::error_code ec;
        stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }

    if (failure) {
        throw boost::system::system_error(failure);
    }
    return response;
}

} // namespace vaulttrade::util
