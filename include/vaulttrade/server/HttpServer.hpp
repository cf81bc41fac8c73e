#pragma once

#include "vaulttrade/server/RequestContext.hpp"
#include "vaulttrade/util/Errors.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <functional>
#include <memory>
#include <string>

namespace vaulttrade::server {

class Router;

struct ServerHooks {
    // Durable state could not be written; the process must not keep serving.
    std::function<void(const util::StorageError&)> onFatal;
    // Runs after every routed request, before the response is written.
    std::function<void()> afterRequest;
};

// Routes one request and fills ctx.response: 404 for unknown routes, the
// JSON envelope for JSON bodies unless the handler opted out, 400 for an
// escaped util::ValidationError and 500 for anything else thrown.
void processRequest(const Router& router, RequestContext& ctx, const ServerHooks& hooks);

class HttpServer : public std::enable_shared_from_this<HttpServer> {
public:
    HttpServer(boost::asio::io_context& io,
               std::shared_ptr<Router> router,
               std::string host,
               unsigned short port,
               ServerHooks hooks = {});

    void start();
    void stop();

private:
    void doAccept();

    boost::asio::io_context& io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<Router> router_;
    std::shared_ptr<const ServerHooks> hooks_;
    std::string host_;
    unsigned short port_{};
    bool running_{};
};

} // namespace vaulttrade::server
