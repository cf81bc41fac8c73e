#include "vaulttrade/server/HttpServer.hpp"
#include "vaulttrade/server/Router.hpp"
#include "vaulttrade/util/JsonResponse.hpp"
#include "vaulttrade/util/JsonUtil.hpp"
#include "vaulttrade/util/Logging.hpp"

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace vaulttrade::server {
namespace {

constexpr std::size_t kBodyLimit = 1024 * 1024;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

void writeJson(RequestContext& ctx, boost::beast::http::status status, const boost::json::value& body) {
    ctx.response.result(status);
    ctx.response.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    ctx.response.body() = util::stringifyJson(body);
    ctx.response.prepare_payload();
}

void wrapJsonEnvelope(RequestContext& ctx) {
    auto& response = ctx.response;
    if (auto header = response.find(kEnvelopeHeader); header != response.end()) {
        std::string flag = toLower(std::string(header->value()));
        response.erase(header);
        if (flag == "skip") {
            return;
        }
    }
    if (response.body().empty()) {
        return;
    }

    auto contentTypeIt = response.find(boost::beast::http::field::content_type);
    if (contentTypeIt == response.end() ||
        toLower(std::string(contentTypeIt->value())).find("application/json") == std::string::npos) {
        return;
    }

    std::string target(ctx.request.target());
    if (auto queryPos = target.find('?'); queryPos != std::string::npos) {
        target.resize(queryPos);
    }
    const bool success = response.result_int() >= 200 && response.result_int() < 400;

    boost::json::value parsed;
    try {
        parsed = util::parseJson(response.body());
    } catch (const std::exception&) {
        parsed = boost::json::value(boost::json::string(response.body()));
    }

    boost::json::object envelope;
    if (success) {
        envelope = util::makeSuccessResponse(parsed, target);
    } else {
        std::string message;
        auto errorClass = util::ErrorClass::internal;
        if (parsed.is_object()) {
            const auto& object = parsed.as_object();
            message = util::getString(object, "message").value_or(util::getString(object, "error").value_or(""));
            if (auto text = util::getString(object, "errorClass")) {
                errorClass = util::parseErrorClass(*text).value_or(util::ErrorClass::internal);
            }
        } else if (parsed.is_string()) {
            message = std::string(parsed.as_string());
        }
        envelope = util::makeErrorResponse(message, errorClass, target);
    }

    response.body() = util::stringifyJson(envelope);
    response.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    response.prepare_payload();
}

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(boost::asio::ip::tcp::socket socket,
                std::shared_ptr<Router> router,
                std::shared_ptr<const ServerHooks> hooks)
        : stream_(std::move(socket)), router_(std::move(router)), hooks_(std::move(hooks)) {}

    void start() { readRequest(); }

private:
    void readRequest() {
        parser_.emplace();
        parser_->body_limit(kBodyLimit);
        stream_.expires_after(std::chrono::seconds(30));
        boost::beast::http::async_read(stream_, buffer_, *parser_,
            boost::asio::bind_executor(stream_.get_executor(),
            [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    self->doClose();
                    return;
                }
                self->dispatch();
            }));
    }

    void dispatch() {
        stream_.expires_never();

        RequestContext ctx;
        ctx.startedAt = std::chrono::steady_clock::now();
        ctx.request = parser_->release();
        ctx.response.version(ctx.request.version());
        ctx.response.keep_alive(ctx.request.keep_alive());

        processRequest(*router_, ctx, *hooks_);

        auto response = std::make_shared<RequestContext::HttpResponse>(std::move(ctx.response));
        boost::beast::http::async_write(stream_, *response,
            boost::asio::bind_executor(stream_.get_executor(),
            [self = shared_from_this(), response](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    self->doClose();
                    return;
                }
                if (!response->keep_alive()) {
                    self->doClose();
                    return;
                }
                self->readRequest();
            }));
    }

    void doClose() {
        boost::system::error_code ec;
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        stream_.socket().close(ec);
    }

    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
    std::shared_ptr<Router> router_;
    std::shared_ptr<const ServerHooks> hooks_;
};

} // namespace

void processRequest(const Router& router, RequestContext& ctx, const ServerHooks& hooks) {
    std::unordered_map<std::string, std::string> params;
    auto handler = router.resolve(std::string(ctx.request.method_string()), std::string(ctx.request.target()), params);
    ctx.pathParameters = std::move(params);

    if (!handler) {
        writeJson(ctx, boost::beast::http::status::not_found,
                  boost::json::object{{"message", "Not found"}, {"errorClass", "validation"}});
    } else {
        try {
            handler(ctx);
            if (hooks.afterRequest) {
                hooks.afterRequest();
            }
        } catch (const util::StorageError& ex) {
            util::log(util::LogLevel::error, "Storage failure on " + ex.target() + ": " + ex.what());
            writeJson(ctx, boost::beast::http::status::internal_server_error,
                      util::makeRpcError("Storage failure", util::ErrorClass::internal));
            ctx.response.set(kEnvelopeHeader, "skip");
            ctx.response.keep_alive(false);
            if (hooks.onFatal) {
                hooks.onFatal(ex);
            }
        } catch (const util::ValidationError& ex) {
            writeJson(ctx, boost::beast::http::status::bad_request,
                      boost::json::object{{"message", ex.what()}, {"errorClass", "validation"}});
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error, "Unhandled error on " + std::string(ctx.request.target()) + ": " + ex.what());
            writeJson(ctx, boost::beast::http::status::internal_server_error,
                      util::makeRpcError(ex.what(), util::ErrorClass::internal));
        }
        if (ctx.response.body().empty() && ctx.response.result() == boost::beast::http::status::ok) {
            ctx.response.result(boost::beast::http::status::no_content);
        }
        ctx.response.prepare_payload();
    }

    wrapJsonEnvelope(ctx);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - ctx.startedAt);
    util::log(util::LogLevel::debug, std::string(ctx.request.method_string()) + " " +
                                         std::string(ctx.request.target()) + " -> " +
                                         std::to_string(ctx.response.result_int()) + " in " +
                                         std::to_string(elapsed.count()) + "ms");
}

HttpServer::HttpServer(boost::asio::io_context& io,
                       std::shared_ptr<Router> router,
                       std::string host,
                       unsigned short port,
                       ServerHooks hooks)
    : io_(io)
    , acceptor_(io)
    , router_(std::move(router))
    , hooks_(std::make_shared<const ServerHooks>(std::move(hooks)))
    , host_(std::move(host))
    , port_(port) {}

void HttpServer::start() {
    if (running_) {
        return;
    }
    running_ = true;

    boost::asio::ip::tcp::endpoint endpoint{
        boost::asio::ip::make_address(host_), port_};

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();

    util::log(util::LogLevel::info, "Listening on " + host_ + ":" + std::to_string(port_));
    doAccept();
}

void HttpServer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    boost::system::error_code ec;
    acceptor_.cancel(ec);
    acceptor_.close(ec);
}

void HttpServer::doAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(io_),
        [self = shared_from_this()](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
            if (!self->running_) {
                return;
            }

            if (!ec) {
                std::make_shared<HttpSession>(std::move(socket), self->router_, self->hooks_)->start();
            } else {
                util::log(util::LogLevel::warn, "Accept failed: " + ec.message());
            }

            self->doAccept();
        });
}

} // namespace vaulttrade::server
