#include "cvforge/server/HttpServer.hpp"
#include "cvforge/server/RequestContext.hpp"
#include "cvforge/server/Router.hpp"
#include "cvforge/util/JsonResponse.hpp"
#include "cvforge/util/Logging.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cvforge::server {
namespace {

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

std::uint64_t nextRequestId() {
    static std::atomic<std::uint64_t> counter{0};
    return ++counter;
}

bool isJson(const RequestContext::Response& response) {
    auto it = response.find(http::field::content_type);
    if (it == response.end()) {
        return false;
    }
    std::string value(it->value());
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value.find("application/json") != std::string::npos;
}

std::string joinMethods(const std::vector<std::string>& methods) {
    std::string joined;
    for (const auto& method : methods) {
        joined += joined.empty() ? method : ", " + method;
    }
    return joined;
}

void applyCorsHeaders(RequestContext::Response& response) {
    response.set(http::field::access_control_allow_origin, "*");
    response.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    response.set(http::field::access_control_allow_headers, "Content-Type, Authorization");
}

// JSON bodies leave the server inside the success/error envelope unless the
// handler set "X-Api-Envelope: skip".
void applyEnvelope(RequestContext::Response& response, const std::string& target) {
    if (response.body().empty() || !isJson(response)) {
        return;
    }
    if (auto header = response.find("X-Api-Envelope"); header != response.end()) {
        const bool skip = header->value() == "skip";
        response.erase(header);
        if (skip) {
            return;
        }
    }

    boost::json::value payload;
    boost::json::error_code ec;
    payload = boost::json::parse(response.body(), ec);
    if (ec) {
        payload = boost::json::string(response.body());
    }

    const auto path = target.substr(0, target.find('?'));
    response.body() = boost::json::serialize(
        util::makeEnvelope(static_cast<int>(response.result_int()), std::move(payload), path));
    response.prepare_payload();
}

// What finish() needs once the request itself has been handed to a handler.
struct RequestLine {
    std::string method;
    std::string target;
    std::uint64_t requestId{0};
    unsigned version{11};
    bool keepAlive{false};
    std::chrono::steady_clock::time_point receivedAt;
};

RequestLine describe(const RequestContext& ctx, bool keepAlive) {
    return RequestLine{std::string(ctx.request.method_string()), std::string(ctx.request.target()),
                       ctx.requestId, ctx.request.version(), keepAlive, ctx.receivedAt};
}

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, std::shared_ptr<Router> router, const ServerOptions& options)
        : remoteAddress_(describePeer(socket))
        , stream_(std::move(socket))
        , router_(std::move(router))
        , bodyLimit_(options.bodyLimit)
        , idleTimeout_(options.idleTimeout) {}

    void start() { read(); }

private:
    static std::string describePeer(const tcp::socket& socket) {
        boost::system::error_code ec;
        auto endpoint = socket.remote_endpoint(ec);
        return ec ? std::string{"unknown"} : endpoint.address().to_string();
    }

    void read() {
        parser_.emplace();
        parser_->body_limit(bodyLimit_);
        stream_.expires_after(idleTimeout_);
        http::async_read(stream_, buffer_, *parser_,
            [self = shared_from_this()](boost::system::error_code ec, std::size_t) { self->onRead(ec); });
    }

    void onRead(boost::system::error_code ec) {
        if (ec == http::error::body_limit) {
            RequestContext ctx;
            ctx.request = parser_->release();
            ctx.requestId = nextRequestId();
            ctx.replyJson(http::status::payload_too_large, boost::json::object{{"message", "request body too large"}});
            finish(describe(ctx, false), std::move(ctx.response));
            return;
        }
        if (ec) {
            if (ec != http::error::end_of_stream && ec != boost::beast::error::timeout) {
                util::log(util::LogLevel::debug, "Read from " + remoteAddress_ + " failed: " + ec.message());
            }
            close();
            return;
        }

        stream_.expires_never();
        RequestContext ctx;
        ctx.request = parser_->release();
        ctx.requestId = nextRequestId();
        ctx.remoteAddress = remoteAddress_;
        auto line = describe(ctx, ctx.request.keep_alive());
        ctx.responder = [self = shared_from_this(), line](RequestContext::Response response) {
            boost::asio::post(self->stream_.get_executor(),
                [self, line, response = std::move(response)]() mutable {
                    self->finish(std::move(line), std::move(response));
                });
        };
        dispatch(ctx);
        if (!ctx.deferred) {
            finish(std::move(line), std::move(ctx.response));
        }
    }

    void dispatch(RequestContext& ctx) {
        const std::string method(ctx.request.method_string());
        const std::string target(ctx.request.target());

        if (auto handler = router_->resolve(method, target, ctx.pathParameters)) {
            try {
                handler(ctx);
            } catch (const std::exception& ex) {
                util::log(util::LogLevel::error, "Unhandled error in " + method + " " + target + ": " + ex.what());
                // Once deferred, the response belongs to whoever holds the responder.
                if (!ctx.deferred) {
                    ctx.replyJson(http::status::internal_server_error,
                                  boost::json::object{{"message", "internal server error"}});
                }
            }
            return;
        }

        const auto allowed = router_->allowedMethods(target);
        if (allowed.empty()) {
            ctx.replyJson(http::status::not_found, boost::json::object{{"message", "not found"}});
        } else if (ctx.request.method() == http::verb::options) {
            ctx.response.result(http::status::no_content);
            ctx.response.set(http::field::allow, joinMethods(allowed));
            ctx.response.prepare_payload();
        } else {
            ctx.replyJson(http::status::method_not_allowed, boost::json::object{{"message", "method not allowed"}});
            ctx.response.set(http::field::allow, joinMethods(allowed));
        }
    }

    void finish(RequestLine line, RequestContext::Response response) {
        response.version(line.version);
        response.keep_alive(line.keepAlive);
        applyCorsHeaders(response);
        applyEnvelope(response, line.target);

        if (util::isLogEnabled(util::LogLevel::debug)) {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - line.receivedAt);
            util::log(util::LogLevel::debug,
                      "#" + std::to_string(line.requestId) + " " + remoteAddress_ + " " + line.method + " " + line.target +
                          " -> " + std::to_string(response.result_int()) + " (" + std::to_string(elapsed.count()) +
                          "ms)");
        }

        auto message = std::make_shared<RequestContext::Response>(std::move(response));
        http::async_write(stream_, *message,
            [self = shared_from_this(), message](boost::system::error_code ec, std::size_t) {
                if (ec || !message->keep_alive()) {
                    self->close();
                    return;
                }
                self->read();
            });
    }

    void close() {
        boost::system::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
        stream_.socket().close(ec);
    }

    std::string remoteAddress_;
    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<Router> router_;
    std::size_t bodyLimit_;
    std::chrono::seconds idleTimeout_;
};

} // namespace

HttpServer::HttpServer(boost::asio::io_context& io, std::shared_ptr<Router> router, ServerOptions options)
    : io_(io)
    , acceptor_(io)
    , router_(std::move(router))
    , options_(std::move(options)) {}

void HttpServer::start() {
    if (running_.exchange(true)) {
        return;
    }

    const tcp::endpoint endpoint{boost::asio::ip::make_address(options_.host), options_.port};
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    boundPort_ = acceptor_.local_endpoint().port();

    accept();
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    boost::system::error_code ec;
    acceptor_.cancel(ec);
    acceptor_.close(ec);
}

void HttpServer::accept() {
    acceptor_.async_accept(
        boost::asio::make_strand(io_),
        [self = shared_from_this()](boost::system::error_code ec, tcp::socket socket) {
            if (!self->running_) {
                return;
            }
            if (ec) {
                util::log(util::LogLevel::warn, "Accept failed: " + ec.message());
            } else {
                std::make_shared<HttpSession>(std::move(socket), self->router_, self->options_)->start();
            }
            self->accept();
        });
}

} // namespace cvforge::server
