#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace cvforge::server {

class Router;

struct ServerOptions {
    std::string host{"0.0.0.0"};
    unsigned short port{8000};
    std::size_t bodyLimit{1024 * 1024};
    // Applies while waiting for a request, not while a handler runs.
    std::chrono::seconds idleTimeout{30};
};

// Accepts connections on the shared io_context and serves each one on its own
// strand. Handlers run on the io thread that read the request; one that blocks
// should call RequestContext::deferResponse and finish on another thread. The
// response is then written back on the connection's strand.
class HttpServer : public std::enable_shared_from_this<HttpServer> {
public:
    HttpServer(boost::asio::io_context& io, std::shared_ptr<Router> router, ServerOptions options);

    // Throws boost::system::system_error when the address cannot be bound.
    void start();
    void stop();

    // The bound port once started; differs from the option only when that was 0.
    unsigned short port() const noexcept { return boundPort_; }

private:
    void accept();

    boost::asio::io_context& io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<Router> router_;
    ServerOptions options_;
    unsigned short boundPort_{0};
    std::atomic<bool> running_{false};
};

} // namespace cvforge::server
