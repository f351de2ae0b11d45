#include "cvforge/util/HttpClient.hpp"
#include "cvforge/util/Logging.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace cvforge::util {
namespace {

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

constexpr unsigned kHttp11 = 11;

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

// Starts one async operation and runs the private context until it completes.
// tcp_stream deadlines only fire for async operations.
template <class Initiate>
void runToCompletion(boost::asio::io_context& ioc, Initiate&& initiate) {
    boost::system::error_code result = boost::asio::error::would_block;
    initiate([&result](boost::system::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    if (result) {
        throw boost::system::system_error(result);
    }
}

http::request<http::string_body> buildMessage(const HttpClient::Request& request, const Endpoint& endpoint) {
    http::request<http::string_body> message{request.method, endpoint.target, kHttp11};
    message.set(http::field::host, endpoint.host);
    message.set(http::field::user_agent, "cvforge");
    for (const auto& [name, value] : request.headers) {
        message.set(name, value);
    }
    message.body() = request.body;
    message.prepare_payload();
    return message;
}

} // namespace

Endpoint parseEndpoint(const std::string& url) {
    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("not an absolute URL: " + url);
    }

    Endpoint endpoint;
    const auto scheme = lowercase(url.substr(0, schemeEnd));
    if (scheme == "https") {
        endpoint.tls = true;
    } else if (scheme != "http") {
        throw std::invalid_argument("unsupported URL scheme: " + scheme);
    }

    const auto authorityStart = schemeEnd + 3;
    const auto pathStart = url.find_first_of("/?", authorityStart);
    const auto authority = url.substr(authorityStart,
                                      pathStart == std::string::npos ? std::string::npos : pathStart - authorityStart);
    const auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        endpoint.host = authority;
        endpoint.port = endpoint.tls ? "443" : "80";
    } else {
        endpoint.host = authority.substr(0, colon);
        endpoint.port = authority.substr(colon + 1);
        const bool numeric = !endpoint.port.empty() &&
            std::all_of(endpoint.port.begin(), endpoint.port.end(), [](unsigned char c) { return std::isdigit(c); });
        if (!numeric) {
            throw std::invalid_argument("invalid port in URL: " + url);
        }
    }
    if (endpoint.host.empty()) {
        throw std::invalid_argument("URL has no host: " + url);
    }

    if (pathStart == std::string::npos) {
        endpoint.target = "/";
    } else if (url[pathStart] == '?') {
        endpoint.target = "/" + url.substr(pathStart);
    } else {
        endpoint.target = url.substr(pathStart);
    }
    return endpoint;
}

HttpClient::HttpClient()
    : sslContext_(boost::asio::ssl::context::tls_client) {
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(boost::asio::ssl::verify_peer);
}

HttpClient::Response HttpClient::send(const Request& request) {
    const auto endpoint = parseEndpoint(request.url);
    auto message = buildMessage(request, endpoint);

    boost::asio::io_context ioc;
    tcp::resolver resolver(ioc);
    const auto results = resolver.resolve(endpoint.host, endpoint.port);

    boost::beast::flat_buffer buffer;
    Response response;

    if (!endpoint.tls) {
        boost::beast::tcp_stream stream(ioc);
        stream.expires_after(request.timeout);
        runToCompletion(ioc, [&](auto done) { stream.async_connect(results, std::move(done)); });
        runToCompletion(ioc, [&](auto done) { http::async_write(stream, message, std::move(done)); });
        runToCompletion(ioc, [&](auto done) { http::async_read(stream, buffer, response, std::move(done)); });

        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return response;
    }

    boost::beast::ssl_stream<boost::beast::tcp_stream> stream(ioc, sslContext_);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str())) {
        throw std::runtime_error("Failed to set SNI host name for " + endpoint.host);
    }
    stream.set_verify_callback(boost::asio::ssl::host_name_verification(endpoint.host));

    auto& socket = boost::beast::get_lowest_layer(stream);
    socket.expires_after(request.timeout);
    runToCompletion(ioc, [&](auto done) { socket.async_connect(results, std::move(done)); });
    runToCompletion(ioc, [&](auto done) {
        stream.async_handshake(boost::asio::ssl::stream_base::client, std::move(done));
    });
    runToCompletion(ioc, [&](auto done) { http::async_write(stream, message, std::move(done)); });
    runToCompletion(ioc, [&](auto done) { http::async_read(stream, buffer, response, std::move(done)); });

    // The response is complete at this point; a dirty close does not invalidate it.
    boost::system::error_code shutdownError;
    stream.async_shutdown([&shutdownError](boost::system::error_code ec) { shutdownError = ec; });
    ioc.restart();
    ioc.run();
    if (shutdownError && shutdownError != boost::asio::error::eof &&
        shutdownError != boost::asio::ssl::error::stream_truncated) {
        log(LogLevel::debug, "TLS shutdown with " + endpoint.host + " failed: " + shutdownError.message());
    }
    return response;
}

} // namespace cvforge::util
