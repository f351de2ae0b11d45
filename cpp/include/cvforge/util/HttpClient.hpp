#pragma once

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace cvforge::util {

struct Endpoint {
    bool tls{false};
    std::string host;
    std::string port;
    std::string target;
};

// Splits an absolute http:// or https:// URL. Throws std::invalid_argument otherwise.
Endpoint parseEndpoint(const std::string& url);

// Blocking HTTP/1.1 client. Every call runs on its own io_context so that the
// deadline covers connect, TLS handshake, write and read together. Transport
// failures and timeouts throw boost::system::system_error; any HTTP status is
// handed back as a response.
class HttpClient {
public:
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    struct Request {
        boost::beast::http::verb method{boost::beast::http::verb::get};
        std::string url;
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;
        std::chrono::seconds timeout{30};
    };

    HttpClient();

    Response send(const Request& request);

private:
    boost::asio::ssl::context sslContext_;
};

} // namespace cvforge::util
