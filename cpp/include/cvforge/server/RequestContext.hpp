#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>

namespace cvforge::server {

struct RequestContext {
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;
    using Responder = std::function<void(Response)>;

    Request request;
    Response response;
    std::unordered_map<std::string, std::string> pathParameters;
    std::uint64_t requestId{0};
    std::string remoteAddress;
    std::chrono::steady_clock::time_point receivedAt{std::chrono::steady_clock::now()};

    // Installed by the server before the handler runs.
    Responder responder;
    bool deferred{false};

    void replyJson(boost::beast::http::status status, const boost::json::value& body) {
        writeJson(response, status, body);
    }

    // The handler's return no longer ends the request; the returned responder
    // must be called exactly once, from any thread, with the response.
    Responder deferResponse() {
        deferred = true;
        return responder;
    }

    static void writeJson(Response& target, boost::beast::http::status status, const boost::json::value& body) {
        target.result(status);
        target.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
        target.body() = boost::json::serialize(body);
        target.prepare_payload();
    }
};

} // namespace cvforge::server
