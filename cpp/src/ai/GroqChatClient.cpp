#include "cvforge/ai/GroqChatClient.hpp"
#include "cvforge/util/JsonUtil.hpp"
#include "cvforge/util/Logging.hpp"

#include <boost/json.hpp>

#include <utility>

namespace cvforge::ai {
namespace {

// Pulls choices[0].message.content out of an OpenAI-style completion body.
std::string extractContent(const std::string& body) {
    try {
        const auto parsed = util::parseJson(body);
        if (const auto* content = util::findPath(parsed, "choices.0.message.content"); content && content->is_string()) {
            return std::string(content->get_string().c_str());
        }
    } catch (const util::JsonError& ex) {
        util::log(util::LogLevel::warn, std::string{"Unreadable chat completion payload: "} + ex.what());
    }
    return {};
}

} // namespace

GroqChatClient::GroqChatClient(util::HttpClient& httpClient, Settings settings)
    : httpClient_(httpClient)
    , settings_(std::move(settings)) {}

ChatResult GroqChatClient::complete(const ChatRequest& request, const std::string& apiKey) {
    boost::json::array messages;
    messages.push_back(boost::json::object{{"role", "system"}, {"content", request.systemPrompt}});
    messages.push_back(boost::json::object{{"role", "user"}, {"content", request.userPrompt}});

    boost::json::object payload;
    payload["model"] = settings_.model;
    payload["messages"] = std::move(messages);
    payload["temperature"] = settings_.temperature;
    payload["max_tokens"] = settings_.maxTokens;

    util::HttpClient::Request call;
    call.method = boost::beast::http::verb::post;
    call.url = settings_.endpoint;
    call.headers = {
        {"Authorization", "Bearer " + apiKey},
        {"Content-Type", "application/json"},
        {"Accept", "application/json"},
    };
    call.body = boost::json::serialize(payload);
    call.timeout = settings_.timeout;

    auto response = httpClient_.send(call);

    ChatResult result;
    result.status = static_cast<int>(response.result_int());
    result.body = std::move(response.body());
    if (result.status == 200) {
        result.content = extractContent(result.body);
    }
    return result;
}

} // namespace cvforge::ai
