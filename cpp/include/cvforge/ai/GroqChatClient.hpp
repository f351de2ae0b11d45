#pragma once

#include "cvforge/ai/ChatClient.hpp"
#include "cvforge/util/HttpClient.hpp"

#include <chrono>
#include <string>

namespace cvforge::ai {

class GroqChatClient : public ChatClient {
public:
    struct Settings {
        std::string endpoint{"https://api.groq.com/openai/v1/chat/completions"};
        std::string model{"llama-3.3-70b-versatile"};
        std::chrono::seconds timeout{60};
        int maxTokens{2000};
        double temperature{0.7};
    };

    GroqChatClient(util::HttpClient& httpClient, Settings settings);

    ChatResult complete(const ChatRequest& request, const std::string& apiKey) override;

private:
    util::HttpClient& httpClient_;
    Settings settings_;
};

} // namespace cvforge::ai
