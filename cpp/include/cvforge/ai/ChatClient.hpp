#pragma once

#include <string>
#include <string_view>

namespace cvforge::ai {

struct ChatRequest {
    std::string systemPrompt;
    std::string userPrompt;
};

struct ChatResult {
    int status{};
    // Assistant message text; only filled for successful responses.
    std::string content;
    // Raw response body, kept for error reporting.
    std::string body;
};

enum class Outcome {
    success,
    rateLimited,
    failed
};

// A chat-completion backend. Implementations throw on transport failures
// (resolve, connect, TLS, timeout) and return every HTTP status as a result.
class ChatClient {
public:
    virtual ~ChatClient() = default;

    virtual ChatResult complete(const ChatRequest& request, const std::string& apiKey) = 0;
};

Outcome classifyOutcome(int status, std::string_view body);
const char* toString(Outcome outcome);

} // namespace cvforge::ai
