#pragma once

#include "cvforge/ai/ChatClient.hpp"

#include <deque>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

namespace cvforge::test {

// Replays a fixed list of responses and records what it was asked.
class ScriptedChatClient : public ai::ChatClient {
public:
    struct Step {
        int status{200};
        std::string content;
        std::string body;
        bool throws{false};
    };

    void push(Step step) { steps_.push_back(std::move(step)); }

    void pushOk(std::string content) { push({200, content, "{}", false}); }

    void pushStatus(int status, std::string body) { push({status, {}, std::move(body), false}); }

    void pushTransportError() { push({0, {}, {}, true}); }

    ai::ChatResult complete(const ai::ChatRequest& request, const std::string& apiKey) override {
        if (gate.valid()) {
            gate.wait();
        }
        keysSeen.push_back(apiKey);
        requests.push_back(request);
        if (steps_.empty()) {
            throw std::logic_error("no scripted response left");
        }
        auto step = steps_.front();
        steps_.pop_front();
        if (step.throws) {
            throw std::runtime_error("operation timed out");
        }
        return {step.status, step.content, step.body};
    }

    std::vector<std::string> keysSeen;
    std::vector<ai::ChatRequest> requests;
    // When set, every call waits for it first.
    std::shared_future<void> gate;

private:
    std::deque<Step> steps_;
};

} // namespace cvforge::test
