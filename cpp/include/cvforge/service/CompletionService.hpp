#pragma once

#include "cvforge/ai/ChatClient.hpp"
#include "cvforge/key/KeyPool.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace cvforge::service {

class CompletionError : public std::runtime_error {
public:
    CompletionError(int status, const std::string& message)
        : std::runtime_error(message)
        , status_(status) {}

    [[nodiscard]] int status() const noexcept { return status_; }

private:
    int status_;
};

struct Completion {
    std::string content;
    std::string maskedKey;
    // 1-based attempt that produced the content.
    std::size_t attempt{};
};

// Runs one chat completion with key failover. Each attempt is a full
// acquire -> call -> report cycle; at most one attempt per pooled key.
// NoKeysAvailableError from the pool propagates unchanged.
class CompletionService {
public:
    CompletionService(key::KeyPool& pool, ai::ChatClient& client);

    Completion complete(const ai::ChatRequest& request);

private:
    key::KeyPool& pool_;
    ai::ChatClient& client_;
};

} // namespace cvforge::service
