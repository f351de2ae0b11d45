#include "cvforge/service/CompletionService.hpp"
#include "cvforge/util/Logging.hpp"

#include <exception>

namespace cvforge::service {
namespace {

constexpr std::size_t kMaxErrorSnippet = 300;

bool retryableStatus(int status) {
    return status == 401 || status == 408 || status >= 500;
}

std::string snippet(const std::string& body) {
    if (body.size() <= kMaxErrorSnippet) {
        return body;
    }
    return body.substr(0, kMaxErrorSnippet) + "...";
}

} // namespace

CompletionService::CompletionService(key::KeyPool& pool, ai::ChatClient& client)
    : pool_(pool)
    , client_(client) {}

Completion CompletionService::complete(const ai::ChatRequest& request) {
    const auto attempts = pool_.size();
    std::string lastError;

    for (std::size_t attempt = 1; attempt <= attempts; ++attempt) {
        auto apiKey = pool_.acquire();
        const auto masked = key::maskKey(apiKey);
        util::log(util::LogLevel::info,
                  "Attempt " + std::to_string(attempt) + "/" + std::to_string(attempts) + " using API key " + masked);

        ai::ChatResult result;
        try {
            result = client_.complete(request, apiKey);
        } catch (const std::exception& ex) {
            pool_.reportFailure(apiKey, false);
            lastError = ex.what();
            util::log(util::LogLevel::error, "Chat request with API key " + masked + " failed: " + lastError);
            continue;
        }

        const auto outcome = ai::classifyOutcome(result.status, result.body);
        const auto summary = std::string{"status "} + std::to_string(result.status) + ", " + ai::toString(outcome);
        switch (outcome) {
        case ai::Outcome::success:
            pool_.reportSuccess(apiKey);
            if (result.content.empty()) {
                throw CompletionError(502, "Empty response from AI");
            }
            util::log(util::LogLevel::debug, "API key " + masked + " answered (" + summary + ")");
            return Completion{std::move(result.content), masked, attempt};
        case ai::Outcome::rateLimited:
            pool_.reportFailure(apiKey, true);
            lastError = snippet(result.body);
            util::log(util::LogLevel::warn, "API key " + masked + " rejected (" + summary + ")");
            continue;
        case ai::Outcome::failed:
            pool_.reportFailure(apiKey, false);
            lastError = snippet(result.body);
            util::log(util::LogLevel::error, "Chat API error with key " + masked + " (" + summary + "): " + lastError);
            if (!retryableStatus(result.status)) {
                throw CompletionError(result.status, lastError);
            }
            continue;
        }
    }

    throw CompletionError(503,
                          "Failed to generate a completion after " + std::to_string(attempts) +
                              " attempts. Last error: " + lastError);
}

} // namespace cvforge::service
