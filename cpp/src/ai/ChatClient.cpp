#include "cvforge/ai/ChatClient.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace cvforge::ai {
namespace {

constexpr std::array<std::string_view, 4> kRateLimitMarkers{"rate limit", "rate_limit", "quota", "limit"};

std::string toLower(std::string_view value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

} // namespace

Outcome classifyOutcome(int status, std::string_view body) {
    if (status == 200) {
        return Outcome::success;
    }
    // Groq answers 429 when throttled and 403 when the key's quota is gone.
    if (status == 429 || status == 403) {
        return Outcome::rateLimited;
    }
    auto lowered = toLower(body);
    for (auto marker : kRateLimitMarkers) {
        if (lowered.find(marker) != std::string::npos) {
            return Outcome::rateLimited;
        }
    }
    return Outcome::failed;
}

const char* toString(Outcome outcome) {
    switch (outcome) {
    case Outcome::success: return "success";
    case Outcome::rateLimited: return "rate_limited";
    case Outcome::failed: return "failed";
    }
    return "failed";
}

} // namespace cvforge::ai
