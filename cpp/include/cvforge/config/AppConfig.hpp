#pragma once

#include "cvforge/util/Logging.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace cvforge::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Longest accepted key cooldown; larger values are a ConfigError.
inline constexpr std::chrono::minutes kMaxKeyCooldown{24 * 60};

struct ServerConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{8000};
    unsigned int threads{0};
    // Threads for blocking completion work; 0 picks a default in main.
    unsigned int workers{0};
    std::size_t maxBodyBytes{1024 * 1024};
};

struct GroqConfig {
    std::vector<std::string> apiKeys;
    std::string endpoint{"https://api.groq.com/openai/v1/chat/completions"};
    std::string model{"llama-3.3-70b-versatile"};
    std::chrono::seconds timeout{60};
    int maxTokens{2000};
    double temperature{0.7};
};

struct KeyPoolConfig {
    std::chrono::minutes cooldown{5};
    int failureThreshold{0};
};

struct AppConfig {
    std::string appName{"cvforge"};
    std::string appVersion{"1.0.0"};
    ServerConfig server;
    GroqConfig groq;
    KeyPoolConfig keyPool;
    util::LogLevel logLevel{util::LogLevel::info};
};

// Splits a comma-separated key list, trimming whitespace and dropping blanks.
std::vector<std::string> parseKeyList(std::string_view csv);

// Overlays the fields present in `json` onto `config`.
void applyJson(AppConfig& config, const boost::json::object& json);

// Overlays CVFORGE_* environment variables. Throws ConfigError on malformed numbers.
void applyEnvironment(AppConfig& config);

// Defaults, then the JSON file at `path` when it exists and parses, then the environment.
AppConfig loadAppConfig(const std::filesystem::path& path);

} // namespace cvforge::config
