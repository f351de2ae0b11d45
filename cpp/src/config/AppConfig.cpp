#include "cvforge/config/AppConfig.hpp"
#include "cvforge/util/JsonUtil.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <thread>

namespace cvforge::config {
namespace {

std::string_view trimView(std::string_view input) {
    const auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\r\n");
    return input.substr(begin, end - begin + 1);
}

long long parseInteger(const char* name, const char* value) {
    errno = 0;
    char* end = nullptr;
    auto parsed = std::strtoll(value, &end, 10);
    if (errno != 0 || end == value || !trimView(end).empty()) {
        throw ConfigError(std::string{name} + " is not an integer: " + value);
    }
    return parsed;
}

double parseFloating(const char* name, const char* value) {
    errno = 0;
    char* end = nullptr;
    auto parsed = std::strtod(value, &end);
    if (errno != 0 || end == value || !trimView(end).empty()) {
        throw ConfigError(std::string{name} + " is not a number: " + value);
    }
    return parsed;
}

std::uint16_t checkedPort(long long value) {
    if (value <= 0 || value > 65535) {
        throw ConfigError("port out of range: " + std::to_string(value));
    }
    return static_cast<std::uint16_t>(value);
}

std::chrono::minutes checkedCooldown(long long value) {
    if (value > kMaxKeyCooldown.count()) {
        throw ConfigError("key cooldown above " + std::to_string(kMaxKeyCooldown.count()) +
                          " minutes: " + std::to_string(value));
    }
    return std::chrono::minutes(value);
}

void applyServer(ServerConfig& server, const boost::json::object& obj) {
    if (auto value = util::readString(obj, "host")) server.host = *value;
    if (auto value = util::readInt(obj, "port")) server.port = checkedPort(*value);
    if (auto value = util::readInt(obj, "threads"); value && *value > 0) {
        server.threads = static_cast<unsigned int>(*value);
    }
    if (auto value = util::readInt(obj, "workers"); value && *value > 0) {
        server.workers = static_cast<unsigned int>(*value);
    }
    if (auto value = util::readInt(obj, "maxBodyBytes"); value && *value > 0) {
        server.maxBodyBytes = static_cast<std::size_t>(*value);
    }
}

void applyGroq(GroqConfig& groq, const boost::json::object& obj) {
    if (auto it = obj.if_contains("apiKeys")) {
        if (it->is_array()) {
            groq.apiKeys.clear();
            for (const auto& item : it->as_array()) {
                if (item.is_string()) {
                    const auto& text = item.as_string();
                    auto trimmed = trimView(std::string_view(text.data(), text.size()));
                    if (!trimmed.empty()) {
                        groq.apiKeys.emplace_back(trimmed);
                    }
                }
            }
        } else if (it->is_string()) {
            const auto& text = it->as_string();
            groq.apiKeys = parseKeyList(std::string_view(text.data(), text.size()));
        }
    }
    if (auto value = util::readString(obj, "endpoint")) groq.endpoint = *value;
    if (auto value = util::readString(obj, "model")) groq.model = *value;
    if (auto value = util::readInt(obj, "timeoutSeconds"); value && *value > 0) {
        groq.timeout = std::chrono::seconds(*value);
    }
    if (auto value = util::readInt(obj, "maxTokens"); value && *value > 0) {
        groq.maxTokens = static_cast<int>(*value);
    }
    if (auto value = util::readDouble(obj, "temperature")) groq.temperature = *value;
}

void applyKeyPool(KeyPoolConfig& keyPool, const boost::json::object& obj) {
    if (auto value = util::readInt(obj, "cooldownMinutes"); value && *value > 0) {
        keyPool.cooldown = checkedCooldown(*value);
    }
    if (auto value = util::readInt(obj, "failureThreshold"); value && *value >= 0) {
        keyPool.failureThreshold = static_cast<int>(*value);
    }
}

} // namespace

std::vector<std::string> parseKeyList(std::string_view csv) {
    std::vector<std::string> keys;
    std::size_t start = 0;
    while (start <= csv.size()) {
        auto comma = csv.find(',', start);
        auto length = (comma == std::string_view::npos) ? csv.size() - start : comma - start;
        auto trimmed = trimView(csv.substr(start, length));
        if (!trimmed.empty()) {
            keys.emplace_back(trimmed);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return keys;
}

void applyJson(AppConfig& config, const boost::json::object& json) {
    if (auto value = util::readString(json, "appName")) config.appName = *value;
    if (auto value = util::readString(json, "appVersion")) config.appVersion = *value;
    if (auto value = util::readString(json, "logLevel")) {
        if (auto level = util::parseLogLevel(*value)) {
            config.logLevel = *level;
        } else {
            util::log(util::LogLevel::warn, "Unknown logLevel in config: " + *value);
        }
    }
    if (auto it = json.if_contains("server"); it && it->is_object()) applyServer(config.server, it->as_object());
    if (auto it = json.if_contains("groq"); it && it->is_object()) applyGroq(config.groq, it->as_object());
    if (auto it = json.if_contains("keyPool"); it && it->is_object()) applyKeyPool(config.keyPool, it->as_object());
}

void applyEnvironment(AppConfig& config) {
    if (const char* value = std::getenv("CVFORGE_APP_NAME")) config.appName = value;
    if (const char* value = std::getenv("CVFORGE_APP_VERSION")) config.appVersion = value;
    if (const char* value = std::getenv("CVFORGE_HOST")) config.server.host = value;
    if (const char* value = std::getenv("CVFORGE_PORT")) {
        config.server.port = checkedPort(parseInteger("CVFORGE_PORT", value));
    }
    if (const char* value = std::getenv("CVFORGE_THREADS")) {
        auto threads = parseInteger("CVFORGE_THREADS", value);
        if (threads > 0) {
            config.server.threads = static_cast<unsigned int>(threads);
        }
    }
    if (const char* value = std::getenv("CVFORGE_WORKERS")) {
        auto workers = parseInteger("CVFORGE_WORKERS", value);
        if (workers > 0) {
            config.server.workers = static_cast<unsigned int>(workers);
        }
    }
    if (const char* value = std::getenv("CVFORGE_MAX_BODY_BYTES")) {
        auto bytes = parseInteger("CVFORGE_MAX_BODY_BYTES", value);
        if (bytes <= 0) {
            throw ConfigError("CVFORGE_MAX_BODY_BYTES must be positive");
        }
        config.server.maxBodyBytes = static_cast<std::size_t>(bytes);
    }
    if (const char* value = std::getenv("CVFORGE_GROQ_API_KEYS")) config.groq.apiKeys = parseKeyList(value);
    if (const char* value = std::getenv("CVFORGE_GROQ_ENDPOINT")) config.groq.endpoint = value;
    if (const char* value = std::getenv("CVFORGE_GROQ_MODEL")) config.groq.model = value;
    if (const char* value = std::getenv("CVFORGE_GROQ_TIMEOUT")) {
        auto seconds = parseInteger("CVFORGE_GROQ_TIMEOUT", value);
        if (seconds > 0) {
            config.groq.timeout = std::chrono::seconds(seconds);
        }
    }
    if (const char* value = std::getenv("CVFORGE_GROQ_MAX_TOKENS")) {
        auto tokens = parseInteger("CVFORGE_GROQ_MAX_TOKENS", value);
        if (tokens > 0) {
            config.groq.maxTokens = static_cast<int>(tokens);
        }
    }
    if (const char* value = std::getenv("CVFORGE_GROQ_TEMPERATURE")) {
        config.groq.temperature = parseFloating("CVFORGE_GROQ_TEMPERATURE", value);
    }
    if (const char* value = std::getenv("CVFORGE_KEY_COOLDOWN_MINUTES")) {
        auto minutes = parseInteger("CVFORGE_KEY_COOLDOWN_MINUTES", value);
        if (minutes <= 0) {
            throw ConfigError("CVFORGE_KEY_COOLDOWN_MINUTES must be positive");
        }
        config.keyPool.cooldown = checkedCooldown(minutes);
    }
    if (const char* value = std::getenv("CVFORGE_KEY_FAILURE_THRESHOLD")) {
        auto threshold = parseInteger("CVFORGE_KEY_FAILURE_THRESHOLD", value);
        config.keyPool.failureThreshold = static_cast<int>(std::max(0LL, threshold));
    }
    if (const char* value = std::getenv("CVFORGE_LOG_LEVEL")) {
        auto level = util::parseLogLevel(value);
        if (!level) {
            throw ConfigError(std::string{"CVFORGE_LOG_LEVEL is not a log level: "} + value);
        }
        config.logLevel = *level;
    }
}

AppConfig loadAppConfig(const std::filesystem::path& path) {
    AppConfig config;

    if (std::filesystem::exists(path)) {
        std::ifstream ifs(path);
        if (ifs.is_open()) {
            std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
            if (!content.empty()) {
                try {
                    auto json = util::parseJson(content);
                    if (json.is_object()) {
                        applyJson(config, json.as_object());
                    } else {
                        util::log(util::LogLevel::warn, "Config file " + path.string() + " is not a JSON object");
                    }
                } catch (const util::JsonError& ex) {
                    util::log(util::LogLevel::warn,
                              "Failed to parse config file " + path.string() + ": " + ex.what());
                }
            }
        }
    }

    applyEnvironment(config);

    if (config.server.threads == 0) {
        config.server.threads = std::max(2u, std::thread::hardware_concurrency());
    }
    return config;
}

} // namespace cvforge::config
