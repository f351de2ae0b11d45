#include <gtest/gtest.h>
#include "cvforge/config/AppConfig.hpp"
#include "cvforge/util/JsonUtil.hpp"

#include <chrono>
#include <cstdlib>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using cvforge::config::AppConfig;
using cvforge::config::ConfigError;
using cvforge::config::applyEnvironment;
using cvforge::config::applyJson;
using cvforge::config::loadAppConfig;
using cvforge::config::parseKeyList;
using cvforge::util::LogLevel;

namespace {

const char* const kVariables[] = {
    "CVFORGE_APP_NAME",         "CVFORGE_APP_VERSION",          "CVFORGE_HOST",
    "CVFORGE_PORT",             "CVFORGE_THREADS",              "CVFORGE_GROQ_API_KEYS",
    "CVFORGE_GROQ_ENDPOINT",    "CVFORGE_GROQ_MODEL",           "CVFORGE_GROQ_TIMEOUT",
    "CVFORGE_GROQ_MAX_TOKENS",  "CVFORGE_GROQ_TEMPERATURE",     "CVFORGE_KEY_COOLDOWN_MINUTES",
    "CVFORGE_KEY_FAILURE_THRESHOLD", "CVFORGE_LOG_LEVEL", "CVFORGE_MAX_BODY_BYTES",
    "CVFORGE_WORKERS",
};

class AppConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnvironment(); }
    void TearDown() override {
        clearEnvironment();
        if (!tempFile_.empty()) {
            std::filesystem::remove(tempFile_);
        }
    }

    static void clearEnvironment() {
        for (const char* name : kVariables) {
            ::unsetenv(name);
        }
    }

    std::filesystem::path writeConfig(const std::string& content) {
        tempFile_ = std::filesystem::temp_directory_path() /
                    ("cvforge-config-" + std::to_string(::getpid()) + ".json");
        std::ofstream out(tempFile_);
        out << content;
        return tempFile_;
    }

    std::filesystem::path tempFile_;
};

} // namespace

TEST(ParseKeyListTest, TrimsAndDropsBlanks) {
    EXPECT_EQ(parseKeyList(" a , b,,c , "), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(parseKeyList("").empty());
    EXPECT_TRUE(parseKeyList(" , ,").empty());
    EXPECT_EQ(parseKeyList("single"), (std::vector<std::string>{"single"}));
}

TEST_F(AppConfigTest, JsonOverlaysNestedSections) {
    AppConfig config;
    auto json = cvforge::util::parseJson(R"({
        "appName": "cv-api",
        "logLevel": "debug",
        "server": {"host": "127.0.0.1", "port": 9090, "threads": 3, "maxBodyBytes": 4096},
        "groq": {"apiKeys": [" k1 ", "", "k2"], "model": "llama-3.1-8b-instant", "timeoutSeconds": 30},
        "keyPool": {"cooldownMinutes": 2, "failureThreshold": 4}
    })");
    applyJson(config, json.as_object());

    EXPECT_EQ(config.appName, "cv-api");
    EXPECT_EQ(config.logLevel, LogLevel::debug);
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.server.threads, 3u);
    EXPECT_EQ(config.server.maxBodyBytes, 4096u);
    EXPECT_EQ(config.groq.apiKeys, (std::vector<std::string>{"k1", "k2"}));
    EXPECT_EQ(config.groq.model, "llama-3.1-8b-instant");
    EXPECT_EQ(config.groq.timeout, std::chrono::seconds(30));
    EXPECT_EQ(config.keyPool.cooldown, std::chrono::minutes(2));
    EXPECT_EQ(config.keyPool.failureThreshold, 4);
}

TEST_F(AppConfigTest, JsonAcceptsCommaSeparatedKeys) {
    AppConfig config;
    applyJson(config, cvforge::util::parseJson(R"({"groq": {"apiKeys": "k1, k2 ,k3"}})").as_object());
    EXPECT_EQ(config.groq.apiKeys, (std::vector<std::string>{"k1", "k2", "k3"}));
}

TEST_F(AppConfigTest, EnvironmentOverridesFile) {
    auto path = writeConfig(R"({"server": {"port": 9090}, "groq": {"apiKeys": ["from-file"]}})");
    ::setenv("CVFORGE_PORT", "7000", 1);
    ::setenv("CVFORGE_GROQ_API_KEYS", "env-1,env-2", 1);
    ::setenv("CVFORGE_KEY_COOLDOWN_MINUTES", "10", 1);

    auto config = loadAppConfig(path);
    EXPECT_EQ(config.server.port, 7000);
    EXPECT_EQ(config.groq.apiKeys, (std::vector<std::string>{"env-1", "env-2"}));
    EXPECT_EQ(config.keyPool.cooldown, std::chrono::minutes(10));
}

TEST_F(AppConfigTest, MissingFileGivesDefaults) {
    auto config = loadAppConfig("/nonexistent/cvforge.json");

    EXPECT_EQ(config.server.host, "0.0.0.0");
    EXPECT_EQ(config.server.port, 8000);
    EXPECT_GE(config.server.threads, 2u);
    EXPECT_TRUE(config.groq.apiKeys.empty());
    EXPECT_EQ(config.keyPool.cooldown, std::chrono::minutes(5));
    EXPECT_EQ(config.keyPool.failureThreshold, 0);
}

TEST_F(AppConfigTest, UnparsableFileFallsBackToDefaults) {
    auto path = writeConfig("{ not json");
    auto config = loadAppConfig(path);
    EXPECT_EQ(config.server.port, 8000);
}

TEST_F(AppConfigTest, MalformedEnvironmentIsRejected) {
    ::setenv("CVFORGE_PORT", "eighty", 1);
    EXPECT_THROW(loadAppConfig("/nonexistent/cvforge.json"), ConfigError);
    ::unsetenv("CVFORGE_PORT");

    ::setenv("CVFORGE_KEY_COOLDOWN_MINUTES", "0", 1);
    EXPECT_THROW(loadAppConfig("/nonexistent/cvforge.json"), ConfigError);
    ::unsetenv("CVFORGE_KEY_COOLDOWN_MINUTES");

    ::setenv("CVFORGE_LOG_LEVEL", "chatty", 1);
    EXPECT_THROW(loadAppConfig("/nonexistent/cvforge.json"), ConfigError);
}

TEST_F(AppConfigTest, CooldownAboveOneDayIsRejected) {
    AppConfig config;
    EXPECT_THROW(applyJson(config, cvforge::util::parseJson(R"({"keyPool": {"cooldownMinutes": 1441}})").as_object()),
                 ConfigError);
    applyJson(config, cvforge::util::parseJson(R"({"keyPool": {"cooldownMinutes": 1440}})").as_object());
    EXPECT_EQ(config.keyPool.cooldown, std::chrono::hours(24));

    ::setenv("CVFORGE_KEY_COOLDOWN_MINUTES", "9223372036854775807", 1);
    EXPECT_THROW(applyEnvironment(config), ConfigError);
    EXPECT_EQ(config.keyPool.cooldown, std::chrono::hours(24));
}

TEST_F(AppConfigTest, WorkerThreadsFromFileAndEnvironment) {
    AppConfig config;
    EXPECT_EQ(config.server.workers, 0u);
    applyJson(config, cvforge::util::parseJson(R"({"server": {"workers": 6}})").as_object());
    EXPECT_EQ(config.server.workers, 6u);

    ::setenv("CVFORGE_WORKERS", "3", 1);
    applyEnvironment(config);
    EXPECT_EQ(config.server.workers, 3u);
}

TEST_F(AppConfigTest, NegativeThresholdClampsToZero) {
    AppConfig config;
    ::setenv("CVFORGE_KEY_FAILURE_THRESHOLD", "-2", 1);
    applyEnvironment(config);
    EXPECT_EQ(config.keyPool.failureThreshold, 0);
}
