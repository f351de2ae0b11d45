#include "cvforge/ai/GroqChatClient.hpp"
#include "cvforge/config/AppConfig.hpp"
#include "cvforge/controller/CvController.hpp"
#include "cvforge/controller/HealthController.hpp"
#include "cvforge/key/KeyPool.hpp"
#include "cvforge/server/HttpServer.hpp"
#include "cvforge/server/Router.hpp"
#include "cvforge/service/CompletionService.hpp"
#include "cvforge/service/TailorService.hpp"
#include "cvforge/util/HttpClient.hpp"
#include "cvforge/util/Logging.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

std::optional<cvforge::config::AppConfig> loadConfiguration(const std::filesystem::path& path) {
    try {
        return cvforge::config::loadAppConfig(path);
    } catch (const cvforge::config::ConfigError& ex) {
        cvforge::util::log(cvforge::util::LogLevel::error, std::string{"Invalid configuration: "} + ex.what());
        return std::nullopt;
    }
}

std::unique_ptr<cvforge::key::KeyPool> buildKeyPool(const cvforge::config::AppConfig& config) {
    cvforge::key::KeyPoolOptions options;
    options.cooldown = std::chrono::duration_cast<std::chrono::seconds>(config.keyPool.cooldown);
    options.failureThreshold = config.keyPool.failureThreshold;
    try {
        return std::make_unique<cvforge::key::KeyPool>(config.groq.apiKeys, options);
    } catch (const cvforge::key::EmptyPoolError& ex) {
        cvforge::util::log(cvforge::util::LogLevel::error,
                           std::string{"Refusing to start: "} + ex.what() + " (set CVFORGE_GROQ_API_KEYS)");
        return nullptr;
    }
}

} // namespace

int main(int argc, char** argv) {
    using namespace cvforge;

    const std::filesystem::path configPath = argc > 1 ? argv[1] : "data/cvforge.json";
    auto config = loadConfiguration(configPath);
    if (!config) {
        return 1;
    }
    util::initLogging(config->logLevel);

    auto keyPool = buildKeyPool(*config);
    if (!keyPool) {
        return 1;
    }

    boost::asio::io_context io;
    const unsigned int workerCount =
        config->server.workers > 0 ? config->server.workers : std::max(2u, std::thread::hardware_concurrency());
    boost::asio::thread_pool workerPool(workerCount);
    util::HttpClient httpClient;

    ai::GroqChatClient::Settings chatSettings;
    chatSettings.endpoint = config->groq.endpoint;
    chatSettings.model = config->groq.model;
    chatSettings.timeout = config->groq.timeout;
    chatSettings.maxTokens = config->groq.maxTokens;
    chatSettings.temperature = config->groq.temperature;
    ai::GroqChatClient chatClient{httpClient, chatSettings};

    service::CompletionService completionService{*keyPool, chatClient};
    service::TailorService tailorService{completionService};

    auto router = std::make_shared<server::Router>();
    controller::HealthController healthController{*keyPool, config->appName};
    healthController.registerRoutes(*router);

    controller::CvController cvController{tailorService, workerPool};
    cvController.registerRoutes(*router);

    server::ServerOptions serverOptions;
    serverOptions.host = config->server.host;
    serverOptions.port = config->server.port;
    serverOptions.bodyLimit = config->server.maxBodyBytes;
    auto server = std::make_shared<server::HttpServer>(io, router, serverOptions);
    try {
        server->start();
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error,
                  "Failed to listen on " + config->server.host + ":" + std::to_string(config->server.port) + ": " +
                      ex.what());
        return 1;
    }

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&io, server](const boost::system::error_code& ec, int) {
        if (!ec) {
            util::log(util::LogLevel::info, "Shutting down");
            server->stop();
            io.stop();
        }
    });

    const unsigned int ioThreadsCount =
        config->server.threads > 0 ? config->server.threads : std::max(2u, std::thread::hardware_concurrency());
    std::vector<std::thread> ioThreads;
    if (ioThreadsCount > 1) {
        ioThreads.reserve(ioThreadsCount - 1);
        for (unsigned int i = 0; i < ioThreadsCount - 1; ++i) {
            ioThreads.emplace_back([&io]() { io.run(); });
        }
    }

    util::log(util::LogLevel::info,
              config->appName + " " + config->appVersion + " listening on " + config->server.host + ":" +
                  std::to_string(config->server.port) + " with " + std::to_string(ioThreadsCount) + " io threads and " + std::to_string(workerCount) +
                  " workers");
    io.run();

    for (auto& thread : ioThreads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    // Queued tailoring jobs are dropped; running ones finish before the services go away.
    workerPool.stop();
    workerPool.join();
    return 0;
}
