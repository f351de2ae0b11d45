#include "cvforge/controller/HealthController.hpp"

#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <utility>

namespace cvforge::controller {
namespace {

double toSeconds(std::chrono::milliseconds value) {
    return static_cast<double>(value.count()) / 1000.0;
}

} // namespace

HealthController::HealthController(key::KeyPool& keyPool, std::string appName)
    : keyPool_(keyPool)
    , appName_(std::move(appName)) {}

void HealthController::registerRoutes(server::Router& router) {
    router.addRoute("GET", "/", [this](auto& ctx) { handleRoot(ctx); });
    router.addRoute("GET", "/health", [this](auto& ctx) { handleHealth(ctx); });
    router.addRoute("GET", "/api-keys/status", [this](auto& ctx) { handleKeyStatus(ctx); });
}

boost::json::object HealthController::renderKeyStatus(const key::KeyPool& keyPool) {
    const auto snapshot = keyPool.snapshot();

    boost::json::array keys;
    for (const auto& entry : snapshot.credentials) {
        boost::json::object item;
        item["key"] = entry.maskedKey;
        item["state"] = key::toString(entry.state);
        item["consecutive_failures"] = static_cast<std::int64_t>(entry.consecutiveFailures);
        item["cooldown_remaining_seconds"] = toSeconds(entry.cooldownRemaining);
        item["cooldown_count"] = static_cast<std::int64_t>(entry.cooldownCount);
        if (entry.lastUsedAt) {
            item["last_used_seconds_ago"] =
                toSeconds(std::chrono::duration_cast<std::chrono::milliseconds>(snapshot.takenAt - *entry.lastUsedAt));
        } else {
            item["last_used_seconds_ago"] = nullptr;
        }
        keys.push_back(std::move(item));
    }

    const auto& options = keyPool.options();
    boost::json::object body;
    body["total_keys"] = static_cast<std::int64_t>(snapshot.credentials.size());
    body["available_keys"] = static_cast<std::int64_t>(snapshot.available);
    body["cooldown_minutes"] = static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::minutes>(options.cooldown).count());
    body["failure_threshold"] = static_cast<std::int64_t>(options.failureThreshold);
    body["has_available_keys"] = snapshot.available > 0;
    body["keys"] = std::move(keys);
    return body;
}

void HealthController::handleRoot(server::RequestContext& ctx) {
    ctx.replyJson(boost::beast::http::status::ok, boost::json::object{{"status", appName_ + " is running"}});
}

void HealthController::handleHealth(server::RequestContext& ctx) {
    ctx.replyJson(boost::beast::http::status::ok, boost::json::object{{"status", "healthy"}});
}

void HealthController::handleKeyStatus(server::RequestContext& ctx) {
    ctx.replyJson(boost::beast::http::status::ok, renderKeyStatus(keyPool_));
}

} // namespace cvforge::controller
