#pragma once

#include "cvforge/key/KeyPool.hpp"
#include "cvforge/server/Router.hpp"

#include <boost/json.hpp>

#include <string>

namespace cvforge::controller {

class HealthController {
public:
    HealthController(key::KeyPool& keyPool, std::string appName);

    void registerRoutes(server::Router& router);

    // Renders KeyPool::status() plus pool-wide counters.
    static boost::json::object renderKeyStatus(const key::KeyPool& keyPool);

private:
    void handleRoot(server::RequestContext& ctx);
    void handleHealth(server::RequestContext& ctx);
    void handleKeyStatus(server::RequestContext& ctx);

    key::KeyPool& keyPool_;
    std::string appName_;
};

} // namespace cvforge::controller
