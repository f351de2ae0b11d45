#pragma once

#include "cvforge/server/RequestContext.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cvforge::server {

class Router {
public:
    using Handler = std::function<void(RequestContext&)>;
    using Params = std::unordered_map<std::string, std::string>;

    // Pattern segments written as ":name" capture into Params. Empty segments
    // and a trailing slash are ignored on both sides.
    void addRoute(std::string_view method, std::string_view pattern, Handler handler);

    // Returns an empty Handler when no route matches. The query string is ignored.
    Handler resolve(std::string_view method, std::string_view target, Params& params) const;

    // Methods registered for the path, in registration order. Empty for an unknown path.
    std::vector<std::string> allowedMethods(std::string_view target) const;

private:
    struct Route {
        std::string method;
        std::vector<std::string> segments;
        Handler handler;
    };

    static bool matches(const Route& route, const std::vector<std::string_view>& segments, Params* params);

    std::vector<Route> routes_;
};

} // namespace cvforge::server
