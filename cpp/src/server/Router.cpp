#include "cvforge/server/Router.hpp"

#include <algorithm>
#include <cctype>

namespace cvforge::server {
namespace {

std::string upper(std::string_view method) {
    std::string result(method);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return result;
}

std::vector<std::string_view> splitPath(std::string_view target) {
    target = target.substr(0, target.find('?'));
    std::vector<std::string_view> segments;
    while (!target.empty()) {
        const auto slash = target.find('/');
        const auto segment = target.substr(0, slash);
        if (!segment.empty()) {
            segments.push_back(segment);
        }
        if (slash == std::string_view::npos) {
            break;
        }
        target.remove_prefix(slash + 1);
    }
    return segments;
}

} // namespace

void Router::addRoute(std::string_view method, std::string_view pattern, Handler handler) {
    Route route;
    route.method = upper(method);
    for (auto segment : splitPath(pattern)) {
        route.segments.emplace_back(segment);
    }
    route.handler = std::move(handler);
    routes_.push_back(std::move(route));
}

bool Router::matches(const Route& route, const std::vector<std::string_view>& segments, Params* params) {
    if (route.segments.size() != segments.size()) {
        return false;
    }
    Params captured;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto& expected = route.segments[i];
        if (expected.front() == ':') {
            captured.emplace(expected.substr(1), std::string(segments[i]));
        } else if (expected != segments[i]) {
            return false;
        }
    }
    if (params) {
        *params = std::move(captured);
    }
    return true;
}

Router::Handler Router::resolve(std::string_view method, std::string_view target, Params& params) const {
    const auto wanted = upper(method);
    const auto segments = splitPath(target);
    for (const auto& route : routes_) {
        if (route.method == wanted && matches(route, segments, &params)) {
            return route.handler;
        }
    }
    return {};
}

std::vector<std::string> Router::allowedMethods(std::string_view target) const {
    const auto segments = splitPath(target);
    std::vector<std::string> methods;
    for (const auto& route : routes_) {
        if (matches(route, segments, nullptr) &&
            std::find(methods.begin(), methods.end(), route.method) == methods.end()) {
            methods.push_back(route.method);
        }
    }
    return methods;
}

} // namespace cvforge::server
