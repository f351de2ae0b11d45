#include "cvforge/util/JsonResponse.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace cvforge::util {

std::string formatIsoTimestamp(std::chrono::system_clock::time_point timePoint) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(timePoint);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

boost::json::object makeEnvelope(int status,
                                 boost::json::value payload,
                                 std::string_view path,
                                 std::chrono::system_clock::time_point at) {
    boost::json::object envelope;
    envelope["success"] = status < 400;
    envelope["timestamp"] = formatIsoTimestamp(at);
    if (!path.empty()) {
        envelope["path"] = path;
    }

    if (status < 400) {
        envelope["data"] = std::move(payload);
        return envelope;
    }

    boost::json::object error;
    error["status"] = status;
    if (payload.is_object()) {
        auto& fields = payload.as_object();
        if (auto* message = fields.if_contains("message"); message && message->is_string()) {
            error["message"] = message->as_string();
            fields.erase("message");
        }
        if (!fields.empty()) {
            error["details"] = std::move(fields);
        }
    } else if (!payload.is_null()) {
        error["details"] = std::move(payload);
    }
    envelope["error"] = std::move(error);
    return envelope;
}

} // namespace cvforge::util
