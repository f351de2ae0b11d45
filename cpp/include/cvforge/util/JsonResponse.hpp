#pragma once

#include <boost/json.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace cvforge::util {

// "2024-01-02T03:04:05Z"
std::string formatIsoTimestamp(std::chrono::system_clock::time_point timePoint);

// Statuses below 400 become {"success": true, "timestamp", "path", "data": payload}.
// Anything else becomes {"success": false, "timestamp", "path", "error": {"status",
// "message", "details"}}, where a string "message" member of an object payload is
// lifted into error.message and the remaining members become error.details.
boost::json::object makeEnvelope(int status,
                                 boost::json::value payload,
                                 std::string_view path,
                                 std::chrono::system_clock::time_point at = std::chrono::system_clock::now());

} // namespace cvforge::util
