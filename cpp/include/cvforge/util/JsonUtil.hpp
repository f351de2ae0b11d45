#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cvforge::util {

class JsonError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Throws JsonError on malformed input.
boost::json::value parseJson(std::string_view text);

// Walks a dotted path such as "choices.0.message.content"; numeric steps index arrays.
// Returns nullptr as soon as a step does not exist.
const boost::json::value* findPath(const boost::json::value& root, std::string_view path);

// Lenient member readers for config files and request bodies: numbers written as
// strings are accepted, integers are readable as strings, anything else is nullopt.
std::optional<std::string> readString(const boost::json::object& object, std::string_view key);
std::optional<std::int64_t> readInt(const boost::json::object& object, std::string_view key);
std::optional<double> readDouble(const boost::json::object& object, std::string_view key);

} // namespace cvforge::util
