#include "cvforge/util/JsonUtil.hpp"

#include <charconv>
#include <cerrno>
#include <cstdlib>

namespace cvforge::util {
namespace {

std::string_view view(const boost::json::string& text) {
    return {text.data(), text.size()};
}

std::optional<std::int64_t> integerFromText(std::string_view text) {
    std::int64_t parsed = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<double> doubleFromText(std::string_view text) {
    const std::string copy(text);
    char* end = nullptr;
    errno = 0;
    const double parsed = std::strtod(copy.c_str(), &end);
    if (copy.empty() || errno != 0 || end != copy.c_str() + copy.size()) {
        return std::nullopt;
    }
    return parsed;
}

} // namespace

boost::json::value parseJson(std::string_view text) {
    boost::json::error_code ec;
    auto value = boost::json::parse(text, ec);
    if (ec) {
        throw JsonError("invalid JSON: " + ec.message());
    }
    return value;
}

const boost::json::value* findPath(const boost::json::value& root, std::string_view path) {
    const boost::json::value* current = &root;
    while (!path.empty()) {
        const auto dot = path.find('.');
        const auto step = path.substr(0, dot);
        path = dot == std::string_view::npos ? std::string_view{} : path.substr(dot + 1);

        if (const auto* object = current->if_object()) {
            current = object->if_contains(step);
        } else if (const auto* array = current->if_array()) {
            auto index = integerFromText(step);
            if (!index || *index < 0 || static_cast<std::size_t>(*index) >= array->size()) {
                return nullptr;
            }
            current = &(*array)[static_cast<std::size_t>(*index)];
        } else {
            return nullptr;
        }
        if (!current) {
            return nullptr;
        }
    }
    return current;
}

std::optional<std::string> readString(const boost::json::object& object, std::string_view key) {
    const auto* value = object.if_contains(key);
    if (!value) {
        return std::nullopt;
    }
    if (value->is_string()) {
        return std::string(view(value->get_string()));
    }
    if (value->is_int64()) {
        return std::to_string(value->get_int64());
    }
    return std::nullopt;
}

std::optional<std::int64_t> readInt(const boost::json::object& object, std::string_view key) {
    const auto* value = object.if_contains(key);
    if (!value) {
        return std::nullopt;
    }
    switch (value->kind()) {
    case boost::json::kind::int64:
        return value->get_int64();
    case boost::json::kind::uint64:
        return static_cast<std::int64_t>(value->get_uint64());
    case boost::json::kind::double_:
        return static_cast<std::int64_t>(value->get_double());
    case boost::json::kind::string:
        return integerFromText(view(value->get_string()));
    default:
        return std::nullopt;
    }
}

std::optional<double> readDouble(const boost::json::object& object, std::string_view key) {
    const auto* value = object.if_contains(key);
    if (!value) {
        return std::nullopt;
    }
    switch (value->kind()) {
    case boost::json::kind::double_:
        return value->get_double();
    case boost::json::kind::int64:
        return static_cast<double>(value->get_int64());
    case boost::json::kind::uint64:
        return static_cast<double>(value->get_uint64());
    case boost::json::kind::string:
        return doubleFromText(view(value->get_string()));
    default:
        return std::nullopt;
    }
}

} // namespace cvforge::util
