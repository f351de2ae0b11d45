#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace cvforge::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

void initLogging(LogLevel level);

// Lines go to std::clog unless a sink is installed. Pass nullptr to restore.
void setLogSink(std::ostream* sink);

bool isLogEnabled(LogLevel level);

// One line per call: UTC timestamp, level, thread id, message.
void log(LogLevel level, const std::string& message);

std::string_view toString(LogLevel level);

// Case-insensitive; "warning" is accepted for warn.
std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace cvforge::util
