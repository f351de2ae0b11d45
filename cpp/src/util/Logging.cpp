#include "cvforge/util/Logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace cvforge::util {
namespace {

struct LoggerState {
    std::atomic<LogLevel> threshold{LogLevel::info};
    std::mutex writeMutex;
    std::ostream* sink{nullptr};
};

LoggerState& state() {
    static LoggerState instance;
    return instance;
}

void writeTimestamp(std::ostream& out) {
    const auto now = std::chrono::system_clock::now();
    const auto whole = std::chrono::floor<std::chrono::seconds>(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now - whole).count();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(whole);

    std::tm utc{};
    gmtime_r(&seconds, &utc);
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
}

} // namespace

void initLogging(LogLevel level) {
    state().threshold.store(level, std::memory_order_relaxed);
}

void setLogSink(std::ostream* sink) {
    std::lock_guard lock(state().writeMutex);
    state().sink = sink;
}

bool isLogEnabled(LogLevel level) {
    return level >= state().threshold.load(std::memory_order_relaxed);
}

std::string_view toString(LogLevel level) {
    switch (level) {
    case LogLevel::trace: return "TRACE";
    case LogLevel::debug: return "DEBUG";
    case LogLevel::info:  return "INFO";
    case LogLevel::warn:  return "WARN";
    case LogLevel::error: return "ERROR";
    }
    return "INFO";
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    for (auto level : {LogLevel::trace, LogLevel::debug, LogLevel::info, LogLevel::warn, LogLevel::error}) {
        std::string candidate(toString(level));
        std::transform(candidate.begin(), candidate.end(), candidate.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (key == candidate) {
            return level;
        }
    }
    if (key == "warning") {
        return LogLevel::warn;
    }
    return std::nullopt;
}

void log(LogLevel level, const std::string& message) {
    if (!isLogEnabled(level)) {
        return;
    }

    std::ostringstream line;
    writeTimestamp(line);
    line << ' ' << std::left << std::setw(5) << std::setfill(' ') << toString(level)
         << " [" << std::this_thread::get_id() << "] " << message << '\n';

    auto& logger = state();
    std::lock_guard lock(logger.writeMutex);
    std::ostream& out = logger.sink ? *logger.sink : std::clog;
    out << line.str();
    out.flush();
}

} // namespace cvforge::util
