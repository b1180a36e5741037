/**
 * TrackSense - Logging Implementation
 */

#include "log.h"
#include <atomic>
#include <cstdio>

namespace tracksense {

namespace {

std::atomic<int> g_log_level{static_cast<int>(LogLevel::Warn)};

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Info:  return "info";
        case LogLevel::Debug: return "debug";
    }
    return "debug";
}

} // namespace

void set_log_level(LogLevel level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel get_log_level() {
    return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

LogLevel parse_log_level(const std::string& name) {
    if (name == "error") return LogLevel::Error;
    if (name == "info") return LogLevel::Info;
    if (name == "debug") return LogLevel::Debug;
    return LogLevel::Warn;
}

void log_line(LogLevel level, const char* tag, const std::string& message) {
    // One fprintf per line keeps lines from concurrent runs intact.
    std::fprintf(stderr, "[TrackSense][%s][%s] %s\n",
        level_name(level), tag ? tag : "", message.c_str());
}

} // namespace tracksense
