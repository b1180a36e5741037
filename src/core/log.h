/**
 * TrackSense - Logging
 *
 * Leveled stderr logger. Lines look like "[TrackSense][warn][Boundaries] message".
 *
 *   error: the requested operation failed
 *   warn:  degraded or suspicious input (near-silent track, trivial segmentation)
 *   info:  per-stage summaries and timings
 *   debug: internal values (thresholds, candidate peaks)
 */

#ifndef TRACKSENSE_LOG_H
#define TRACKSENSE_LOG_H

#include <sstream>
#include <string>

namespace tracksense {

enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

void set_log_level(LogLevel level);
LogLevel get_log_level();

/**
 * Parse "error", "warn", "info" or "debug". Unknown names map to Warn.
 */
LogLevel parse_log_level(const std::string& name);

inline bool should_log(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(get_log_level());
}

void log_line(LogLevel level, const char* tag, const std::string& message);

} // namespace tracksense

#define TRACKSENSE_LOG(level, tag, message)                                   \
    do {                                                                      \
        if (::tracksense::should_log(level)) {                                \
            std::ostringstream _tracksense_log_stream;                        \
            _tracksense_log_stream << message;                                \
            ::tracksense::log_line(level, tag, _tracksense_log_stream.str()); \
        }                                                                     \
    } while (0)

#define TRACKSENSE_LOG_ERROR(tag, message) TRACKSENSE_LOG(::tracksense::LogLevel::Error, tag, message)
#define TRACKSENSE_LOG_WARN(tag, message) TRACKSENSE_LOG(::tracksense::LogLevel::Warn, tag, message)
#define TRACKSENSE_LOG_INFO(tag, message) TRACKSENSE_LOG(::tracksense::LogLevel::Info, tag, message)
#define TRACKSENSE_LOG_DEBUG(tag, message) TRACKSENSE_LOG(::tracksense::LogLevel::Debug, tag, message)

#endif // TRACKSENSE_LOG_H
