#pragma once

#include <functional>
#include <string>

namespace rc_mcp {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

// Receives one fully formatted line (no trailing newline).
using LogSink = std::function<void(LogLevel level, const std::string &line)>;

void set_log_sink(LogSink sink);
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Accepts "debug", "info", "warn"/"warning", "error" (any case). Unknown -> Info.
LogLevel parse_log_level(const std::string &text);
const char *log_level_name(LogLevel level);

void log_debug(const char *format, ...);
void log_msg(const char *format, ...);
void log_warn(const char *format, ...);
void log_error(const char *format, ...);

} // namespace rc_mcp
