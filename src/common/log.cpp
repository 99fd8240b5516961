#include "common/log.hpp"
#include "common/string_util.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <iostream>
#include <mutex>

namespace rc_mcp {

namespace {
    constexpr const char *kTag = "[RC MCP]";

    std::mutex &log_mutex() {
        static std::mutex mutex;
        return mutex;
    }

    LogSink &current_sink() {
        static LogSink sink;
        return sink;
    }

    std::atomic<int> &threshold() {
        static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
        return level;
    }

    std::string format_message(const char *format, va_list args) {
        va_list copy;
        va_copy(copy, args);
        int required = std::vsnprintf(nullptr, 0, format, copy);
        va_end(copy);

        if (required <= 0) {
            return {};
        }

        std::string buffer(static_cast<size_t>(required), '\0');
        std::vsnprintf(&buffer[0], buffer.size() + 1, format, args);
        return buffer;
    }

    void write_line(LogLevel level, const char *format, va_list args) {
        if (static_cast<int>(level) < threshold().load()) {
            return;
        }

        std::string line = std::string(kTag) + " " + format_message(format, args);
        // Callers still pass msg()-style trailing newlines.
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }

        std::lock_guard<std::mutex> guard(log_mutex());
        if (current_sink()) {
            current_sink()(level, line);
        } else {
            std::cerr << line << std::endl;
        }
    }
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> guard(log_mutex());
    current_sink() = std::move(sink);
}

void set_log_level(LogLevel level) {
    threshold().store(static_cast<int>(level));
}

LogLevel get_log_level() {
    return static_cast<LogLevel>(threshold().load());
}

LogLevel parse_log_level(const std::string &text) {
    const std::string lower = to_lower(text);

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return LogLevel::Info;
}

const char *log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

void log_debug(const char *format, ...) {
    va_list args;
    va_start(args, format);
    write_line(LogLevel::Debug, format, args);
    va_end(args);
}

void log_msg(const char *format, ...) {
    va_list args;
    va_start(args, format);
    write_line(LogLevel::Info, format, args);
    va_end(args);
}

void log_warn(const char *format, ...) {
    va_list args;
    va_start(args, format);
    write_line(LogLevel::Warn, format, args);
    va_end(args);
}

void log_error(const char *format, ...) {
    va_list args;
    va_start(args, format);
    write_line(LogLevel::Error, format, args);
    va_end(args);
}

} // namespace rc_mcp
