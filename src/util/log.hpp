#pragma once

#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace util {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Fatal };

inline const char* level_name(LogLevel lvl) noexcept {
    switch (lvl) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Fatal: return "FATAL";
    }
    return "UNKNOWN";
}

// A sink receives one fully formatted line without the trailing newline.
// Early boot code points this at its serial console; the default writes to stderr.
using LogSink = void (*)(LogLevel lvl, const char* line);

namespace detail {
inline std::mutex& log_mutex() {
    static std::mutex mtx;
    return mtx;
}

inline void stderr_sink(LogLevel lvl, const char* line) {
    std::fprintf(stderr, "%s: %s\n", level_name(lvl), line);
}

inline LogSink& current_sink() noexcept {
    static LogSink sink = &stderr_sink;
    return sink;
}

inline LogLevel& current_min_level() noexcept {
    static LogLevel lvl = LogLevel::Info;
    return lvl;
}

inline void log_impl(LogLevel lvl, const char* fmt, va_list args) {
    if (lvl < current_min_level()) {
        return;
    }
    char line[512];
    std::vsnprintf(line, sizeof(line), fmt, args);
    std::lock_guard<std::mutex> lock(log_mutex());
    current_sink()(lvl, line);
}
} // namespace detail

// Passing nullptr restores the stderr sink.
inline void set_log_sink(LogSink sink) noexcept {
    detail::current_sink() = sink ? sink : &detail::stderr_sink;
}

inline void set_log_level(LogLevel lvl) noexcept { detail::current_min_level() = lvl; }

[[nodiscard]] inline LogLevel log_level() noexcept { return detail::current_min_level(); }

[[nodiscard]] inline bool log_enabled(LogLevel lvl) noexcept { return lvl >= detail::current_min_level(); }

inline void log(LogLevel lvl, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::log_impl(lvl, fmt, args);
    va_end(args);
}

} // namespace util

#define LOG_TRACE(FMT, ...) ::util::log(::util::LogLevel::Trace, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_DEBUG(FMT, ...) ::util::log(::util::LogLevel::Debug, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_INFO(FMT, ...)  ::util::log(::util::LogLevel::Info,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_WARN(FMT, ...)  ::util::log(::util::LogLevel::Warn,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_ERROR(FMT, ...) ::util::log(::util::LogLevel::Error, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_FATAL(FMT, ...) ::util::log(::util::LogLevel::Fatal, (FMT) __VA_OPT__(, __VA_ARGS__))
