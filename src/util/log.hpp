#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>
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

namespace detail {

struct SlowLogState {
    std::mutex mtx;
    std::atomic<LogLevel> threshold{LogLevel::Info};
    std::FILE* stream{stderr};
};

inline SlowLogState& slow_log_state() {
    static SlowLogState state;
    return state;
}

inline void slow_log_impl(LogLevel lvl, const char* fmt, va_list args) {
    auto& state = slow_log_state();
    if (lvl < state.threshold.load(std::memory_order_relaxed)) {
        return;
    }
    timespec ts{};
    clock_gettime(CLOCK_REALTIME, &ts);
    tm utc{};
    gmtime_r(&ts.tv_sec, &utc);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &utc);

    std::lock_guard<std::mutex> lock(state.mtx);
    std::fprintf(state.stream, "%s.%06ldZ %s: ", stamp, ts.tv_nsec / 1000, level_name(lvl));
    std::vfprintf(state.stream, fmt, args);
    std::fputc('\n', state.stream);
}

} // namespace detail

// Records below the threshold are discarded. Fatal is never filtered.
inline void set_log_level(LogLevel lvl) noexcept {
    detail::slow_log_state().threshold.store(lvl > LogLevel::Fatal ? LogLevel::Fatal : lvl,
                                             std::memory_order_relaxed);
}

inline LogLevel log_level() noexcept {
    return detail::slow_log_state().threshold.load(std::memory_order_relaxed);
}

inline bool log_enabled(LogLevel lvl) noexcept {
    return lvl >= log_level();
}

// Redirects the synchronous log; stderr when null.
inline void set_log_stream(std::FILE* stream) {
    auto& state = detail::slow_log_state();
    std::lock_guard<std::mutex> lock(state.mtx);
    state.stream = stream != nullptr ? stream : stderr;
}

inline void log(LogLevel lvl, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::slow_log_impl(lvl, fmt, args);
    va_end(args);
}

} // namespace util

#define LOG_SLOW_TRACE(FMT, ...) ::util::log(::util::LogLevel::Trace, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_DEBUG(FMT, ...) ::util::log(::util::LogLevel::Debug, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_INFO(FMT, ...)  ::util::log(::util::LogLevel::Info,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_WARN(FMT, ...)  ::util::log(::util::LogLevel::Warn,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_ERROR(FMT, ...) ::util::log(::util::LogLevel::Error, (FMT) __VA_OPT__(, __VA_ARGS__))
