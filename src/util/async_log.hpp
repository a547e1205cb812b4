#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>

#include "util/log.hpp"

namespace util {

// Fixed-size record; producers copy literals and two integers, no formatting.
struct HotLogRecord {
    std::uint64_t timestamp_ns{0};
    LogLevel level{LogLevel::Info};
    char category[8]{};
    std::uint16_t message_len{0};
    char message[160]{};
    std::int64_t arg0{0};
    std::int64_t arg1{0};
};

// Bounded multi-producer / single-consumer logger for the replay loop.
// try_log never blocks: a full queue or a stopped logger drops the record.
class AsyncLogger {
public:
    struct Config {
        std::size_t capacity_pow2{1u << 12};
        LogLevel min_level{LogLevel::Debug};
        bool flush_on_warn{true};
        std::size_t flush_every{256};
        std::string file_path{}; // stderr when empty
        std::uint64_t consumer_sleep_ns{50'000};
    };

    AsyncLogger() = default;
    ~AsyncLogger();

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    bool start(const Config& cfg) noexcept;
    void stop() noexcept;
    bool running() const noexcept { return !stop_.load(std::memory_order_acquire); }

    bool try_log(LogLevel lvl, const char* category, std::size_t category_len,
                 const char* msg, std::size_t len,
                 std::int64_t arg0 = 0, std::int64_t arg1 = 0) noexcept;

    bool try_logf(LogLevel lvl, const char* category, const char* fmt, ...) noexcept;

    std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }
    std::uint64_t filtered() const noexcept { return filtered_.load(std::memory_order_relaxed); }
    std::uint64_t written() const noexcept { return written_.load(std::memory_order_relaxed); }

private:
    struct Slot {
        std::atomic<std::uint64_t> sequence{0};
        HotLogRecord record{};
    };

    bool claim(std::uint64_t& pos) noexcept;
    bool try_pop(HotLogRecord& out) noexcept;
    void consumer_loop() noexcept;
    void write_record(const HotLogRecord& rec) noexcept;
    void close_sink() noexcept;

    std::atomic<std::uint64_t> head_{0};
    std::uint64_t tail_{0};
    std::size_t mask_{0};
    std::unique_ptr<Slot[]> slots_{};

    std::atomic<bool> stop_{true};
    std::thread consumer_{};
    Config config_{};

    FILE* sink_{stderr};
    bool owns_file_{false};

    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> filtered_{0};
    std::atomic<std::uint64_t> written_{0};
};

AsyncLogger& hot_logger() noexcept;
bool init_hot_logger(const AsyncLogger::Config& cfg) noexcept;
void shutdown_hot_logger() noexcept;

} // namespace util

#define LOG_HOT_LITERAL(LVL, CAT_LIT, MSG_LIT, ARG0, ARG1)                                                 \
    do {                                                                                                 \
        constexpr std::size_t _cat_len = sizeof(CAT_LIT) - 1;                                            \
        constexpr std::size_t _msg_len = sizeof(MSG_LIT) - 1;                                            \
        ::util::hot_logger().try_log((LVL), (CAT_LIT), _cat_len, (MSG_LIT), _msg_len,                    \
                                     static_cast<std::int64_t>(ARG0), static_cast<std::int64_t>(ARG1));  \
    } while (0)

#define LOG_HOT_DEBUG(MSG_LIT, ARG0, ARG1) LOG_HOT_LITERAL(::util::LogLevel::Debug, "REPLAY", MSG_LIT, (ARG0), (ARG1))
#define LOG_HOT_INFO(MSG_LIT, ARG0, ARG1)  LOG_HOT_LITERAL(::util::LogLevel::Info,  "REPLAY", MSG_LIT, (ARG0), (ARG1))
#define LOG_HOT_WARN(MSG_LIT, ARG0, ARG1)  LOG_HOT_LITERAL(::util::LogLevel::Warn,  "REPLAY", MSG_LIT, (ARG0), (ARG1))
#define LOG_HOT_ERROR(MSG_LIT, ARG0, ARG1) LOG_HOT_LITERAL(::util::LogLevel::Error, "REPLAY", MSG_LIT, (ARG0), (ARG1))

// Formats on the caller's thread; keep out of per-fragment paths.
#define LOG_WARM_FMT(LVL, CAT, FMT, ...) ::util::hot_logger().try_logf((LVL), (CAT), (FMT) __VA_OPT__(, __VA_ARGS__))
