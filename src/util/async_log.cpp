#include "util/async_log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdarg>
#include <cstring>
#include <new>
#include <system_error>

namespace util {
namespace {

AsyncLogger& global_hot_logger() {
    static AsyncLogger logger;
    return logger;
}

bool is_power_of_two(std::size_t v) noexcept { return v != 0 && (v & (v - 1)) == 0; }

std::uint64_t steady_now_ns() noexcept {
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

} // namespace

AsyncLogger::~AsyncLogger() { stop(); }

bool AsyncLogger::start(const Config& cfg) noexcept {
    if (!is_power_of_two(cfg.capacity_pow2) || cfg.capacity_pow2 < 2) {
        return false;
    }
    if (running()) {
        return true;
    }

    std::unique_ptr<Slot[]> slots(new (std::nothrow) Slot[cfg.capacity_pow2]);
    if (!slots) {
        return false;
    }
    for (std::size_t i = 0; i < cfg.capacity_pow2; ++i) {
        slots[i].sequence.store(i, std::memory_order_relaxed);
    }

    FILE* sink = stderr;
    if (!cfg.file_path.empty()) {
        sink = std::fopen(cfg.file_path.c_str(), "a");
        if (!sink) {
            return false;
        }
    }

    config_ = cfg;
    slots_ = std::move(slots);
    mask_ = cfg.capacity_pow2 - 1;
    head_.store(0, std::memory_order_relaxed);
    tail_ = 0;
    sink_ = sink;
    owns_file_ = sink != stderr;

    stop_.store(false, std::memory_order_release);
    try {
        consumer_ = std::thread([this] { consumer_loop(); });
    } catch (const std::system_error&) {
        stop_.store(true, std::memory_order_release);
        close_sink();
        return false;
    }
    return true;
}

void AsyncLogger::stop() noexcept {
    if (stop_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (consumer_.joinable()) {
        consumer_.join();
    }
    close_sink();
}

void AsyncLogger::close_sink() noexcept {
    if (owns_file_ && sink_) {
        std::fclose(sink_);
    }
    sink_ = stderr;
    owns_file_ = false;
}

bool AsyncLogger::claim(std::uint64_t& pos) noexcept {
    pos = head_.load(std::memory_order_relaxed);
    for (;;) {
        Slot& slot = slots_[pos & mask_];
        const std::uint64_t seq = slot.sequence.load(std::memory_order_acquire);
        const auto dif = static_cast<std::int64_t>(seq) - static_cast<std::int64_t>(pos);
        if (dif == 0) {
            if (head_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed, std::memory_order_relaxed)) {
                return true;
            }
        } else if (dif < 0) {
            return false;
        } else {
            pos = head_.load(std::memory_order_relaxed);
        }
    }
}

bool AsyncLogger::try_log(LogLevel lvl, const char* category, std::size_t category_len,
                          const char* msg, std::size_t len,
                          std::int64_t arg0, std::int64_t arg1) noexcept {
    if (!running() || !slots_) {
        return false;
    }
    if (lvl < config_.min_level) {
        filtered_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    std::uint64_t pos = 0;
    if (!claim(pos)) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    Slot& slot = slots_[pos & mask_];
    HotLogRecord& rec = slot.record;
    rec.timestamp_ns = steady_now_ns();
    rec.level = lvl;
    std::memset(rec.category, 0, sizeof(rec.category));
    if (category) {
        std::memcpy(rec.category, category, std::min(category_len, sizeof(rec.category) - 1));
    }
    rec.message_len = static_cast<std::uint16_t>(std::min(len, sizeof(rec.message)));
    if (rec.message_len > 0) {
        std::memcpy(rec.message, msg, rec.message_len);
    }
    rec.arg0 = arg0;
    rec.arg1 = arg1;

    slot.sequence.store(pos + 1, std::memory_order_release);
    return true;
}

bool AsyncLogger::try_logf(LogLevel lvl, const char* category, const char* fmt, ...) noexcept {
    char buffer[sizeof(HotLogRecord::message)];
    va_list args;
    va_start(args, fmt);
    const int n = std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);
    const std::size_t len = n < 0 ? 0u : std::min(static_cast<std::size_t>(n), sizeof(buffer) - 1);
    const std::size_t cat_len = category ? std::strlen(category) : 0;
    return try_log(lvl, category, cat_len, buffer, len);
}

bool AsyncLogger::try_pop(HotLogRecord& out) noexcept {
    Slot& slot = slots_[tail_ & mask_];
    const std::uint64_t seq = slot.sequence.load(std::memory_order_acquire);
    if (static_cast<std::int64_t>(seq) - static_cast<std::int64_t>(tail_ + 1) != 0) {
        return false;
    }
    out = slot.record;
    slot.sequence.store(tail_ + mask_ + 1, std::memory_order_release);
    ++tail_;
    return true;
}

void AsyncLogger::write_record(const HotLogRecord& rec) noexcept {
    std::fprintf(sink_, "[%llu][%s][%s] ", static_cast<unsigned long long>(rec.timestamp_ns),
                 level_name(rec.level), rec.category);
    if (rec.message_len > 0) {
        std::fwrite(rec.message, 1, rec.message_len, sink_);
    }
    if (rec.arg0 != 0 || rec.arg1 != 0) {
        std::fprintf(sink_, " | a0=%lld a1=%lld", static_cast<long long>(rec.arg0),
                     static_cast<long long>(rec.arg1));
    }
    std::fputc('\n', sink_);
}

void AsyncLogger::consumer_loop() noexcept {
    std::size_t since_flush = 0;
    std::uint32_t idle_spins = 0;
    while (running() || tail_ != head_.load(std::memory_order_acquire)) {
        HotLogRecord rec{};
        if (try_pop(rec)) {
            write_record(rec);
            written_.fetch_add(1, std::memory_order_relaxed);
            idle_spins = 0;
            ++since_flush;
            if ((config_.flush_on_warn && rec.level >= LogLevel::Warn) ||
                (config_.flush_every > 0 && since_flush >= config_.flush_every)) {
                std::fflush(sink_);
                since_flush = 0;
            }
            continue;
        }
        if (since_flush > 0) {
            std::fflush(sink_);
            since_flush = 0;
        }
        if (idle_spins < 256 || config_.consumer_sleep_ns == 0) {
            ++idle_spins;
            std::this_thread::yield();
        } else {
            idle_spins = 0;
            std::this_thread::sleep_for(std::chrono::nanoseconds(config_.consumer_sleep_ns));
        }
    }
    std::fflush(sink_);
}

AsyncLogger& hot_logger() noexcept { return global_hot_logger(); }

bool init_hot_logger(const AsyncLogger::Config& cfg) noexcept { return global_hot_logger().start(cfg); }

void shutdown_hot_logger() noexcept { global_hot_logger().stop(); }

} // namespace util
