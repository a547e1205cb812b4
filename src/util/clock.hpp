#pragma once

#include <chrono>
#include <cstdint>

namespace util {

// Monotonic time source; replaced in tests to drive idle timeouts
// deterministically.
class MonotonicClock {
public:
    virtual ~MonotonicClock() = default;

    virtual std::uint64_t now_ns() const noexcept {
        return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                              std::chrono::steady_clock::now().time_since_epoch())
                                              .count());
    }
};

inline const MonotonicClock& default_clock() noexcept {
    static const MonotonicClock clock;
    return clock;
}

} // namespace util
