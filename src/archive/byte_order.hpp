#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

namespace archive {

// Archive metadata is little-endian on disk regardless of host order.
template <typename T>
constexpr T byteswap_integral(T v) noexcept {
    static_assert(std::is_integral_v<T>, "integral types only");
    using U = std::make_unsigned_t<T>;
    U u = static_cast<U>(v);
    U r = 0;
    for (std::size_t i = 0; i < sizeof(U); ++i) {
        r = static_cast<U>((r << 8) | (u & 0xFFu));
        u = static_cast<U>(u >> 8);
    }
    return static_cast<T>(r);
}

template <typename T>
constexpr T to_little_endian(T v) noexcept {
    if constexpr (std::endian::native == std::endian::little || sizeof(T) == 1) {
        return v;
    } else {
        return byteswap_integral(v);
    }
}

template <typename T>
constexpr T from_little_endian(T v) noexcept { return to_little_endian(v); }

template <typename T>
inline T load_le(const std::byte* p) noexcept {
    T v{};
    std::memcpy(&v, p, sizeof(T));
    return from_little_endian(v);
}

template <typename T>
inline void store_le(T v, std::byte* p) noexcept {
    const T le = to_little_endian(v);
    std::memcpy(p, &le, sizeof(T));
}

} // namespace archive
