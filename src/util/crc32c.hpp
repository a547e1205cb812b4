#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace util {

// Table-driven CRC32C (Castagnoli, reflected). Software only so the value is
// identical on every host that reads an archive.
namespace detail {

inline constexpr std::uint32_t crc32c_poly = 0x82F63B78u;

constexpr std::array<std::uint32_t, 256> make_crc32c_table() noexcept {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t i = 0; i < 256; ++i) {
        std::uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1u) ? (crc32c_poly ^ (c >> 1)) : (c >> 1);
        }
        table[i] = c;
    }
    return table;
}

inline constexpr std::array<std::uint32_t, 256> crc32c_table = make_crc32c_table();

} // namespace detail

class Crc32c {
public:
    static constexpr std::uint32_t initial = 0xFFFFFFFFu;
    static constexpr std::uint32_t xor_out = 0xFFFFFFFFu;

    static constexpr std::uint32_t update(std::uint32_t crc, const std::uint8_t* data, std::size_t len) noexcept {
        for (std::size_t i = 0; i < len; ++i) {
            crc = (crc >> 8) ^ detail::crc32c_table[(crc ^ data[i]) & 0xFFu];
        }
        return crc;
    }

    static std::uint32_t update(std::uint32_t crc, std::span<const std::byte> data) noexcept {
        return update(crc, reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
    }

    static constexpr std::uint32_t finalize(std::uint32_t crc) noexcept { return crc ^ xor_out; }

    static constexpr std::uint32_t compute(const std::uint8_t* data, std::size_t len) noexcept {
        return finalize(update(initial, data, len));
    }

    static std::uint32_t compute(std::span<const std::byte> data) noexcept {
        return finalize(update(initial, data));
    }
};

// Running digest over a sequence of buffers; value() is valid at any point.
class Crc32cDigest {
public:
    void update(const std::uint8_t* data, std::size_t len) noexcept {
        state_ = Crc32c::update(state_, data, len);
    }

    std::uint32_t value() const noexcept { return Crc32c::finalize(state_); }

    void reset() noexcept { state_ = Crc32c::initial; }

private:
    std::uint32_t state_{Crc32c::initial};
};

} // namespace util
