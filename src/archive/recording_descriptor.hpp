#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>

namespace archive {

inline constexpr std::int64_t null_position = -1;
inline constexpr std::int64_t null_length = -1;

// Recording descriptor (<recording_id>.inf), little-endian, fixed size:
//  offset size field
//       0   4   magic "RDSC"
//       4   2   schema version
//       6   2   flags (bit 0: recording stopped)
//       8   8   recording_id
//      16   4   term_buffer_length
//      20   4   segment_file_length
//      24   8   join_position
//      32   8   end_position (position reached when the snapshot was written)
//      40   4   stream_id
//      44   4   session_id
//      48   8   reserved
//      56   4   crc32c over bytes [0, 56)
//      60   4   reserved
inline constexpr std::uint32_t descriptor_magic = 0x43534452u; // "RDSC"
inline constexpr std::uint16_t descriptor_schema_version = 1;
inline constexpr std::size_t descriptor_size = 64;
inline constexpr std::size_t descriptor_crc_offset = 56;
inline constexpr std::uint16_t descriptor_flag_stopped = 0x1;

inline constexpr std::int32_t min_term_buffer_length = 64;
inline constexpr std::int32_t max_term_buffer_length = 1 << 30;

struct RecordingDescriptor {
    std::int64_t recording_id{0};
    std::int32_t term_buffer_length{0};
    std::int32_t segment_file_length{0};
    std::int64_t join_position{0};
    std::int64_t end_position{0};
    std::int32_t stream_id{0};
    std::int32_t session_id{0};
    bool stopped{false};

    // Snapshot value; a lower bound while the recording is active.
    std::int64_t recording_length() const noexcept { return end_position - join_position; }
};

enum class DescriptorStatus {
    Ok = 0,
    Missing,
    IoError,
    Truncated,
    BadMagic,
    VersionMismatch,
    ChecksumMismatch,
    RecordingIdMismatch,
    InvalidGeometry,
};

const char* descriptor_status_name(DescriptorStatus status) noexcept;

struct DescriptorLoadResult {
    DescriptorStatus status{DescriptorStatus::Missing};
    int error_code{0};

    bool ok() const noexcept { return status == DescriptorStatus::Ok; }
};

void encode_descriptor(const RecordingDescriptor& desc, std::span<std::byte, descriptor_size> out) noexcept;

// Checks framing (magic, version, crc) then geometry.
DescriptorStatus decode_descriptor(std::span<const std::byte> bytes, RecordingDescriptor& out) noexcept;

DescriptorStatus validate_geometry(const RecordingDescriptor& desc) noexcept;

// Reads <archive_dir>/<recording_id>.inf once; out is untouched on failure.
DescriptorLoadResult load_recording_descriptor(const std::filesystem::path& archive_dir,
                                               std::int64_t recording_id,
                                               RecordingDescriptor& out) noexcept;

// Replaces the descriptor file atomically (write to temp, then rename) so a
// concurrent loader never sees a torn record.
DescriptorLoadResult store_recording_descriptor(const std::filesystem::path& archive_dir,
                                                const RecordingDescriptor& desc) noexcept;

} // namespace archive
