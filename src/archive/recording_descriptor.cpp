#include "archive/recording_descriptor.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <new>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "archive/archive_files.hpp"
#include "archive/byte_order.hpp"
#include "archive/frame_format.hpp"
#include "util/crc32c.hpp"

namespace archive {

namespace {

constexpr std::int64_t max_segment_file_length = 0x7FFFFFFF;

std::uint32_t descriptor_crc(const std::byte* bytes) noexcept {
    return util::Crc32c::compute(std::span<const std::byte>(bytes, descriptor_crc_offset));
}

bool read_fully(int fd, std::byte* out, std::size_t len, int& error_code) noexcept {
    std::size_t done = 0;
    while (done < len) {
        const ssize_t n = ::read(fd, out + done, len - done);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_code = errno;
            return false;
        }
        if (n == 0) {
            break;
        }
        done += static_cast<std::size_t>(n);
    }
    return done == len;
}

bool write_fully(int fd, const std::byte* data, std::size_t len, int& error_code) noexcept {
    std::size_t done = 0;
    while (done < len) {
        const ssize_t n = ::write(fd, data + done, len - done);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_code = errno;
            return false;
        }
        done += static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace

const char* descriptor_status_name(DescriptorStatus status) noexcept {
    switch (status) {
    case DescriptorStatus::Ok: return "ok";
    case DescriptorStatus::Missing: return "missing";
    case DescriptorStatus::IoError: return "io-error";
    case DescriptorStatus::Truncated: return "truncated";
    case DescriptorStatus::BadMagic: return "bad-magic";
    case DescriptorStatus::VersionMismatch: return "version-mismatch";
    case DescriptorStatus::ChecksumMismatch: return "checksum-mismatch";
    case DescriptorStatus::RecordingIdMismatch: return "recording-id-mismatch";
    case DescriptorStatus::InvalidGeometry: return "invalid-geometry";
    }
    return "unknown";
}

void encode_descriptor(const RecordingDescriptor& desc, std::span<std::byte, descriptor_size> out) noexcept {
    std::byte* p = out.data();
    std::fill(out.begin(), out.end(), std::byte{0});
    store_le<std::uint32_t>(descriptor_magic, p + 0);
    store_le<std::uint16_t>(descriptor_schema_version, p + 4);
    store_le<std::uint16_t>(desc.stopped ? descriptor_flag_stopped : 0, p + 6);
    store_le<std::int64_t>(desc.recording_id, p + 8);
    store_le<std::int32_t>(desc.term_buffer_length, p + 16);
    store_le<std::int32_t>(desc.segment_file_length, p + 20);
    store_le<std::int64_t>(desc.join_position, p + 24);
    store_le<std::int64_t>(desc.end_position, p + 32);
    store_le<std::int32_t>(desc.stream_id, p + 40);
    store_le<std::int32_t>(desc.session_id, p + 44);
    store_le<std::uint32_t>(descriptor_crc(p), p + descriptor_crc_offset);
}

DescriptorStatus decode_descriptor(std::span<const std::byte> bytes, RecordingDescriptor& out) noexcept {
    if (bytes.size() < descriptor_size) {
        return DescriptorStatus::Truncated;
    }
    const std::byte* p = bytes.data();
    if (load_le<std::uint32_t>(p) != descriptor_magic) {
        return DescriptorStatus::BadMagic;
    }
    if (load_le<std::uint16_t>(p + 4) != descriptor_schema_version) {
        return DescriptorStatus::VersionMismatch;
    }
    if (load_le<std::uint32_t>(p + descriptor_crc_offset) != descriptor_crc(p)) {
        return DescriptorStatus::ChecksumMismatch;
    }

    RecordingDescriptor desc{};
    desc.stopped = (load_le<std::uint16_t>(p + 6) & descriptor_flag_stopped) != 0;
    desc.recording_id = load_le<std::int64_t>(p + 8);
    desc.term_buffer_length = load_le<std::int32_t>(p + 16);
    desc.segment_file_length = load_le<std::int32_t>(p + 20);
    desc.join_position = load_le<std::int64_t>(p + 24);
    desc.end_position = load_le<std::int64_t>(p + 32);
    desc.stream_id = load_le<std::int32_t>(p + 40);
    desc.session_id = load_le<std::int32_t>(p + 44);

    const auto geometry = validate_geometry(desc);
    if (geometry != DescriptorStatus::Ok) {
        return geometry;
    }
    out = desc;
    return DescriptorStatus::Ok;
}

DescriptorStatus validate_geometry(const RecordingDescriptor& desc) noexcept {
    const std::int32_t term = desc.term_buffer_length;
    if (term < min_term_buffer_length || term > max_term_buffer_length || (term & (term - 1)) != 0) {
        return DescriptorStatus::InvalidGeometry;
    }
    const std::int64_t segment = desc.segment_file_length;
    if (segment < term || segment > max_segment_file_length || segment % term != 0) {
        return DescriptorStatus::InvalidGeometry;
    }
    if (desc.join_position < 0 || desc.join_position % frame_alignment != 0) {
        return DescriptorStatus::InvalidGeometry;
    }
    if (desc.end_position < desc.join_position) {
        return DescriptorStatus::InvalidGeometry;
    }
    return DescriptorStatus::Ok;
}

DescriptorLoadResult load_recording_descriptor(const std::filesystem::path& archive_dir,
                                               std::int64_t recording_id,
                                               RecordingDescriptor& out) noexcept {
    std::string path;
    try {
        path = descriptor_path(archive_dir, recording_id).string();
    } catch (const std::bad_alloc&) {
        return {DescriptorStatus::IoError, ENOMEM};
    }

    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        return {err == ENOENT ? DescriptorStatus::Missing : DescriptorStatus::IoError, err};
    }

    std::array<std::byte, descriptor_size> bytes{};
    int err = 0;
    const bool complete = read_fully(fd, bytes.data(), bytes.size(), err);
    ::close(fd);
    if (!complete) {
        return {err != 0 ? DescriptorStatus::IoError : DescriptorStatus::Truncated, err};
    }

    RecordingDescriptor desc{};
    const auto status = decode_descriptor(bytes, desc);
    if (status != DescriptorStatus::Ok) {
        return {status, 0};
    }
    if (desc.recording_id != recording_id) {
        return {DescriptorStatus::RecordingIdMismatch, 0};
    }
    out = desc;
    return {DescriptorStatus::Ok, 0};
}

DescriptorLoadResult store_recording_descriptor(const std::filesystem::path& archive_dir,
                                                const RecordingDescriptor& desc) noexcept {
    std::string final_path;
    std::string tmp_path;
    try {
        final_path = descriptor_path(archive_dir, desc.recording_id).string();
        tmp_path = final_path + ".tmp";
    } catch (const std::bad_alloc&) {
        return {DescriptorStatus::IoError, ENOMEM};
    }

    std::array<std::byte, descriptor_size> bytes{};
    encode_descriptor(desc, bytes);

    const int fd = ::open(tmp_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return {DescriptorStatus::IoError, errno};
    }
    int err = 0;
    const bool written = write_fully(fd, bytes.data(), bytes.size(), err);
    ::close(fd);
    if (!written) {
        ::unlink(tmp_path.c_str());
        return {DescriptorStatus::IoError, err};
    }
    if (std::rename(tmp_path.c_str(), final_path.c_str()) != 0) {
        err = errno;
        ::unlink(tmp_path.c_str());
        return {DescriptorStatus::IoError, err};
    }
    return {DescriptorStatus::Ok, 0};
}

} // namespace archive
