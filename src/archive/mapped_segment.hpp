#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "archive/frame_format.hpp"

namespace archive {

enum class SegmentIoStatus {
    Ok = 0,
    Missing,
    Truncated,
    IoError,
    MapFailed,
};

const char* segment_io_status_name(SegmentIoStatus status) noexcept;

struct SegmentIoResult {
    SegmentIoStatus status{SegmentIoStatus::Ok};
    int error_code{0};

    bool ok() const noexcept { return status == SegmentIoStatus::Ok; }
};

// Read-only shared mapping of one whole segment file. Move-only; the mapping
// is released when the owner is destroyed or reset.
class MappedSegment {
public:
    MappedSegment() = default;
    ~MappedSegment();

    MappedSegment(const MappedSegment&) = delete;
    MappedSegment& operator=(const MappedSegment&) = delete;
    MappedSegment(MappedSegment&& other) noexcept;
    MappedSegment& operator=(MappedSegment&& other) noexcept;

    // Maps exactly `length` bytes; a shorter file is Truncated.
    static SegmentIoResult map(const std::filesystem::path& path, std::size_t length, MappedSegment& out) noexcept;

    void reset() noexcept;

    bool valid() const noexcept { return base_ != nullptr; }
    std::uint8_t* data() const noexcept { return base_; }
    std::size_t size() const noexcept { return length_; }

    // Mappings currently alive in this process.
    static std::int64_t live_mappings() noexcept { return live_.load(std::memory_order_relaxed); }

private:
    MappedSegment(std::uint8_t* base, std::size_t length) noexcept : base_(base), length_(length) {}

    std::uint8_t* base_{nullptr};
    std::size_t length_{0};

    static std::atomic<std::int64_t> live_;
};

// Holds at most one mapped segment of one recording at a time.
class SegmentMapper {
public:
    SegmentMapper(std::filesystem::path archive_dir,
                  std::int64_t recording_id,
                  std::int32_t segment_file_length) noexcept;

    // Releases the current mapping before mapping segment_index. On failure
    // nothing is mapped.
    SegmentIoResult open(std::int32_t segment_index) noexcept;
    void close() noexcept;

    bool is_open() const noexcept { return segment_.valid(); }
    std::int32_t segment_index() const noexcept { return segment_index_; }

    // View over [term_start_offset, term_start_offset + term_length) of the
    // mapped segment. Requires is_open().
    AtomicBuffer term(std::int32_t term_start_offset, std::int32_t term_length) const noexcept;

    std::uint64_t segments_mapped() const noexcept { return segments_mapped_; }
    const std::string& last_path() const noexcept { return last_path_; }

private:
    std::filesystem::path archive_dir_;
    std::int64_t recording_id_;
    std::int32_t segment_file_length_;
    std::int32_t segment_index_{-1};
    MappedSegment segment_{};
    std::uint64_t segments_mapped_{0};
    std::string last_path_{};
};

} // namespace archive
