#include "archive/mapped_segment.hpp"

#include <cerrno>
#include <new>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include "archive/archive_files.hpp"
#include "util/log.hpp"

namespace archive {

std::atomic<std::int64_t> MappedSegment::live_{0};

const char* segment_io_status_name(SegmentIoStatus status) noexcept {
    switch (status) {
    case SegmentIoStatus::Ok: return "ok";
    case SegmentIoStatus::Missing: return "missing";
    case SegmentIoStatus::Truncated: return "truncated";
    case SegmentIoStatus::IoError: return "io-error";
    case SegmentIoStatus::MapFailed: return "map-failed";
    }
    return "unknown";
}

MappedSegment::~MappedSegment() {
    reset();
}

MappedSegment::MappedSegment(MappedSegment&& other) noexcept
    : base_(std::exchange(other.base_, nullptr)), length_(std::exchange(other.length_, 0)) {}

MappedSegment& MappedSegment::operator=(MappedSegment&& other) noexcept {
    if (this != &other) {
        reset();
        base_ = std::exchange(other.base_, nullptr);
        length_ = std::exchange(other.length_, 0);
    }
    return *this;
}

void MappedSegment::reset() noexcept {
    if (base_ == nullptr) {
        return;
    }
    if (::munmap(base_, length_) != 0) {
        util::log(util::LogLevel::Warn, "munmap failed errno=%d", errno);
    }
    base_ = nullptr;
    length_ = 0;
    live_.fetch_sub(1, std::memory_order_relaxed);
}

SegmentIoResult MappedSegment::map(const std::filesystem::path& path, std::size_t length, MappedSegment& out) noexcept {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        return {err == ENOENT ? SegmentIoStatus::Missing : SegmentIoStatus::IoError, err};
    }

    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        const int err = errno;
        ::close(fd);
        return {SegmentIoStatus::IoError, err};
    }
    if (st.st_size < 0 || static_cast<std::size_t>(st.st_size) < length) {
        ::close(fd);
        return {SegmentIoStatus::Truncated, 0};
    }

    void* addr = ::mmap(nullptr, length, PROT_READ, MAP_SHARED, fd, 0);
    const int map_err = errno;
    ::close(fd);
    if (addr == MAP_FAILED) {
        return {SegmentIoStatus::MapFailed, map_err};
    }

    out = MappedSegment(static_cast<std::uint8_t*>(addr), length);
    live_.fetch_add(1, std::memory_order_relaxed);
    return {SegmentIoStatus::Ok, 0};
}

SegmentMapper::SegmentMapper(std::filesystem::path archive_dir,
                             std::int64_t recording_id,
                             std::int32_t segment_file_length) noexcept
    : archive_dir_(std::move(archive_dir)), recording_id_(recording_id), segment_file_length_(segment_file_length) {}

SegmentIoResult SegmentMapper::open(std::int32_t segment_index) noexcept {
    close();
    try {
        last_path_ = segment_path(archive_dir_, recording_id_, segment_index).string();
    } catch (const std::bad_alloc&) {
        return {SegmentIoStatus::IoError, ENOMEM};
    }

    const auto res = MappedSegment::map(last_path_, static_cast<std::size_t>(segment_file_length_), segment_);
    if (!res.ok()) {
        return res;
    }
    segment_index_ = segment_index;
    ++segments_mapped_;
    return res;
}

void SegmentMapper::close() noexcept {
    segment_.reset();
    segment_index_ = -1;
}

AtomicBuffer SegmentMapper::term(std::int32_t term_start_offset, std::int32_t term_length) const noexcept {
    return AtomicBuffer(segment_.data() + term_start_offset, static_cast<std::size_t>(term_length));
}

} // namespace archive
