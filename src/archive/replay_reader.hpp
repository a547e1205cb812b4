#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>

#include "archive/frame_format.hpp"
#include "archive/mapped_segment.hpp"
#include "archive/recording_descriptor.hpp"
#include "archive/segment_locator.hpp"

namespace archive {

// Receives the payload of one data frame. Returning false rejects it; the
// same fragment is offered again by the next poll.
using ReplayFragmentHandler = std::function<bool(const AtomicBuffer&, index_t, index_t)>;

struct ReplayReaderOptions {
    std::filesystem::path archive_dir{};
    std::int64_t recording_id{0};
    std::int64_t position{null_position}; // null: from the join position
    std::int64_t length{null_length};     // null: to the snapshot end
    // With a null length on an active recording, replay until the
    // end-of-recording sentinel instead of stopping at the snapshot end.
    bool open_ended{false};
};

enum class ReplayOpenStatus {
    Ok = 0,
    DescriptorError,
    PositionOutOfRange,
    LengthOutOfRange,
    SegmentError,
    CorruptFrame,
};

enum class ReplayPollStatus {
    Ok = 0,
    Backpressured,
    EndOfData,
    EndOfRecording,
    Complete,
    AlreadyDone,
    SegmentError,
    CorruptFrame,
    NotOpen,
};

const char* replay_open_status_name(ReplayOpenStatus status) noexcept;
const char* replay_poll_status_name(ReplayPollStatus status) noexcept;

inline bool is_poll_error(ReplayPollStatus status) noexcept {
    return status == ReplayPollStatus::SegmentError || status == ReplayPollStatus::CorruptFrame ||
           status == ReplayPollStatus::NotOpen;
}

struct ReplayPollResult {
    int fragments{0};
    ReplayPollStatus status{ReplayPollStatus::Ok};
};

struct ReplayReaderStats {
    std::uint64_t fragments{0};
    std::uint64_t payload_bytes{0};
    std::uint64_t padding_skipped{0};
    std::uint64_t rejections{0};
    std::uint64_t end_of_data_hits{0};
    std::uint64_t terms_rolled{0};
    std::uint64_t segments_mapped{0};
};

// Replays a byte range of one recording from its segment files. Single
// owner; not thread safe. Tolerates a writer appending to the segment it is
// reading: an unwritten frame reads as end-of-data.
class ReplayReader {
public:
    explicit ReplayReader(ReplayReaderOptions opts);
    ~ReplayReader();

    ReplayReader(const ReplayReader&) = delete;
    ReplayReader& operator=(const ReplayReader&) = delete;

    // Loads the descriptor, validates the range, maps the first segment and
    // snaps the start forward to the next frame boundary.
    ReplayOpenStatus open();

    // Delivers at most fragment_limit fragments.
    ReplayPollResult poll(const ReplayFragmentHandler& handler, int fragment_limit);

    void close() noexcept;

    bool is_open() const noexcept { return opened_; }
    bool is_done() const noexcept { return cursor_.done; }
    std::int64_t from_position() const noexcept { return from_position_; }
    std::int64_t replay_length() const noexcept { return replay_length_; }
    std::int64_t transmitted() const noexcept { return cursor_.transmitted; }
    std::int64_t remaining() const noexcept { return replay_length_ - cursor_.transmitted; }
    // Next undelivered stream position.
    std::int64_t position() const noexcept { return from_position_ + cursor_.transmitted; }

    const RecordingDescriptor& descriptor() const noexcept { return descriptor_; }
    const ReplayCursor& cursor() const noexcept { return cursor_; }
    const ReplayReaderStats& stats() const noexcept { return stats_; }
    const ReplayReaderOptions& options() const noexcept { return opts_; }

    DescriptorLoadResult descriptor_result() const noexcept { return descriptor_result_; }
    SegmentIoResult segment_result() const noexcept { return segment_result_; }

private:
    ReplayOpenStatus resolve_range(std::int64_t& position, std::int64_t& length) const noexcept;
    bool map_segment(std::int32_t segment_index) noexcept;
    bool advance_term() noexcept;
    ReplayPollResult fail(ReplayPollStatus status, int fragments) noexcept;

    ReplayReaderOptions opts_;
    RecordingDescriptor descriptor_{};
    RecordingGeometry geometry_{};
    std::optional<SegmentMapper> mapper_{};
    AtomicBuffer term_{};
    ReplayCursor cursor_{};
    std::int64_t from_position_{null_position};
    std::int64_t replay_length_{0};
    bool opened_{false};
    ReplayPollStatus latched_error_{ReplayPollStatus::Ok};
    ReplayReaderStats stats_{};
    DescriptorLoadResult descriptor_result_{};
    SegmentIoResult segment_result_{};
};

} // namespace archive
