#include "archive/replay_reader.hpp"

#include <limits>
#include <utility>

#include "util/async_log.hpp"
#include "util/log.hpp"

namespace archive {

const char* replay_open_status_name(ReplayOpenStatus status) noexcept {
    switch (status) {
    case ReplayOpenStatus::Ok: return "ok";
    case ReplayOpenStatus::DescriptorError: return "descriptor-error";
    case ReplayOpenStatus::PositionOutOfRange: return "position-out-of-range";
    case ReplayOpenStatus::LengthOutOfRange: return "length-out-of-range";
    case ReplayOpenStatus::SegmentError: return "segment-error";
    case ReplayOpenStatus::CorruptFrame: return "corrupt-frame";
    }
    return "unknown";
}

const char* replay_poll_status_name(ReplayPollStatus status) noexcept {
    switch (status) {
    case ReplayPollStatus::Ok: return "ok";
    case ReplayPollStatus::Backpressured: return "backpressured";
    case ReplayPollStatus::EndOfData: return "end-of-data";
    case ReplayPollStatus::EndOfRecording: return "end-of-recording";
    case ReplayPollStatus::Complete: return "complete";
    case ReplayPollStatus::AlreadyDone: return "already-done";
    case ReplayPollStatus::SegmentError: return "segment-error";
    case ReplayPollStatus::CorruptFrame: return "corrupt-frame";
    case ReplayPollStatus::NotOpen: return "not-open";
    }
    return "unknown";
}

ReplayReader::ReplayReader(ReplayReaderOptions opts) : opts_(std::move(opts)) {}

ReplayReader::~ReplayReader() {
    close();
}

ReplayOpenStatus ReplayReader::open() {
    close();
    latched_error_ = ReplayPollStatus::Ok;
    stats_ = ReplayReaderStats{};
    segment_result_ = SegmentIoResult{};
    const auto recording_id = static_cast<long long>(opts_.recording_id);

    descriptor_result_ = load_recording_descriptor(opts_.archive_dir, opts_.recording_id, descriptor_);
    if (!descriptor_result_.ok()) {
        util::log(util::LogLevel::Error, "ReplayReader: recording %lld descriptor %s errno=%d",
                  recording_id, descriptor_status_name(descriptor_result_.status), descriptor_result_.error_code);
        return ReplayOpenStatus::DescriptorError;
    }
    geometry_ = geometry_of(descriptor_);

    std::int64_t position{0};
    std::int64_t length{0};
    const auto range = resolve_range(position, length);
    if (range != ReplayOpenStatus::Ok) {
        util::log(util::LogLevel::Error,
                  "ReplayReader: recording %lld rejected position=%lld length=%lld join=%lld end=%lld: %s",
                  recording_id, static_cast<long long>(opts_.position), static_cast<long long>(opts_.length),
                  static_cast<long long>(descriptor_.join_position), static_cast<long long>(descriptor_.end_position),
                  replay_open_status_name(range));
        return range;
    }

    const SegmentLocation loc = locate_position(geometry_, position);
    mapper_.emplace(opts_.archive_dir, opts_.recording_id, descriptor_.segment_file_length);
    cursor_ = cursor_at(loc);

    if (length == 0) {
        from_position_ = position;
        replay_length_ = 0;
        cursor_.done = true;
        opened_ = true;
        return ReplayOpenStatus::Ok;
    }

    if (!map_segment(loc.segment_index)) {
        return ReplayOpenStatus::SegmentError;
    }

    const index_t term_length = geometry_.term_buffer_length;
    term_ = mapper_->term(loc.term_start_offset, term_length);
    const FrameBoundary boundary =
        find_frame_boundary(term_, first_frame_offset(geometry_, loc), loc.term_offset, term_length);
    if (!boundary.found) {
        mapper_->close();
        util::log(util::LogLevel::Error,
                  "ReplayReader: recording %lld position %lld not reachable, scan stopped at %s term_offset=%d",
                  recording_id, static_cast<long long>(position), frame_kind_name(boundary.stopped_at),
                  boundary.offset);
        return boundary.stopped_at == FrameKind::Corrupt ? ReplayOpenStatus::CorruptFrame
                                                         : ReplayOpenStatus::PositionOutOfRange;
    }

    const std::int64_t gap = boundary.offset - loc.term_offset;
    from_position_ = position + gap;
    replay_length_ = length > gap ? length - gap : 0;
    cursor_.term_offset = boundary.offset;
    opened_ = true;

    if (gap != 0) {
        util::log(util::LogLevel::Debug, "ReplayReader: recording %lld snapped start %lld -> %lld",
                  recording_id, static_cast<long long>(position), static_cast<long long>(from_position_));
    }

    if (replay_length_ == 0) {
        cursor_.done = true;
        return ReplayOpenStatus::Ok;
    }
    if (cursor_.term_offset >= term_length && !advance_term()) {
        opened_ = false;
        return ReplayOpenStatus::SegmentError;
    }

    util::log(util::LogLevel::Debug, "ReplayReader: recording %lld open from=%lld length=%lld segment=%d",
              recording_id, static_cast<long long>(from_position_), static_cast<long long>(replay_length_),
              cursor_.segment_index);
    return ReplayOpenStatus::Ok;
}

ReplayPollResult ReplayReader::poll(const ReplayFragmentHandler& handler, int fragment_limit) {
    if (!opened_) {
        return {0, ReplayPollStatus::NotOpen};
    }
    if (latched_error_ != ReplayPollStatus::Ok) {
        return {0, latched_error_};
    }
    if (cursor_.done) {
        return {0, ReplayPollStatus::AlreadyDone};
    }

    const index_t term_length = geometry_.term_buffer_length;
    int polled = 0;

    while (cursor_.term_offset < term_length && cursor_.transmitted < replay_length_ && polled < fragment_limit) {
        const index_t frame_offset = cursor_.term_offset;
        const FrameView frame = decode_frame(term_, frame_offset, term_length);

        switch (frame.kind) {
        case FrameKind::EndOfRecording:
            cursor_.done = true;
            LOG_HOT_INFO("end of recording", position(), cursor_.transmitted);
            return {polled, ReplayPollStatus::EndOfRecording};
        case FrameKind::EndOfData:
            ++stats_.end_of_data_hits;
            LOG_HOT_DEBUG("end of data", position(), cursor_.transmitted);
            return {polled, ReplayPollStatus::EndOfData};
        case FrameKind::Corrupt:
            util::log(util::LogLevel::Error,
                      "ReplayReader: recording %lld corrupt frame length=%d segment=%d term_start=%d term_offset=%d",
                      static_cast<long long>(opts_.recording_id), frame.frame_length, cursor_.segment_index,
                      cursor_.term_start_offset, frame_offset);
            return fail(ReplayPollStatus::CorruptFrame, polled);
        case FrameKind::Data:
        case FrameKind::Padding:
            break;
        }

        // Never deliver past the requested range.
        if (frame.aligned_length > replay_length_ - cursor_.transmitted) {
            cursor_.done = true;
            return {polled, ReplayPollStatus::Complete};
        }

        cursor_.transmitted += frame.aligned_length;
        cursor_.term_offset += frame.aligned_length;

        if (frame.kind == FrameKind::Padding) {
            ++stats_.padding_skipped;
            continue;
        }

        if (!handler(term_, frame.data_offset, frame.data_length)) {
            cursor_.transmitted -= frame.aligned_length;
            cursor_.term_offset -= frame.aligned_length;
            ++stats_.rejections;
            LOG_HOT_DEBUG("fragment rejected", position(), frame.data_length);
            return {polled, ReplayPollStatus::Backpressured};
        }

        ++polled;
        ++stats_.fragments;
        stats_.payload_bytes += static_cast<std::uint64_t>(frame.data_length);
    }

    if (cursor_.transmitted >= replay_length_) {
        cursor_.done = true;
        return {polled, ReplayPollStatus::Complete};
    }
    if (cursor_.term_offset >= term_length && !advance_term()) {
        return fail(ReplayPollStatus::SegmentError, polled);
    }
    return {polled, ReplayPollStatus::Ok};
}

void ReplayReader::close() noexcept {
    if (mapper_) {
        mapper_->close();
    }
    opened_ = false;
}

ReplayOpenStatus ReplayReader::resolve_range(std::int64_t& position, std::int64_t& length) const noexcept {
    const std::int64_t join = descriptor_.join_position;
    const std::int64_t end = descriptor_.end_position;

    position = opts_.position == null_position ? join : opts_.position;
    if (position < join || position > end) {
        return ReplayOpenStatus::PositionOutOfRange;
    }

    if (opts_.length == null_length) {
        if (opts_.open_ended && !descriptor_.stopped) {
            length = std::numeric_limits<std::int64_t>::max() - position;
        } else {
            length = end - position;
        }
        return ReplayOpenStatus::Ok;
    }
    if (opts_.length < 0) {
        return ReplayOpenStatus::LengthOutOfRange;
    }
    // The snapshot end is final only once the recording has stopped.
    if (descriptor_.stopped && opts_.length > end - position) {
        return ReplayOpenStatus::LengthOutOfRange;
    }
    length = opts_.length;
    return ReplayOpenStatus::Ok;
}

bool ReplayReader::map_segment(std::int32_t segment_index) noexcept {
    segment_result_ = mapper_->open(segment_index);
    stats_.segments_mapped = mapper_->segments_mapped();
    if (!segment_result_.ok()) {
        util::log(util::LogLevel::Error, "ReplayReader: recording %lld segment %d (%s) %s errno=%d",
                  static_cast<long long>(opts_.recording_id), segment_index, mapper_->last_path().c_str(),
                  segment_io_status_name(segment_result_.status), segment_result_.error_code);
        return false;
    }
    return true;
}

bool ReplayReader::advance_term() noexcept {
    const ReplayCursor next = next_term(geometry_, cursor_);
    if (crosses_segment(cursor_, next) && !map_segment(next.segment_index)) {
        return false;
    }
    cursor_ = next;
    term_ = mapper_->term(cursor_.term_start_offset, geometry_.term_buffer_length);
    ++stats_.terms_rolled;
    LOG_HOT_DEBUG("term rollover", cursor_.segment_index, cursor_.term_start_offset);
    return true;
}

ReplayPollResult ReplayReader::fail(ReplayPollStatus status, int fragments) noexcept {
    latched_error_ = status;
    if (mapper_) {
        mapper_->close();
    }
    return {fragments, status};
}

} // namespace archive
