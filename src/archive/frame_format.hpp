#pragma once

#include <cstdint>

#include <aeron/concurrent/AtomicBuffer.h>
#include <aeron/concurrent/logbuffer/DataFrameHeader.h>
#include <aeron/concurrent/logbuffer/FrameDescriptor.h>
#include <aeron/util/BitUtil.h>
#include <aeron/util/Index.h>

namespace archive {

using aeron::concurrent::AtomicBuffer;
using aeron::util::index_t;

// Term region layout (shared with the recording writer):
//   [frame][frame]...[pad frame]
// Every frame starts on a 32-byte boundary and begins with the Aeron data
// frame header (int32 frame_length at offset 0, uint16 type at offset 6).
// A frame occupies align(frame_length, 32) bytes.
//
// Length values that are not frames:
//    0  end of data       - writer has not reached this offset yet
//   -1  end of recording  - nothing will ever be written at or after it
inline constexpr std::int32_t end_of_data_indicator = 0;
inline constexpr std::int32_t end_of_recording_indicator = -1;

inline constexpr index_t frame_alignment = aeron::concurrent::logbuffer::FrameDescriptor::FRAME_ALIGNMENT;
inline constexpr index_t frame_header_length = aeron::concurrent::logbuffer::DataFrameHeader::LENGTH;
inline constexpr index_t frame_type_offset = aeron::concurrent::logbuffer::DataFrameHeader::TYPE_FIELD_OFFSET;

static_assert(frame_header_length % frame_alignment == 0, "header must keep payloads aligned");

enum class FrameKind : std::uint8_t {
    Data,
    Padding,
    EndOfData,
    EndOfRecording,
    Corrupt,
};

inline const char* frame_kind_name(FrameKind kind) noexcept {
    switch (kind) {
    case FrameKind::Data: return "data";
    case FrameKind::Padding: return "padding";
    case FrameKind::EndOfData: return "end-of-data";
    case FrameKind::EndOfRecording: return "end-of-recording";
    case FrameKind::Corrupt: return "corrupt";
    }
    return "unknown";
}

// Decoded length field. aligned_length is only meaningful for Data/Padding.
struct FrameView {
    FrameKind kind{FrameKind::Corrupt};
    index_t frame_length{0};
    index_t aligned_length{0};
    index_t data_offset{0};
    index_t data_length{0};
};

inline index_t aligned_frame_length(index_t frame_length) noexcept {
    return aeron::util::BitUtil::align(frame_length, frame_alignment);
}

// frame_offset must be frame-aligned and inside the term. The length is read
// with acquire semantics because the writer may be appending concurrently.
inline FrameView decode_frame(const AtomicBuffer& term, index_t frame_offset, index_t term_length) noexcept {
    FrameView view{};
    const std::int32_t frame_length = term.getInt32Volatile(frame_offset);
    view.frame_length = frame_length;

    if (frame_length == end_of_data_indicator) {
        view.kind = FrameKind::EndOfData;
        return view;
    }
    if (frame_length == end_of_recording_indicator) {
        view.kind = FrameKind::EndOfRecording;
        return view;
    }
    if (frame_length < frame_header_length || frame_length > term_length - frame_offset) {
        view.kind = FrameKind::Corrupt;
        return view;
    }

    view.aligned_length = aligned_frame_length(frame_length);
    if (view.aligned_length > term_length - frame_offset) {
        view.kind = FrameKind::Corrupt;
        return view;
    }

    const std::uint16_t type = term.getUInt16(frame_offset + frame_type_offset);
    view.kind = (type == aeron::concurrent::logbuffer::DataFrameHeader::HDR_TYPE_PAD) ? FrameKind::Padding
                                                                                      : FrameKind::Data;
    view.data_offset = frame_offset + frame_header_length;
    view.data_length = frame_length - frame_header_length;
    return view;
}

struct FrameBoundary {
    bool found{false};
    index_t offset{0};
    FrameKind stopped_at{FrameKind::Data};
};

// Walks whole frames from scan_from (a known frame start) until reaching or
// passing target_offset. The returned offset is the first frame start at or
// after target_offset, possibly term_length when the target sits in the
// term's last frame.
inline FrameBoundary find_frame_boundary(const AtomicBuffer& term,
                                         index_t scan_from,
                                         index_t target_offset,
                                         index_t term_length) noexcept {
    FrameBoundary boundary{};
    index_t offset = scan_from;
    while (offset < target_offset) {
        const FrameView frame = decode_frame(term, offset, term_length);
        if (frame.kind != FrameKind::Data && frame.kind != FrameKind::Padding) {
            boundary.offset = offset;
            boundary.stopped_at = frame.kind;
            return boundary;
        }
        offset += frame.aligned_length;
    }
    boundary.found = true;
    boundary.offset = offset;
    return boundary;
}

} // namespace archive
