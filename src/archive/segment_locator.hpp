#pragma once

#include <cstdint>

#include "archive/recording_descriptor.hpp"

namespace archive {

// Three coordinate systems meet here:
//   stream position   absolute byte offset in the recorded stream
//   segment file      index from the join's segment, byte offset inside it
//   term              start offset of the term inside the segment, offset in the term
// Segment files are aligned to absolute positions: segment 0 starts at the
// segment boundary at or below the join position.
struct RecordingGeometry {
    std::int32_t term_buffer_length{0};
    std::int32_t segment_file_length{0};
    std::int64_t join_position{0};
};

inline RecordingGeometry geometry_of(const RecordingDescriptor& desc) noexcept {
    return {desc.term_buffer_length, desc.segment_file_length, desc.join_position};
}

struct SegmentLocation {
    std::int32_t segment_index{0};
    std::int32_t segment_offset{0};
    std::int32_t term_start_offset{0};
    std::int32_t term_offset{0};
};

inline std::int64_t segment_base_position(const RecordingGeometry& g) noexcept {
    return g.join_position - (g.join_position % g.segment_file_length);
}

// position must not precede the segment base.
inline SegmentLocation locate_position(const RecordingGeometry& g, std::int64_t position) noexcept {
    const std::int64_t relative = position - segment_base_position(g);
    SegmentLocation loc{};
    loc.segment_index = static_cast<std::int32_t>(relative / g.segment_file_length);
    loc.segment_offset = static_cast<std::int32_t>(relative % g.segment_file_length);
    loc.term_offset = loc.segment_offset & (g.term_buffer_length - 1);
    loc.term_start_offset = loc.segment_offset - loc.term_offset;
    return loc;
}

inline std::int64_t position_of(const RecordingGeometry& g,
                                std::int32_t segment_index,
                                std::int32_t term_start_offset,
                                std::int32_t term_offset) noexcept {
    return segment_base_position(g) +
           static_cast<std::int64_t>(segment_index) * g.segment_file_length +
           term_start_offset + term_offset;
}

// First offset in the located term that can hold a frame. Only the join's
// term has unwritten bytes ahead of its first frame.
inline std::int32_t first_frame_offset(const RecordingGeometry& g, const SegmentLocation& loc) noexcept {
    const SegmentLocation join = locate_position(g, g.join_position);
    if (join.segment_index == loc.segment_index && join.term_start_offset == loc.term_start_offset) {
        return join.term_offset;
    }
    return 0;
}

// Mutable replay session state. Transitions below are pure; mapping the
// segment a cursor points at is the caller's job.
struct ReplayCursor {
    std::int32_t segment_index{0};
    std::int32_t term_start_offset{0};
    std::int32_t term_offset{0};
    std::int64_t transmitted{0};
    bool done{false};
};

inline ReplayCursor cursor_at(const SegmentLocation& loc) noexcept {
    ReplayCursor cursor{};
    cursor.segment_index = loc.segment_index;
    cursor.term_start_offset = loc.term_start_offset;
    cursor.term_offset = loc.term_offset;
    return cursor;
}

inline std::int64_t cursor_position(const RecordingGeometry& g, const ReplayCursor& c) noexcept {
    return position_of(g, c.segment_index, c.term_start_offset, c.term_offset);
}

// Moves to offset 0 of the following term, crossing into the next segment
// file when the current one is exhausted.
inline ReplayCursor next_term(const RecordingGeometry& g, ReplayCursor c) noexcept {
    c.term_offset = 0;
    c.term_start_offset += g.term_buffer_length;
    if (c.term_start_offset == g.segment_file_length) {
        c.term_start_offset = 0;
        ++c.segment_index;
    }
    return c;
}

inline bool crosses_segment(const ReplayCursor& from, const ReplayCursor& to) noexcept {
    return from.segment_index != to.segment_index;
}

} // namespace archive
