#include <gtest/gtest.h>

#include <array>
#include <cstdint>

#include "archive/frame_format.hpp"

namespace {

constexpr archive::index_t term_length = 256;

struct Term {
    alignas(64) std::array<std::uint8_t, term_length> bytes{};
    archive::AtomicBuffer buffer{bytes.data(), bytes.size()};

    void put_frame(archive::index_t offset, std::int32_t length, std::uint16_t type) {
        buffer.putUInt16(offset + archive::frame_type_offset, type);
        buffer.putInt32(offset, length);
    }
};

constexpr std::uint16_t data_type = aeron::concurrent::logbuffer::DataFrameHeader::HDR_TYPE_DATA;
constexpr std::uint16_t pad_type = aeron::concurrent::logbuffer::DataFrameHeader::HDR_TYPE_PAD;

} // namespace

TEST(FrameFormat, HeaderAndAlignmentMatchAeron) {
    EXPECT_EQ(archive::frame_header_length, 32);
    EXPECT_EQ(archive::frame_alignment, 32);
    EXPECT_EQ(archive::aligned_frame_length(32), 32);
    EXPECT_EQ(archive::aligned_frame_length(33), 64);
    EXPECT_EQ(archive::aligned_frame_length(64), 64);
}

TEST(FrameFormat, DecodesDataFrame) {
    Term term;
    term.put_frame(0, 32 + 10, data_type);
    const auto frame = archive::decode_frame(term.buffer, 0, term_length);
    EXPECT_EQ(frame.kind, archive::FrameKind::Data);
    EXPECT_EQ(frame.frame_length, 42);
    EXPECT_EQ(frame.aligned_length, 64);
    EXPECT_EQ(frame.data_offset, 32);
    EXPECT_EQ(frame.data_length, 10);
}

TEST(FrameFormat, DecodesPaddingFrame) {
    Term term;
    term.put_frame(64, term_length - 64, pad_type);
    const auto frame = archive::decode_frame(term.buffer, 64, term_length);
    EXPECT_EQ(frame.kind, archive::FrameKind::Padding);
    EXPECT_EQ(frame.aligned_length, term_length - 64);
}

TEST(FrameFormat, SentinelsDecodeToDistinctKinds) {
    Term term;
    EXPECT_EQ(archive::decode_frame(term.buffer, 0, term_length).kind, archive::FrameKind::EndOfData);
    term.buffer.putInt32(32, archive::end_of_recording_indicator);
    EXPECT_EQ(archive::decode_frame(term.buffer, 32, term_length).kind, archive::FrameKind::EndOfRecording);
}

TEST(FrameFormat, RejectsImpossibleLengths) {
    Term term;
    term.put_frame(0, 8, data_type);
    EXPECT_EQ(archive::decode_frame(term.buffer, 0, term_length).kind, archive::FrameKind::Corrupt);

    term.put_frame(0, -7, data_type);
    EXPECT_EQ(archive::decode_frame(term.buffer, 0, term_length).kind, archive::FrameKind::Corrupt);

    // Overruns the term.
    term.put_frame(192, 96, data_type);
    EXPECT_EQ(archive::decode_frame(term.buffer, 192, term_length).kind, archive::FrameKind::Corrupt);
}

TEST(FrameFormat, BoundaryScanSnapsForwardInsideFrame) {
    Term term;
    term.put_frame(0, 32 + 40, data_type); // occupies [0, 96)
    term.put_frame(96, 32, data_type);     // occupies [96, 128)

    const auto exact = archive::find_frame_boundary(term.buffer, 0, 96, term_length);
    EXPECT_TRUE(exact.found);
    EXPECT_EQ(exact.offset, 96);

    const auto inside = archive::find_frame_boundary(term.buffer, 0, 40, term_length);
    EXPECT_TRUE(inside.found);
    EXPECT_EQ(inside.offset, 96);
}

TEST(FrameFormat, BoundaryScanStopsAtUnwrittenData) {
    Term term;
    term.put_frame(0, 32, data_type);
    const auto boundary = archive::find_frame_boundary(term.buffer, 0, 128, term_length);
    EXPECT_FALSE(boundary.found);
    EXPECT_EQ(boundary.offset, 32);
    EXPECT_EQ(boundary.stopped_at, archive::FrameKind::EndOfData);
}

TEST(FrameFormat, BoundaryScanCanReachTermEnd) {
    Term term;
    term.put_frame(0, 64, data_type);
    term.put_frame(64, term_length - 64, pad_type);
    const auto boundary = archive::find_frame_boundary(term.buffer, 0, 100, term_length);
    EXPECT_TRUE(boundary.found);
    EXPECT_EQ(boundary.offset, term_length);
}
