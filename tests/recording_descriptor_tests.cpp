#include <gtest/gtest.h>

#include <array>
#include <cstring>
#include <filesystem>
#include <fstream>

#include "archive/archive_files.hpp"
#include "archive/recording_descriptor.hpp"
#include "harness/recording_builder.hpp"
#include "util/crc32c.hpp"

namespace {

archive::RecordingDescriptor make_descriptor(std::int64_t id) {
    archive::RecordingDescriptor desc{};
    desc.recording_id = id;
    desc.term_buffer_length = 64 * 1024;
    desc.segment_file_length = 4 * 64 * 1024;
    desc.join_position = 4096;
    desc.end_position = 4096 + 123 * 32;
    desc.stream_id = 10;
    desc.session_id = -5;
    desc.stopped = true;
    return desc;
}

void write_bytes(const std::filesystem::path& path, const void* data, std::size_t len) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(static_cast<const char*>(data), static_cast<std::streamsize>(len));
}

} // namespace

TEST(Crc32c, KnownVector) {
    const char* text = "123456789";
    EXPECT_EQ(util::Crc32c::compute(reinterpret_cast<const std::uint8_t*>(text), 9), 0xE3069283u);
}

TEST(RecordingDescriptor, EncodeDecode) {
    const auto desc = make_descriptor(42);
    std::array<std::byte, archive::descriptor_size> bytes{};
    archive::encode_descriptor(desc, bytes);

    archive::RecordingDescriptor out{};
    ASSERT_EQ(archive::decode_descriptor(bytes, out), archive::DescriptorStatus::Ok);
    EXPECT_EQ(out.recording_id, 42);
    EXPECT_EQ(out.term_buffer_length, desc.term_buffer_length);
    EXPECT_EQ(out.segment_file_length, desc.segment_file_length);
    EXPECT_EQ(out.join_position, desc.join_position);
    EXPECT_EQ(out.end_position, desc.end_position);
    EXPECT_EQ(out.stream_id, 10);
    EXPECT_EQ(out.session_id, -5);
    EXPECT_TRUE(out.stopped);
    EXPECT_EQ(out.recording_length(), 123 * 32);
}

TEST(RecordingDescriptor, DetectsFramingDamage) {
    std::array<std::byte, archive::descriptor_size> bytes{};
    archive::encode_descriptor(make_descriptor(1), bytes);
    archive::RecordingDescriptor out{};

    auto bad_magic = bytes;
    bad_magic[0] = std::byte{0};
    EXPECT_EQ(archive::decode_descriptor(bad_magic, out), archive::DescriptorStatus::BadMagic);

    auto bad_version = bytes;
    bad_version[4] = std::byte{9};
    EXPECT_EQ(archive::decode_descriptor(bad_version, out), archive::DescriptorStatus::VersionMismatch);

    auto flipped = bytes;
    flipped[30] ^= std::byte{0x01};
    EXPECT_EQ(archive::decode_descriptor(flipped, out), archive::DescriptorStatus::ChecksumMismatch);

    EXPECT_EQ(archive::decode_descriptor(std::span<const std::byte>(bytes.data(), 20), out),
              archive::DescriptorStatus::Truncated);
}

TEST(RecordingDescriptor, ValidatesGeometry) {
    auto desc = make_descriptor(1);
    EXPECT_EQ(archive::validate_geometry(desc), archive::DescriptorStatus::Ok);

    auto odd_term = desc;
    odd_term.term_buffer_length = 3000;
    EXPECT_EQ(archive::validate_geometry(odd_term), archive::DescriptorStatus::InvalidGeometry);

    auto tiny_term = desc;
    tiny_term.term_buffer_length = 32;
    EXPECT_EQ(archive::validate_geometry(tiny_term), archive::DescriptorStatus::InvalidGeometry);

    auto uneven_segment = desc;
    uneven_segment.segment_file_length = desc.term_buffer_length * 3 + 32;
    EXPECT_EQ(archive::validate_geometry(uneven_segment), archive::DescriptorStatus::InvalidGeometry);

    auto unaligned_join = desc;
    unaligned_join.join_position = 4100;
    EXPECT_EQ(archive::validate_geometry(unaligned_join), archive::DescriptorStatus::InvalidGeometry);

    auto backwards = desc;
    backwards.end_position = desc.join_position - 32;
    EXPECT_EQ(archive::validate_geometry(backwards), archive::DescriptorStatus::InvalidGeometry);

    // Checked on decode too.
    std::array<std::byte, archive::descriptor_size> bytes{};
    archive::encode_descriptor(odd_term, bytes);
    archive::RecordingDescriptor out{};
    EXPECT_EQ(archive::decode_descriptor(bytes, out), archive::DescriptorStatus::InvalidGeometry);
}

TEST(RecordingDescriptor, StoreAndLoad) {
    test::TempDir dir("descriptor_store");
    const auto desc = make_descriptor(7);
    ASSERT_TRUE(archive::store_recording_descriptor(dir.path(), desc).ok());
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "7.inf"));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "7.inf.tmp"));

    archive::RecordingDescriptor out{};
    const auto res = archive::load_recording_descriptor(dir.path(), 7, out);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(out.end_position, desc.end_position);
}

TEST(RecordingDescriptor, LoadFailures) {
    test::TempDir dir("descriptor_load");
    archive::RecordingDescriptor out{};
    out.recording_id = 999;

    auto res = archive::load_recording_descriptor(dir.path(), 3, out);
    EXPECT_EQ(res.status, archive::DescriptorStatus::Missing);
    EXPECT_EQ(out.recording_id, 999);

    const char partial[10] = {};
    write_bytes(archive::descriptor_path(dir.path(), 3), partial, sizeof(partial));
    res = archive::load_recording_descriptor(dir.path(), 3, out);
    EXPECT_EQ(res.status, archive::DescriptorStatus::Truncated);

    // Contents describe recording 4 but the file is named for 5.
    std::array<std::byte, archive::descriptor_size> bytes{};
    archive::encode_descriptor(make_descriptor(4), bytes);
    write_bytes(archive::descriptor_path(dir.path(), 5), bytes.data(), bytes.size());
    res = archive::load_recording_descriptor(dir.path(), 5, out);
    EXPECT_EQ(res.status, archive::DescriptorStatus::RecordingIdMismatch);
    EXPECT_EQ(out.recording_id, 999);
}
