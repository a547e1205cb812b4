#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace archive {

// Archive directory contents for recording N:
//   N.inf             recording descriptor
//   N-<segment>.rec   segment files, segment index counted from the join
inline constexpr std::string_view descriptor_suffix = ".inf";
inline constexpr std::string_view segment_suffix = ".rec";

std::string descriptor_file_name(std::int64_t recording_id);
std::string segment_file_name(std::int64_t recording_id, std::int32_t segment_index);

std::filesystem::path descriptor_path(const std::filesystem::path& archive_dir, std::int64_t recording_id);
std::filesystem::path segment_path(const std::filesystem::path& archive_dir,
                                   std::int64_t recording_id,
                                   std::int32_t segment_index);

bool parse_descriptor_file_name(const std::filesystem::path& path, std::int64_t& recording_id) noexcept;
bool parse_segment_file_name(const std::filesystem::path& path,
                             std::int64_t& recording_id,
                             std::int32_t& segment_index) noexcept;

// Recording ids with a descriptor in archive_dir, ascending. Never throws;
// an unreadable directory yields an empty list.
std::vector<std::int64_t> scan_recordings(const std::filesystem::path& archive_dir);

} // namespace archive
