#include "archive/archive_files.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>

namespace archive {

namespace {

template <typename T>
bool parse_decimal(std::string_view text, T& out) noexcept {
    if (text.empty() || text.front() == '-' || text.front() == '+') {
        return false;
    }
    T value{};
    const auto res = std::from_chars(text.data(), text.data() + text.size(), value);
    if (res.ec != std::errc() || res.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

bool strip_suffix(std::string_view& name, std::string_view suffix) noexcept {
    if (name.size() <= suffix.size() || name.substr(name.size() - suffix.size()) != suffix) {
        return false;
    }
    name.remove_suffix(suffix.size());
    return true;
}

} // namespace

std::string descriptor_file_name(std::int64_t recording_id) {
    return std::to_string(recording_id) + std::string(descriptor_suffix);
}

std::string segment_file_name(std::int64_t recording_id, std::int32_t segment_index) {
    return std::to_string(recording_id) + "-" + std::to_string(segment_index) + std::string(segment_suffix);
}

std::filesystem::path descriptor_path(const std::filesystem::path& archive_dir, std::int64_t recording_id) {
    return archive_dir / descriptor_file_name(recording_id);
}

std::filesystem::path segment_path(const std::filesystem::path& archive_dir,
                                   std::int64_t recording_id,
                                   std::int32_t segment_index) {
    return archive_dir / segment_file_name(recording_id, segment_index);
}

bool parse_descriptor_file_name(const std::filesystem::path& path, std::int64_t& recording_id) noexcept {
    const auto filename = path.filename().native();
    std::string_view name(filename);
    if (!strip_suffix(name, descriptor_suffix)) {
        return false;
    }
    return parse_decimal(name, recording_id);
}

bool parse_segment_file_name(const std::filesystem::path& path,
                             std::int64_t& recording_id,
                             std::int32_t& segment_index) noexcept {
    const auto filename = path.filename().native();
    std::string_view name(filename);
    if (!strip_suffix(name, segment_suffix)) {
        return false;
    }
    const auto dash = name.find('-');
    if (dash == std::string_view::npos) {
        return false;
    }
    std::int64_t id{0};
    std::int32_t index{0};
    if (!parse_decimal(name.substr(0, dash), id) || !parse_decimal(name.substr(dash + 1), index)) {
        return false;
    }
    recording_id = id;
    segment_index = index;
    return true;
}

std::vector<std::int64_t> scan_recordings(const std::filesystem::path& archive_dir) {
    std::vector<std::int64_t> ids;
    if (archive_dir.empty()) {
        return ids;
    }
    std::error_code ec;
    for (std::filesystem::directory_iterator it(archive_dir, ec); !ec && it != std::filesystem::directory_iterator();
         it.increment(ec)) {
        if (!it->is_regular_file(ec) || ec) {
            ec.clear();
            continue;
        }
        std::int64_t id{0};
        if (parse_descriptor_file_name(it->path(), id)) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace archive
