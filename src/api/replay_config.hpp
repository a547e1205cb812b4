#pragma once

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>

#include "archive/recording_descriptor.hpp"

namespace api {

// Settings for one recording_replay run.
struct ReplayConfig {
    std::filesystem::path archive_dir{"archive"};
    std::int64_t recording_id{0};
    std::int64_t position{archive::null_position}; // null: from join
    std::int64_t length{archive::null_length};     // null: to current end

    int fragment_limit{10};
    bool follow{false};                 // keep tailing an active recording
    std::uint64_t idle_timeout_ms{5000}; // follow mode: give up after this long without data

    // Empty channel: fragments go to a digest sink and only a summary is printed.
    std::string channel{};
    std::int32_t stream_id{100};
    std::string aeron_dir{}; // empty: Aeron client default
    std::uint64_t connect_timeout_ms{5000};

    bool list{false};
    bool quiet{false};
    bool verbose{false};
};

[[nodiscard]] inline ReplayConfig default_replay_config() {
    return ReplayConfig{};
}

enum class ParseStatus {
    Ok = 0,
    Help,
    Invalid,
};

// Parses recording_replay flags into cfg. On Invalid, error names the
// offending argument.
ParseStatus parse_replay_args(int argc, const char* const* argv, ReplayConfig& cfg, std::string& error);

void print_usage(std::ostream& out, const char* prog);

} // namespace api
