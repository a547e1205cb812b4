#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <iosfwd>

#include "api/replay_config.hpp"

namespace api {

// Prints one line per recording found in archive_dir. Returns the number of
// recordings whose descriptor loaded.
std::size_t list_recordings(const std::filesystem::path& archive_dir, std::ostream& out);

// Runs one replay (or the listing) in-process. Returns 0 on success,
// non-zero on failure. stop_flag may be null.
int run_replay(const ReplayConfig& cfg, std::ostream& out, const std::atomic<bool>* stop_flag = nullptr);

} // namespace api
