#include "api/replay_config.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <ostream>

namespace api {

namespace {

bool parse_int64(const char* text, std::int64_t& out) {
    if (text == nullptr || *text == '\0') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const long long value = std::strtoll(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0') {
        return false;
    }
    out = static_cast<std::int64_t>(value);
    return true;
}

bool parse_uint64(const char* text, std::uint64_t& out) {
    std::int64_t value{0};
    if (!parse_int64(text, value) || value < 0) {
        return false;
    }
    out = static_cast<std::uint64_t>(value);
    return true;
}

bool parse_int32(const char* text, std::int32_t& out) {
    std::int64_t value{0};
    if (!parse_int64(text, value) || value < std::numeric_limits<std::int32_t>::min() ||
        value > std::numeric_limits<std::int32_t>::max()) {
        return false;
    }
    out = static_cast<std::int32_t>(value);
    return true;
}

} // namespace

ParseStatus parse_replay_args(int argc, const char* const* argv, ReplayConfig& cfg, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        bool ok = true;

        if (arg == "--help" || arg == "-h") {
            return ParseStatus::Help;
        } else if (arg == "--archive-dir" && has_value) {
            cfg.archive_dir = argv[++i];
        } else if (arg == "--recording-id" && has_value) {
            ok = parse_int64(argv[++i], cfg.recording_id) && cfg.recording_id >= 0;
        } else if (arg == "--position" && has_value) {
            ok = parse_int64(argv[++i], cfg.position);
        } else if (arg == "--length" && has_value) {
            ok = parse_int64(argv[++i], cfg.length);
        } else if (arg == "--fragment-limit" && has_value) {
            std::int32_t limit{0};
            ok = parse_int32(argv[++i], limit) && limit > 0;
            cfg.fragment_limit = limit;
        } else if (arg == "--follow") {
            cfg.follow = true;
        } else if (arg == "--idle-timeout-ms" && has_value) {
            ok = parse_uint64(argv[++i], cfg.idle_timeout_ms);
        } else if (arg == "--channel" && has_value) {
            cfg.channel = argv[++i];
        } else if (arg == "--stream-id" && has_value) {
            ok = parse_int32(argv[++i], cfg.stream_id);
        } else if (arg == "--aeron-dir" && has_value) {
            cfg.aeron_dir = argv[++i];
        } else if (arg == "--connect-timeout-ms" && has_value) {
            ok = parse_uint64(argv[++i], cfg.connect_timeout_ms);
        } else if (arg == "--list") {
            cfg.list = true;
        } else if (arg == "--quiet") {
            cfg.quiet = true;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else {
            error = "unknown or incomplete argument: " + arg;
            return ParseStatus::Invalid;
        }

        if (!ok) {
            error = "invalid value for " + arg + ": " + argv[i];
            return ParseStatus::Invalid;
        }
    }

    if (cfg.quiet && cfg.verbose) {
        error = "--quiet and --verbose are mutually exclusive";
        return ParseStatus::Invalid;
    }
    return ParseStatus::Ok;
}

void print_usage(std::ostream& out, const char* prog) {
    out << "Usage: " << prog << " --archive-dir <dir> --recording-id <id> [options]\n"
        << "       " << prog << " --archive-dir <dir> --list\n"
        << "Options:\n"
        << "  --position <int64>          Start stream position (default: join position)\n"
        << "  --length <int64>            Bytes to replay (default: to current end)\n"
        << "  --fragment-limit <N>        Fragments per poll (default 10)\n"
        << "  --follow                    Keep tailing an active recording\n"
        << "  --idle-timeout-ms <N>       Follow mode: stop after N ms without data (default 5000)\n"
        << "  --channel <uri>             Aeron channel to publish to (default: digest only)\n"
        << "  --stream-id <N>             Aeron stream id (default 100)\n"
        << "  --aeron-dir <path>          Aeron media driver directory\n"
        << "  --connect-timeout-ms <N>    Wait for the publication to connect (default 5000)\n"
        << "  --list                      List recordings in the archive directory\n"
        << "  --quiet                     Suppress non-error logs\n"
        << "  --verbose                   Enable debug logging\n";
}

} // namespace api
