#include "api/replay.hpp"

#include <chrono>
#include <cstdio>
#include <memory>
#include <ostream>
#include <thread>

#include <aeron/Aeron.h>
#include <aeron/util/Exceptions.h>

#include "api/fragment_sink.hpp"
#include "api/publication_view.hpp"
#include "api/replay_session.hpp"
#include "archive/archive_files.hpp"
#include "archive/recording_descriptor.hpp"
#include "util/async_log.hpp"
#include "util/clock.hpp"
#include "util/log.hpp"

namespace api {

namespace {

void apply_log_level(const ReplayConfig& cfg) {
    if (cfg.quiet) {
        util::set_log_level(util::LogLevel::Warn);
    } else if (cfg.verbose) {
        util::set_log_level(util::LogLevel::Debug);
    } else {
        util::set_log_level(util::LogLevel::Info);
    }
}

archive::ReplayReaderOptions reader_options(const ReplayConfig& cfg) {
    archive::ReplayReaderOptions opts;
    opts.archive_dir = cfg.archive_dir;
    opts.recording_id = cfg.recording_id;
    opts.position = cfg.position;
    opts.length = cfg.length;
    opts.open_ended = cfg.follow;
    return opts;
}

ReplaySessionOptions session_options(const ReplayConfig& cfg) {
    ReplaySessionOptions opts;
    opts.fragment_limit = cfg.fragment_limit;
    opts.follow = cfg.follow;
    opts.idle_timeout_ns = cfg.idle_timeout_ms * 1'000'000ULL;
    return opts;
}

// Waits for the registration to resolve and the publication to gain a
// subscriber. Returns nullptr on timeout or stop.
std::shared_ptr<PublicationView> await_publication(AeronClientView& client,
                                                   const ReplayConfig& cfg,
                                                   const std::atomic<bool>* stop_flag) {
    const auto& clock = util::default_clock();
    const std::uint64_t deadline = clock.now_ns() + cfg.connect_timeout_ms * 1'000'000ULL;
    const auto stopped = [stop_flag] { return stop_flag != nullptr && stop_flag->load(std::memory_order_acquire); };

    const std::int64_t registration_id = client.add_publication(cfg.channel, cfg.stream_id);
    std::shared_ptr<PublicationView> publication;
    while (!publication && !stopped() && clock.now_ns() < deadline) {
        publication = client.find_publication(registration_id);
        if (!publication) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    if (!publication) {
        util::log(util::LogLevel::Error, "Replay: publication %s stream %d not available", cfg.channel.c_str(),
                  cfg.stream_id);
        return nullptr;
    }

    while (!publication->is_connected() && !stopped() && clock.now_ns() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    if (!publication->is_connected()) {
        util::log(util::LogLevel::Error, "Replay: publication %s stream %d has no subscriber", cfg.channel.c_str(),
                  cfg.stream_id);
        return nullptr;
    }
    return publication;
}

int report(const ReplaySessionResult& result, std::ostream& out, const DigestSink* digest) {
    out << "recording replay: " << replay_session_outcome_name(result.outcome) << " fragments=" << result.fragments
        << " bytes=" << result.bytes << " from=" << result.from_position << " position=" << result.final_position;
    if (digest != nullptr) {
        char crc[16];
        std::snprintf(crc, sizeof(crc), "%08x", digest->digest());
        out << " crc32c=" << crc;
    }
    out << '\n';
    return is_session_success(result.outcome) ? 0 : 1;
}

int run_to_publication(const ReplayConfig& cfg, std::ostream& out, const std::atomic<bool>* stop_flag) {
    try {
        aeron::Context context;
        if (!cfg.aeron_dir.empty()) {
            context.aeronDir(cfg.aeron_dir);
        }
        auto client = make_aeron_client_view(aeron::Aeron::connect(context));
        auto publication = await_publication(*client, cfg, stop_flag);
        if (!publication) {
            return 1;
        }

        PublicationSink sink(std::move(publication));
        ReplaySession session(reader_options(cfg), sink, session_options(cfg), stop_flag);
        const auto result = session.run();
        const auto& stats = sink.stats();
        util::log(util::LogLevel::Debug, "Replay: offered=%llu back_pressured=%llu admin_actions=%llu",
                  static_cast<unsigned long long>(stats.offered),
                  static_cast<unsigned long long>(stats.back_pressured),
                  static_cast<unsigned long long>(stats.admin_actions));
        return report(result, out, nullptr);
    } catch (const aeron::util::SourcedException& e) {
        util::log(util::LogLevel::Error, "Replay: Aeron error %s at %s", e.what(), e.where());
        return 1;
    }
}

} // namespace

std::size_t list_recordings(const std::filesystem::path& archive_dir, std::ostream& out) {
    std::size_t listed = 0;
    for (const std::int64_t id : archive::scan_recordings(archive_dir)) {
        archive::RecordingDescriptor desc{};
        const auto res = archive::load_recording_descriptor(archive_dir, id, desc);
        if (!res.ok()) {
            out << "recording " << id << ": unreadable descriptor (" << archive::descriptor_status_name(res.status)
                << ")\n";
            continue;
        }
        out << "recording " << id << ": stream=" << desc.stream_id << " session=" << desc.session_id
            << " term=" << desc.term_buffer_length << " segment=" << desc.segment_file_length
            << " join=" << desc.join_position << " end=" << desc.end_position
            << " length=" << desc.recording_length() << ' ' << (desc.stopped ? "stopped" : "active") << '\n';
        ++listed;
    }
    return listed;
}

int run_replay(const ReplayConfig& cfg, std::ostream& out, const std::atomic<bool>* stop_flag) {
    apply_log_level(cfg);

    if (cfg.list) {
        list_recordings(cfg.archive_dir, out);
        return 0;
    }
    if (cfg.fragment_limit <= 0) {
        util::log(util::LogLevel::Error, "Replay: fragment limit must be positive, got %d", cfg.fragment_limit);
        return 1;
    }

    util::log(util::LogLevel::Info, "Replay: recording %lld from %s to %s", static_cast<long long>(cfg.recording_id),
              cfg.archive_dir.string().c_str(), cfg.channel.empty() ? "digest" : cfg.channel.c_str());

    if (!cfg.channel.empty()) {
        return run_to_publication(cfg, out, stop_flag);
    }

    DigestSink sink;
    ReplaySession session(reader_options(cfg), sink, session_options(cfg), stop_flag);
    return report(session.run(), out, &sink);
}

} // namespace api
