#include "api/replay_session.hpp"

#include <chrono>
#include <thread>
#include <utility>

#include "util/async_log.hpp"
#include "util/log.hpp"

namespace api {

void BackoffIdle::idle() noexcept {
    if (count_ < cfg_.max_spins) {
        ++count_;
        return;
    }
    if (count_ < cfg_.max_spins + cfg_.max_yields) {
        ++count_;
        std::this_thread::yield();
        return;
    }
    std::this_thread::sleep_for(std::chrono::nanoseconds(cfg_.sleep_ns));
}

const char* replay_session_outcome_name(ReplaySessionOutcome outcome) noexcept {
    switch (outcome) {
    case ReplaySessionOutcome::Completed: return "completed";
    case ReplaySessionOutcome::EndOfRecording: return "end-of-recording";
    case ReplaySessionOutcome::CaughtUp: return "caught-up";
    case ReplaySessionOutcome::IdleTimeout: return "idle-timeout";
    case ReplaySessionOutcome::Stopped: return "stopped";
    case ReplaySessionOutcome::OpenFailed: return "open-failed";
    case ReplaySessionOutcome::ReadError: return "read-error";
    case ReplaySessionOutcome::SinkFailed: return "sink-failed";
    }
    return "unknown";
}

ReplaySession::ReplaySession(archive::ReplayReaderOptions reader_opts,
                             FragmentSink& sink,
                             ReplaySessionOptions opts,
                             const std::atomic<bool>* stop_flag,
                             const util::MonotonicClock& clock)
    : reader_(std::move(reader_opts)), sink_(sink), opts_(opts), stop_flag_(stop_flag), clock_(clock) {}

ReplaySessionResult ReplaySession::run() {
    ReplaySessionResult result{};
    result.open_status = reader_.open();
    if (result.open_status != archive::ReplayOpenStatus::Ok) {
        return finish(result, ReplaySessionOutcome::OpenFailed);
    }
    result.from_position = reader_.from_position();

    const archive::ReplayFragmentHandler handler =
        [this](const archive::AtomicBuffer& buffer, archive::index_t offset, archive::index_t length) {
            return sink_.on_fragment(buffer, offset, length);
        };

    BackoffIdle idle(opts_.idle);
    std::uint64_t idle_since_ns = 0;
    bool idling = false;

    while (true) {
        if (stop_flag_ != nullptr && stop_flag_->load(std::memory_order_acquire)) {
            return finish(result, ReplaySessionOutcome::Stopped);
        }

        const auto poll = reader_.poll(handler, opts_.fragment_limit);
        result.last_poll_status = poll.status;
        if (poll.fragments > 0) {
            idle.reset();
            idling = false;
        }

        switch (poll.status) {
        case archive::ReplayPollStatus::Complete:
        case archive::ReplayPollStatus::AlreadyDone:
            return finish(result, ReplaySessionOutcome::Completed);
        case archive::ReplayPollStatus::EndOfRecording:
            return finish(result, ReplaySessionOutcome::EndOfRecording);
        case archive::ReplayPollStatus::SegmentError:
        case archive::ReplayPollStatus::CorruptFrame:
        case archive::ReplayPollStatus::NotOpen:
            return finish(result, ReplaySessionOutcome::ReadError);
        case archive::ReplayPollStatus::Backpressured:
            if (sink_.failed()) {
                return finish(result, ReplaySessionOutcome::SinkFailed);
            }
            idle.idle();
            break;
        case archive::ReplayPollStatus::EndOfData:
            if (!opts_.follow) {
                return finish(result, ReplaySessionOutcome::CaughtUp);
            }
            if (poll.fragments == 0) {
                const std::uint64_t now = clock_.now_ns();
                if (!idling) {
                    idling = true;
                    idle_since_ns = now;
                } else if (now - idle_since_ns >= opts_.idle_timeout_ns) {
                    return finish(result, ReplaySessionOutcome::IdleTimeout);
                }
                idle.idle();
            }
            break;
        case archive::ReplayPollStatus::Ok:
            break;
        }
    }
}

ReplaySessionResult ReplaySession::finish(ReplaySessionResult result, ReplaySessionOutcome outcome) const {
    result.outcome = outcome;
    const auto& stats = reader_.stats();
    result.fragments = stats.fragments;
    result.bytes = stats.payload_bytes;
    if (reader_.is_open()) {
        result.final_position = reader_.position();
    }

    const auto lvl = is_session_success(outcome) ? util::LogLevel::Info : util::LogLevel::Error;
    util::log(lvl,
              "ReplaySession: recording %lld %s fragments=%llu bytes=%llu from=%lld position=%lld "
              "padding=%llu rejections=%llu terms=%llu segments=%llu",
              static_cast<long long>(reader_.options().recording_id), replay_session_outcome_name(outcome),
              static_cast<unsigned long long>(stats.fragments), static_cast<unsigned long long>(stats.payload_bytes),
              static_cast<long long>(result.from_position), static_cast<long long>(result.final_position),
              static_cast<unsigned long long>(stats.padding_skipped),
              static_cast<unsigned long long>(stats.rejections), static_cast<unsigned long long>(stats.terms_rolled),
              static_cast<unsigned long long>(stats.segments_mapped));
    LOG_HOT_INFO("session finished", static_cast<int>(outcome), result.final_position);
    return result;
}

} // namespace api
