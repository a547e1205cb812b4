#pragma once

#include <atomic>
#include <cstdint>

#include "api/fragment_sink.hpp"
#include "archive/replay_reader.hpp"
#include "util/clock.hpp"

namespace api {

// Spin, then yield, then sleep. reset() after any progress.
class BackoffIdle {
public:
    struct Config {
        int max_spins{32};
        int max_yields{64};
        std::uint64_t sleep_ns{100'000};
    };

    BackoffIdle() = default;
    explicit BackoffIdle(Config cfg) noexcept : cfg_(cfg) {}

    void idle() noexcept;
    void reset() noexcept { count_ = 0; }

private:
    Config cfg_{};
    int count_{0};
};

struct ReplaySessionOptions {
    int fragment_limit{10};
    // Keep polling through end-of-data until more data, stop or timeout.
    bool follow{false};
    std::uint64_t idle_timeout_ns{5'000'000'000ULL};
    BackoffIdle::Config idle{};
};

enum class ReplaySessionOutcome {
    Completed = 0,  // requested length delivered
    EndOfRecording, // recording stopped before the requested length
    CaughtUp,       // reached the writer and not following
    IdleTimeout,    // following, but no data arrived in time
    Stopped,
    OpenFailed,
    ReadError,
    SinkFailed,
};

const char* replay_session_outcome_name(ReplaySessionOutcome outcome) noexcept;

inline bool is_session_success(ReplaySessionOutcome outcome) noexcept {
    return outcome == ReplaySessionOutcome::Completed || outcome == ReplaySessionOutcome::EndOfRecording ||
           outcome == ReplaySessionOutcome::CaughtUp || outcome == ReplaySessionOutcome::Stopped;
}

struct ReplaySessionResult {
    ReplaySessionOutcome outcome{ReplaySessionOutcome::OpenFailed};
    std::uint64_t fragments{0};
    std::uint64_t bytes{0};
    std::int64_t from_position{archive::null_position};
    std::int64_t final_position{archive::null_position};
    archive::ReplayOpenStatus open_status{archive::ReplayOpenStatus::Ok};
    archive::ReplayPollStatus last_poll_status{archive::ReplayPollStatus::Ok};
};

// Drives one reader into one sink until the session reaches a terminal
// outcome. stop_flag may be null.
class ReplaySession {
public:
    ReplaySession(archive::ReplayReaderOptions reader_opts,
                  FragmentSink& sink,
                  ReplaySessionOptions opts,
                  const std::atomic<bool>* stop_flag = nullptr,
                  const util::MonotonicClock& clock = util::default_clock());

    ReplaySessionResult run();

    const archive::ReplayReader& reader() const noexcept { return reader_; }

private:
    ReplaySessionResult finish(ReplaySessionResult result, ReplaySessionOutcome outcome) const;

    archive::ReplayReader reader_;
    FragmentSink& sink_;
    ReplaySessionOptions opts_;
    const std::atomic<bool>* stop_flag_;
    const util::MonotonicClock& clock_;
};

} // namespace api
