#include <gtest/gtest.h>

#include <atomic>
#include <functional>
#include <memory>
#include <vector>

#include "api/fragment_sink.hpp"
#include "api/replay_session.hpp"
#include "harness/recording_builder.hpp"
#include "util/crc32c.hpp"

namespace {

using Payload = std::vector<std::uint8_t>;

test::RecordingBuilderOptions recording_options(const std::filesystem::path& dir) {
    test::RecordingBuilderOptions opts;
    opts.archive_dir = dir;
    opts.recording_id = 21;
    opts.term_buffer_length = 4096;
    opts.segment_file_length = 8192;
    return opts;
}

archive::ReplayReaderOptions reader_options(const std::filesystem::path& dir) {
    archive::ReplayReaderOptions opts;
    opts.archive_dir = dir;
    opts.recording_id = 21;
    return opts;
}

std::vector<Payload> append_messages(test::RecordingBuilder& builder, int count, std::uint32_t first_seq = 0) {
    std::vector<Payload> payloads;
    for (int i = 0; i < count; ++i) {
        Payload payload;
        const auto seq = first_seq + static_cast<std::uint32_t>(i);
        test::fill_sequenced_payload(payload, seq, 50 + (seq * 37) % 400);
        builder.append(payload);
        payloads.push_back(std::move(payload));
    }
    return payloads;
}

// Advances one millisecond per reading and runs a hook on a chosen reading.
class SteppingClock final : public util::MonotonicClock {
public:
    std::uint64_t now_ns() const noexcept override {
        ++reads_;
        if (hook_ && reads_ == hook_at_) {
            hook_();
        }
        now_ += 1'000'000;
        return now_;
    }

    void on_read(std::uint64_t n, std::function<void()> hook) {
        hook_at_ = n;
        hook_ = std::move(hook);
    }

    std::uint64_t reads() const noexcept { return reads_; }

private:
    mutable std::uint64_t now_{0};
    mutable std::uint64_t reads_{0};
    std::uint64_t hook_at_{0};
    std::function<void()> hook_{};
};

class ScriptedPublication final : public api::PublicationView {
public:
    explicit ScriptedPublication(std::vector<std::int64_t> script) : script_(std::move(script)) {}

    std::int64_t offer(const aeron::concurrent::AtomicBuffer& buffer,
                       aeron::util::index_t offset,
                       aeron::util::index_t length) override {
        ++offers;
        std::int64_t result = 0;
        if (next_ < script_.size()) {
            result = script_[next_++];
        } else {
            position_ += length;
            result = position_;
        }
        if (result > 0) {
            const std::uint8_t* data = buffer.buffer() + offset;
            delivered.emplace_back(data, data + length);
        }
        return result;
    }

    bool is_connected() const override { return true; }

    std::vector<Payload> delivered;
    int offers{0};

private:
    std::vector<std::int64_t> script_;
    std::size_t next_{0};
    std::int64_t position_{0};
};

std::uint32_t crc_of(const std::vector<Payload>& payloads) {
    util::Crc32cDigest digest;
    for (const auto& p : payloads) {
        digest.update(p.data(), p.size());
    }
    return digest.value();
}

} // namespace

TEST(ReplaySession, DigestSinkSeesWholeRecording) {
    test::TempDir dir("session_digest");
    test::RecordingBuilder builder(recording_options(dir.path()));
    const auto payloads = append_messages(builder, 200);
    builder.stop();

    api::DigestSink sink;
    api::ReplaySession session(reader_options(dir.path()), sink, api::ReplaySessionOptions{});
    const auto result = session.run();

    EXPECT_EQ(result.outcome, api::ReplaySessionOutcome::Completed);
    EXPECT_EQ(result.fragments, 200u);
    EXPECT_EQ(sink.fragments(), 200u);
    EXPECT_EQ(result.bytes, sink.bytes());
    EXPECT_EQ(sink.digest(), crc_of(payloads));
    EXPECT_EQ(result.from_position, 0);
    EXPECT_EQ(result.final_position, builder.position());
}

TEST(ReplaySession, PublicationBackPressureRedelivers) {
    test::TempDir dir("session_backpressure");
    test::RecordingBuilder builder(recording_options(dir.path()));
    const auto payloads = append_messages(builder, 30);
    builder.stop();

    auto publication = std::make_shared<ScriptedPublication>(
        std::vector<std::int64_t>{aeron::BACK_PRESSURED, aeron::ADMIN_ACTION, aeron::BACK_PRESSURED});
    api::PublicationSink sink(publication);
    api::ReplaySession session(reader_options(dir.path()), sink, api::ReplaySessionOptions{});
    const auto result = session.run();

    EXPECT_EQ(result.outcome, api::ReplaySessionOutcome::Completed);
    EXPECT_EQ(publication->delivered, payloads);
    EXPECT_EQ(publication->offers, 33);
    EXPECT_EQ(sink.stats().back_pressured, 2u);
    EXPECT_EQ(sink.stats().admin_actions, 1u);
    EXPECT_EQ(session.reader().stats().rejections, 3u);
}

TEST(ReplaySession, ClosedPublicationFailsSession) {
    test::TempDir dir("session_closed");
    test::RecordingBuilder builder(recording_options(dir.path()));
    append_messages(builder, 10);
    builder.stop();

    auto publication = std::make_shared<ScriptedPublication>(std::vector<std::int64_t>{64, aeron::PUBLICATION_CLOSED});
    api::PublicationSink sink(publication);
    api::ReplaySession session(reader_options(dir.path()), sink, api::ReplaySessionOptions{});
    const auto result = session.run();

    EXPECT_EQ(result.outcome, api::ReplaySessionOutcome::SinkFailed);
    EXPECT_EQ(sink.failure(), api::PublicationFailure::Closed);
    EXPECT_EQ(result.fragments, 1u);
    EXPECT_FALSE(api::is_session_success(result.outcome));
}

TEST(ReplaySession, CatchesUpWithoutFollow) {
    test::TempDir dir("session_caught_up");
    test::RecordingBuilder builder(recording_options(dir.path()));
    append_messages(builder, 5);
    builder.publish_descriptor();

    auto opts = reader_options(dir.path());
    opts.open_ended = true;
    api::DigestSink sink;
    api::ReplaySession session(opts, sink, api::ReplaySessionOptions{});
    const auto result = session.run();

    EXPECT_EQ(result.outcome, api::ReplaySessionOutcome::CaughtUp);
    EXPECT_EQ(result.fragments, 5u);
    EXPECT_EQ(result.final_position, builder.position());
}

TEST(ReplaySession, FollowTimesOutWhenWriterStalls) {
    test::TempDir dir("session_follow_timeout");
    test::RecordingBuilder builder(recording_options(dir.path()));
    append_messages(builder, 5);
    builder.publish_descriptor();

    auto opts = reader_options(dir.path());
    opts.open_ended = true;
    api::ReplaySessionOptions session_opts;
    session_opts.follow = true;
    session_opts.idle_timeout_ns = 10'000'000;
    session_opts.idle.max_spins = 1000;

    SteppingClock clock;
    api::DigestSink sink;
    api::ReplaySession session(opts, sink, session_opts, nullptr, clock);
    const auto result = session.run();

    EXPECT_EQ(result.outcome, api::ReplaySessionOutcome::IdleTimeout);
    EXPECT_EQ(result.fragments, 5u);
    EXPECT_GE(clock.reads(), 10u);
}

TEST(ReplaySession, FollowResumesWhenWriterAppends) {
    test::TempDir dir("session_follow_resume");
    test::RecordingBuilder builder(recording_options(dir.path()));
    auto payloads = append_messages(builder, 5);
    builder.publish_descriptor();

    auto opts = reader_options(dir.path());
    opts.open_ended = true;
    api::ReplaySessionOptions session_opts;
    session_opts.follow = true;
    session_opts.idle_timeout_ns = 1'000'000'000;
    session_opts.idle.max_spins = 1000;

    std::vector<Payload> late;
    SteppingClock clock;
    clock.on_read(3, [&] {
        late = append_messages(builder, 40, 5);
        builder.stop();
    });

    api::DigestSink sink;
    api::ReplaySession session(opts, sink, session_opts, nullptr, clock);
    const auto result = session.run();

    EXPECT_EQ(result.outcome, api::ReplaySessionOutcome::EndOfRecording);
    EXPECT_EQ(result.fragments, 45u);
    payloads.insert(payloads.end(), late.begin(), late.end());
    EXPECT_EQ(sink.digest(), crc_of(payloads));
}

TEST(ReplaySession, StopFlagEndsSession) {
    test::TempDir dir("session_stop");
    test::RecordingBuilder builder(recording_options(dir.path()));
    append_messages(builder, 5);
    builder.publish_descriptor();

    auto opts = reader_options(dir.path());
    opts.open_ended = true;
    api::ReplaySessionOptions session_opts;
    session_opts.follow = true;
    session_opts.idle.max_spins = 1000;

    std::atomic<bool> stop{false};
    SteppingClock clock;
    clock.on_read(2, [&] { stop.store(true); });
    api::DigestSink sink;
    api::ReplaySession session(opts, sink, session_opts, &stop, clock);
    const auto result = session.run();

    EXPECT_EQ(result.outcome, api::ReplaySessionOutcome::Stopped);
    EXPECT_TRUE(api::is_session_success(result.outcome));
}

TEST(ReplaySession, OpenFailureIsReported) {
    test::TempDir dir("session_open_fail");
    api::DigestSink sink;
    api::ReplaySession session(reader_options(dir.path()), sink, api::ReplaySessionOptions{});
    const auto result = session.run();

    EXPECT_EQ(result.outcome, api::ReplaySessionOutcome::OpenFailed);
    EXPECT_EQ(result.open_status, archive::ReplayOpenStatus::DescriptorError);
    EXPECT_EQ(result.fragments, 0u);
}

TEST(ReplaySession, ReadErrorIsReported) {
    test::TempDir dir("session_read_error");
    test::RecordingBuilder builder(recording_options(dir.path()));
    append_messages(builder, 100);
    builder.stop();
    std::filesystem::remove(builder.segment_path(1));

    api::DigestSink sink;
    api::ReplaySession session(reader_options(dir.path()), sink, api::ReplaySessionOptions{});
    const auto result = session.run();

    EXPECT_EQ(result.outcome, api::ReplaySessionOutcome::ReadError);
    EXPECT_EQ(result.last_poll_status, archive::ReplayPollStatus::SegmentError);
    EXPECT_GT(result.fragments, 0u);
}
