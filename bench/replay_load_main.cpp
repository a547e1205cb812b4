#include <chrono>
#include <cstdlib>
#include <iostream>
#include <random>
#include <vector>

#include "archive/replay_reader.hpp"
#include "harness/recording_builder.hpp"
#include "util/log.hpp"

int main(int argc, char** argv) {
    std::uint32_t messages = 2'000'000;
    if (argc > 1) {
        const long long n = std::strtoll(argv[1], nullptr, 10);
        if (n <= 0) {
            std::cerr << "usage: " << argv[0] << " [messages]\n";
            return 2;
        }
        messages = static_cast<std::uint32_t>(n);
    }
    util::set_log_level(util::LogLevel::Warn);

    test::TempDir dir("replay_load_bench");
    test::RecordingBuilderOptions opts;
    opts.archive_dir = dir.path();
    opts.recording_id = 1;
    opts.term_buffer_length = 16 * 1024 * 1024;
    opts.segment_file_length = 128 * 1024 * 1024;

    std::uint64_t expected_bytes = 0;
    auto start = std::chrono::steady_clock::now();
    try {
        test::RecordingBuilder builder(opts);
        std::mt19937 rng(42);
        std::uniform_int_distribution<std::uint32_t> frame_length(64, 1023);
        std::vector<std::uint8_t> payload;
        for (std::uint32_t seq = 0; seq < messages; ++seq) {
            const std::uint32_t len = frame_length(rng) - test::RecordingBuilder::data_header_length;
            test::fill_sequenced_payload(payload, seq, len);
            builder.append(payload);
            expected_bytes += len;
        }
        builder.stop();
    } catch (const std::exception& e) {
        std::cerr << "building recording failed: " << e.what() << '\n';
        return 1;
    }
    auto end = std::chrono::steady_clock::now();
    const auto write_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();

    archive::ReplayReaderOptions reader_opts;
    reader_opts.archive_dir = dir.path();
    reader_opts.recording_id = 1;
    archive::ReplayReader reader(reader_opts);
    if (reader.open() != archive::ReplayOpenStatus::Ok) {
        std::cerr << "open failed\n";
        return 1;
    }

    std::uint32_t next_seq = 0;
    std::uint64_t bytes = 0;
    std::uint64_t out_of_order = 0;
    const archive::ReplayFragmentHandler handler =
        [&](const archive::AtomicBuffer& buffer, archive::index_t offset, archive::index_t length) {
            if (test::payload_sequence(buffer.buffer() + offset) != next_seq) {
                ++out_of_order;
            }
            ++next_seq;
            bytes += static_cast<std::uint64_t>(length);
            return true;
        };

    start = std::chrono::steady_clock::now();
    archive::ReplayPollResult result{};
    do {
        result = reader.poll(handler, 64);
    } while (result.status == archive::ReplayPollStatus::Ok);
    end = std::chrono::steady_clock::now();
    const auto read_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();

    const bool ok = result.status == archive::ReplayPollStatus::Complete && next_seq == messages &&
                    bytes == expected_bytes && out_of_order == 0;
    std::cout << "Replay load " << messages << " messages (" << bytes << " payload bytes)"
              << " write " << write_ns << " ns, replay " << read_ns << " ns ("
              << (read_ns / (messages ? messages : 1)) << " ns/msg, "
              << (read_ns > 0 ? (static_cast<double>(bytes) * 1e3 / static_cast<double>(read_ns)) : 0.0)
              << " MB/s) status=" << archive::replay_poll_status_name(result.status)
              << (ok ? " verified" : " MISMATCH") << '\n';
    return ok ? 0 : 1;
}
