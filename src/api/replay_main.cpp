#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

#include "api/replay.hpp"
#include "api/replay_config.hpp"
#include "util/async_log.hpp"
#include "util/log.hpp"

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop.store(true, std::memory_order_release);
}

} // namespace

int main(int argc, char** argv) {
    api::ReplayConfig cfg = api::default_replay_config();
    std::string error;
    const auto parsed = api::parse_replay_args(argc, argv, cfg, error);
    if (parsed == api::ParseStatus::Help) {
        api::print_usage(std::cout, argv[0]);
        return 0;
    }
    if (parsed != api::ParseStatus::Ok || argc < 2) {
        if (!error.empty()) {
            std::cerr << error << '\n';
        }
        api::print_usage(std::cerr, argv[0]);
        return 2;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    util::AsyncLogger::Config hot_cfg{};
    hot_cfg.min_level = cfg.verbose ? util::LogLevel::Debug : (cfg.quiet ? util::LogLevel::Warn : util::LogLevel::Info);
    if (!util::init_hot_logger(hot_cfg)) {
        LOG_SLOW_ERROR("Failed to start async logger for recording_replay");
    }

    const int rc = api::run_replay(cfg, std::cout, &g_stop);

    util::shutdown_hot_logger();
    return rc;
}
