#include "tui/Signal.hpp"

#include <csignal>

std::atomic_bool g_stop_requested{false};

namespace {
void StopHandler(int) {
    g_stop_requested.store(true, std::memory_order_relaxed);
}
} // namespace

void InitStopSignalHandlers() {
    g_stop_requested.store(false, std::memory_order_relaxed);

    struct sigaction action {};
    action.sa_handler = StopHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    // A closed terminal must still stop ffmpeg and the worker.
    sigaction(SIGHUP, &action, nullptr);
}
