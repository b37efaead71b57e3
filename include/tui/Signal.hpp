#ifndef TUI_SIGNAL_HPP
#define TUI_SIGNAL_HPP

#include <atomic>

// Flipped by the SIGINT/SIGTERM/SIGHUP handler so the main loop can stop the running
// conversion and restore the terminal before exiting.
extern std::atomic_bool g_stop_requested;

// Installs handlers that only set the flag (async-signal-safe).
void InitStopSignalHandlers();

#endif // TUI_SIGNAL_HPP
