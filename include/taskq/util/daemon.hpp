#pragma once

#include <atomic>

namespace taskq {

extern std::atomic<bool> g_shutdown_requested;

[[nodiscard]] auto daemonize() -> bool;
void setup_signal_handlers();
void wait_for_shutdown();
[[nodiscard]] auto write_pid_file(const char* path) -> bool;

}  // namespace taskq
