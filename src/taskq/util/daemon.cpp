#include "taskq/util/daemon.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>

#include <fcntl.h>
#include <unistd.h>

namespace taskq {

std::atomic<bool> g_shutdown_requested{false};

namespace {
void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
  g_shutdown_requested.notify_one();
}
}  // namespace

auto daemonize() -> bool {
  pid_t pid = fork();
  if (pid < 0)
    return false;
  if (pid > 0)
    std::exit(0);

  if (setsid() < 0)
    return false;

  pid = fork();
  if (pid < 0)
    return false;
  if (pid > 0)
    std::exit(0);

  int devnull = ::open("/dev/null", O_RDWR);
  if (devnull >= 0) {
    ::dup2(devnull, STDIN_FILENO);
    ::dup2(devnull, STDOUT_FILENO);
    ::dup2(devnull, STDERR_FILENO);
    if (devnull > STDERR_FILENO)
      ::close(devnull);
  }
  return true;
}

void setup_signal_handlers() {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
}

void wait_for_shutdown() {
  g_shutdown_requested.wait(false, std::memory_order_acquire);
}

auto write_pid_file(const char* path) -> bool {
  std::FILE* f = std::fopen(path, "w");
  if (!f)
    return false;
  std::fprintf(f, "%d\n", static_cast<int>(::getpid()));
  return std::fclose(f) == 0;
}

}  // namespace taskq
