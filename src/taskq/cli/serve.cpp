#include "taskq/app/application.hpp"
#include "taskq/cli/commands.hpp"
#include "taskq/config/config.hpp"
#include "taskq/util/daemon.hpp"
#include "taskq/util/log.hpp"

#include <print>

namespace taskq::cli {

auto cmd_serve(const ServeOptions& opts) -> int {
  auto result = ConfigLoader::load_from_file(opts.config_file);
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }
  auto config = std::move(*result);

  const auto log_file = opts.log_file.value_or(config.coordinator.log_file);
  if (opts.daemon && log_file.empty()) {
    std::println(
        stderr,
        "Error: --daemon requires log_file (set in config or --log-file)");
    return 1;
  }
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }

  if (opts.daemon && !daemonize()) {
    std::println(stderr, "Error: Failed to daemonize");
    return 1;
  }

  if (!config.coordinator.pid_file.empty() &&
      !write_pid_file(config.coordinator.pid_file.c_str())) {
    std::println(stderr, "Error: Failed to write pid file: {}",
                 config.coordinator.pid_file);
    return 1;
  }

  log::set_level(config.coordinator.log_level);
  log::start();

  Application app(std::move(config));

  if (auto r = app.init(); !r) {
    log::error("Initialization failed: {}", r.error().message());
    log::stop();
    return 1;
  }

  setup_signal_handlers();

  log::info("taskq starting (database {})...", app.config().storage.db_file);
  if (auto r = app.start(); !r) {
    log::error("Failed to start: {}", r.error().message());
    log::stop();
    return 1;
  }

  wait_for_shutdown();
  log::info("Received shutdown signal, stopping...");
  app.stop();

  log::info("taskq stopped.");
  log::stop();
  return 0;
}

}  // namespace taskq::cli
