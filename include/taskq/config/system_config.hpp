#pragma once

#include "taskq/core/constants.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace taskq {

struct StorageConfig {
  std::string db_file{"taskq.db"};
  std::chrono::milliseconds busy_timeout{timing::kBusyTimeout};
};

struct CoordinatorConfig {
  std::string log_level{"info"};
  std::string log_file;
  std::string pid_file;
  bool recover_on_start{true};
};

struct LivenessConfig {
  std::chrono::milliseconds heartbeat_timeout{timing::kHeartbeatTimeout};
  std::chrono::milliseconds death_timeout{timing::kDeathTimeout};
  // Zero means heartbeat_timeout / 2
  std::chrono::milliseconds sweep_interval{0};

  [[nodiscard]] auto effective_sweep_interval() const noexcept
      -> std::chrono::milliseconds {
    return sweep_interval.count() > 0 ? sweep_interval : heartbeat_timeout / 2;
  }
};

struct DispatcherConfig {
  std::chrono::milliseconds poll_interval{timing::kDispatchPollInterval};
  std::size_t batch_size{limits::kDispatchBatchSize};
  // Zero disables the per-worker cap
  std::size_t max_in_flight_per_worker{0};
  int publish_max_attempts{limits::kPublishMaxAttempts};
  std::chrono::milliseconds publish_backoff{timing::kPublishBackoff};
  std::chrono::milliseconds publish_backoff_max{timing::kPublishBackoffMax};
};

struct TransportConfig {
  std::string queue_prefix{queues::kDispatchPrefix};
  std::string results_queue{queues::kResults};
  std::chrono::milliseconds receive_timeout{timing::kReceiveTimeout};
  // Delay before a delivery that failed transiently is requeued
  std::chrono::milliseconds retry_backoff{timing::kRetryBackoff};
  std::chrono::milliseconds retry_backoff_max{timing::kRetryBackoffMax};

  [[nodiscard]] auto dispatch_queue(std::string_view task_type_name) const
      -> std::string {
    return queue_prefix + std::string(task_type_name);
  }
};

struct SystemConfig {
  StorageConfig storage;
  CoordinatorConfig coordinator;
  LivenessConfig liveness;
  DispatcherConfig dispatcher;
  TransportConfig transport;
  std::vector<std::string> task_types;
};

}  // namespace taskq
