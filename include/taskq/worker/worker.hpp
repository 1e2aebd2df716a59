#pragma once

#include "taskq/app/application.hpp"
#include "taskq/core/constants.hpp"
#include "taskq/core/error.hpp"
#include "taskq/transport/transport.hpp"
#include "taskq/util/util.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace taskq {

struct WorkerOptions {
  WorkerId id{generate_id<WorkerId>()};
  std::string name{"worker"};
  std::chrono::milliseconds heartbeat_interval{
      timing::kWorkerHeartbeatInterval};
};

// Returns the task output. Throwing reports the task as failed with
// {"message": what()}.
using TaskHandler =
    std::move_only_function<nlohmann::json(const nlohmann::json& input)>;

// In-process worker: registers its handlers' task types, heartbeats, and
// consumes one dispatch queue per type. Delivery is at-least-once, so a
// handler may run more than once for the same task.
class WorkerRuntime {
public:
  WorkerRuntime(Application& app, WorkerOptions options);
  ~WorkerRuntime();

  WorkerRuntime(const WorkerRuntime&) = delete;
  auto operator=(const WorkerRuntime&) -> WorkerRuntime& = delete;

  auto on(std::string task_type_name, TaskHandler handler) -> WorkerRuntime&;

  // Fails with InvalidCapability when a handler names an unknown type
  [[nodiscard]] auto start() -> Result<void>;
  // Stops consuming and unregisters; in-flight tasks go back to pending
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load();
  }

  [[nodiscard]] auto id() const noexcept -> const WorkerId& {
    return options_.id;
  }
  [[nodiscard]] auto executed() const noexcept -> std::size_t {
    return executed_.load();
  }

  // Receives and handles at most one dispatch message of `task_type_name`.
  // Returns false when nothing arrived in time.
  [[nodiscard]] auto poll_once(const std::string& task_type_name)
      -> Result<bool>;

private:
  enum class Disposition : std::uint8_t {
    Acked,
    // Still owned by the worker it was routed to; requeue for that worker
    HandedOff,
    // Transient failure; requeue after a backoff
    Retry,
  };

  [[nodiscard]] auto register_self() -> Result<void>;
  [[nodiscard]] auto make_retry() const -> RetryBackoff;
  [[nodiscard]] auto poll(const std::string& task_type_name,
                          RetryBackoff& retry) -> Result<bool>;
  [[nodiscard]] auto handle(const std::string& task_type_name,
                            const Delivery& delivery) -> Disposition;
  auto wait_before_retry(std::chrono::milliseconds delay) -> void;
  auto heartbeat_loop() -> void;
  auto consume_loop(std::string task_type_name) -> void;

  Application& app_;
  WorkerOptions options_;
  std::map<std::string, TaskHandler> handlers_;

  alignas(kCacheLineSize) std::atomic<bool> running_{false};
  std::atomic<std::size_t> executed_{0};
  std::mutex mu_;
  std::condition_variable cv_;
  std::thread heartbeat_thread_;
  std::vector<std::thread> consumers_;
};

}  // namespace taskq
