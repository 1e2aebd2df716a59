#pragma once

#include "taskq/config/system_config.hpp"
#include "taskq/coordinator/lifecycle.hpp"
#include "taskq/coordinator/worker_registry.hpp"
#include "taskq/core/constants.hpp"
#include "taskq/core/error.hpp"
#include "taskq/storage/persistence.hpp"
#include "taskq/transport/transport.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace taskq {

struct DispatchReport {
  std::size_t assigned{0};
  std::size_t published{0};
  std::size_t stale{0};
  std::size_t rolled_back{0};
};

// Moves pending tasks to capable live workers. Per task: CAS pending ->
// queued with the chosen worker, then publish. A lost CAS means another
// dispatcher (or a death) got there first and nothing is published. A
// publish that keeps failing is compensated by queued -> pending.
class Dispatcher {
public:
  Dispatcher(Persistence& persistence, WorkerRegistry& registry,
             TaskLifecycle& lifecycle, ITransport& transport,
             DispatcherConfig config, TransportConfig transport_config);
  ~Dispatcher();

  Dispatcher(const Dispatcher&) = delete;
  auto operator=(const Dispatcher&) -> Dispatcher& = delete;

  [[nodiscard]] auto dispatch_once() -> Result<DispatchReport>;

  // Publishes the dispatch message for an already queued task, retrying with
  // backoff. Fails with PublishFailure once attempts are exhausted.
  [[nodiscard]] auto publish(const Task& task, const WorkerId& worker,
                             std::string_view task_type_name) -> Result<void>;

  // Wakes the loop ahead of the poll interval
  auto notify() -> void;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load();
  }

private:
  auto run_loop() -> void;
  // Waits for `delay` unless stop() is called first; returns false on stop.
  auto backoff(std::chrono::milliseconds delay) -> bool;
  auto dispatch_type(const TaskTypeId& type, DispatchReport& report)
      -> Result<void>;

  Persistence& persistence_;
  WorkerRegistry& registry_;
  TaskLifecycle& lifecycle_;
  ITransport& transport_;
  DispatcherConfig config_;
  TransportConfig transport_config_;

  alignas(kCacheLineSize) std::atomic<bool> running_{false};
  std::mutex mu_;
  std::condition_variable cv_;
  bool wake_{false};
  std::thread loop_thread_;
};

}  // namespace taskq
