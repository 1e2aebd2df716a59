#pragma once

#include "taskq/config/config.hpp"
#include "taskq/coordinator/dispatcher.hpp"
#include "taskq/coordinator/lifecycle.hpp"
#include "taskq/coordinator/liveness_detector.hpp"
#include "taskq/coordinator/result_reconciler.hpp"
#include "taskq/coordinator/worker_registry.hpp"
#include "taskq/core/error.hpp"
#include "taskq/storage/persistence.hpp"
#include "taskq/transport/transport.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace taskq {

// Application facade - owns the store, the transport and the coordinator
// components, and exposes the submission and worker boundaries.
class Application {
public:
  explicit Application(Config config);
  Application(Config config, std::unique_ptr<ITransport> transport);
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  // Opens the store and creates the configured task types
  [[nodiscard]] auto init() -> Result<void>;
  // Runs recovery (when enabled), then the detector, dispatcher and
  // reconciler loops
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load();
  }

  // Submission boundary
  [[nodiscard]] auto create_task_type(std::string_view name)
      -> Result<TaskType>;
  [[nodiscard]] auto submit(std::string_view task_type_name,
                            nlohmann::json input) -> Result<TaskId>;
  [[nodiscard]] auto cancel(const TaskId& task) -> Result<void>;
  [[nodiscard]] auto get_task(const TaskId& task) -> Result<Task>;
  [[nodiscard]] auto get_result(const TaskId& task) -> Result<TaskResult>;

  // Worker boundary
  [[nodiscard]] auto register_worker(const WorkerId& id, std::string_view name,
                                     const std::vector<std::string>& task_types)
      -> Result<void>;
  [[nodiscard]] auto unregister_worker(const WorkerId& id) -> Result<void>;
  [[nodiscard]] auto heartbeat(const WorkerId& id,
                               TimePoint time = Clock::now())
      -> Result<WorkerState>;
  [[nodiscard]] auto mark_running(const TaskId& task, const WorkerId& worker)
      -> Result<void>;
  [[nodiscard]] auto report_result(const ResultReport& report)
      -> Result<ReportOutcome>;

  [[nodiscard]] auto config() const noexcept -> const Config& {
    return config_;
  }
  [[nodiscard]] auto persistence() noexcept -> Persistence& {
    return persistence_;
  }
  [[nodiscard]] auto transport() noexcept -> ITransport& {
    return *transport_;
  }
  [[nodiscard]] auto registry() noexcept -> WorkerRegistry& {
    return registry_;
  }
  [[nodiscard]] auto detector() noexcept -> LivenessDetector& {
    return detector_;
  }
  [[nodiscard]] auto lifecycle() noexcept -> TaskLifecycle& {
    return lifecycle_;
  }
  [[nodiscard]] auto dispatcher() noexcept -> Dispatcher& {
    return dispatcher_;
  }
  [[nodiscard]] auto reconciler() noexcept -> ResultReconciler& {
    return reconciler_;
  }

private:
  auto setup_callbacks() -> void;

  std::atomic<bool> running_{false};
  Config config_;

  Persistence persistence_;
  std::unique_ptr<ITransport> transport_;
  WorkerRegistry registry_;
  LivenessDetector detector_;
  TaskLifecycle lifecycle_;
  Dispatcher dispatcher_;
  ResultReconciler reconciler_;
};

}  // namespace taskq
