#pragma once

#include "taskq/core/error.hpp"
#include "taskq/model/task.hpp"
#include "taskq/model/worker.hpp"
#include "taskq/storage/persistence.hpp"

#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace taskq {

// Tracks workers, their capabilities and the task type catalogue.
// Task types are never removed, so lookups by id and name are cached.
class WorkerRegistry {
public:
  explicit WorkerRegistry(Persistence& persistence);

  // Upserts name and capabilities, resets liveness to alive and seeds a
  // heartbeat. Any queued/running task still assigned to the worker goes
  // back to pending. Unknown task type ids fail with InvalidCapability.
  [[nodiscard]] auto register_worker(const WorkerId& id, std::string_view name,
                                     const std::vector<TaskTypeId>& caps,
                                     TimePoint now = Clock::now())
      -> Result<void>;

  // Same as register_worker, with capabilities given by task type name.
  [[nodiscard]] auto register_worker(const WorkerId& id, std::string_view name,
                                     const std::vector<std::string>& type_names,
                                     TimePoint now = Clock::now())
      -> Result<void>;

  // Marks the worker dead and reclaims its in-flight tasks. Returns how many
  // tasks went back to pending; unregistering a dead worker returns 0.
  [[nodiscard]] auto unregister(const WorkerId& id) -> Result<std::size_t>;

  [[nodiscard]] auto capable_workers(const TaskTypeId& type)
      -> Result<std::set<WorkerId>>;
  [[nodiscard]] auto worker_loads(const TaskTypeId& type)
      -> Result<std::vector<WorkerLoad>>;

  [[nodiscard]] auto get_worker(const WorkerId& id) -> Result<Worker>;
  [[nodiscard]] auto list_workers() -> Result<std::vector<Worker>>;

  // Idempotent: an existing name returns the existing type.
  [[nodiscard]] auto create_task_type(std::string_view name,
                                      TimePoint now = Clock::now())
      -> Result<TaskType>;
  [[nodiscard]] auto find_task_type(std::string_view name) -> Result<TaskType>;
  [[nodiscard]] auto get_task_type(const TaskTypeId& id) -> Result<TaskType>;
  [[nodiscard]] auto list_task_types() -> Result<std::vector<TaskType>>;

private:
  auto remember(const TaskType& type) -> void;

  Persistence& persistence_;

  std::mutex cache_mu_;
  std::unordered_map<std::string, TaskType, StringHash, StringEqual> by_name_;
  std::unordered_map<TaskTypeId, TaskType> by_id_;
};

}  // namespace taskq
