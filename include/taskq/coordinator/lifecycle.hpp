#pragma once

#include "taskq/coordinator/worker_registry.hpp"
#include "taskq/core/error.hpp"
#include "taskq/model/task.hpp"
#include "taskq/storage/persistence.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace taskq {

namespace detail {

// Row = from, column = to
constexpr std::array<std::array<bool, kTaskStatusCount>, kTaskStatusCount>
    kAllowedTransitions = {{
        // pending  queued running completed failed cancelled
        {false, true, false, false, false, true},   // pending
        {true, false, true, true, true, true},      // queued
        {true, false, false, true, true, false},    // running
        {false, false, false, false, false, false}, // completed
        {false, false, false, false, false, false}, // failed
        {false, false, false, false, false, false}, // cancelled
    }};

}  // namespace detail

[[nodiscard]] constexpr auto is_transition_allowed(TaskStatus from,
                                                   TaskStatus to) noexcept
    -> bool {
  return detail::kAllowedTransitions[std::to_underlying(from)]
                                    [std::to_underlying(to)];
}

// Every status change is a compare-and-set in the store. A guard that no
// longer holds is a no-op reported as StaleTransition.
class TaskLifecycle {
public:
  TaskLifecycle(Persistence& persistence, WorkerRegistry& registry);

  // Creates a pending task. Unknown type name: NotFound.
  [[nodiscard]] auto submit(std::string_view task_type_name,
                            nlohmann::json input, TimePoint now = Clock::now())
      -> Result<TaskId>;

  // pending -> queued; the worker must be alive and capable at write time
  [[nodiscard]] auto assign(const TaskId& task, const WorkerId& worker)
      -> Result<void>;
  // queued -> running; only the assignee may start
  [[nodiscard]] auto start(const TaskId& task, const WorkerId& worker)
      -> Result<void>;
  // queued -> pending; compensation for a dispatch that never reached the
  // worker
  [[nodiscard]] auto release(const TaskId& task, const WorkerId& worker)
      -> Result<void>;
  // pending/queued -> cancelled
  [[nodiscard]] auto cancel(const TaskId& task) -> Result<void>;

  // queued/running -> completed/failed together with the result row
  [[nodiscard]] auto finalize(const ResultReport& report,
                              TimePoint now = Clock::now())
      -> Result<TaskResult>;

  [[nodiscard]] auto get(const TaskId& task) -> Result<Task>;
  [[nodiscard]] auto list(std::optional<TaskStatus> status = std::nullopt,
                          std::size_t limit = 100) -> Result<std::vector<Task>>;
  [[nodiscard]] auto result(const TaskId& task) -> Result<TaskResult>;

private:
  [[nodiscard]] auto transition(TaskTransition t) -> Result<void>;

  Persistence& persistence_;
  WorkerRegistry& registry_;
};

}  // namespace taskq
