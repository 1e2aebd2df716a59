#pragma once

#include "taskq/util/id.hpp"
#include "taskq/util/util.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace taskq {

enum class TaskStatus : std::uint8_t {
  Pending,
  Queued,
  Running,
  Completed,
  Failed,
  Cancelled,
};

inline constexpr std::size_t kTaskStatusCount = 6;

[[nodiscard]] constexpr auto is_in_flight(TaskStatus s) noexcept -> bool {
  return s == TaskStatus::Queued || s == TaskStatus::Running;
}

[[nodiscard]] constexpr auto is_terminal(TaskStatus s) noexcept -> bool {
  return s == TaskStatus::Completed || s == TaskStatus::Failed ||
         s == TaskStatus::Cancelled;
}

struct TaskType {
  TaskTypeId id;
  std::string name;
  TimePoint created_at{};
};

struct Task {
  TaskId id;
  TaskTypeId task_type_id;
  nlohmann::json input_data;
  TaskStatus status{TaskStatus::Pending};
  TimePoint created_at{};
  std::optional<WorkerId> assigned_to;
};

// Exactly one of output_data / error_data is set, chosen by the outcome.
struct TaskResult {
  ResultId id;
  TaskId task_id;
  std::optional<nlohmann::json> output_data;
  std::optional<nlohmann::json> error_data;
  TimePoint completed_at{};
  WorkerId worker_id;
  TimePoint created_at{};

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return output_data.has_value();
  }
};

// A worker-reported outcome, as accepted by the result reconciler.
struct ResultReport {
  TaskId task_id;
  WorkerId worker_id;
  bool success{true};
  nlohmann::json payload;
  TimePoint completed_at{};
};

}  // namespace taskq
