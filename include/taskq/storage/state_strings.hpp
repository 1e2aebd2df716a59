#pragma once

#include "taskq/model/task.hpp"
#include "taskq/model/worker.hpp"

#include <algorithm>
#include <format>
#include <array>
#include <optional>
#include <ranges>
#include <string_view>
#include <utility>

namespace taskq {

namespace detail {

constexpr std::array<std::string_view, kTaskStatusCount> kTaskStatusNames = {
    "pending", "queued", "running", "completed", "failed", "cancelled",
};

constexpr std::array<std::string_view, 3> kWorkerStateNames = {
    "alive",
    "suspected",
    "dead",
};

}  // namespace detail

[[nodiscard]] inline auto task_status_name(TaskStatus status) noexcept
    -> const char* {
  auto idx = std::to_underlying(status);
  return idx < detail::kTaskStatusNames.size()
             ? detail::kTaskStatusNames[idx].data()
             : "unknown";
}

[[nodiscard]] inline auto parse_task_status(std::string_view name) noexcept
    -> std::optional<TaskStatus> {
  auto it = std::ranges::find(detail::kTaskStatusNames, name);
  if (it != detail::kTaskStatusNames.end()) {
    return static_cast<TaskStatus>(
        std::ranges::distance(detail::kTaskStatusNames.begin(), it));
  }
  return std::nullopt;
}

[[nodiscard]] inline auto worker_state_name(WorkerState state) noexcept
    -> const char* {
  auto idx = std::to_underlying(state);
  return idx < detail::kWorkerStateNames.size()
             ? detail::kWorkerStateNames[idx].data()
             : "unknown";
}

[[nodiscard]] inline auto parse_worker_state(std::string_view name) noexcept
    -> WorkerState {
  auto it = std::ranges::find(detail::kWorkerStateNames, name);
  if (it != detail::kWorkerStateNames.end()) {
    return static_cast<WorkerState>(
        std::ranges::distance(detail::kWorkerStateNames.begin(), it));
  }
  // An unreadable state is never trusted with work
  return WorkerState::Dead;
}

}  // namespace taskq

template <>
struct std::formatter<taskq::TaskStatus> : std::formatter<std::string_view> {
  auto format(taskq::TaskStatus s, auto& ctx) const {
    return std::formatter<std::string_view>::format(taskq::task_status_name(s),
                                                    ctx);
  }
};

template <>
struct std::formatter<taskq::WorkerState> : std::formatter<std::string_view> {
  auto format(taskq::WorkerState s, auto& ctx) const {
    return std::formatter<std::string_view>::format(
        taskq::worker_state_name(s), ctx);
  }
};
