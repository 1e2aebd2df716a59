#include "taskq/coordinator/lifecycle.hpp"

#include "taskq/storage/state_strings.hpp"
#include "taskq/util/log.hpp"

#include <algorithm>

namespace taskq {

TaskLifecycle::TaskLifecycle(Persistence& persistence,
                             WorkerRegistry& registry)
    : persistence_(persistence), registry_(registry) {
}

auto TaskLifecycle::transition(TaskTransition t) -> Result<void> {
  bool allowed = std::ranges::all_of(
      t.from, [&](TaskStatus from) { return is_transition_allowed(from, t.to); });
  if (!allowed) {
    log::error("Illegal transition request to {} for task {}", t.to, t.task_id);
    return fail(Error::InvalidArgument);
  }

  auto r = persistence_.transition_task(t);
  if (!r && r.error() == make_error_code(Error::StaleTransition)) {
    log::debug("Stale transition to {} for task {}", t.to, t.task_id);
  }
  return r;
}

auto TaskLifecycle::submit(std::string_view task_type_name,
                           nlohmann::json input, TimePoint now)
    -> Result<TaskId> {
  auto type = registry_.find_task_type(task_type_name);
  if (!type) {
    log::warn("Submit rejected: unknown task type '{}'", task_type_name);
    return fail(type.error());
  }

  Task task;
  task.id = generate_id<TaskId>();
  task.task_type_id = type->id;
  task.input_data = std::move(input);
  task.status = TaskStatus::Pending;
  task.created_at = now;

  if (auto r = persistence_.insert_task(task); !r) {
    return fail(r.error());
  }
  log::debug("Task {} submitted ({})", task.id, task_type_name);
  return task.id;
}

auto TaskLifecycle::assign(const TaskId& task, const WorkerId& worker)
    -> Result<void> {
  return transition(TaskTransition{
      .task_id = task,
      .from = {TaskStatus::Pending},
      .to = TaskStatus::Queued,
      .expected_assignee = std::nullopt,
      .assignee = worker,
      .require_capable_assignee = true,
  });
}

auto TaskLifecycle::start(const TaskId& task, const WorkerId& worker)
    -> Result<void> {
  return transition(TaskTransition{
      .task_id = task,
      .from = {TaskStatus::Queued},
      .to = TaskStatus::Running,
      .expected_assignee = worker,
      .assignee = worker,
      .require_capable_assignee = false,
  });
}

auto TaskLifecycle::release(const TaskId& task, const WorkerId& worker)
    -> Result<void> {
  return transition(TaskTransition{
      .task_id = task,
      .from = {TaskStatus::Queued},
      .to = TaskStatus::Pending,
      .expected_assignee = worker,
      .assignee = std::nullopt,
      .require_capable_assignee = false,
  });
}

auto TaskLifecycle::cancel(const TaskId& task) -> Result<void> {
  auto r = transition(TaskTransition{
      .task_id = task,
      .from = {TaskStatus::Pending, TaskStatus::Queued},
      .to = TaskStatus::Cancelled,
      .expected_assignee = std::nullopt,
      .assignee = std::nullopt,
      .require_capable_assignee = false,
  });
  if (r) {
    log::info("Task {} cancelled", task);
  }
  return r;
}

auto TaskLifecycle::finalize(const ResultReport& report, TimePoint now)
    -> Result<TaskResult> {
  return persistence_.finalize_task(report, now);
}

auto TaskLifecycle::get(const TaskId& task) -> Result<Task> {
  return persistence_.get_task(task);
}

auto TaskLifecycle::list(std::optional<TaskStatus> status, std::size_t limit)
    -> Result<std::vector<Task>> {
  return persistence_.list_tasks(status, limit);
}

auto TaskLifecycle::result(const TaskId& task) -> Result<TaskResult> {
  return persistence_.get_result(task);
}

}  // namespace taskq
