#include "taskq/cli/commands.hpp"
#include "taskq/storage/persistence.hpp"
#include "taskq/storage/state_strings.hpp"

#include <print>

namespace taskq::cli {

namespace {

auto print_task(Persistence& db, const Task& task) -> void {
  auto type = db.get_task_type(task.task_type_id);
  std::println("Task:     {}", task.id);
  std::println("Type:     {}", type ? type->name : task.task_type_id.str());
  std::println("Status:   {}", task.status);
  std::println("Created:  {}", format_timestamp(task.created_at));
  if (task.assigned_to) {
    std::println("Assigned: {}", *task.assigned_to);
  }
  std::println("Input:    {}", task.input_data.dump());

  auto result = db.get_result(task.id);
  if (!result) {
    return;
  }
  std::println("Worker:   {}", result->worker_id);
  std::println("Finished: {}", format_timestamp(result->completed_at));
  if (result->succeeded()) {
    std::println("Output:   {}", result->output_data->dump());
  } else {
    std::println("Error:    {}", result->error_data->dump());
  }
}

}  // namespace

auto cmd_status(const StatusOptions& opts) -> int {
  Persistence db(opts.db_file);
  if (auto r = db.open(); !r) {
    std::println(stderr, "Error: Failed to open database: {}",
                 r.error().message());
    return 1;
  }

  if (!opts.task_id.empty()) {
    auto task = db.get_task(TaskId{opts.task_id});
    if (!task) {
      std::println(stderr, "Error: Task not found: {}", opts.task_id);
      return 1;
    }
    print_task(db, *task);
    return 0;
  }

  std::optional<TaskStatus> filter;
  if (!opts.state.empty()) {
    filter = parse_task_status(opts.state);
    if (!filter) {
      std::println(stderr, "Error: Unknown status: {}", opts.state);
      return 1;
    }
  }

  auto counts = db.count_tasks_by_status();
  if (!counts) {
    std::println(stderr, "Error: {}", counts.error().message());
    return 1;
  }
  for (std::size_t i = 0; i < kTaskStatusCount; ++i) {
    std::println("{:<10} {}", static_cast<TaskStatus>(i), (*counts)[i]);
  }
  std::println("");

  auto tasks = db.list_tasks(filter, opts.limit);
  if (!tasks) {
    std::println(stderr, "Error: {}", tasks.error().message());
    return 1;
  }
  if (tasks->empty()) {
    std::println("No tasks found.");
    return 0;
  }

  std::println("{:<36} {:<10} {:<36} {:<20}", "TASK_ID", "STATUS",
               "ASSIGNED_TO", "CREATED");
  for (const auto& task : *tasks) {
    std::println("{:<36} {:<10} {:<36} {:<20}", task.id, task.status,
                 task.assigned_to ? task.assigned_to->str() : "-",
                 format_timestamp(task.created_at));
  }
  return 0;
}

}  // namespace taskq::cli
