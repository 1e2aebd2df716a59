#include "taskq/coordinator/recovery.hpp"

#include "taskq/util/log.hpp"

#include <cstdint>
#include <limits>

namespace taskq {

Recovery::Recovery(WorkerRegistry& registry, TaskLifecycle& lifecycle,
                   Dispatcher& dispatcher, LivenessDetector& detector)
    : registry_(registry),
      lifecycle_(lifecycle),
      dispatcher_(dispatcher),
      detector_(detector) {
}

auto Recovery::recover(TimePoint now) -> Result<RecoveryResult> {
  RecoveryResult result;

  auto queued = lifecycle_.list(TaskStatus::Queued,
                                std::numeric_limits<std::int32_t>::max());
  if (!queued) {
    log::error("Failed to list queued tasks");
    return fail(queued.error());
  }
  log::info("Found {} queued tasks to recover", queued->size());

  for (const auto& task : *queued) {
    const auto& worker_id = *task.assigned_to;

    auto worker = registry_.get_worker(worker_id);
    auto type = registry_.get_task_type(task.task_type_id);
    bool alive = worker && worker->state == WorkerState::Alive;

    if (alive && type) {
      if (auto r = dispatcher_.publish(task, worker_id, type->name); r) {
        result.republished.push_back(task.id);
        continue;
      }
      log::warn("Republish of task {} failed, releasing it", task.id);
    }

    if (auto r = lifecycle_.release(task.id, worker_id); r) {
      log::info("Task {} returned to pending (assignee {} unavailable)",
                task.id, worker_id);
      result.released.push_back(task.id);
    } else {
      log::warn("Could not release task {}: {}", task.id,
                r.error().message());
    }
  }

  auto sweep = detector_.sweep(now);
  if (!sweep) {
    return fail(sweep.error());
  }
  result.sweep = *sweep;

  log::info("Recovery complete: {} republished, {} released, {} workers dead",
            result.republished.size(), result.released.size(),
            result.sweep.dead);
  return result;
}

}  // namespace taskq
