#include "taskq/cli/commands.hpp"
#include "taskq/coordinator/lifecycle.hpp"
#include "taskq/coordinator/worker_registry.hpp"
#include "taskq/storage/persistence.hpp"
#include "taskq/storage/state_strings.hpp"

#include <print>

namespace taskq::cli {

auto cmd_cancel(const CancelOptions& opts) -> int {
  Persistence db(opts.db_file);
  if (auto r = db.open(); !r) {
    std::println(stderr, "Error: Failed to open database: {}",
                 r.error().message());
    return 1;
  }

  WorkerRegistry registry(db);
  TaskLifecycle lifecycle(db, registry);
  TaskId id{opts.task_id};

  if (auto r = lifecycle.cancel(id); !r) {
    if (r.error() == make_error_code(Error::StaleTransition)) {
      auto task = lifecycle.get(id);
      std::println(stderr, "Error: Task {} cannot be cancelled (status {})",
                   id, task ? task_status_name(task->status) : "unknown");
    } else {
      std::println(stderr, "Error: {}", r.error().message());
    }
    return 1;
  }

  std::println("Cancelled {}", id);
  return 0;
}

}  // namespace taskq::cli
