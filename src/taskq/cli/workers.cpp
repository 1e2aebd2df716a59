#include "taskq/cli/commands.hpp"
#include "taskq/coordinator/worker_registry.hpp"
#include "taskq/storage/persistence.hpp"
#include "taskq/storage/state_strings.hpp"

#include <print>

namespace taskq::cli {

auto cmd_workers(const WorkersOptions& opts) -> int {
  Persistence db(opts.db_file);
  if (auto r = db.open(); !r) {
    std::println(stderr, "Error: Failed to open database: {}",
                 r.error().message());
    return 1;
  }
  WorkerRegistry registry(db);

  auto workers = registry.list_workers();
  if (!workers) {
    std::println(stderr, "Error: {}", workers.error().message());
    return 1;
  }
  if (workers->empty()) {
    std::println("No workers registered.");
    return 0;
  }

  std::println("{:<36} {:<16} {:<10} {:<20} {}", "WORKER_ID", "NAME", "STATE",
               "LAST_HEARTBEAT", "TASK_TYPES");
  for (const auto& w : *workers) {
    std::string types;
    for (const auto& cap : w.capabilities) {
      auto type = registry.get_task_type(cap);
      if (!types.empty()) {
        types += ",";
      }
      types += type ? type->name : cap.str();
    }
    std::println("{:<36} {:<16} {:<10} {:<20} {}", w.id, w.name, w.state,
                 format_timestamp(w.last_heartbeat_at), types);
  }
  return 0;
}

}  // namespace taskq::cli
