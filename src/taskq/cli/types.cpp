#include "taskq/cli/commands.hpp"
#include "taskq/coordinator/worker_registry.hpp"
#include "taskq/storage/persistence.hpp"

#include <print>

namespace taskq::cli {

auto cmd_types(const TypesOptions& opts) -> int {
  Persistence db(opts.db_file);
  if (auto r = db.open(); !r) {
    std::println(stderr, "Error: Failed to open database: {}",
                 r.error().message());
    return 1;
  }
  WorkerRegistry registry(db);

  if (!opts.add.empty()) {
    auto type = registry.create_task_type(opts.add);
    if (!type) {
      std::println(stderr, "Error: {}", type.error().message());
      return 1;
    }
    std::println("{} {}", type->id, type->name);
    return 0;
  }

  auto types = registry.list_task_types();
  if (!types) {
    std::println(stderr, "Error: {}", types.error().message());
    return 1;
  }
  if (types->empty()) {
    std::println("No task types defined.");
    return 0;
  }

  std::println("{:<36} {:<24} {}", "TYPE_ID", "NAME", "CREATED");
  for (const auto& t : *types) {
    std::println("{:<36} {:<24} {}", t.id, t.name,
                 format_timestamp(t.created_at));
  }
  return 0;
}

}  // namespace taskq::cli
