#include "taskq/cli/commands.hpp"
#include "taskq/coordinator/lifecycle.hpp"
#include "taskq/coordinator/worker_registry.hpp"
#include "taskq/storage/persistence.hpp"

#include <nlohmann/json.hpp>

#include <print>

namespace taskq::cli {

auto cmd_submit(const SubmitOptions& opts) -> int {
  auto input = nlohmann::json::parse(opts.input, nullptr, false);
  if (input.is_discarded()) {
    std::println(stderr, "Error: --input is not valid JSON");
    return 1;
  }

  Persistence db(opts.db_file);
  if (auto r = db.open(); !r) {
    std::println(stderr, "Error: Failed to open database: {}",
                 r.error().message());
    return 1;
  }

  WorkerRegistry registry(db);
  TaskLifecycle lifecycle(db, registry);

  auto id = lifecycle.submit(opts.task_type, std::move(input));
  if (!id) {
    if (id.error() == make_error_code(Error::NotFound)) {
      std::println(stderr, "Error: Unknown task type: {}", opts.task_type);
    } else {
      std::println(stderr, "Error: {}", id.error().message());
    }
    return 1;
  }

  std::println("{}", *id);
  return 0;
}

}  // namespace taskq::cli
