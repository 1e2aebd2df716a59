#include "taskq/cli/commands.hpp"
#include "taskq/config/config.hpp"

#include <print>

namespace taskq::cli {

auto cmd_validate(const ValidateOptions& opts) -> int {
  auto result = ConfigLoader::load_from_file(opts.config_file);
  if (!result) {
    std::println(stderr, "\u2717 {}: {}", opts.config_file,
                 result.error().message());
    return 1;
  }

  std::println("\u2713 {}", opts.config_file);
  std::println("");
  std::println("{}", ConfigLoader::to_string(*result));
  return 0;
}

}  // namespace taskq::cli
