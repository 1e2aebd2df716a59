#include "taskq/cli/commands.hpp"

#include <charconv>
#include <cstdlib>
#include <print>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  std::println("taskq - distributed task coordination engine");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  serve    -c <file> [-d] [--log-file <file>]");
  std::println("           Run the coordinator");
  std::println("  submit   --db <file> --type <name> [--input <json>]");
  std::println("           Create a pending task and print its id");
  std::println("  status   --db <file> [--task <id>] [--state <status>] "
               "[--limit <n>]");
  std::println("           Show task counts, a task list or one task");
  std::println("  workers  --db <file>");
  std::println("           List registered workers");
  std::println("  types    --db <file> [--add <name>]");
  std::println("           List or create task types");
  std::println("  cancel   --db <file> --task <id>");
  std::println("           Cancel a task that has not started");
  std::println("  validate -c <file>");
  std::println("           Check a configuration file");
  std::println("");
  std::println("Options:");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
}

void print_version() {
  std::println("taskq v0.1.0");
}

struct Options {
  std::string command;
  std::string config_file;
  std::string db_file{"taskq.db"};
  std::string log_file;
  std::string task_type;
  std::string input{"null"};
  std::string task_id;
  std::string state;
  std::string add;
  std::size_t limit{20};
  bool daemon{false};
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> const char* {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;
  if (argc < 2) {
    print_usage(argv[0]);
    std::exit(1);
  }

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = require_value(i, argc, argv, arg);
    } else if (arg == "--db") {
      opts.db_file = require_value(i, argc, argv, arg);
    } else if (arg == "--log-file") {
      opts.log_file = require_value(i, argc, argv, arg);
    } else if (arg == "--type") {
      opts.task_type = require_value(i, argc, argv, arg);
    } else if (arg == "--input") {
      opts.input = require_value(i, argc, argv, arg);
    } else if (arg == "--task") {
      opts.task_id = require_value(i, argc, argv, arg);
    } else if (arg == "--state") {
      opts.state = require_value(i, argc, argv, arg);
    } else if (arg == "--add") {
      opts.add = require_value(i, argc, argv, arg);
    } else if (arg == "--limit") {
      std::string_view value = require_value(i, argc, argv, arg);
      auto [ptr, ec] =
          std::from_chars(value.data(), value.data() + value.size(), opts.limit);
      if (ec != std::errc{} || ptr != value.data() + value.size()) {
        std::println(stderr, "Error: --limit expects a number, got '{}'",
                     value);
        std::exit(1);
      }
    } else if (arg == "-d" || arg == "--daemon") {
      opts.daemon = true;
    } else if (opts.command.empty() && !arg.starts_with("-")) {
      opts.command = arg;
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

auto require(bool present, std::string_view what) -> bool {
  if (!present) {
    std::println(stderr, "Error: {} is required", what);
  }
  return present;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace taskq::cli;
  auto opts = parse_args(argc, argv);

  if (opts.command == "serve") {
    if (!require(!opts.config_file.empty(), "-c <file>"))
      return 1;
    ServeOptions serve{.config_file = opts.config_file,
                       .log_file = std::nullopt,
                       .daemon = opts.daemon};
    if (!opts.log_file.empty()) {
      serve.log_file = opts.log_file;
    }
    return cmd_serve(serve);
  }
  if (opts.command == "submit") {
    if (!require(!opts.task_type.empty(), "--type <name>"))
      return 1;
    return cmd_submit({.db_file = opts.db_file,
                       .task_type = opts.task_type,
                       .input = opts.input});
  }
  if (opts.command == "status") {
    return cmd_status({.db_file = opts.db_file,
                       .task_id = opts.task_id,
                       .state = opts.state,
                       .limit = opts.limit});
  }
  if (opts.command == "workers") {
    return cmd_workers({.db_file = opts.db_file});
  }
  if (opts.command == "types") {
    return cmd_types({.db_file = opts.db_file, .add = opts.add});
  }
  if (opts.command == "cancel") {
    if (!require(!opts.task_id.empty(), "--task <id>"))
      return 1;
    return cmd_cancel({.db_file = opts.db_file, .task_id = opts.task_id});
  }
  if (opts.command == "validate") {
    if (!require(!opts.config_file.empty(), "-c <file>"))
      return 1;
    return cmd_validate({.config_file = opts.config_file});
  }

  std::println(stderr, "Unknown command: {}", opts.command);
  print_usage(argv[0]);
  return 1;
}
