#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace taskq::cli {

struct ServeOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  bool daemon{false};
};

struct SubmitOptions {
  std::string db_file;
  std::string task_type;
  std::string input{"null"};
};

struct StatusOptions {
  std::string db_file;
  std::string task_id;
  std::string state;
  std::size_t limit{20};
};

struct WorkersOptions {
  std::string db_file;
};

struct TypesOptions {
  std::string db_file;
  std::string add;
};

struct CancelOptions {
  std::string db_file;
  std::string task_id;
};

struct ValidateOptions {
  std::string config_file;
};

[[nodiscard]] auto cmd_serve(const ServeOptions& opts) -> int;
[[nodiscard]] auto cmd_submit(const SubmitOptions& opts) -> int;
[[nodiscard]] auto cmd_status(const StatusOptions& opts) -> int;
[[nodiscard]] auto cmd_workers(const WorkersOptions& opts) -> int;
[[nodiscard]] auto cmd_types(const TypesOptions& opts) -> int;
[[nodiscard]] auto cmd_cancel(const CancelOptions& opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;

}  // namespace taskq::cli
