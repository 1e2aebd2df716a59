#pragma once

#include "taskq/core/error.hpp"
#include "taskq/model/task.hpp"
#include "taskq/util/id.hpp"
#include "taskq/util/util.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace taskq {

// Coordinator -> worker, on "<queue_prefix><type name>"
struct DispatchMessage {
  TaskId task_id;
  std::string task_type;
  WorkerId assigned_to;
  nlohmann::json payload;
};

// Worker -> coordinator, on the results queue
struct ResultMessage {
  TaskId task_id;
  WorkerId worker_id;
  bool success{true};
  nlohmann::json payload;
  TimePoint completed_at{};
};

[[nodiscard]] auto encode(const DispatchMessage& msg) -> std::string;
[[nodiscard]] auto encode(const ResultMessage& msg) -> std::string;

// Malformed bodies (bad JSON, missing ids) yield ParseError.
[[nodiscard]] auto decode_dispatch(std::string_view body)
    -> Result<DispatchMessage>;
[[nodiscard]] auto decode_result(std::string_view body) -> Result<ResultMessage>;

[[nodiscard]] auto to_report(ResultMessage msg) -> ResultReport;

}  // namespace taskq
