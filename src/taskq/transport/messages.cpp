#include "taskq/transport/messages.hpp"

#include "taskq/util/log.hpp"

namespace taskq {

namespace {

using json = nlohmann::json;

auto parse_object(std::string_view body) -> Result<json> {
  auto j = json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    log::warn("Message is not a JSON object: {}", body.substr(0, 128));
    return fail(Error::ParseError);
  }
  return j;
}

auto required_string(const json& j, const char* key) -> Result<std::string> {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string() || it->get<std::string>().empty()) {
    log::warn("Message lacks required field '{}'", key);
    return fail(Error::ParseError);
  }
  return it->get<std::string>();
}

}  // namespace

auto encode(const DispatchMessage& msg) -> std::string {
  json j = {{"task_id", msg.task_id.str()},
            {"task_type", msg.task_type},
            {"assigned_to", msg.assigned_to.str()},
            {"payload", msg.payload}};
  return j.dump();
}

auto encode(const ResultMessage& msg) -> std::string {
  json j = {{"task_id", msg.task_id.str()},
            {"worker_id", msg.worker_id.str()},
            {"success", msg.success},
            {"payload", msg.payload},
            {"completed_at", to_millis(msg.completed_at)}};
  return j.dump();
}

auto decode_dispatch(std::string_view body) -> Result<DispatchMessage> {
  auto j = parse_object(body);
  if (!j)
    return std::unexpected(j.error());

  auto task_id = required_string(*j, "task_id");
  if (!task_id)
    return std::unexpected(task_id.error());
  auto assigned_to = required_string(*j, "assigned_to");
  if (!assigned_to)
    return std::unexpected(assigned_to.error());

  DispatchMessage msg;
  msg.task_id = TaskId{std::move(*task_id)};
  msg.assigned_to = WorkerId{std::move(*assigned_to)};
  msg.task_type = j->value("task_type", "");
  msg.payload = j->value("payload", json());
  return msg;
}

auto decode_result(std::string_view body) -> Result<ResultMessage> {
  auto j = parse_object(body);
  if (!j)
    return std::unexpected(j.error());

  auto task_id = required_string(*j, "task_id");
  if (!task_id)
    return std::unexpected(task_id.error());
  auto worker_id = required_string(*j, "worker_id");
  if (!worker_id)
    return std::unexpected(worker_id.error());

  auto success = j->find("success");
  if (success == j->end() || !success->is_boolean()) {
    log::warn("Result message lacks boolean 'success'");
    return fail(Error::ParseError);
  }

  ResultMessage msg;
  msg.task_id = TaskId{std::move(*task_id)};
  msg.worker_id = WorkerId{std::move(*worker_id)};
  msg.success = success->get<bool>();
  msg.payload = j->value("payload", json());
  auto completed = j->find("completed_at");
  msg.completed_at = completed != j->end() && completed->is_number_integer()
                         ? from_millis(completed->get<std::int64_t>())
                         : Clock::now();
  return msg;
}

auto to_report(ResultMessage msg) -> ResultReport {
  return ResultReport{
      .task_id = std::move(msg.task_id),
      .worker_id = std::move(msg.worker_id),
      .success = msg.success,
      .payload = std::move(msg.payload),
      .completed_at = msg.completed_at,
  };
}

}  // namespace taskq
