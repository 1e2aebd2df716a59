#include "taskq/app/application.hpp"

#include "taskq/coordinator/recovery.hpp"
#include "taskq/util/log.hpp"

namespace taskq {

Application::Application(Config config)
    : Application(std::move(config), create_memory_transport()) {
}

Application::Application(Config config, std::unique_ptr<ITransport> transport)
    : config_(std::move(config)),
      persistence_(config_.storage.db_file, config_.storage.busy_timeout),
      transport_(std::move(transport)),
      registry_(persistence_),
      detector_(persistence_, config_.liveness),
      lifecycle_(persistence_, registry_),
      dispatcher_(persistence_, registry_, lifecycle_, *transport_,
                  config_.dispatcher, config_.transport),
      reconciler_(lifecycle_, *transport_, config_.transport) {
  setup_callbacks();
}

Application::~Application() {
  stop();
}

auto Application::setup_callbacks() -> void {
  detector_.set_on_reclaim([this](std::size_t) { dispatcher_.notify(); });
  reconciler_.set_on_recorded(
      [this](const TaskResult&) { dispatcher_.notify(); });
}

auto Application::init() -> Result<void> {
  if (auto r = persistence_.open(); !r) {
    log::error("Failed to open database {}: {}", config_.storage.db_file,
               r.error().message());
    return fail(r.error());
  }

  for (const auto& name : config_.task_types) {
    auto type = registry_.create_task_type(name);
    if (!type) {
      log::error("Failed to create task type '{}': {}", name,
                 type.error().message());
      return fail(type.error());
    }
    log::debug("Task type {} -> {}", name, type->id);
  }
  return ok();
}

auto Application::start() -> Result<void> {
  if (running_.exchange(true))
    return ok();

  if (!persistence_.is_open()) {
    if (auto r = init(); !r) {
      running_.store(false);
      return r;
    }
  }

  if (config_.coordinator.recover_on_start) {
    Recovery recovery(registry_, lifecycle_, dispatcher_, detector_);
    if (auto r = recovery.recover(); !r) {
      log::error("Recovery failed: {}", r.error().message());
      running_.store(false);
      return fail(r.error());
    }
  }

  detector_.start();
  dispatcher_.start();
  reconciler_.start();
  log::info("taskq coordinator started");
  return ok();
}

auto Application::stop() -> void {
  if (!running_.exchange(false))
    return;

  log::info("Stopping taskq coordinator...");
  reconciler_.stop();
  dispatcher_.stop();
  detector_.stop();
  log::info("taskq coordinator stopped");
}

auto Application::create_task_type(std::string_view name) -> Result<TaskType> {
  return registry_.create_task_type(name);
}

auto Application::submit(std::string_view task_type_name,
                         nlohmann::json input) -> Result<TaskId> {
  auto id = lifecycle_.submit(task_type_name, std::move(input));
  if (id) {
    dispatcher_.notify();
  }
  return id;
}

auto Application::cancel(const TaskId& task) -> Result<void> {
  return lifecycle_.cancel(task);
}

auto Application::get_task(const TaskId& task) -> Result<Task> {
  return lifecycle_.get(task);
}

auto Application::get_result(const TaskId& task) -> Result<TaskResult> {
  return lifecycle_.result(task);
}

auto Application::register_worker(const WorkerId& id, std::string_view name,
                                  const std::vector<std::string>& task_types)
    -> Result<void> {
  auto r = registry_.register_worker(id, name, task_types);
  if (r) {
    dispatcher_.notify();
  }
  return r;
}

auto Application::unregister_worker(const WorkerId& id) -> Result<void> {
  auto reclaimed = registry_.unregister(id);
  if (!reclaimed)
    return fail(reclaimed.error());
  if (*reclaimed > 0) {
    dispatcher_.notify();
  }
  return ok();
}

auto Application::heartbeat(const WorkerId& id, TimePoint time)
    -> Result<WorkerState> {
  return detector_.record_heartbeat(id, time);
}

auto Application::mark_running(const TaskId& task, const WorkerId& worker)
    -> Result<void> {
  return lifecycle_.start(task, worker);
}

auto Application::report_result(const ResultReport& report)
    -> Result<ReportOutcome> {
  return reconciler_.report(report);
}

}  // namespace taskq
