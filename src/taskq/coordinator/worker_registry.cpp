#include "taskq/coordinator/worker_registry.hpp"

#include "taskq/util/log.hpp"

namespace taskq {

WorkerRegistry::WorkerRegistry(Persistence& persistence)
    : persistence_(persistence) {
}

auto WorkerRegistry::register_worker(const WorkerId& id, std::string_view name,
                                     const std::vector<TaskTypeId>& caps,
                                     TimePoint now) -> Result<void> {
  WorkerRegistration reg{
      .id = id,
      .name = std::string(name),
      .capabilities = caps,
      .now = now,
  };
  auto reclaimed = persistence_.register_worker(reg);
  if (!reclaimed) {
    log::warn("Registration of worker {} failed: {}", id,
              reclaimed.error().message());
    return fail(reclaimed.error());
  }
  if (*reclaimed > 0) {
    log::warn("Worker {} re-registered; {} stale assignments returned to "
              "pending",
              id, *reclaimed);
  }
  log::info("Worker {} ({}) registered with {} capabilities", id, name,
            caps.size());
  return ok();
}

auto WorkerRegistry::register_worker(const WorkerId& id, std::string_view name,
                                     const std::vector<std::string>& type_names,
                                     TimePoint now) -> Result<void> {
  std::vector<TaskTypeId> caps;
  caps.reserve(type_names.size());
  for (const auto& type_name : type_names) {
    auto type = find_task_type(type_name);
    if (!type) {
      if (type.error() == make_error_code(Error::NotFound)) {
        log::warn("Worker {} declares unknown task type '{}'", id, type_name);
        return fail(Error::InvalidCapability);
      }
      return fail(type.error());
    }
    caps.push_back(type->id);
  }
  return register_worker(id, name, caps, now);
}

auto WorkerRegistry::unregister(const WorkerId& id) -> Result<std::size_t> {
  WorkerTransition t{
      .worker_id = id,
      .from = {WorkerState::Alive, WorkerState::Suspected},
      .to = WorkerState::Dead,
      .heartbeat_at_or_before = std::nullopt,
      .heartbeat_after = std::nullopt,
  };
  auto reclaimed = persistence_.transition_worker(t);
  if (!reclaimed) {
    if (reclaimed.error() == make_error_code(Error::StaleTransition)) {
      return std::size_t{0};
    }
    return fail(reclaimed.error());
  }
  log::info("Worker {} unregistered; {} tasks returned to pending", id,
            *reclaimed);
  return *reclaimed;
}

auto WorkerRegistry::capable_workers(const TaskTypeId& type)
    -> Result<std::set<WorkerId>> {
  auto ids = persistence_.capable_workers(type);
  if (!ids)
    return fail(ids.error());
  return std::set<WorkerId>(ids->begin(), ids->end());
}

auto WorkerRegistry::worker_loads(const TaskTypeId& type)
    -> Result<std::vector<WorkerLoad>> {
  return persistence_.worker_loads(type);
}

auto WorkerRegistry::get_worker(const WorkerId& id) -> Result<Worker> {
  return persistence_.get_worker(id);
}

auto WorkerRegistry::list_workers() -> Result<std::vector<Worker>> {
  return persistence_.list_workers();
}

auto WorkerRegistry::create_task_type(std::string_view name, TimePoint now)
    -> Result<TaskType> {
  auto type = persistence_.create_task_type(name, now);
  if (!type)
    return fail(type.error());
  remember(*type);
  return type;
}

auto WorkerRegistry::find_task_type(std::string_view name) -> Result<TaskType> {
  {
    std::lock_guard lock(cache_mu_);
    if (auto it = by_name_.find(name); it != by_name_.end()) {
      return it->second;
    }
  }
  auto type = persistence_.find_task_type(name);
  if (!type)
    return fail(type.error());
  remember(*type);
  return type;
}

auto WorkerRegistry::get_task_type(const TaskTypeId& id) -> Result<TaskType> {
  {
    std::lock_guard lock(cache_mu_);
    if (auto it = by_id_.find(id); it != by_id_.end()) {
      return it->second;
    }
  }
  auto type = persistence_.get_task_type(id);
  if (!type)
    return fail(type.error());
  remember(*type);
  return type;
}

auto WorkerRegistry::list_task_types() -> Result<std::vector<TaskType>> {
  auto types = persistence_.list_task_types();
  if (!types)
    return fail(types.error());
  for (const auto& t : *types) {
    remember(t);
  }
  return types;
}

auto WorkerRegistry::remember(const TaskType& type) -> void {
  std::lock_guard lock(cache_mu_);
  by_name_.insert_or_assign(type.name, type);
  by_id_.insert_or_assign(type.id, type);
}

}  // namespace taskq
