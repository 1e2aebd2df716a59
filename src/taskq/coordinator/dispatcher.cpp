#include "taskq/coordinator/dispatcher.hpp"

#include "taskq/transport/messages.hpp"
#include "taskq/util/log.hpp"
#include "taskq/util/util.hpp"

#include <algorithm>
#include <ranges>

namespace taskq {

Dispatcher::Dispatcher(Persistence& persistence, WorkerRegistry& registry,
                       TaskLifecycle& lifecycle, ITransport& transport,
                       DispatcherConfig config,
                       TransportConfig transport_config)
    : persistence_(persistence),
      registry_(registry),
      lifecycle_(lifecycle),
      transport_(transport),
      config_(config),
      transport_config_(std::move(transport_config)) {
}

Dispatcher::~Dispatcher() {
  stop();
}

auto Dispatcher::backoff(std::chrono::milliseconds delay) -> bool {
  std::unique_lock lock(mu_);
  // Direct dispatch_once() calls (tests, recovery) run without the loop
  if (!running_.load()) {
    lock.unlock();
    std::this_thread::sleep_for(delay);
    return true;
  }
  return !cv_.wait_for(lock, delay, [this] { return !running_.load(); });
}

auto Dispatcher::publish(const Task& task, const WorkerId& worker,
                         std::string_view task_type_name) -> Result<void> {
  auto queue = transport_config_.dispatch_queue(task_type_name);
  auto body = encode(DispatchMessage{
      .task_id = task.id,
      .task_type = std::string(task_type_name),
      .assigned_to = worker,
      .payload = task.input_data,
  });

  RetryBackoff delay(config_.publish_backoff, config_.publish_backoff_max);
  for (int attempt = 1; attempt <= config_.publish_max_attempts; ++attempt) {
    auto r = transport_.publish(queue, body);
    if (r) {
      return ok();
    }
    log::warn("Publish of task {} to {} failed (attempt {}/{}): {}", task.id,
              queue, attempt, config_.publish_max_attempts,
              r.error().message());
    if (r.error() == make_error_code(Error::TransportClosed) ||
        attempt == config_.publish_max_attempts) {
      break;
    }
    if (!backoff(delay.next())) {
      break;
    }
  }
  return fail(Error::PublishFailure);
}

auto Dispatcher::dispatch_type(const TaskTypeId& type, DispatchReport& report)
    -> Result<void> {
  auto type_info = registry_.get_task_type(type);
  if (!type_info)
    return fail(type_info.error());

  auto loads = registry_.worker_loads(type);
  if (!loads)
    return fail(loads.error());
  if (loads->empty()) {
    return ok();
  }

  auto tasks = persistence_.pending_tasks(type, config_.batch_size);
  if (!tasks)
    return fail(tasks.error());

  const auto cap = config_.max_in_flight_per_worker;
  for (const auto& task : *tasks) {
    // loads is ordered by registration among equals, so min_element keeps
    // the earliest registered worker on ties
    auto candidates = *loads | std::views::filter([cap](const WorkerLoad& l) {
      return cap == 0 || l.in_flight < cap;
    });
    auto chosen = std::ranges::min_element(
        candidates, {}, [](const WorkerLoad& l) { return l.in_flight; });
    if (chosen == candidates.end()) {
      log::debug("All workers for {} at capacity", type_info->name);
      break;
    }
    WorkerLoad& target = *chosen;

    if (auto r = lifecycle_.assign(task.id, target.worker_id); !r) {
      if (r.error() == make_error_code(Error::StaleTransition)) {
        ++report.stale;
        continue;
      }
      return fail(r.error());
    }
    ++report.assigned;

    if (auto r = publish(task, target.worker_id, type_info->name); !r) {
      log::error("Giving up on publishing task {}; returning it to pending",
                 task.id);
      if (auto rb = lifecycle_.release(task.id, target.worker_id); rb) {
        ++report.rolled_back;
      } else {
        // The worker died meanwhile and the sweep already reclaimed it
        log::warn("Rollback of task {} was stale: {}", task.id,
                  rb.error().message());
      }
      return fail(Error::PublishFailure);
    }

    ++report.published;
    ++target.in_flight;
    log::debug("Task {} dispatched to worker {}", task.id, target.worker_id);
  }
  return ok();
}

auto Dispatcher::dispatch_once() -> Result<DispatchReport> {
  auto types = persistence_.pending_task_types();
  if (!types) {
    log::error("Dispatcher could not read pending work: {}",
               types.error().message());
    return fail(types.error());
  }

  DispatchReport report;
  for (const auto& type : *types) {
    if (auto r = dispatch_type(type, report); !r) {
      log::warn("Dispatch for task type {} stopped this pass: {}", type,
                r.error().message());
    }
  }

  if (report.assigned > 0 || report.stale > 0) {
    log::debug("Dispatch pass: {} assigned, {} published, {} stale, {} rolled "
               "back",
               report.assigned, report.published, report.stale,
               report.rolled_back);
  }
  return report;
}

auto Dispatcher::notify() -> void {
  {
    std::lock_guard lock(mu_);
    wake_ = true;
  }
  cv_.notify_all();
}

auto Dispatcher::start() -> void {
  if (running_.exchange(true))
    return;

  loop_thread_ = std::thread([this] { run_loop(); });
  log::info("Dispatcher started (poll every {}ms)",
            config_.poll_interval.count());
}

auto Dispatcher::stop() -> void {
  {
    std::lock_guard lock(mu_);
    if (!running_.exchange(false))
      return;
  }
  cv_.notify_all();
  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }
  log::info("Dispatcher stopped");
}

auto Dispatcher::run_loop() -> void {
  while (running_.load(std::memory_order_relaxed)) {
    if (auto r = dispatch_once(); !r) {
      log::warn("Dispatch pass failed: {}", r.error().message());
    }

    std::unique_lock lock(mu_);
    cv_.wait_for(lock, config_.poll_interval, [this] {
      return wake_ || !running_.load(std::memory_order_relaxed);
    });
    wake_ = false;
  }
}

}  // namespace taskq
