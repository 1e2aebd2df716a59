#include "taskq/worker/worker.hpp"

#include "taskq/storage/state_strings.hpp"
#include "taskq/transport/messages.hpp"
#include "taskq/util/log.hpp"

#include <exception>

namespace taskq {

WorkerRuntime::WorkerRuntime(Application& app, WorkerOptions options)
    : app_(app), options_(std::move(options)) {
}

WorkerRuntime::~WorkerRuntime() {
  stop();
}

auto WorkerRuntime::on(std::string task_type_name, TaskHandler handler)
    -> WorkerRuntime& {
  handlers_.insert_or_assign(std::move(task_type_name), std::move(handler));
  return *this;
}

auto WorkerRuntime::register_self() -> Result<void> {
  std::vector<std::string> types;
  types.reserve(handlers_.size());
  for (const auto& [name, _] : handlers_) {
    types.push_back(name);
  }
  return app_.register_worker(options_.id, options_.name, types);
}

auto WorkerRuntime::start() -> Result<void> {
  if (handlers_.empty()) {
    log::error("Worker {} has no handlers", options_.id);
    return fail(Error::InvalidArgument);
  }
  if (running_.exchange(true))
    return ok();

  if (auto r = register_self(); !r) {
    running_.store(false);
    return r;
  }

  heartbeat_thread_ = std::thread([this] { heartbeat_loop(); });
  for (const auto& [name, _] : handlers_) {
    consumers_.emplace_back([this, name] { consume_loop(name); });
  }
  log::info("Worker {} ({}) started with {} task types", options_.id,
            options_.name, handlers_.size());
  return ok();
}

auto WorkerRuntime::stop() -> void {
  {
    std::lock_guard lock(mu_);
    if (!running_.exchange(false))
      return;
  }
  cv_.notify_all();

  if (heartbeat_thread_.joinable()) {
    heartbeat_thread_.join();
  }
  for (auto& t : consumers_) {
    if (t.joinable()) {
      t.join();
    }
  }
  consumers_.clear();

  if (auto r = app_.unregister_worker(options_.id); !r) {
    log::warn("Worker {} failed to unregister: {}", options_.id,
              r.error().message());
  }
  log::info("Worker {} stopped after {} tasks", options_.id, executed_.load());
}

auto WorkerRuntime::make_retry() const -> RetryBackoff {
  const auto& t = app_.config().transport;
  return RetryBackoff(t.retry_backoff, t.retry_backoff_max);
}

auto WorkerRuntime::poll_once(const std::string& task_type_name)
    -> Result<bool> {
  auto retry = make_retry();
  return poll(task_type_name, retry);
}

auto WorkerRuntime::poll(const std::string& task_type_name,
                         RetryBackoff& retry) -> Result<bool> {
  auto& transport = app_.transport();
  auto queue = app_.config().transport.dispatch_queue(task_type_name);
  auto delivery =
      transport.receive(queue, app_.config().transport.receive_timeout);
  if (!delivery)
    return fail(delivery.error());
  if (!delivery->has_value()) {
    return false;
  }

  const auto& d = **delivery;
  auto requeue = [&] {
    if (auto r = transport.nack(d.tag, true); !r) {
      log::warn("Worker {} could not requeue delivery {}: {}", options_.id,
                d.tag, r.error().message());
    }
  };

  switch (handle(task_type_name, d)) {
    case Disposition::Acked:
      retry.reset();
      break;
    case Disposition::HandedOff:
      // Give the assignee a chance to take it before polling again
      requeue();
      retry.reset();
      wait_before_retry(retry.next());
      break;
    case Disposition::Retry: {
      auto delay = retry.next();
      log::warn("Worker {} requeues delivery {} in {}ms", options_.id, d.tag,
                delay.count());
      wait_before_retry(delay);
      requeue();
      break;
    }
  }
  return true;
}

auto WorkerRuntime::wait_before_retry(std::chrono::milliseconds delay)
    -> void {
  std::unique_lock lock(mu_);
  if (!running_.load()) {
    lock.unlock();
    std::this_thread::sleep_for(delay);
    return;
  }
  cv_.wait_for(lock, delay, [this] { return !running_.load(); });
}

auto WorkerRuntime::handle(const std::string& task_type_name,
                           const Delivery& delivery) -> Disposition {
  auto ack = [&] {
    if (auto r = app_.transport().ack(delivery.tag); !r) {
      log::warn("Worker {} could not ack delivery {}: {}", options_.id,
                delivery.tag, r.error().message());
    }
    return Disposition::Acked;
  };

  auto msg = decode_dispatch(delivery.body);
  if (!msg) {
    log::error("Worker {} dropping malformed dispatch message", options_.id);
    return ack();
  }

  // Per-type queues are shared, so a message may be routed to a peer
  if (msg->assigned_to != options_.id) {
    auto task = app_.get_task(msg->task_id);
    if (!task) {
      if (is_transient(task.error()))
        return Disposition::Retry;
      log::warn("Skipping task {}: {}", msg->task_id,
                task.error().message());
      return ack();
    }
    if (is_in_flight(task->status) && task->assigned_to == msg->assigned_to) {
      log::debug("Worker {} hands task {} back for {}", options_.id,
                 msg->task_id, msg->assigned_to);
      return Disposition::HandedOff;
    }
    log::info("Dropping stale dispatch of task {} for {}", msg->task_id,
              msg->assigned_to);
    return ack();
  }

  if (auto r = app_.mark_running(msg->task_id, options_.id); !r) {
    if (is_transient(r.error())) {
      log::warn("Worker {} could not start task {}: {}", options_.id,
                msg->task_id, r.error().message());
      return Disposition::Retry;
    }
    // Already running here (redelivery) or moved on
    auto task = app_.get_task(msg->task_id);
    if (!task) {
      log::warn("Skipping task {}: {}", msg->task_id,
                task.error().message());
      return ack();
    }
    if (!is_in_flight(task->status) || task->assigned_to != options_.id) {
      log::info("Skipping task {} in state {}", msg->task_id, task->status);
      return ack();
    }
  }

  ResultMessage result;
  result.task_id = msg->task_id;
  result.worker_id = options_.id;
  try {
    result.payload = handlers_.at(task_type_name)(msg->payload);
    result.success = true;
  } catch (const std::exception& e) {
    log::warn("Task {} failed in handler: {}", msg->task_id, e.what());
    result.success = false;
    result.payload = nlohmann::json{{"message", e.what()}};
  }
  result.completed_at = Clock::now();
  ++executed_;

  const auto& results_queue = app_.config().transport.results_queue;
  if (auto r = app_.transport().publish(results_queue, encode(result)); !r) {
    log::error("Worker {} could not publish result of task {}: {}",
               options_.id, msg->task_id, r.error().message());
    return Disposition::Retry;
  }
  return ack();
}

auto WorkerRuntime::heartbeat_loop() -> void {
  while (running_.load(std::memory_order_relaxed)) {
    {
      std::unique_lock lock(mu_);
      if (cv_.wait_for(lock, options_.heartbeat_interval, [this] {
            return !running_.load(std::memory_order_relaxed);
          })) {
        break;
      }
    }

    auto state = app_.heartbeat(options_.id);
    bool reregister = false;
    if (!state) {
      log::warn("Worker {} heartbeat failed: {}", options_.id,
                state.error().message());
      reregister = state.error() == make_error_code(Error::NotFound);
    } else if (*state == WorkerState::Dead) {
      log::warn("Worker {} was declared dead; re-registering", options_.id);
      reregister = true;
    }

    if (reregister) {
      if (auto r = register_self(); !r) {
        log::error("Worker {} re-registration failed: {}", options_.id,
                   r.error().message());
      }
    }
  }
}

auto WorkerRuntime::consume_loop(std::string task_type_name) -> void {
  auto retry = make_retry();
  while (running_.load(std::memory_order_relaxed)) {
    auto r = poll(task_type_name, retry);
    if (!r) {
      if (r.error() == make_error_code(Error::TransportClosed)) {
        break;
      }
      log::error("Worker {} receive on {} failed: {}", options_.id,
                 task_type_name, r.error().message());
      std::this_thread::sleep_for(app_.config().transport.receive_timeout);
    }
  }
}

}  // namespace taskq
