#include "taskq/coordinator/result_reconciler.hpp"

#include "taskq/transport/messages.hpp"
#include "taskq/util/log.hpp"

namespace taskq {

ResultReconciler::ResultReconciler(TaskLifecycle& lifecycle,
                                   ITransport& transport,
                                   TransportConfig config)
    : lifecycle_(lifecycle),
      transport_(transport),
      config_(std::move(config)),
      retry_(config_.retry_backoff, config_.retry_backoff_max) {
}

ResultReconciler::~ResultReconciler() {
  stop();
}

auto ResultReconciler::set_on_recorded(RecordedCallback cb) -> void {
  on_recorded_ = std::move(cb);
}

auto ResultReconciler::report(const ResultReport& report)
    -> Result<ReportOutcome> {
  auto recorded = lifecycle_.finalize(report);
  if (recorded) {
    log::info("Task {} {} by worker {}", report.task_id,
              report.success ? "completed" : "failed", report.worker_id);
    if (on_recorded_) {
      on_recorded_(*recorded);
    }
    return ReportOutcome::Recorded;
  }

  const auto& ec = recorded.error();
  if (ec == make_error_code(Error::DuplicateResult)) {
    log::info("Duplicate result for task {} from worker {} ignored",
              report.task_id, report.worker_id);
    return ReportOutcome::Duplicate;
  }
  if (ec == make_error_code(Error::OrphanedResult)) {
    log::warn("Orphaned result for task {} from worker {} discarded",
              report.task_id, report.worker_id);
    return ReportOutcome::Orphaned;
  }
  if (ec == make_error_code(Error::NotFound)) {
    log::warn("Result references unknown task {} or worker {}",
              report.task_id, report.worker_id);
  }
  return fail(ec);
}

auto ResultReconciler::settle(const Delivery& delivery) -> void {
  auto msg = decode_result(delivery.body);
  if (!msg) {
    log::error("Dropping malformed result message (tag {})", delivery.tag);
    if (auto r = transport_.ack(delivery.tag); !r) {
      log::warn("ack failed: {}", r.error().message());
    }
    return;
  }

  auto outcome = report(to_report(std::move(*msg)));
  if (!outcome && (is_transient(outcome.error()) ||
                   outcome.error() == make_error_code(Error::StaleTransition))) {
    auto delay = retry_.next();
    log::warn("Result settlement deferred {}ms: {}", delay.count(),
              outcome.error().message());
    wait_before_retry(delay);
    if (auto r = transport_.nack(delivery.tag, true); !r) {
      log::warn("nack failed: {}", r.error().message());
    }
    return;
  }
  retry_.reset();

  if (auto r = transport_.ack(delivery.tag); !r) {
    log::warn("ack failed: {}", r.error().message());
  }
}

auto ResultReconciler::wait_before_retry(std::chrono::milliseconds delay)
    -> void {
  std::unique_lock lock(mu_);
  // Direct poll_once() calls run without the consumer thread
  if (!running_.load()) {
    lock.unlock();
    std::this_thread::sleep_for(delay);
    return;
  }
  cv_.wait_for(lock, delay, [this] { return !running_.load(); });
}

auto ResultReconciler::poll_once() -> Result<bool> {
  auto delivery =
      transport_.receive(config_.results_queue, config_.receive_timeout);
  if (!delivery)
    return fail(delivery.error());
  if (!delivery->has_value()) {
    return false;
  }
  settle(**delivery);
  return true;
}

auto ResultReconciler::start() -> void {
  if (running_.exchange(true))
    return;

  consume_thread_ = std::thread([this] { run_loop(); });
  log::info("Result reconciler consuming '{}'", config_.results_queue);
}

auto ResultReconciler::stop() -> void {
  {
    std::lock_guard lock(mu_);
    if (!running_.exchange(false))
      return;
  }
  cv_.notify_all();
  if (consume_thread_.joinable()) {
    consume_thread_.join();
  }
  log::info("Result reconciler stopped");
}

auto ResultReconciler::run_loop() -> void {
  while (running_.load(std::memory_order_relaxed)) {
    auto r = poll_once();
    if (!r) {
      if (r.error() == make_error_code(Error::TransportClosed)) {
        log::info("Results queue closed");
        break;
      }
      log::error("Result receive failed: {}", r.error().message());
      std::this_thread::sleep_for(config_.receive_timeout);
    }
  }
}

}  // namespace taskq
