#include "taskq/coordinator/liveness_detector.hpp"

#include "taskq/util/log.hpp"

namespace taskq {

namespace {

auto is_stale(const std::error_code& ec) -> bool {
  return ec == make_error_code(Error::StaleTransition);
}

}  // namespace

LivenessDetector::LivenessDetector(Persistence& persistence,
                                   LivenessConfig config)
    : persistence_(persistence), config_(config) {
}

LivenessDetector::~LivenessDetector() {
  stop();
}

auto LivenessDetector::set_on_reclaim(ReclaimCallback cb) -> void {
  on_reclaim_ = std::move(cb);
}

auto LivenessDetector::revive(const WorkerId& worker, TimePoint now)
    -> Result<bool> {
  WorkerTransition t{
      .worker_id = worker,
      .from = {WorkerState::Suspected},
      .to = WorkerState::Alive,
      .heartbeat_at_or_before = std::nullopt,
      .heartbeat_after = now - config_.heartbeat_timeout,
  };
  if (auto r = persistence_.transition_worker(t); !r) {
    if (is_stale(r.error())) {
      return false;
    }
    return fail(r.error());
  }
  return true;
}

auto LivenessDetector::record_heartbeat(const WorkerId& worker,
                                        TimePoint heartbeat_time,
                                        TimePoint now) -> Result<WorkerState> {
  auto updated = persistence_.append_heartbeat(worker, heartbeat_time, now);
  if (!updated) {
    if (updated.error() == make_error_code(Error::NotFound)) {
      log::warn("Heartbeat from unknown worker {}", worker);
    }
    return fail(updated.error());
  }

  if (updated->state != WorkerState::Suspected ||
      updated->last_heartbeat_at <= now - config_.heartbeat_timeout) {
    return updated->state;
  }

  auto revived = revive(worker, now);
  if (!revived)
    return fail(revived.error());
  if (*revived) {
    log::info("Worker {} is alive again", worker);
    return WorkerState::Alive;
  }

  // Lost a race with the sweep; report what the store says now
  auto current = persistence_.get_worker(worker);
  if (!current)
    return fail(current.error());
  return current->state;
}

auto LivenessDetector::sweep(TimePoint now) -> Result<SweepReport> {
  auto workers = persistence_.list_workers();
  if (!workers) {
    log::error("Liveness sweep could not list workers: {}",
               workers.error().message());
    return fail(workers.error());
  }

  const auto suspect_before = now - config_.heartbeat_timeout;
  const auto dead_before = now - config_.death_timeout;

  SweepReport report;
  for (const auto& w : *workers) {
    auto state = w.state;
    if (state == WorkerState::Dead) {
      continue;
    }

    if (state == WorkerState::Alive && w.last_heartbeat_at <= suspect_before) {
      WorkerTransition t{
          .worker_id = w.id,
          .from = {WorkerState::Alive},
          .to = WorkerState::Suspected,
          .heartbeat_at_or_before = suspect_before,
          .heartbeat_after = std::nullopt,
      };
      if (auto r = persistence_.transition_worker(t); r) {
        log::warn("Worker {} suspected: last heartbeat {}", w.id,
                  format_timestamp(w.last_heartbeat_at));
        ++report.suspected;
        state = WorkerState::Suspected;
      } else if (!is_stale(r.error())) {
        log::error("Failed to suspect worker {}: {}", w.id,
                   r.error().message());
        continue;
      }
    }

    if (state != WorkerState::Suspected) {
      continue;
    }

    if (w.last_heartbeat_at <= dead_before) {
      WorkerTransition t{
          .worker_id = w.id,
          .from = {WorkerState::Suspected},
          .to = WorkerState::Dead,
          .heartbeat_at_or_before = dead_before,
          .heartbeat_after = std::nullopt,
      };
      if (auto r = persistence_.transition_worker(t); r) {
        log::warn("Worker {} declared dead; {} tasks returned to pending",
                  w.id, *r);
        ++report.dead;
        report.reclaimed += *r;
      } else if (!is_stale(r.error())) {
        log::error("Failed to declare worker {} dead: {}", w.id,
                   r.error().message());
      }
    } else if (w.last_heartbeat_at > suspect_before) {
      auto r = revive(w.id, now);
      if (!r) {
        log::error("Failed to revive worker {}: {}", w.id,
                   r.error().message());
      } else if (*r) {
        log::info("Worker {} is alive again", w.id);
        ++report.revived;
      }
    }
  }

  if (report.suspected + report.dead + report.revived > 0) {
    log::info("Liveness sweep: {} suspected, {} revived, {} dead, {} reclaimed",
              report.suspected, report.revived, report.dead, report.reclaimed);
  }
  return report;
}

auto LivenessDetector::start() -> void {
  if (running_.exchange(true))
    return;

  sweep_thread_ = std::thread([this] { run_loop(); });
  log::info("Liveness detector started (sweep every {}ms)",
            config_.effective_sweep_interval().count());
}

auto LivenessDetector::stop() -> void {
  if (!running_.exchange(false))
    return;
  {
    std::lock_guard lock(mu_);
  }
  cv_.notify_all();
  if (sweep_thread_.joinable()) {
    sweep_thread_.join();
  }
  log::info("Liveness detector stopped");
}

auto LivenessDetector::run_loop() -> void {
  const auto interval = config_.effective_sweep_interval();
  while (running_.load(std::memory_order_relaxed)) {
    if (auto report = sweep(Clock::now());
        report && report->reclaimed > 0 && on_reclaim_) {
      on_reclaim_(report->reclaimed);
    }

    std::unique_lock lock(mu_);
    cv_.wait_for(lock, interval, [this] {
      return !running_.load(std::memory_order_relaxed);
    });
  }
}

}  // namespace taskq
