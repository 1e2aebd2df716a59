#pragma once

#include "taskq/config/system_config.hpp"
#include "taskq/core/constants.hpp"
#include "taskq/core/error.hpp"
#include "taskq/model/worker.hpp"
#include "taskq/storage/persistence.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace taskq {

struct SweepReport {
  std::size_t suspected{0};
  std::size_t revived{0};
  std::size_t dead{0};
  std::size_t reclaimed{0};
};

// Derives worker liveness from the heartbeat log and two thresholds:
// alive -> suspected after heartbeat_timeout, suspected -> dead after
// death_timeout. Death reclaims the worker's in-flight tasks atomically.
class LivenessDetector {
public:
  using ReclaimCallback = std::move_only_function<void(std::size_t reclaimed)>;

  LivenessDetector(Persistence& persistence, LivenessConfig config);
  ~LivenessDetector();

  LivenessDetector(const LivenessDetector&) = delete;
  auto operator=(const LivenessDetector&) -> LivenessDetector& = delete;

  // Returns the worker's state after the heartbeat. A dead worker stays
  // dead and has to re-register.
  [[nodiscard]] auto record_heartbeat(const WorkerId& worker,
                                      TimePoint heartbeat_time = Clock::now(),
                                      TimePoint now = Clock::now())
      -> Result<WorkerState>;

  [[nodiscard]] auto sweep(TimePoint now = Clock::now()) -> Result<SweepReport>;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load();
  }

  // Invoked from the sweep thread when a death returned tasks to pending.
  auto set_on_reclaim(ReclaimCallback cb) -> void;

  [[nodiscard]] auto config() const noexcept -> const LivenessConfig& {
    return config_;
  }

private:
  auto run_loop() -> void;
  [[nodiscard]] auto revive(const WorkerId& worker, TimePoint now)
      -> Result<bool>;

  Persistence& persistence_;
  LivenessConfig config_;
  ReclaimCallback on_reclaim_;

  alignas(kCacheLineSize) std::atomic<bool> running_{false};
  std::mutex mu_;
  std::condition_variable cv_;
  std::thread sweep_thread_;
};

}  // namespace taskq
