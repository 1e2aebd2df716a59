#pragma once

#include "taskq/config/system_config.hpp"
#include "taskq/coordinator/lifecycle.hpp"
#include "taskq/core/constants.hpp"
#include "taskq/core/error.hpp"
#include "taskq/model/task.hpp"
#include "taskq/transport/transport.hpp"
#include "taskq/util/util.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace taskq {

enum class ReportOutcome : std::uint8_t {
  Recorded,
  Duplicate,
  Orphaned,
};

[[nodiscard]] constexpr auto report_outcome_name(ReportOutcome o) noexcept
    -> const char* {
  switch (o) {
    case ReportOutcome::Recorded:
      return "recorded";
    case ReportOutcome::Duplicate:
      return "duplicate";
    case ReportOutcome::Orphaned:
      return "orphaned";
  }
  return "unknown";
}

// Turns worker-reported outcomes into exactly one TaskResult per task.
// Duplicate and orphaned results are successful no-ops; unknown tasks and
// store failures are errors.
class ResultReconciler {
public:
  using RecordedCallback = std::move_only_function<void(const TaskResult&)>;

  ResultReconciler(TaskLifecycle& lifecycle, ITransport& transport,
                   TransportConfig config);
  ~ResultReconciler();

  ResultReconciler(const ResultReconciler&) = delete;
  auto operator=(const ResultReconciler&) -> ResultReconciler& = delete;

  [[nodiscard]] auto report(const ResultReport& report)
      -> Result<ReportOutcome>;

  // Receives and settles at most one message from the results queue.
  // Returns false when nothing arrived within the receive timeout.
  [[nodiscard]] auto poll_once() -> Result<bool>;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load();
  }

  auto set_on_recorded(RecordedCallback cb) -> void;

private:
  auto settle(const Delivery& delivery) -> void;
  auto run_loop() -> void;
  // Returns early when stop() is called
  auto wait_before_retry(std::chrono::milliseconds delay) -> void;

  TaskLifecycle& lifecycle_;
  ITransport& transport_;
  TransportConfig config_;
  RecordedCallback on_recorded_;
  // Touched only by the consuming thread
  RetryBackoff retry_;

  alignas(kCacheLineSize) std::atomic<bool> running_{false};
  std::mutex mu_;
  std::condition_variable cv_;
  std::thread consume_thread_;
};

}  // namespace taskq
