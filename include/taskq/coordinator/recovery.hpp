#pragma once

#include "taskq/coordinator/dispatcher.hpp"
#include "taskq/coordinator/lifecycle.hpp"
#include "taskq/coordinator/liveness_detector.hpp"
#include "taskq/coordinator/worker_registry.hpp"
#include "taskq/core/error.hpp"

#include <vector>

namespace taskq {

struct RecoveryResult {
  std::vector<TaskId> republished;
  std::vector<TaskId> released;
  SweepReport sweep;
};

// Runs once before the loops start. A queued task may have been assigned
// without its message ever reaching the transport: republish it when the
// assignee is alive, otherwise return it to pending. Duplicate deliveries
// are absorbed by the start guard and the duplicate-result rule.
class Recovery {
public:
  Recovery(WorkerRegistry& registry, TaskLifecycle& lifecycle,
           Dispatcher& dispatcher, LivenessDetector& detector);

  [[nodiscard]] auto recover(TimePoint now = Clock::now())
      -> Result<RecoveryResult>;

private:
  WorkerRegistry& registry_;
  TaskLifecycle& lifecycle_;
  Dispatcher& dispatcher_;
  LivenessDetector& detector_;
};

}  // namespace taskq
