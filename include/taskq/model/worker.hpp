#pragma once

#include "taskq/util/id.hpp"
#include "taskq/util/util.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace taskq {

// dead is only left through re-registration, never through a heartbeat
enum class WorkerState : std::uint8_t {
  Alive,
  Suspected,
  Dead,
};

struct Worker {
  WorkerId id;
  std::string name;
  TimePoint registered_at{};
  WorkerState state{WorkerState::Alive};
  TimePoint last_heartbeat_at{};
  std::vector<TaskTypeId> capabilities;
};

struct Heartbeat {
  HeartbeatId id;
  WorkerId worker_id;
  TimePoint heartbeat_time{};
  TimePoint created_at{};
};

struct WorkerLoad {
  WorkerId worker_id;
  std::size_t in_flight{0};
};

}  // namespace taskq
