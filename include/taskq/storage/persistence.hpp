#pragma once

#include "taskq/core/constants.hpp"
#include "taskq/core/error.hpp"
#include "taskq/model/task.hpp"
#include "taskq/model/worker.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace taskq {

// Compare-and-set on a task row. The update only applies when the current
// status is one of `from` and every optional guard holds; otherwise the call
// fails with Error::StaleTransition and nothing is written.
struct TaskTransition {
  TaskId task_id;
  std::vector<TaskStatus> from;
  TaskStatus to{TaskStatus::Pending};
  // Guard: assigned_to must equal this worker
  std::optional<WorkerId> expected_assignee;
  // New assigned_to; must be set iff `to` is queued or running
  std::optional<WorkerId> assignee;
  // Guard: the new assignee is alive and capable of the task's type
  bool require_capable_assignee{false};
};

// Compare-and-set on a worker's liveness state. A transition to Dead also
// returns every queued/running task of that worker to pending in the same
// transaction.
struct WorkerTransition {
  WorkerId worker_id;
  std::vector<WorkerState> from;
  WorkerState to{WorkerState::Alive};
  // Guard: last_heartbeat_at <= this instant
  std::optional<TimePoint> heartbeat_at_or_before;
  // Guard: last_heartbeat_at > this instant
  std::optional<TimePoint> heartbeat_after;
};

struct WorkerRegistration {
  WorkerId id;
  std::string name;
  std::vector<TaskTypeId> capabilities;
  TimePoint now{};
};

using StatusCounts = std::array<std::int64_t, kTaskStatusCount>;

class Persistence {
public:
  explicit Persistence(std::string_view db_path,
                       std::chrono::milliseconds busy_timeout =
                           timing::kBusyTimeout);
  ~Persistence();

  Persistence(const Persistence&) = delete;
  Persistence& operator=(const Persistence&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool;
  [[nodiscard]] auto path() const noexcept -> const std::string& {
    return db_path_;
  }

  // Task types
  [[nodiscard]] auto create_task_type(std::string_view name, TimePoint now)
      -> Result<TaskType>;
  [[nodiscard]] auto find_task_type(std::string_view name) -> Result<TaskType>;
  [[nodiscard]] auto get_task_type(const TaskTypeId& id) -> Result<TaskType>;
  [[nodiscard]] auto list_task_types() -> Result<std::vector<TaskType>>;

  // Workers. register_worker returns how many stale assignments it cleared.
  [[nodiscard]] auto register_worker(const WorkerRegistration& reg)
      -> Result<std::size_t>;
  [[nodiscard]] auto get_worker(const WorkerId& id) -> Result<Worker>;
  [[nodiscard]] auto list_workers() -> Result<std::vector<Worker>>;
  [[nodiscard]] auto capable_workers(const TaskTypeId& type)
      -> Result<std::vector<WorkerId>>;
  [[nodiscard]] auto worker_loads(const TaskTypeId& type)
      -> Result<std::vector<WorkerLoad>>;

  // Liveness
  [[nodiscard]] auto append_heartbeat(const WorkerId& worker,
                                      TimePoint heartbeat_time, TimePoint now)
      -> Result<Worker>;
  [[nodiscard]] auto list_heartbeats(const WorkerId& worker,
                                     std::size_t limit = 50)
      -> Result<std::vector<Heartbeat>>;
  [[nodiscard]] auto transition_worker(const WorkerTransition& t)
      -> Result<std::size_t>;

  // Tasks
  [[nodiscard]] auto insert_task(const Task& task) -> Result<void>;
  [[nodiscard]] auto get_task(const TaskId& id) -> Result<Task>;
  [[nodiscard]] auto list_tasks(std::optional<TaskStatus> status = std::nullopt,
                                std::size_t limit = 100)
      -> Result<std::vector<Task>>;
  [[nodiscard]] auto count_tasks_by_status() -> Result<StatusCounts>;
  [[nodiscard]] auto pending_task_types() -> Result<std::vector<TaskTypeId>>;
  // Oldest first: creation time, then insertion order
  [[nodiscard]] auto pending_tasks(const TaskTypeId& type, std::size_t limit)
      -> Result<std::vector<Task>>;
  [[nodiscard]] auto transition_task(const TaskTransition& t) -> Result<void>;

  // Results. finalize_task records the result and moves the task to
  // completed/failed atomically, or fails with DuplicateResult,
  // OrphanedResult or NotFound without writing anything.
  [[nodiscard]] auto finalize_task(const ResultReport& report, TimePoint now)
      -> Result<TaskResult>;
  [[nodiscard]] auto get_result(const TaskId& task_id) -> Result<TaskResult>;
  [[nodiscard]] auto count_results(const TaskId& task_id)
      -> Result<std::size_t>;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;
  [[nodiscard]] auto step_error(int rc) const -> std::error_code;

  [[nodiscard]] auto begin_transaction() -> Result<void>;
  [[nodiscard]] auto commit_transaction() -> Result<void>;
  auto rollback_transaction() -> void;

  [[nodiscard]] auto read_worker(const WorkerId& id) -> Result<Worker>;
  [[nodiscard]] auto read_capabilities(const WorkerId& id)
      -> Result<std::vector<TaskTypeId>>;
  [[nodiscard]] auto reclaim_assigned(const WorkerId& id)
      -> Result<std::size_t>;
  [[nodiscard]] auto read_tasks(sqlite3_stmt* stmt) -> std::vector<Task>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    [[nodiscard]] explicit operator bool() const noexcept {
      return stmt_ != nullptr;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  // Rolls back on scope exit unless commit() succeeded.
  class Transaction {
  public:
    explicit Transaction(Persistence& db) noexcept : db_(db) {
    }
    ~Transaction();
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    [[nodiscard]] auto begin() -> Result<void>;
    [[nodiscard]] auto commit() -> Result<void>;

  private:
    Persistence& db_;
    bool active_{false};
  };

  std::string db_path_;
  std::chrono::milliseconds busy_timeout_;
  mutable std::mutex mu_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace taskq
