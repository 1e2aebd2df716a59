#include "taskq/storage/persistence.hpp"
#include "taskq/storage/state_strings.hpp"

#include <sqlite3.h>

#include <cstdlib>
#include <utility>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace taskq;
using namespace taskq::test;
using namespace std::chrono_literals;

class PersistenceTest : public ::testing::Test {
protected:
  void SetUp() override {
    persistence_ = std::make_unique<Persistence>(db_.path());
  }

  void TearDown() override {
    persistence_.reset();
  }

  TempDb db_;
  std::unique_ptr<Persistence> persistence_;
};

class OpenPersistenceTest : public PersistenceTest {
protected:
  void SetUp() override {
    PersistenceTest::SetUp();
    ASSERT_TRUE(persistence_->open().has_value());
    auto type = persistence_->create_task_type("render", kT0);
    ASSERT_TRUE(type.has_value());
    render_ = type->id;
  }

  void TearDown() override {
    persistence_->close();
    PersistenceTest::TearDown();
  }

  auto add_worker(const std::string& id, TimePoint now = kT0) -> WorkerId {
    WorkerRegistration reg{
        .id = worker_id(id),
        .name = id,
        .capabilities = {render_},
        .now = now,
    };
    auto r = persistence_->register_worker(reg);
    EXPECT_TRUE(r.has_value());
    return reg.id;
  }

  auto add_task(std::string id, TimePoint created = kT0) -> TaskId {
    Task task;
    task.id = TaskId{std::move(id)};
    task.task_type_id = render_;
    task.input_data = {{"frame", 1}};
    task.created_at = created;
    EXPECT_TRUE(persistence_->insert_task(task).has_value());
    return task.id;
  }

  auto queue_to(const TaskId& task, const WorkerId& worker) -> Result<void> {
    return persistence_->transition_task(TaskTransition{
        .task_id = task,
        .from = {TaskStatus::Pending},
        .to = TaskStatus::Queued,
        .expected_assignee = std::nullopt,
        .assignee = worker,
        .require_capable_assignee = true,
    });
  }

  auto kill(const WorkerId& worker) -> Result<std::size_t> {
    return persistence_->transition_worker(WorkerTransition{
        .worker_id = worker,
        .from = {WorkerState::Alive, WorkerState::Suspected},
        .to = WorkerState::Dead,
        .heartbeat_at_or_before = std::nullopt,
        .heartbeat_after = std::nullopt,
    });
  }

  TaskTypeId render_;
};

TEST_F(PersistenceTest, InitialState_IsNotOpen) {
  EXPECT_FALSE(persistence_->is_open());
}

TEST_F(PersistenceTest, Open_CreatesSchema) {
  ASSERT_TRUE(persistence_->open().has_value());
  EXPECT_TRUE(persistence_->is_open());

  sqlite3* raw = nullptr;
  ASSERT_EQ(sqlite3_open(db_.path().c_str(), &raw), SQLITE_OK);
  int tables = 0;
  sqlite3_exec(
      raw,
      "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name IN "
      "('task_types', 'workers', 'worker_task_types', 'worker_heartbeats', "
      "'tasks', 'task_results');",
      [](void* out, int, char** values, char**) {
        *static_cast<int*>(out) = std::atoi(values[0]);
        return 0;
      },
      &tables, nullptr);
  sqlite3_close(raw);
  EXPECT_EQ(tables, 6);
}

TEST_F(PersistenceTest, OperationsOnClosedStoreFail) {
  auto tasks = persistence_->list_tasks();

  ASSERT_FALSE(tasks.has_value());
  EXPECT_EQ(tasks.error(), make_error_code(Error::DatabaseError));
}

TEST_F(PersistenceTest, Reopen_KeepsData) {
  ASSERT_TRUE(persistence_->open().has_value());
  ASSERT_TRUE(persistence_->create_task_type("render", kT0).has_value());
  persistence_->close();

  ASSERT_TRUE(persistence_->open().has_value());
  auto type = persistence_->find_task_type("render");
  ASSERT_TRUE(type.has_value());
  EXPECT_EQ(type->name, "render");
}

TEST_F(OpenPersistenceTest, CreateTaskType_IsIdempotent) {
  auto again = persistence_->create_task_type("render", at(5s));

  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->id, render_);
  EXPECT_EQ(again->created_at, kT0);

  auto all = persistence_->list_task_types();
  ASSERT_TRUE(all.has_value());
  EXPECT_EQ(all->size(), 1u);
}

TEST_F(OpenPersistenceTest, CreateTaskType_EmptyNameRejected) {
  auto r = persistence_->create_task_type("", kT0);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
}

TEST_F(OpenPersistenceTest, FindTaskType_Unknown) {
  auto r = persistence_->find_task_type("transcode");

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
}

TEST_F(OpenPersistenceTest, RegisterWorker_StoresCapabilitiesAndHeartbeat) {
  auto id = add_worker("w1");

  auto worker = persistence_->get_worker(id);
  ASSERT_TRUE(worker.has_value());
  EXPECT_EQ(worker->name, "w1");
  EXPECT_EQ(worker->state, WorkerState::Alive);
  EXPECT_EQ(worker->last_heartbeat_at, kT0);
  ASSERT_EQ(worker->capabilities.size(), 1u);
  EXPECT_EQ(worker->capabilities[0], render_);

  auto beats = persistence_->list_heartbeats(id);
  ASSERT_TRUE(beats.has_value());
  EXPECT_EQ(beats->size(), 1u);
}

TEST_F(OpenPersistenceTest, RegisterWorker_UnknownCapabilityWritesNothing) {
  WorkerRegistration reg{
      .id = worker_id("w1"),
      .name = "w1",
      .capabilities = {render_, TaskTypeId{"no-such-type"}},
      .now = kT0,
  };

  auto r = persistence_->register_worker(reg);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidCapability));
  auto worker = persistence_->get_worker(reg.id);
  ASSERT_FALSE(worker.has_value());
  EXPECT_EQ(worker.error(), make_error_code(Error::NotFound));
}

TEST_F(OpenPersistenceTest, RegisterWorker_ReplacesCapabilities) {
  auto transcode = persistence_->create_task_type("transcode", kT0);
  ASSERT_TRUE(transcode.has_value());
  auto id = add_worker("w1");

  WorkerRegistration reg{
      .id = id,
      .name = "w1-renamed",
      .capabilities = {transcode->id},
      .now = at(1s),
  };
  ASSERT_TRUE(persistence_->register_worker(reg).has_value());

  auto worker = persistence_->get_worker(id);
  ASSERT_TRUE(worker.has_value());
  EXPECT_EQ(worker->name, "w1-renamed");
  ASSERT_EQ(worker->capabilities.size(), 1u);
  EXPECT_EQ(worker->capabilities[0], transcode->id);

  auto capable = persistence_->capable_workers(render_);
  ASSERT_TRUE(capable.has_value());
  EXPECT_TRUE(capable->empty());
}

TEST_F(OpenPersistenceTest, RegisterWorker_ReclaimsStaleAssignments) {
  auto id = add_worker("w1");
  auto task = add_task("t1");
  ASSERT_TRUE(queue_to(task, id).has_value());

  WorkerRegistration reg{
      .id = id, .name = "w1", .capabilities = {render_}, .now = at(1s)};
  auto reclaimed = persistence_->register_worker(reg);

  ASSERT_TRUE(reclaimed.has_value());
  EXPECT_EQ(*reclaimed, 1u);
  auto t = persistence_->get_task(task);
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->status, TaskStatus::Pending);
  EXPECT_FALSE(t->assigned_to.has_value());
}

TEST_F(OpenPersistenceTest, AppendHeartbeat_KeepsLatestTime) {
  auto id = add_worker("w1");

  ASSERT_TRUE(persistence_->append_heartbeat(id, at(10s), at(10s)).has_value());
  // Out-of-order delivery must not move the clock backwards
  auto worker = persistence_->append_heartbeat(id, at(5s), at(11s));

  ASSERT_TRUE(worker.has_value());
  EXPECT_EQ(worker->last_heartbeat_at, at(10s));
  auto beats = persistence_->list_heartbeats(id);
  ASSERT_TRUE(beats.has_value());
  EXPECT_EQ(beats->size(), 3u);
  EXPECT_EQ(beats->front().heartbeat_time, at(10s));
}

TEST_F(OpenPersistenceTest, AppendHeartbeat_UnknownWorker) {
  auto r = persistence_->append_heartbeat(worker_id("ghost"), kT0, kT0);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
}

TEST_F(OpenPersistenceTest, TransitionWorker_GuardOnHeartbeat) {
  auto id = add_worker("w1");
  WorkerTransition suspect{
      .worker_id = id,
      .from = {WorkerState::Alive},
      .to = WorkerState::Suspected,
      .heartbeat_at_or_before = kT0 - std::chrono::seconds(1),
      .heartbeat_after = std::nullopt,
  };

  auto stale = persistence_->transition_worker(suspect);
  ASSERT_FALSE(stale.has_value());
  EXPECT_EQ(stale.error(), make_error_code(Error::StaleTransition));

  suspect.heartbeat_at_or_before = kT0;
  EXPECT_TRUE(persistence_->transition_worker(suspect).has_value());
  auto worker = persistence_->get_worker(id);
  ASSERT_TRUE(worker.has_value());
  EXPECT_EQ(worker->state, WorkerState::Suspected);
}

TEST_F(OpenPersistenceTest, TransitionWorker_UnknownWorker) {
  auto r = kill(worker_id("ghost"));

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
}

TEST_F(OpenPersistenceTest, TransitionWorker_DeathReclaimsInFlight) {
  auto w1 = add_worker("w1");
  auto w2 = add_worker("w2");
  auto queued = add_task("t1");
  auto running = add_task("t2");
  auto other = add_task("t3");
  ASSERT_TRUE(queue_to(queued, w1).has_value());
  ASSERT_TRUE(queue_to(running, w1).has_value());
  ASSERT_TRUE(queue_to(other, w2).has_value());
  ASSERT_TRUE(persistence_
                  ->transition_task(TaskTransition{
                      .task_id = running,
                      .from = {TaskStatus::Queued},
                      .to = TaskStatus::Running,
                      .expected_assignee = w1,
                      .assignee = w1,
                      .require_capable_assignee = false,
                  })
                  .has_value());

  auto reclaimed = kill(w1);

  ASSERT_TRUE(reclaimed.has_value());
  EXPECT_EQ(*reclaimed, 2u);
  EXPECT_EQ(persistence_->get_task(queued)->status, TaskStatus::Pending);
  EXPECT_EQ(persistence_->get_task(running)->status, TaskStatus::Pending);
  EXPECT_EQ(persistence_->get_task(other)->status, TaskStatus::Queued);

  auto again = kill(w1);
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), make_error_code(Error::StaleTransition));
}

TEST_F(OpenPersistenceTest, InsertTask_DuplicateId) {
  add_task("t1");
  Task dup;
  dup.id = TaskId{"t1"};
  dup.task_type_id = render_;
  dup.created_at = kT0;

  auto r = persistence_->insert_task(dup);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::AlreadyExists));
}

TEST_F(OpenPersistenceTest, InsertTask_AssigneeMustMatchStatus) {
  Task task;
  task.id = TaskId{"t1"};
  task.task_type_id = render_;
  task.status = TaskStatus::Queued;

  auto r = persistence_->insert_task(task);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
}

TEST_F(OpenPersistenceTest, GetTask_RoundTripsInput) {
  auto id = add_task("t1");

  auto task = persistence_->get_task(id);

  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->task_type_id, render_);
  EXPECT_EQ(task->input_data, (nlohmann::json{{"frame", 1}}));
  EXPECT_EQ(task->status, TaskStatus::Pending);
  EXPECT_EQ(task->created_at, kT0);
}

TEST_F(OpenPersistenceTest, PendingTasks_OldestFirstThenInsertionOrder) {
  add_task("late", at(2s));
  add_task("tie-a", at(1s));
  add_task("tie-b", at(1s));
  add_task("early", at(0s));

  auto tasks = persistence_->pending_tasks(render_, 10);

  ASSERT_TRUE(tasks.has_value());
  ASSERT_EQ(tasks->size(), 4u);
  EXPECT_EQ((*tasks)[0].id, task_id("early"));
  EXPECT_EQ((*tasks)[1].id, task_id("tie-a"));
  EXPECT_EQ((*tasks)[2].id, task_id("tie-b"));
  EXPECT_EQ((*tasks)[3].id, task_id("late"));

  auto limited = persistence_->pending_tasks(render_, 2);
  ASSERT_TRUE(limited.has_value());
  EXPECT_EQ(limited->size(), 2u);
}

TEST_F(OpenPersistenceTest, TransitionTask_WrongSourceIsStale) {
  auto w1 = add_worker("w1");
  auto task = add_task("t1");
  ASSERT_TRUE(queue_to(task, w1).has_value());

  auto r = queue_to(task, w1);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::StaleTransition));
}

TEST_F(OpenPersistenceTest, TransitionTask_UnknownTask) {
  auto w1 = add_worker("w1");

  auto r = queue_to(task_id("missing"), w1);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
}

TEST_F(OpenPersistenceTest, TransitionTask_RequiresLiveCapableAssignee) {
  auto transcode = persistence_->create_task_type("transcode", kT0);
  ASSERT_TRUE(transcode.has_value());
  WorkerRegistration reg{.id = worker_id("tx"),
                         .name = "tx",
                         .capabilities = {transcode->id},
                         .now = kT0};
  ASSERT_TRUE(persistence_->register_worker(reg).has_value());
  auto dead = add_worker("dead");
  ASSERT_TRUE(kill(dead).has_value());
  auto task = add_task("t1");

  EXPECT_EQ(queue_to(task, reg.id).error(),
            make_error_code(Error::StaleTransition));
  EXPECT_EQ(queue_to(task, dead).error(),
            make_error_code(Error::StaleTransition));
  EXPECT_EQ(persistence_->get_task(task)->status, TaskStatus::Pending);
}

TEST_F(OpenPersistenceTest, TransitionTask_ExpectedAssigneeGuard) {
  auto w1 = add_worker("w1");
  auto w2 = add_worker("w2");
  auto task = add_task("t1");
  ASSERT_TRUE(queue_to(task, w1).has_value());

  auto r = persistence_->transition_task(TaskTransition{
      .task_id = task,
      .from = {TaskStatus::Queued},
      .to = TaskStatus::Running,
      .expected_assignee = w2,
      .assignee = w2,
      .require_capable_assignee = false,
  });

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::StaleTransition));
  EXPECT_EQ(persistence_->get_task(task)->assigned_to, w1);
}

TEST_F(OpenPersistenceTest, TransitionTask_InFlightNeedsAssignee) {
  auto task = add_task("t1");

  auto r = persistence_->transition_task(TaskTransition{
      .task_id = task,
      .from = {TaskStatus::Pending},
      .to = TaskStatus::Queued,
      .expected_assignee = std::nullopt,
      .assignee = std::nullopt,
      .require_capable_assignee = false,
  });

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
}

TEST_F(OpenPersistenceTest, WorkerLoads_OrderedByLoadThenRegistration) {
  auto w1 = add_worker("w1", kT0);
  auto w2 = add_worker("w2", at(1s));
  ASSERT_TRUE(queue_to(add_task("t1"), w1).has_value());

  auto loads = persistence_->worker_loads(render_);

  ASSERT_TRUE(loads.has_value());
  ASSERT_EQ(loads->size(), 2u);
  EXPECT_EQ((*loads)[0].worker_id, w2);
  EXPECT_EQ((*loads)[0].in_flight, 0u);
  EXPECT_EQ((*loads)[1].worker_id, w1);
  EXPECT_EQ((*loads)[1].in_flight, 1u);
}

TEST_F(OpenPersistenceTest, FinalizeTask_RecordsResultAndStatus) {
  auto w1 = add_worker("w1");
  auto task = add_task("t1");
  ASSERT_TRUE(queue_to(task, w1).has_value());

  auto result = persistence_->finalize_task(
      ResultReport{.task_id = task,
                   .worker_id = w1,
                   .success = true,
                   .payload = {{"frames", 10}},
                   .completed_at = at(3s)},
      at(4s));

  ASSERT_TRUE(result.has_value());
  auto t = persistence_->get_task(task);
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->status, TaskStatus::Completed);
  EXPECT_FALSE(t->assigned_to.has_value());

  auto stored = persistence_->get_result(task);
  ASSERT_TRUE(stored.has_value());
  EXPECT_TRUE(stored->succeeded());
  EXPECT_EQ(*stored->output_data, (nlohmann::json{{"frames", 10}}));
  EXPECT_FALSE(stored->error_data.has_value());
  EXPECT_EQ(stored->completed_at, at(3s));
  EXPECT_EQ(stored->created_at, at(4s));
  EXPECT_EQ(stored->worker_id, w1);
}

TEST_F(OpenPersistenceTest, FinalizeTask_FailureStoresErrorOnly) {
  auto w1 = add_worker("w1");
  auto task = add_task("t1");
  ASSERT_TRUE(queue_to(task, w1).has_value());

  auto result = persistence_->finalize_task(
      ResultReport{.task_id = task,
                   .worker_id = w1,
                   .success = false,
                   .payload = {{"message", "boom"}},
                   .completed_at = at(1s)},
      at(1s));

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(persistence_->get_task(task)->status, TaskStatus::Failed);
  auto stored = persistence_->get_result(task);
  ASSERT_TRUE(stored.has_value());
  EXPECT_FALSE(stored->output_data.has_value());
  ASSERT_TRUE(stored->error_data.has_value());
  EXPECT_EQ((*stored->error_data)["message"], "boom");
}

TEST_F(OpenPersistenceTest, FinalizeTask_SuccessWithoutOutputStoresNull) {
  auto w1 = add_worker("w1");
  auto task = add_task("t1");
  ASSERT_TRUE(queue_to(task, w1).has_value());

  ASSERT_TRUE(persistence_
                  ->finalize_task(ResultReport{.task_id = task,
                                               .worker_id = w1,
                                               .success = true,
                                               .payload = nullptr,
                                               .completed_at = kT0},
                                  kT0)
                  .has_value());

  auto stored = persistence_->get_result(task);
  ASSERT_TRUE(stored.has_value());
  ASSERT_TRUE(stored->output_data.has_value());
  EXPECT_TRUE(stored->output_data->is_null());
}

TEST_F(OpenPersistenceTest, FinalizeTask_OutcomesWithoutWrites) {
  auto w1 = add_worker("w1");
  auto pending = add_task("pending");
  auto done = add_task("done");
  ASSERT_TRUE(queue_to(done, w1).has_value());
  ResultReport report{.task_id = done,
                      .worker_id = w1,
                      .success = true,
                      .payload = 1,
                      .completed_at = kT0};
  ASSERT_TRUE(persistence_->finalize_task(report, kT0).has_value());

  EXPECT_EQ(persistence_->finalize_task(report, kT0).error(),
            make_error_code(Error::DuplicateResult));

  report.task_id = pending;
  EXPECT_EQ(persistence_->finalize_task(report, kT0).error(),
            make_error_code(Error::OrphanedResult));

  report.task_id = task_id("missing");
  EXPECT_EQ(persistence_->finalize_task(report, kT0).error(),
            make_error_code(Error::NotFound));

  EXPECT_EQ(*persistence_->count_results(done), 1u);
  EXPECT_EQ(*persistence_->count_results(pending), 0u);
}

TEST_F(OpenPersistenceTest, FinalizeTask_UnknownWorker) {
  auto w1 = add_worker("w1");
  auto task = add_task("t1");
  ASSERT_TRUE(queue_to(task, w1).has_value());

  auto r = persistence_->finalize_task(
      ResultReport{.task_id = task,
                   .worker_id = worker_id("ghost"),
                   .success = true,
                   .payload = 1,
                   .completed_at = kT0},
      kT0);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
  EXPECT_EQ(persistence_->get_task(task)->status, TaskStatus::Queued);
}

TEST_F(OpenPersistenceTest, CountTasksByStatus) {
  auto w1 = add_worker("w1");
  add_task("a");
  add_task("b");
  ASSERT_TRUE(queue_to(add_task("c"), w1).has_value());

  auto counts = persistence_->count_tasks_by_status();

  ASSERT_TRUE(counts.has_value());
  EXPECT_EQ((*counts)[std::to_underlying(TaskStatus::Pending)], 2);
  EXPECT_EQ((*counts)[std::to_underlying(TaskStatus::Queued)], 1);
  EXPECT_EQ((*counts)[std::to_underlying(TaskStatus::Completed)], 0);
}

TEST_F(OpenPersistenceTest, ListTasks_FiltersByStatus) {
  auto w1 = add_worker("w1");
  add_task("a");
  ASSERT_TRUE(queue_to(add_task("b"), w1).has_value());

  auto queued = persistence_->list_tasks(TaskStatus::Queued);
  auto all = persistence_->list_tasks();

  ASSERT_TRUE(queued.has_value());
  ASSERT_EQ(queued->size(), 1u);
  EXPECT_EQ(queued->front().id, task_id("b"));
  EXPECT_EQ(queued->front().assigned_to, w1);
  ASSERT_TRUE(all.has_value());
  EXPECT_EQ(all->size(), 2u);
}

TEST_F(OpenPersistenceTest, StatusNamesRoundTrip) {
  for (std::size_t i = 0; i < kTaskStatusCount; ++i) {
    auto status = static_cast<TaskStatus>(i);
    EXPECT_EQ(parse_task_status(task_status_name(status)), status);
  }
  EXPECT_FALSE(parse_task_status("bogus").has_value());
  EXPECT_EQ(parse_worker_state("bogus"), WorkerState::Dead);
}
