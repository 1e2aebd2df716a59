#include "taskq/worker/worker.hpp"

#include "taskq/app/application.hpp"
#include "taskq/transport/memory_transport.hpp"
#include "taskq/transport/messages.hpp"

#include <chrono>
#include <stdexcept>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace taskq;
using namespace taskq::test;
using namespace std::chrono_literals;

namespace {

auto runtime_config(const std::string& db_path) -> Config {
  Config config;
  config.storage.db_file = db_path;
  config.liveness.heartbeat_timeout = 2s;
  config.liveness.death_timeout = 6s;
  config.dispatcher.poll_interval = 20ms;
  config.dispatcher.publish_backoff = 1ms;
  config.dispatcher.publish_backoff_max = 5ms;
  config.transport.receive_timeout = 20ms;
  config.transport.retry_backoff = 30ms;
  config.transport.retry_backoff_max = 60ms;
  config.task_types = {"render", "transcode"};
  return config;
}

auto options(std::string id) -> WorkerOptions {
  return WorkerOptions{
      .id = WorkerId{std::move(id)},
      .name = "test-worker",
      .heartbeat_interval = 20ms,
  };
}

}  // namespace

class WorkerRuntimeTest : public ::testing::Test {
protected:
  void SetUp() override {
    app_ = std::make_unique<Application>(runtime_config(db_.path()));
    ASSERT_TRUE(app_->init().has_value());
  }

  void TearDown() override {
    app_->stop();
    app_.reset();
  }

  auto status_of(const TaskId& id) -> TaskStatus {
    auto task = app_->get_task(id);
    return task ? task->status : TaskStatus::Cancelled;
  }

  TempDb db_;
  std::unique_ptr<Application> app_;
};

TEST_F(WorkerRuntimeTest, StartWithoutHandlersFails) {
  WorkerRuntime worker(*app_, options("w1"));

  auto r = worker.start();

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
  EXPECT_FALSE(worker.is_running());
}

TEST_F(WorkerRuntimeTest, StartWithUnknownTypeFails) {
  WorkerRuntime worker(*app_, options("w1"));
  worker.on("upscale", [](const nlohmann::json&) { return nlohmann::json{}; });

  auto r = worker.start();

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidCapability));
  EXPECT_FALSE(worker.is_running());
}

TEST_F(WorkerRuntimeTest, StartRegistersCapabilities) {
  WorkerRuntime worker(*app_, options("w1"));
  worker.on("render", [](const nlohmann::json& in) { return in; })
      .on("transcode", [](const nlohmann::json& in) { return in; });

  ASSERT_TRUE(worker.start().has_value());

  auto stored = app_->registry().get_worker(worker.id());
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->state, WorkerState::Alive);
  EXPECT_EQ(stored->capabilities.size(), 2u);
  worker.stop();
}

TEST_F(WorkerRuntimeTest, ExecutesDispatchedTask) {
  ASSERT_TRUE(app_->start().has_value());
  WorkerRuntime worker(*app_, options("w1"));
  worker.on("render", [](const nlohmann::json& in) {
    return nlohmann::json{{"frames", in["frames"].get<int>() * 2}};
  });
  ASSERT_TRUE(worker.start().has_value());

  auto id = app_->submit("render", {{"frames", 21}});
  ASSERT_TRUE(id.has_value());

  ASSERT_TRUE(
      wait_until([&] { return status_of(*id) == TaskStatus::Completed; }));
  auto result = app_->get_result(*id);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->worker_id, worker.id());
  EXPECT_EQ((*result->output_data)["frames"], 42);
  EXPECT_EQ(worker.executed(), 1u);
  worker.stop();
}

TEST_F(WorkerRuntimeTest, ThrowingHandlerReportsFailure) {
  ASSERT_TRUE(app_->start().has_value());
  WorkerRuntime worker(*app_, options("w1"));
  worker.on("render", [](const nlohmann::json&) -> nlohmann::json {
    throw std::runtime_error("scene file missing");
  });
  ASSERT_TRUE(worker.start().has_value());

  auto id = app_->submit("render", nullptr);
  ASSERT_TRUE(id.has_value());

  ASSERT_TRUE(wait_until([&] { return status_of(*id) == TaskStatus::Failed; }));
  auto result = app_->get_result(*id);
  ASSERT_TRUE(result.has_value());
  ASSERT_TRUE(result->error_data.has_value());
  EXPECT_EQ((*result->error_data)["message"], "scene file missing");
  worker.stop();
}

TEST_F(WorkerRuntimeTest, StopUnregistersWorker) {
  WorkerRuntime worker(*app_, options("w1"));
  worker.on("render", [](const nlohmann::json& in) { return in; });
  ASSERT_TRUE(worker.start().has_value());

  worker.stop();

  EXPECT_FALSE(worker.is_running());
  auto stored = app_->registry().get_worker(worker.id());
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->state, WorkerState::Dead);
}

TEST_F(WorkerRuntimeTest, HeartbeatLoopReRegistersAfterDeath) {
  WorkerRuntime worker(*app_, options("w1"));
  worker.on("render", [](const nlohmann::json& in) { return in; });
  ASSERT_TRUE(worker.start().has_value());

  // Coordinator-side death, e.g. after a network partition
  ASSERT_TRUE(app_->unregister_worker(worker.id()).has_value());

  EXPECT_TRUE(wait_until([&] {
    auto w = app_->registry().get_worker(worker.id());
    return w && w->state == WorkerState::Alive;
  }));
  worker.stop();
}

TEST_F(WorkerRuntimeTest, SkipsDispatchForTaskNoLongerInFlight) {
  WorkerRuntime worker(*app_, options("w1"));
  worker.on("render", [](const nlohmann::json& in) { return in; });
  // Registered but consumers not started: drive it with poll_once
  ASSERT_TRUE(app_->register_worker(worker.id(), "w1", {"render"}).has_value());

  auto id = app_->submit("render", 1);
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(app_->cancel(*id).has_value());
  ASSERT_TRUE(app_->transport()
                  .publish("tasks.render",
                           encode(DispatchMessage{.task_id = *id,
                                                  .task_type = "render",
                                                  .assigned_to = worker.id(),
                                                  .payload = 1}))
                  .has_value());

  auto polled = worker.poll_once("render");

  ASSERT_TRUE(polled.has_value());
  EXPECT_TRUE(*polled);
  EXPECT_EQ(worker.executed(), 0u);
  EXPECT_EQ(status_of(*id), TaskStatus::Cancelled);
  auto& memory = dynamic_cast<MemoryTransport&>(app_->transport());
  EXPECT_EQ(memory.depth("tasks.render"), 0u);
  EXPECT_EQ(memory.unacked(), 0u);
  EXPECT_EQ(memory.depth("results"), 0u);
}

TEST_F(WorkerRuntimeTest, PollOnceRunsAssignedTask) {
  WorkerRuntime worker(*app_, options("w1"));
  worker.on("render", [](const nlohmann::json& in) { return in; });
  ASSERT_TRUE(app_->register_worker(worker.id(), "w1", {"render"}).has_value());
  auto id = app_->submit("render", {{"x", 1}});
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(app_->dispatcher().dispatch_once().has_value());

  auto polled = worker.poll_once("render");

  ASSERT_TRUE(polled.has_value());
  EXPECT_TRUE(*polled);
  EXPECT_EQ(worker.executed(), 1u);
  EXPECT_EQ(status_of(*id), TaskStatus::Running);

  // The result waits on the results queue until the reconciler settles it
  ASSERT_TRUE(app_->reconciler().poll_once().has_value());
  EXPECT_EQ(status_of(*id), TaskStatus::Completed);
}

TEST_F(WorkerRuntimeTest, StoreOutageRequeuesAfterBackoff) {
  WorkerRuntime worker(*app_, options("w1"));
  worker.on("render", [](const nlohmann::json& in) { return in; });
  ASSERT_TRUE(app_->register_worker(worker.id(), "w1", {"render"}).has_value());
  auto id = app_->submit("render", {{"x", 1}});
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(app_->dispatcher().dispatch_once().has_value());
  auto& memory = dynamic_cast<MemoryTransport&>(app_->transport());

  app_->persistence().close();
  auto started = std::chrono::steady_clock::now();
  auto polled = worker.poll_once("render");
  auto elapsed = std::chrono::steady_clock::now() - started;

  ASSERT_TRUE(polled.has_value());
  EXPECT_TRUE(*polled);
  EXPECT_GE(elapsed, 30ms);
  EXPECT_EQ(worker.executed(), 0u);
  EXPECT_EQ(memory.depth("tasks.render"), 1u);
  EXPECT_EQ(memory.unacked(), 0u);

  ASSERT_TRUE(app_->persistence().open().has_value());
  polled = worker.poll_once("render");
  ASSERT_TRUE(polled.has_value());
  EXPECT_EQ(worker.executed(), 1u);
  EXPECT_EQ(status_of(*id), TaskStatus::Running);
}

TEST_F(WorkerRuntimeTest, HandsBackDispatchRoutedToPeer) {
  WorkerRuntime worker(*app_, options("w1"));
  worker.on("render", [](const nlohmann::json& in) { return in; });
  auto peer = worker_id("w2");
  ASSERT_TRUE(app_->register_worker(peer, "w2", {"render"}).has_value());
  auto id = app_->submit("render", {{"x", 1}});
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(app_->dispatcher().dispatch_once().has_value());
  ASSERT_EQ(app_->get_task(*id)->assigned_to, peer);
  ASSERT_TRUE(app_->register_worker(worker.id(), "w1", {"render"}).has_value());
  auto& memory = dynamic_cast<MemoryTransport&>(app_->transport());

  auto polled = worker.poll_once("render");

  ASSERT_TRUE(polled.has_value());
  EXPECT_TRUE(*polled);
  EXPECT_EQ(worker.executed(), 0u);
  EXPECT_EQ(memory.depth("tasks.render"), 1u);
  EXPECT_EQ(memory.unacked(), 0u);
  auto task = app_->get_task(*id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::Queued);
  EXPECT_EQ(task->assigned_to, peer);

  // Once the peer is gone its message is stale
  ASSERT_TRUE(app_->unregister_worker(peer).has_value());
  polled = worker.poll_once("render");

  ASSERT_TRUE(polled.has_value());
  EXPECT_EQ(worker.executed(), 0u);
  EXPECT_EQ(memory.depth("tasks.render"), 0u);
  EXPECT_EQ(memory.unacked(), 0u);
  EXPECT_EQ(status_of(*id), TaskStatus::Pending);
}

TEST_F(WorkerRuntimeTest, MalformedDispatchIsDropped) {
  WorkerRuntime worker(*app_, options("w1"));
  worker.on("render", [](const nlohmann::json& in) { return in; });
  ASSERT_TRUE(app_->transport().publish("tasks.render", "garbage").has_value());

  auto polled = worker.poll_once("render");

  ASSERT_TRUE(polled.has_value());
  EXPECT_TRUE(*polled);
  EXPECT_EQ(worker.executed(), 0u);
  auto& memory = dynamic_cast<MemoryTransport&>(app_->transport());
  EXPECT_EQ(memory.unacked(), 0u);
}
