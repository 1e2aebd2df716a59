#include "taskq/transport/memory_transport.hpp"
#include "taskq/transport/messages.hpp"

#include <thread>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace taskq;
using namespace taskq::test;
using namespace std::chrono_literals;

TEST(MemoryTransportTest, ReceiveTimesOutOnEmptyQueue) {
  MemoryTransport transport;

  auto d = transport.receive("tasks.render", 10ms);

  ASSERT_TRUE(d.has_value());
  EXPECT_FALSE(d->has_value());
}

TEST(MemoryTransportTest, FifoPerQueue) {
  MemoryTransport transport;
  ASSERT_TRUE(transport.publish("a", "1").has_value());
  ASSERT_TRUE(transport.publish("b", "x").has_value());
  ASSERT_TRUE(transport.publish("a", "2").has_value());

  auto first = transport.receive("a", 10ms);
  auto second = transport.receive("a", 10ms);

  ASSERT_TRUE(first.has_value() && first->has_value());
  ASSERT_TRUE(second.has_value() && second->has_value());
  EXPECT_EQ((*first)->body, "1");
  EXPECT_EQ((*second)->body, "2");
  EXPECT_EQ(transport.depth("b"), 1u);
  EXPECT_EQ(transport.published(), 3u);
}

TEST(MemoryTransportTest, AckRemovesDelivery) {
  MemoryTransport transport;
  ASSERT_TRUE(transport.publish("q", "m").has_value());
  auto d = transport.receive("q", 10ms);
  ASSERT_TRUE(d.has_value() && d->has_value());
  EXPECT_EQ(transport.unacked(), 1u);

  ASSERT_TRUE(transport.ack((*d)->tag).has_value());

  EXPECT_EQ(transport.unacked(), 0u);
  EXPECT_EQ(transport.depth("q"), 0u);
  EXPECT_EQ(transport.ack((*d)->tag).error(), make_error_code(Error::NotFound));
}

TEST(MemoryTransportTest, NackRequeuesAtFront) {
  MemoryTransport transport;
  ASSERT_TRUE(transport.publish("q", "first").has_value());
  ASSERT_TRUE(transport.publish("q", "second").has_value());
  auto d = transport.receive("q", 10ms);
  ASSERT_TRUE(d.has_value() && d->has_value());
  EXPECT_FALSE((*d)->redelivered);

  ASSERT_TRUE(transport.nack((*d)->tag, true).has_value());

  auto again = transport.receive("q", 10ms);
  ASSERT_TRUE(again.has_value() && again->has_value());
  EXPECT_EQ((*again)->body, "first");
  EXPECT_TRUE((*again)->redelivered);
  EXPECT_NE((*again)->tag, (*d)->tag);
}

TEST(MemoryTransportTest, NackWithoutRequeueDrops) {
  MemoryTransport transport;
  ASSERT_TRUE(transport.publish("q", "m").has_value());
  auto d = transport.receive("q", 10ms);
  ASSERT_TRUE(d.has_value() && d->has_value());

  ASSERT_TRUE(transport.nack((*d)->tag, false).has_value());

  EXPECT_EQ(transport.depth("q"), 0u);
  EXPECT_EQ(transport.unacked(), 0u);
}

TEST(MemoryTransportTest, ReceiveWakesOnPublish) {
  MemoryTransport transport;
  std::thread producer([&] {
    std::this_thread::sleep_for(20ms);
    EXPECT_TRUE(transport.publish("q", "late").has_value());
  });

  auto d = transport.receive("q", 2s);
  producer.join();

  ASSERT_TRUE(d.has_value() && d->has_value());
  EXPECT_EQ((*d)->body, "late");
}

TEST(MemoryTransportTest, CloseWakesReceiversAndRejectsPublish) {
  MemoryTransport transport;
  std::thread closer([&] {
    std::this_thread::sleep_for(20ms);
    transport.close();
  });

  auto d = transport.receive("q", 2s);
  closer.join();

  ASSERT_FALSE(d.has_value());
  EXPECT_EQ(d.error(), make_error_code(Error::TransportClosed));
  EXPECT_TRUE(transport.is_closed());
  EXPECT_EQ(transport.publish("q", "m").error(),
            make_error_code(Error::TransportClosed));
}

TEST(MemoryTransportTest, FactoryReturnsWorkingTransport) {
  auto transport = create_memory_transport();
  ASSERT_TRUE(transport->publish("q", "m").has_value());

  auto d = transport->receive("q", 10ms);

  ASSERT_TRUE(d.has_value() && d->has_value());
  EXPECT_EQ((*d)->queue, "q");
}

TEST(MessagesTest, DispatchMessageDecodes) {
  DispatchMessage msg{
      .task_id = task_id("t1"),
      .task_type = "render",
      .assigned_to = worker_id("w1"),
      .payload = {{"frame", 7}},
  };

  auto decoded = decode_dispatch(encode(msg));

  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->task_id, msg.task_id);
  EXPECT_EQ(decoded->task_type, "render");
  EXPECT_EQ(decoded->assigned_to, msg.assigned_to);
  EXPECT_EQ(decoded->payload["frame"], 7);
}

TEST(MessagesTest, ResultMessageCarriesCompletionTime) {
  ResultMessage msg{
      .task_id = task_id("t1"),
      .worker_id = worker_id("w1"),
      .success = false,
      .payload = {{"message", "boom"}},
      .completed_at = kT0,
  };

  auto decoded = decode_result(encode(msg));

  ASSERT_TRUE(decoded.has_value());
  EXPECT_FALSE(decoded->success);
  EXPECT_EQ(decoded->completed_at, kT0);

  auto report = to_report(std::move(*decoded));
  EXPECT_EQ(report.task_id, task_id("t1"));
  EXPECT_EQ(report.worker_id, worker_id("w1"));
  EXPECT_EQ(report.payload["message"], "boom");
}

TEST(MessagesTest, MalformedBodiesRejected) {
  auto parse_error = make_error_code(Error::ParseError);

  EXPECT_EQ(decode_dispatch("not json").error(), parse_error);
  EXPECT_EQ(decode_dispatch("[1, 2]").error(), parse_error);
  EXPECT_EQ(decode_dispatch(R"({"task_id": "t1"})").error(), parse_error);
  EXPECT_EQ(decode_result(R"({"task_id": "t1", "worker_id": "w1"})").error(),
            parse_error);
  EXPECT_EQ(
      decode_result(R"({"task_id": "", "worker_id": "w1", "success": true})")
          .error(),
      parse_error);
  EXPECT_EQ(
      decode_result(R"({"task_id": "t1", "worker_id": "w1", "success": "yes"})")
          .error(),
      parse_error);
}

TEST(MessagesTest, ResultWithoutPayloadOrTime) {
  auto decoded =
      decode_result(R"({"task_id": "t1", "worker_id": "w1", "success": true})");

  ASSERT_TRUE(decoded.has_value());
  EXPECT_TRUE(decoded->payload.is_null());
  EXPECT_GT(decoded->completed_at, kT0);
}
