#pragma once

#include "taskq/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace taskq {

using DeliveryTag = std::uint64_t;

struct Delivery {
  DeliveryTag tag{0};
  std::string queue;
  std::string body;
  // Set when the message was handed out before and nacked with requeue
  bool redelivered{false};
};

// Durable, acknowledged message queue between coordinator and workers.
// A received message stays unacked until ack() or nack(); unacked messages
// of a closed consumer are redelivered by the broker.
class ITransport {
public:
  virtual ~ITransport() = default;

  virtual auto publish(std::string_view queue, std::string body)
      -> Result<void> = 0;

  // Blocks up to `timeout`. nullopt means nothing arrived in time.
  virtual auto receive(std::string_view queue,
                       std::chrono::milliseconds timeout)
      -> Result<std::optional<Delivery>> = 0;

  virtual auto ack(DeliveryTag tag) -> Result<void> = 0;
  virtual auto nack(DeliveryTag tag, bool requeue) -> Result<void> = 0;

  // Wakes every blocked receive(); later calls fail with TransportClosed.
  virtual auto close() -> void = 0;
};

[[nodiscard]] auto create_memory_transport() -> std::unique_ptr<ITransport>;

}  // namespace taskq
