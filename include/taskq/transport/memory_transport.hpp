#pragma once

#include "taskq/core/error.hpp"
#include "taskq/transport/transport.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace taskq {

// In-process broker: one FIFO per queue name, unacked deliveries tracked by
// tag, nack with requeue puts the message back at the front.
class MemoryTransport : public ITransport {
public:
  MemoryTransport() = default;
  ~MemoryTransport() override;

  MemoryTransport(const MemoryTransport&) = delete;
  MemoryTransport& operator=(const MemoryTransport&) = delete;

  auto publish(std::string_view queue, std::string body)
      -> Result<void> override;
  auto receive(std::string_view queue, std::chrono::milliseconds timeout)
      -> Result<std::optional<Delivery>> override;
  auto ack(DeliveryTag tag) -> Result<void> override;
  auto nack(DeliveryTag tag, bool requeue) -> Result<void> override;
  auto close() -> void override;

  [[nodiscard]] auto depth(std::string_view queue) const -> std::size_t;
  [[nodiscard]] auto unacked() const -> std::size_t;
  [[nodiscard]] auto published() const -> std::uint64_t;
  [[nodiscard]] auto is_closed() const -> bool;

private:
  struct Message {
    std::string body;
    bool redelivered{false};
  };

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::unordered_map<std::string, std::deque<Message>, StringHash, StringEqual>
      queues_;
  std::unordered_map<DeliveryTag, Delivery> in_flight_;
  DeliveryTag next_tag_{1};
  std::uint64_t published_{0};
  bool closed_{false};
};

}  // namespace taskq
