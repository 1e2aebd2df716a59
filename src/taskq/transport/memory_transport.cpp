#include "taskq/transport/memory_transport.hpp"

#include "taskq/util/log.hpp"

namespace taskq {

MemoryTransport::~MemoryTransport() {
  close();
}

auto MemoryTransport::publish(std::string_view queue, std::string body)
    -> Result<void> {
  {
    std::lock_guard lock(mu_);
    if (closed_) {
      return fail(Error::TransportClosed);
    }
    auto it = queues_.find(queue);
    if (it == queues_.end()) {
      it = queues_.emplace(std::string(queue), std::deque<Message>{}).first;
    }
    it->second.push_back(Message{.body = std::move(body), .redelivered = false});
    ++published_;
  }
  cv_.notify_all();
  return ok();
}

auto MemoryTransport::receive(std::string_view queue,
                              std::chrono::milliseconds timeout)
    -> Result<std::optional<Delivery>> {
  std::unique_lock lock(mu_);
  auto has_message = [&] {
    if (closed_) {
      return true;
    }
    auto it = queues_.find(queue);
    return it != queues_.end() && !it->second.empty();
  };

  if (!cv_.wait_for(lock, timeout, has_message)) {
    return std::optional<Delivery>{};
  }
  if (closed_) {
    return fail(Error::TransportClosed);
  }

  auto& q = queues_.find(queue)->second;
  Message msg = std::move(q.front());
  q.pop_front();

  Delivery delivery{
      .tag = next_tag_++,
      .queue = std::string(queue),
      .body = std::move(msg.body),
      .redelivered = msg.redelivered,
  };
  in_flight_.emplace(delivery.tag, delivery);
  return std::optional<Delivery>{std::move(delivery)};
}

auto MemoryTransport::ack(DeliveryTag tag) -> Result<void> {
  std::lock_guard lock(mu_);
  if (in_flight_.erase(tag) == 0) {
    log::warn("ack for unknown delivery tag {}", tag);
    return fail(Error::NotFound);
  }
  return ok();
}

auto MemoryTransport::nack(DeliveryTag tag, bool requeue) -> Result<void> {
  {
    std::lock_guard lock(mu_);
    auto node = in_flight_.extract(tag);
    if (node.empty()) {
      log::warn("nack for unknown delivery tag {}", tag);
      return fail(Error::NotFound);
    }
    if (!requeue) {
      log::debug("Dropped message on {} (tag {})", node.mapped().queue, tag);
      return ok();
    }
    auto& delivery = node.mapped();
    auto it = queues_.find(delivery.queue);
    if (it == queues_.end()) {
      it = queues_.emplace(delivery.queue, std::deque<Message>{}).first;
    }
    it->second.push_front(
        Message{.body = std::move(delivery.body), .redelivered = true});
  }
  cv_.notify_all();
  return ok();
}

auto MemoryTransport::close() -> void {
  {
    std::lock_guard lock(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

auto MemoryTransport::depth(std::string_view queue) const -> std::size_t {
  std::lock_guard lock(mu_);
  auto it = queues_.find(queue);
  return it == queues_.end() ? 0 : it->second.size();
}

auto MemoryTransport::unacked() const -> std::size_t {
  std::lock_guard lock(mu_);
  return in_flight_.size();
}

auto MemoryTransport::published() const -> std::uint64_t {
  std::lock_guard lock(mu_);
  return published_;
}

auto MemoryTransport::is_closed() const -> bool {
  std::lock_guard lock(mu_);
  return closed_;
}

auto create_memory_transport() -> std::unique_ptr<ITransport> {
  return std::make_unique<MemoryTransport>();
}

}  // namespace taskq
