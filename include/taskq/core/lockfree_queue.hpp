#pragma once

#include "taskq/core/constants.hpp"

#include <atomic>
#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <optional>
#include <vector>

namespace taskq {

template <typename T>
concept QueueElement = std::movable<T> && std::destructible<T>;

// Bounded ring for many producers and one consumer (the log writer).
// A cell's turn counter says whose move it is: turn == pos means a producer
// may fill it, turn == pos + 1 means the consumer may take it. Producers
// never block; a full ring rejects the push and counts it.
template <QueueElement T>
class BoundedMPSCQueue {
public:
  explicit BoundedMPSCQueue(std::size_t min_capacity)
      : cells_(std::make_unique<Cell[]>(round_capacity(min_capacity))),
        mask_(round_capacity(min_capacity) - 1) {
    for (std::size_t i = 0; i <= mask_; ++i)
      cells_[i].turn.store(i, std::memory_order_relaxed);
  }

  ~BoundedMPSCQueue() {
    while (try_pop())
      ;
  }

  BoundedMPSCQueue(const BoundedMPSCQueue&) = delete;
  BoundedMPSCQueue& operator=(const BoundedMPSCQueue&) = delete;

  // On false the ring was full and `value` still holds its contents.
  [[nodiscard]] auto push(T& value) noexcept -> bool {
    auto pos = enqueue_pos_.load(std::memory_order_relaxed);
    for (;;) {
      Cell& cell = cells_[pos & mask_];
      auto turn = cell.turn.load(std::memory_order_acquire);
      if (turn == pos) {
        if (enqueue_pos_.compare_exchange_weak(pos, pos + 1,
                                               std::memory_order_relaxed)) {
          std::construct_at(cell.value(), std::move(value));
          cell.turn.store(pos + 1, std::memory_order_release);
          return true;
        }
      } else if (turn < pos) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return false;
      } else {
        pos = enqueue_pos_.load(std::memory_order_relaxed);
      }
    }
  }

  // Consumer only.
  [[nodiscard]] auto try_pop() noexcept -> std::optional<T> {
    Cell& cell = cells_[dequeue_pos_ & mask_];
    if (cell.turn.load(std::memory_order_acquire) != dequeue_pos_ + 1)
      return std::nullopt;

    std::optional<T> out(std::move(*cell.value()));
    std::destroy_at(cell.value());
    cell.turn.store(dequeue_pos_ + mask_ + 1, std::memory_order_release);
    ++dequeue_pos_;
    return out;
  }

  // Consumer only. Appends up to `max` elements and returns how many.
  auto drain_into(std::vector<T>& out, std::size_t max) -> std::size_t {
    std::size_t n = 0;
    while (n < max) {
      auto v = try_pop();
      if (!v)
        break;
      out.push_back(std::move(*v));
      ++n;
    }
    return n;
  }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return mask_ + 1;
  }

  // Pushes refused because the ring was full
  [[nodiscard]] auto rejected() const noexcept -> std::uint64_t {
    return rejected_.load(std::memory_order_relaxed);
  }

private:
  struct Cell {
    std::atomic<std::size_t> turn;
    alignas(T) std::byte storage[sizeof(T)];

    auto value() noexcept -> T* {
      return std::launder(reinterpret_cast<T*>(storage));
    }
  };

  static constexpr auto round_capacity(std::size_t n) noexcept -> std::size_t {
    return std::bit_ceil(n < 2 ? std::size_t{2} : n);
  }

  std::unique_ptr<Cell[]> cells_;
  std::size_t mask_;
  alignas(kCacheLineSize) std::atomic<std::size_t> enqueue_pos_{0};
  alignas(kCacheLineSize) std::size_t dequeue_pos_{0};
  std::atomic<std::uint64_t> rejected_{0};
};

}  // namespace taskq
