#pragma once

#include "taskq/util/id.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <random>
#include <string>

namespace taskq {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline auto generate_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint64_t> dis;

  std::uint64_t a = dis(gen);
  std::uint64_t b = dis(gen);

  // RFC 4122 version 4, variant 1
  a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  return std::format(
      "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
      static_cast<std::uint32_t>(a >> 32), static_cast<std::uint16_t>(a >> 16),
      static_cast<std::uint16_t>(a), static_cast<std::uint16_t>(b >> 48),
      b & 0xFFFFFFFFFFFFULL);
}

template <IsTypedId Id>
[[nodiscard]] inline auto generate_id() -> Id {
  return Id{generate_uuid()};
}

[[nodiscard]] inline auto to_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_millis(std::int64_t ms) -> TimePoint {
  return TimePoint(std::chrono::milliseconds(ms));
}

// Bounded exponential delay: each next() doubles up to `max`.
class RetryBackoff {
public:
  RetryBackoff(std::chrono::milliseconds initial,
               std::chrono::milliseconds max) noexcept
      : initial_(initial), max_(max), current_(initial) {
  }

  [[nodiscard]] auto next() noexcept -> std::chrono::milliseconds {
    auto delay = current_;
    current_ = std::min(current_ * 2, max_);
    return delay;
  }

  auto reset() noexcept -> void {
    current_ = initial_;
  }

private:
  std::chrono::milliseconds initial_;
  std::chrono::milliseconds max_;
  std::chrono::milliseconds current_;
};

inline auto format_timestamp(TimePoint tp) -> std::string {
  auto time = Clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&time, &tm);
  return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec);
}

}  // namespace taskq
