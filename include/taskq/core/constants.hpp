#pragma once

#include <chrono>
#include <cstddef>
#include <new>
#include <string_view>

namespace taskq {

inline constexpr std::size_t kCacheLineSize =
#ifdef __cpp_lib_hardware_interference_size
    std::hardware_destructive_interference_size;
#else
    64;
#endif

namespace timing {
inline constexpr auto kHeartbeatTimeout = std::chrono::milliseconds(30'000);
inline constexpr auto kDeathTimeout = std::chrono::milliseconds(90'000);
inline constexpr auto kDispatchPollInterval = std::chrono::milliseconds(1'000);
inline constexpr auto kPublishBackoff = std::chrono::milliseconds(100);
inline constexpr auto kPublishBackoffMax = std::chrono::milliseconds(5'000);
inline constexpr auto kReceiveTimeout = std::chrono::milliseconds(500);
inline constexpr auto kRetryBackoff = std::chrono::milliseconds(50);
inline constexpr auto kRetryBackoffMax = std::chrono::milliseconds(2'000);
inline constexpr auto kBusyTimeout = std::chrono::milliseconds(5'000);
inline constexpr auto kWorkerHeartbeatInterval = std::chrono::milliseconds(10'000);
}  // namespace timing

namespace limits {
inline constexpr std::size_t kDispatchBatchSize = 100;
inline constexpr int kPublishMaxAttempts = 5;
inline constexpr std::size_t kLogQueueCapacity = 8192;
}  // namespace limits

namespace queues {
inline constexpr std::string_view kDispatchPrefix = "tasks.";
inline constexpr std::string_view kResults = "results";
}  // namespace queues

}  // namespace taskq
