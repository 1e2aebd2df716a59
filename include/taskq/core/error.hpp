#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace taskq {

enum class Error : int {
  Success,
  FileNotFound,
  ParseError,
  DatabaseError,
  DatabaseOpenFailed,
  DatabaseQueryFailed,
  DatabaseBusy,
  InvalidArgument,
  NotFound,
  AlreadyExists,
  Timeout,
  InvalidCapability,
  StaleTransition,
  PublishFailure,
  DuplicateResult,
  OrphanedResult,
  TransportClosed,
  WorkerDead,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::string_view messages[] = {
      "success",
      "file not found",
      "parse error",
      "database error",
      "failed to open database",
      "database query failed",
      "database is busy",
      "invalid argument",
      "not found",
      "already exists",
      "timeout",
      "capability references an unknown task type",
      "task was moved by another participant",
      "failed to publish to transport",
      "result already recorded for task",
      "result for a task no longer in flight",
      "transport closed",
      "worker is dead and must re-register",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "taskq";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages[idx]};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

}  // namespace taskq

template <>
struct std::is_error_code_enum<taskq::Error> : std::true_type {};

namespace taskq {

// Transient failures are worth retrying at the component boundary; logical
// outcomes (stale, duplicate, orphaned, not found) are not.
[[nodiscard]] inline auto is_transient(std::error_code ec) noexcept -> bool {
  return ec == Error::DatabaseBusy || ec == Error::DatabaseError ||
         ec == Error::DatabaseQueryFailed || ec == Error::PublishFailure ||
         ec == Error::Timeout;
}

struct StringHash {
  using is_transparent = void;

  [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
    return std::hash<std::string_view>{}(sv);
  }

  [[nodiscard]] std::size_t operator()(const std::string& s) const noexcept {
    return std::hash<std::string_view>{}(s);
  }

  [[nodiscard]] std::size_t operator()(const char* s) const noexcept {
    return std::hash<std::string_view>{}(s);
  }
};

using StringEqual = std::equal_to<>;

}  // namespace taskq
