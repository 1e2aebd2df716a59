#pragma once

#include <compare>
#include <concepts>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace taskq {

// Phantom type tags for type-safe ID disambiguation
struct TaskTypeTag {};
struct WorkerTag {};
struct TaskTag {};
struct ResultTag {};
struct HeartbeatTag {};

// Prevents accidentally passing a worker id where a task id is expected
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }
  [[nodiscard]] auto c_str() const -> const char* { return value_.c_str(); }

  [[nodiscard]] explicit operator std::string() const { return value_; }
  [[nodiscard]] explicit operator std::string_view() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs,
                                        const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs,
                                       const TypedId& rhs) -> bool = default;

private:
  std::string value_;
};

using TaskTypeId = TypedId<TaskTypeTag>;
using WorkerId = TypedId<WorkerTag>;
using TaskId = TypedId<TaskTag>;
using ResultId = TypedId<ResultTag>;
using HeartbeatId = TypedId<HeartbeatTag>;

template <typename T>
concept IsTypedId = requires(T id) {
  { id.value() } -> std::convertible_to<std::string_view>;
  { id.empty() } -> std::convertible_to<bool>;
};

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id)
    -> std::ostream& {
  return os << id.value();
}

}  // namespace taskq

template <typename Tag>
struct std::hash<taskq::TypedId<Tag>> {
  auto operator()(const taskq::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<taskq::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const taskq::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
