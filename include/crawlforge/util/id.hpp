#pragma once

#include <algorithm>
#include <cctype>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace crawlforge {

[[nodiscard]] inline auto is_valid_id_text(std::string_view value) noexcept
    -> bool {
  return !value.empty() &&
         std::none_of(value.begin(), value.end(), [](unsigned char ch) {
           return std::iscntrl(ch) != 0 || ch == '/';
         });
}

struct TaskTag {};

// Phantom-typed identifier; distinct tags never compare or convert.
template <typename Tag> class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  TypedId() = default;

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

namespace detail {
/// Random 128-bit identifier in canonical 8-4-4-4-12 form (RFC 4122 v4).
[[nodiscard]] auto generate_uuid_v4() -> std::string;
} // namespace detail

[[nodiscard]] inline auto generate_task_id() -> TaskId {
  return TaskId{detail::generate_uuid_v4()};
}

} // namespace crawlforge

// `is_avalanching` lets ankerl::unordered_dense use this hash as-is.
template <typename Tag> struct std::hash<crawlforge::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const crawlforge::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<crawlforge::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const crawlforge::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
