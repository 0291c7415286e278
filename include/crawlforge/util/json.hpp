#pragma once

#include "crawlforge/core/error.hpp"

#include <glaze/json.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace crawlforge {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

[[nodiscard]] inline auto parse_json(std::string_view input)
    -> Result<JsonValue> {
  JsonValue value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

/// Typed lookups on a JSON object; missing keys and type mismatches yield
/// nullptr so callers can apply their own defaults.
[[nodiscard]] inline auto json_member(const JsonValue &obj,
                                      std::string_view key)
    -> const JsonValue * {
  if (!obj.is_object()) {
    return nullptr;
  }
  const auto &members = obj.get_object();
  auto it = members.find(key);
  return it == members.end() ? nullptr : &it->second;
}

[[nodiscard]] inline auto json_string(const JsonValue &obj,
                                      std::string_view key)
    -> const std::string * {
  const auto *v = json_member(obj, key);
  return v && v->is_string() ? &v->get_string() : nullptr;
}

[[nodiscard]] inline auto json_int(const JsonValue &obj, std::string_view key,
                                   std::int64_t fallback) -> std::int64_t {
  const auto *v = json_member(obj, key);
  if (!v) {
    return fallback;
  }
  if (v->holds<std::int64_t>()) {
    return v->get<std::int64_t>();
  }
  if (v->holds<double>()) {
    // -2^63 is exact as a double; 2^63 is its negation.
    constexpr auto kLow =
        static_cast<double>(std::numeric_limits<std::int64_t>::min());
    const double d = v->get<double>();
    if (std::isnan(d) || d < kLow || d >= -kLow) {
      return fallback;
    }
    return static_cast<std::int64_t>(d);
  }
  return fallback;
}

[[nodiscard]] inline auto json_bool(const JsonValue &obj, std::string_view key,
                                    bool fallback) -> bool {
  const auto *v = json_member(obj, key);
  return v && v->is_boolean() ? v->get_boolean() : fallback;
}

} // namespace crawlforge
