#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace crawlforge::util {

// YYYY-MM-DDTHH:MM:SSZ
[[nodiscard]] inline auto
format_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
  if (tp == std::chrono::system_clock::time_point{})
    return {};
  auto const sec_tp = std::chrono::floor<std::chrono::seconds>(tp);
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}", sec_tp);
}

// YYYY-MM-DDTHH:MM:SS.mmmZ
[[nodiscard]] inline auto
format_iso8601_millis(std::chrono::system_clock::time_point tp)
    -> std::string {
  if (tp == std::chrono::system_clock::time_point{})
    return {};
  auto const ms_tp = std::chrono::floor<std::chrono::milliseconds>(tp);
  return std::format("{:%Y-%m-%dT%H:%M:%S}Z", ms_tp);
}

[[nodiscard]] inline auto format_timestamp() -> std::string {
  return format_iso8601(std::chrono::system_clock::now());
}

[[nodiscard]] inline auto
to_unix_millis(std::chrono::system_clock::time_point tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto elapsed_ms(std::chrono::steady_clock::time_point since)
    -> double {
  return std::chrono::duration<double, std::milli>(
             std::chrono::steady_clock::now() - since)
      .count();
}

} // namespace crawlforge::util
