#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace crawlforge {

inline constexpr std::string_view kVersion = "1.0.0";
inline constexpr std::string_view kServiceName = "crawlforge";

namespace api {
constexpr std::size_t kRecentTasks = 10;
constexpr std::int64_t kDefaultResultLimit = 100;
constexpr std::int64_t kMaxResultLimit = 1000;
} // namespace api

namespace timing {
constexpr auto kShutdownPollInterval = std::chrono::milliseconds(50);
constexpr auto kDaemonPollInterval = std::chrono::milliseconds(100);
constexpr auto kEngineGracePeriod = std::chrono::seconds(5);
constexpr auto kProbeTimeout = std::chrono::seconds(2);
} // namespace timing

} // namespace crawlforge
