#pragma once

#include "crawlforge/util/enum.hpp"
#include "crawlforge/util/id.hpp"
#include "crawlforge/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace crawlforge {

enum class TaskStatus : std::uint8_t {
  Pending,
  Running,
  Stopping,
  Completed,
  Failed,
  Stopped,
};
BOOST_DESCRIBE_ENUM(TaskStatus, Pending, Running, Stopping, Completed, Failed,
                    Stopped)
CRAWLFORGE_DEFINE_ENUM_SERDE(TaskStatus, TaskStatus::Pending)

[[nodiscard]] constexpr auto is_terminal(TaskStatus s) noexcept -> bool {
  return s == TaskStatus::Completed || s == TaskStatus::Failed ||
         s == TaskStatus::Stopped;
}

/// Summary a job reports when it finishes.
struct JobSummary {
  std::string close_reason{"finished"};
  std::uint64_t items_scraped{0};
  std::uint64_t items_dropped{0};
  std::int64_t duration_ms{0};
};

struct LaunchOptions {
  int priority{1};
  int timeout_sec{3600};
};

struct TaskRecord {
  TaskId task_id;
  std::string spider_name;
  JsonValue kwargs;
  TaskStatus status{TaskStatus::Pending};
  int priority{1};
  int timeout_sec{3600};
  std::chrono::system_clock::time_point start_time{};
  std::optional<std::chrono::system_clock::time_point> end_time;
  std::uint64_t items_count{0};
  std::optional<std::string> failure_reason;
  std::optional<JobSummary> result;
};

} // namespace crawlforge
