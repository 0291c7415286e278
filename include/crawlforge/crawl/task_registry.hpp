#pragma once

#include "crawlforge/core/error.hpp"
#include "crawlforge/crawl/task_record.hpp"

#include <ankerl/unordered_dense.h>

#include <array>
#include <cstdint>
#include <flat_map>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace crawlforge {

using TaskSnapshot = std::flat_map<TaskId, TaskRecord>;
using StatusCounts = std::array<std::size_t, 6>;

/// Owns every TaskRecord and applies state transitions. Each operation is
/// one critical section, so a status check and the write that depends on it
/// are never interleaved with another transition.
///
///   PENDING -> RUNNING -> STOPPING -> STOPPED
///                  \-> COMPLETED | FAILED
///   PENDING -> FAILED (launch failure)
class TaskRegistry {
public:
  using IdGenerator = std::function<TaskId()>;

  TaskRegistry();
  explicit TaskRegistry(IdGenerator generator);

  TaskRegistry(const TaskRegistry &) = delete;
  TaskRegistry &operator=(const TaskRegistry &) = delete;

  /// New PENDING record under a never-before-issued id.
  [[nodiscard]] auto create(std::string spider_name, JsonValue kwargs,
                            LaunchOptions options = {}) -> TaskId;

  /// As create(), but counts live tasks and inserts in one critical
  /// section. Error::ResourceExhausted when `max_active` non-terminal tasks
  /// already exist; 0 means no ceiling.
  [[nodiscard]] auto try_create(std::string spider_name, JsonValue kwargs,
                                LaunchOptions options, std::size_t max_active)
      -> Result<TaskId>;

  /// PENDING -> RUNNING.
  [[nodiscard]] auto mark_running(const TaskId &id) -> Result<void>;

  /// RUNNING -> COMPLETED. Yields false when the task was no longer RUNNING
  /// (a stop is in progress or already final) and nothing changed.
  auto complete(const TaskId &id, JobSummary summary) -> Result<bool>;

  /// RUNNING or PENDING -> FAILED, with the same guard as complete().
  auto fail(const TaskId &id, std::string reason) -> Result<bool>;

  /// RUNNING -> STOPPING. False for unknown or non-RUNNING tasks.
  [[nodiscard]] auto begin_stop(const TaskId &id) -> bool;

  /// STOPPING -> STOPPED.
  auto finalize_stop(const TaskId &id) -> Result<void>;

  /// Adds to items_count; yields the new total.
  auto add_items(const TaskId &id, std::uint64_t count)
      -> Result<std::uint64_t>;

  [[nodiscard]] auto get(const TaskId &id) const -> std::optional<TaskRecord>;
  [[nodiscard]] auto list_all() const -> TaskSnapshot;
  [[nodiscard]] auto contains(const TaskId &id) const -> bool;

  [[nodiscard]] auto count_by_status() const -> StatusCounts;
  /// Tasks not yet in a terminal state.
  [[nodiscard]] auto active_count() const -> std::size_t;

private:
  [[nodiscard]] auto find(const TaskId &id) -> TaskRecord *;
  auto finish(TaskRecord &record, TaskStatus status) -> void;
  auto insert(std::string spider_name, JsonValue kwargs,
              LaunchOptions options) -> TaskId;
  [[nodiscard]] auto count_active() const -> std::size_t;

  IdGenerator generator_;
  mutable std::mutex mutex_;
  ankerl::unordered_dense::map<TaskId, TaskRecord> tasks_;
};

} // namespace crawlforge
