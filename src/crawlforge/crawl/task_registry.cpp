#include "crawlforge/crawl/task_registry.hpp"

#include "crawlforge/util/log.hpp"

#include <algorithm>
#include <utility>

namespace crawlforge {

TaskRegistry::TaskRegistry() : TaskRegistry(&generate_task_id) {}

TaskRegistry::TaskRegistry(IdGenerator generator)
    : generator_(std::move(generator)) {}

auto TaskRegistry::find(const TaskId &id) -> TaskRecord * {
  auto it = tasks_.find(id);
  return it == tasks_.end() ? nullptr : &it->second;
}

auto TaskRegistry::finish(TaskRecord &record, TaskStatus status) -> void {
  record.status = status;
  if (!record.end_time) {
    record.end_time = std::chrono::system_clock::now();
  }
}

auto TaskRegistry::count_active() const -> std::size_t {
  return static_cast<std::size_t>(
      std::ranges::count_if(tasks_, [](const auto &entry) {
        return !is_terminal(entry.second.status);
      }));
}

auto TaskRegistry::create(std::string spider_name, JsonValue kwargs,
                          LaunchOptions options) -> TaskId {
  std::scoped_lock lock(mutex_);
  return insert(std::move(spider_name), std::move(kwargs), options);
}

auto TaskRegistry::try_create(std::string spider_name, JsonValue kwargs,
                              LaunchOptions options, std::size_t max_active)
    -> Result<TaskId> {
  std::scoped_lock lock(mutex_);
  if (max_active > 0 && count_active() >= max_active) {
    return crawlforge::fail(Error::ResourceExhausted);
  }
  return ok(insert(std::move(spider_name), std::move(kwargs), options));
}

auto TaskRegistry::insert(std::string spider_name, JsonValue kwargs,
                          LaunchOptions options) -> TaskId {
  auto id = generator_();
  // Records are never evicted, so this also rules out reuse of finished ids.
  while (id.empty() || tasks_.contains(id)) {
    log::warn("Generated task id '{}' collides; drawing another", id);
    id = generator_();
  }
  tasks_.emplace(id, TaskRecord{.task_id = id,
                                .spider_name = std::move(spider_name),
                                .kwargs = std::move(kwargs),
                                .status = TaskStatus::Pending,
                                .priority = options.priority,
                                .timeout_sec = options.timeout_sec,
                                .start_time = std::chrono::system_clock::now(),
                                .end_time = std::nullopt,
                                .items_count = 0,
                                .failure_reason = std::nullopt,
                                .result = std::nullopt});
  return id;
}

auto TaskRegistry::mark_running(const TaskId &id) -> Result<void> {
  std::scoped_lock lock(mutex_);
  auto *record = find(id);
  if (!record) {
    return crawlforge::fail(Error::NotFound);
  }
  if (record->status != TaskStatus::Pending) {
    return crawlforge::fail(Error::InvalidState);
  }
  record->status = TaskStatus::Running;
  return ok();
}

auto TaskRegistry::complete(const TaskId &id, JobSummary summary)
    -> Result<bool> {
  std::scoped_lock lock(mutex_);
  auto *record = find(id);
  if (!record) {
    return crawlforge::fail(Error::NotFound);
  }
  if (record->status != TaskStatus::Running) {
    log::debug("Ignoring completion of task {} in state {}", id,
               to_string_view(record->status));
    return ok(false);
  }
  record->result = std::move(summary);
  finish(*record, TaskStatus::Completed);
  return ok(true);
}

auto TaskRegistry::fail(const TaskId &id, std::string reason) -> Result<bool> {
  std::scoped_lock lock(mutex_);
  auto *record = find(id);
  if (!record) {
    return crawlforge::fail(Error::NotFound);
  }
  if (record->status != TaskStatus::Running &&
      record->status != TaskStatus::Pending) {
    log::debug("Ignoring failure of task {} in state {}: {}", id,
               to_string_view(record->status), reason);
    return ok(false);
  }
  record->failure_reason = std::move(reason);
  finish(*record, TaskStatus::Failed);
  return ok(true);
}

auto TaskRegistry::begin_stop(const TaskId &id) -> bool {
  std::scoped_lock lock(mutex_);
  auto *record = find(id);
  if (!record || record->status != TaskStatus::Running) {
    return false;
  }
  record->status = TaskStatus::Stopping;
  return true;
}

auto TaskRegistry::finalize_stop(const TaskId &id) -> Result<void> {
  std::scoped_lock lock(mutex_);
  auto *record = find(id);
  if (!record) {
    return crawlforge::fail(Error::NotFound);
  }
  if (record->status != TaskStatus::Stopping) {
    return crawlforge::fail(Error::InvalidState);
  }
  finish(*record, TaskStatus::Stopped);
  return ok();
}

auto TaskRegistry::add_items(const TaskId &id, std::uint64_t count)
    -> Result<std::uint64_t> {
  std::scoped_lock lock(mutex_);
  auto *record = find(id);
  if (!record) {
    return crawlforge::fail(Error::NotFound);
  }
  record->items_count += count;
  return ok(record->items_count);
}

auto TaskRegistry::get(const TaskId &id) const -> std::optional<TaskRecord> {
  std::scoped_lock lock(mutex_);
  auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto TaskRegistry::list_all() const -> TaskSnapshot {
  std::scoped_lock lock(mutex_);
  TaskSnapshot out;
  for (const auto &[id, record] : tasks_) {
    out.emplace(id, record);
  }
  return out;
}

auto TaskRegistry::contains(const TaskId &id) const -> bool {
  std::scoped_lock lock(mutex_);
  return tasks_.contains(id);
}

auto TaskRegistry::count_by_status() const -> StatusCounts {
  std::scoped_lock lock(mutex_);
  StatusCounts counts{};
  for (const auto &[id, record] : tasks_) {
    ++counts[std::to_underlying(record.status)];
  }
  return counts;
}

auto TaskRegistry::active_count() const -> std::size_t {
  std::scoped_lock lock(mutex_);
  return count_active();
}

} // namespace crawlforge
