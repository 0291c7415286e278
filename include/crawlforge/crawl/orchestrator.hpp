#pragma once

#include "crawlforge/config/system_config.hpp"
#include "crawlforge/core/coroutine.hpp"
#include "crawlforge/core/error.hpp"
#include "crawlforge/core/runtime.hpp"
#include "crawlforge/crawl/job_runtime.hpp"
#include "crawlforge/crawl/result_store.hpp"
#include "crawlforge/crawl/task_registry.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace crawlforge {

struct OrchestratorOptions {
  std::vector<std::string> allowed_spiders;
  int max_concurrent_spiders{5};
  int default_timeout_sec{3600};
  std::chrono::milliseconds stop_timeout{std::chrono::seconds(30)};
  JobSettings job{};

  [[nodiscard]] static auto from(const CrawlerConfig &config)
      -> OrchestratorOptions;
};

struct RunRequest {
  std::string spider_name;
  JsonValue kwargs = JsonValue::object_t{};
  int priority{1};
  std::optional<int> timeout_sec;
};

struct CrawlStats {
  std::size_t total_tasks{0};
  std::uint64_t total_items{0};
  /// completed / (completed + failed), as a percentage.
  double success_rate{0.0};
  StatusCounts by_status{};
  /// Most recently started first.
  std::vector<TaskRecord> recent;
};

/// Public face of the crawl core: wires the registry, the job runtime and
/// the result store together. Terminal job signals are applied on the
/// request runtime; see start().
class Orchestrator {
public:
  /// Called on the request runtime after a task reaches COMPLETED.
  using CompletionHook = std::function<void(const TaskRecord &)>;

  Orchestrator(Runtime &runtime, ResultStore &results,
               OrchestratorOptions options,
               TaskRegistry::IdGenerator id_generator = &generate_task_id);
  ~Orchestrator();

  Orchestrator(const Orchestrator &) = delete;
  Orchestrator &operator=(const Orchestrator &) = delete;

  auto start_engine() -> void;
  /// Asks live jobs to stop and shuts the crawl engine down.
  auto stop_engine(std::chrono::milliseconds grace) -> void;

  /// Normalizes the request in place. Returns a description of the first
  /// violated rule.
  [[nodiscard]] auto check_run_request(RunRequest &request) const
      -> std::optional<std::string>;

  /// Creates the task, launches its job and returns without waiting for it.
  /// A launch failure is recorded on the task and the id is still
  /// returned. Error::InvalidArgument for a bad request,
  /// Error::ResourceExhausted when max_concurrent_spiders is reached.
  [[nodiscard]] auto start(RunRequest request) -> Result<TaskId>;

  [[nodiscard]] auto status(const TaskId &id) const -> Result<TaskRecord>;
  [[nodiscard]] auto list() const -> TaskSnapshot;

  /// Error::NotFound for an unknown task; false when the task is not
  /// RUNNING. Otherwise waits up to stop_timeout for the job to tear down
  /// and finalizes STOPPED either way.
  [[nodiscard]] auto stop(TaskId id) -> task<Result<bool>>;

  /// Stores a batch of records for the task and counts them.
  [[nodiscard]] auto ingest(TaskId id, std::vector<std::string> records)
      -> task<Result<void>>;

  [[nodiscard]] auto results(TaskId id, std::uint64_t offset,
                             std::uint64_t limit) -> task<Result<ResultPage>>;

  [[nodiscard]] auto stats(std::size_t recent_limit = 10) const -> CrawlStats;

  auto set_completion_hook(CompletionHook hook) -> void {
    completion_hook_ = std::move(hook);
  }

  [[nodiscard]] auto registry() noexcept -> TaskRegistry & {
    return registry_;
  }
  [[nodiscard]] auto jobs() noexcept -> JobRuntime & { return jobs_; }
  [[nodiscard]] auto options() const noexcept -> const OrchestratorOptions & {
    return options_;
  }

private:
  auto on_job_completed(const TaskId &id, JobSummary summary) -> void;
  auto on_job_failed(const TaskId &id, std::string reason) -> void;

  Runtime &runtime_;
  ResultStore &results_;
  OrchestratorOptions options_;
  TaskRegistry registry_;
  JobRuntime jobs_;
  CompletionHook completion_hook_;
};

} // namespace crawlforge
