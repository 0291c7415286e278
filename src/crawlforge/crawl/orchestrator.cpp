#include "crawlforge/crawl/orchestrator.hpp"

#include "crawlforge/util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <ranges>
#include <utility>

namespace crawlforge {

namespace {

inline constexpr int kMinPriority = 1;
inline constexpr int kMaxPriority = 10;
inline constexpr int kMinTimeoutSec = 60;

[[nodiscard]] auto trim(std::string_view s) -> std::string_view {
  constexpr std::string_view kSpace = " \t\r\n";
  const auto first = s.find_first_not_of(kSpace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(kSpace);
  return s.substr(first, last - first + 1);
}

} // namespace

auto OrchestratorOptions::from(const CrawlerConfig &config)
    -> OrchestratorOptions {
  return OrchestratorOptions{
      .allowed_spiders = config.allowed_spiders,
      .max_concurrent_spiders = config.max_concurrent_spiders,
      .default_timeout_sec = config.default_timeout_sec,
      .stop_timeout = std::chrono::seconds(config.stop_timeout_sec),
      .job = JobSettings{
          .pipeline = PipelineOptions{.validate_urls = config.validate_items,
                                      .deduplicate = config.deduplicate_items},
          .batch_size = static_cast<std::size_t>(config.ingest_batch_size),
      },
  };
}

Orchestrator::Orchestrator(Runtime &runtime, ResultStore &results,
                           OrchestratorOptions options,
                           TaskRegistry::IdGenerator id_generator)
    : runtime_(runtime), results_(results), options_(std::move(options)),
      registry_(std::move(id_generator)),
      jobs_(options_.job,
            [this](const TaskId &id,
                   std::vector<std::string> records) -> task<Result<void>> {
              // Hop from the crawl engine onto a request shard for the
              // store write; resumes back on the engine afterwards.
              co_return co_await boost::asio::co_spawn(
                  runtime_.executor_for(runtime_.next_external_shard()),
                  ingest(id, std::move(records)), boost::asio::use_awaitable);
            }) {}

Orchestrator::~Orchestrator() = default;

auto Orchestrator::start_engine() -> void { jobs_.start(); }

auto Orchestrator::stop_engine(std::chrono::milliseconds grace) -> void {
  jobs_.stop(grace);
}

auto Orchestrator::check_run_request(RunRequest &request) const
    -> std::optional<std::string> {
  request.spider_name = std::string(trim(request.spider_name));
  if (request.spider_name.empty()) {
    return "spider_name must not be empty";
  }
  if (!std::ranges::contains(options_.allowed_spiders, request.spider_name)) {
    return std::format("spider '{}' is not allowed", request.spider_name);
  }
  if (!request.kwargs.is_object()) {
    return "spider_kwargs must be an object";
  }
  if (request.priority < kMinPriority || request.priority > kMaxPriority) {
    return std::format("priority must be between {} and {}", kMinPriority,
                       kMaxPriority);
  }
  if (request.timeout_sec && *request.timeout_sec < kMinTimeoutSec) {
    return std::format("timeout must be at least {} seconds", kMinTimeoutSec);
  }
  return std::nullopt;
}

auto Orchestrator::start(RunRequest request) -> Result<TaskId> {
  if (auto violation = check_run_request(request)) {
    log::warn("rejected run request: {}", *violation);
    return fail(Error::InvalidArgument);
  }
  const auto ceiling = options_.max_concurrent_spiders > 0
                           ? static_cast<std::size_t>(
                                 options_.max_concurrent_spiders)
                           : std::size_t{0};
  auto created = registry_.try_create(
      request.spider_name, request.kwargs,
      LaunchOptions{.priority = request.priority,
                    .timeout_sec = request.timeout_sec.value_or(
                        options_.default_timeout_sec)},
      ceiling);
  if (!created) {
    log::warn("refusing '{}': {} spiders already active", request.spider_name,
              options_.max_concurrent_spiders);
    return fail(created.error());
  }
  auto id = std::move(*created);

  auto job = jobs_.launch(request.spider_name, id, std::move(request.kwargs));
  if (!job) {
    auto reason = std::format("failed to launch spider '{}': {}",
                              request.spider_name, job.error().message());
    log::error("[{}] {}", id, reason);
    if (auto recorded = registry_.fail(id, std::move(reason)); !recorded) {
      log::error("[{}] cannot record launch failure: {}", id,
                 recorded.error().message());
    }
    return ok(std::move(id));
  }

  if (auto running = registry_.mark_running(id); !running) {
    log::error("[{}] cannot mark running: {}", id, running.error().message());
    return fail(running.error());
  }

  // Sinks are attached only now, so a job that already finished cannot
  // overtake the RUNNING transition.
  const auto home = runtime_.current_shard() == kInvalidShard
                        ? runtime_.next_external_shard()
                        : runtime_.current_shard();
  jobs_.on_complete(*job, [this, home](const TaskId &task_id,
                                       JobSummary summary) {
    runtime_.post_to(home, [this, task_id, summary = std::move(summary)] {
      on_job_completed(task_id, summary);
    });
  });
  jobs_.on_fail(*job, [this, home](const TaskId &task_id, std::string reason) {
    runtime_.post_to(home, [this, task_id, reason = std::move(reason)] {
      on_job_failed(task_id, reason);
    });
  });

  log::info("[{}] task started: spider={} priority={}", id,
            request.spider_name, request.priority);
  return ok(std::move(id));
}

auto Orchestrator::on_job_completed(const TaskId &id, JobSummary summary)
    -> void {
  auto applied = registry_.complete(id, std::move(summary));
  if (!applied) {
    log::warn("[{}] completion for unknown task", id);
    return;
  }
  if (!*applied) {
    log::info("[{}] completion ignored, task is being stopped", id);
    return;
  }
  auto record = registry_.get(id);
  if (!record) {
    return;
  }
  log::info("[{}] task completed: items={}", id, record->items_count);
  if (completion_hook_) {
    completion_hook_(*record);
  }
}

auto Orchestrator::on_job_failed(const TaskId &id, std::string reason)
    -> void {
  auto applied = registry_.fail(id, reason);
  if (!applied) {
    log::warn("[{}] failure for unknown task", id);
    return;
  }
  if (!*applied) {
    log::info("[{}] failure ignored, task is being stopped: {}", id, reason);
    return;
  }
  log::warn("[{}] task failed: {}", id, reason);
}

auto Orchestrator::status(const TaskId &id) const -> Result<TaskRecord> {
  auto record = registry_.get(id);
  if (!record) {
    return fail(Error::NotFound);
  }
  return ok(std::move(*record));
}

auto Orchestrator::list() const -> TaskSnapshot { return registry_.list_all(); }

auto Orchestrator::stop(TaskId id) -> task<Result<bool>> {
  if (!registry_.contains(id)) {
    co_return fail(Error::NotFound);
  }
  if (!registry_.begin_stop(id)) {
    co_return false;
  }

  if (auto handle = jobs_.find_handle(id)) {
    const bool torn_down =
        co_await jobs_.request_stop(std::move(*handle), options_.stop_timeout);
    if (!torn_down) {
      log::warn("[{}] job did not stop within {}ms, forcing STOPPED", id,
                options_.stop_timeout.count());
    }
  } else {
    log::info("[{}] no live job for task, finalizing stop", id);
  }

  if (auto finalized = registry_.finalize_stop(id); !finalized) {
    log::error("[{}] cannot finalize stop: {}", id,
               finalized.error().message());
    co_return fail(finalized.error());
  }
  log::info("[{}] task stopped", id);
  co_return true;
}

auto Orchestrator::ingest(TaskId id, std::vector<std::string> records)
    -> task<Result<void>> {
  if (!registry_.contains(id)) {
    co_return fail(Error::NotFound);
  }
  const auto count = records.size();
  auto stored = co_await results_.append(id, std::move(records));
  if (!stored) {
    log::error("[{}] failed to store {} record(s): {}", id, count,
               stored.error().message());
    co_return fail(stored.error());
  }
  if (auto counted = registry_.add_items(id, count); !counted) {
    co_return fail(counted.error());
  }
  log::debug("[{}] stored {} record(s), {} total", id, count, *stored);
  co_return ok();
}

auto Orchestrator::results(TaskId id, std::uint64_t offset,
                           std::uint64_t limit) -> task<Result<ResultPage>> {
  if (!registry_.contains(id)) {
    co_return fail(Error::NotFound);
  }
  co_return co_await results_.read(id, offset, limit);
}

auto Orchestrator::stats(std::size_t recent_limit) const -> CrawlStats {
  auto snapshot = registry_.list_all();
  CrawlStats out;
  out.total_tasks = snapshot.size();

  std::vector<TaskRecord> records;
  records.reserve(snapshot.size());
  for (auto &&[id, record] : snapshot) {
    out.total_items += record.items_count;
    ++out.by_status[std::to_underlying(record.status)];
    records.push_back(std::move(record));
  }

  const auto completed = out.by_status[std::to_underlying(TaskStatus::Completed)];
  const auto failed = out.by_status[std::to_underlying(TaskStatus::Failed)];
  if (completed + failed > 0) {
    const double rate = static_cast<double>(completed) * 100.0 /
                        static_cast<double>(completed + failed);
    out.success_rate = std::round(rate * 100.0) / 100.0;
  }

  std::ranges::sort(records, std::ranges::greater{}, &TaskRecord::start_time);
  if (records.size() > recent_limit) {
    records.resize(recent_limit);
  }
  out.recent = std::move(records);
  return out;
}

} // namespace crawlforge
