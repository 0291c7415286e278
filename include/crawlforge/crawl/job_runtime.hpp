#pragma once

#include "crawlforge/core/coroutine.hpp"
#include "crawlforge/core/error.hpp"
#include "crawlforge/crawl/job_context.hpp"
#include "crawlforge/crawl/spider.hpp"
#include "crawlforge/crawl/task_record.hpp"
#include "crawlforge/util/id.hpp"
#include "crawlforge/util/json.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace crawlforge {

using CompleteFn = std::function<void(const TaskId &, JobSummary)>;
using FailFn = std::function<void(const TaskId &, std::string)>;

class JobRuntime;

/// A launched job. Holders may outlive the job itself; the outcome is
/// buffered until a sink is attached and delivered exactly once.
class Job {
public:
  Job(SpiderRequest request, std::unique_ptr<ISpider> spider,
      const JobSettings &settings, IngestFn ingest,
      boost::asio::any_io_executor engine);

  [[nodiscard]] auto task_id() const noexcept -> const TaskId & {
    return context_.task_id();
  }
  [[nodiscard]] auto spider_name() const noexcept -> const std::string & {
    return context_.spider_name();
  }
  [[nodiscard]] auto finished() const noexcept -> bool {
    return finished_.load(std::memory_order_acquire);
  }

private:
  friend class JobRuntime;

  struct Outcome {
    bool succeeded{false};
    JobSummary summary;
    std::string reason;
  };

  using Teardown =
      boost::asio::experimental::concurrent_channel<void(
          boost::system::error_code)>;

  auto resolve(Outcome outcome) -> void;
  auto attach(CompleteFn on_complete) -> void;
  auto attach(FailFn on_fail) -> void;
  auto deliver(std::unique_lock<std::mutex> lock) -> void;

  JobContext context_;
  std::unique_ptr<ISpider> spider_;
  Teardown teardown_;
  std::atomic<bool> finished_{false};

  std::mutex mutex_;
  std::optional<Outcome> outcome_;
  CompleteFn on_complete_;
  FailFn on_fail_;
  bool delivered_{false};
};

using JobHandle = std::shared_ptr<Job>;

/// Hosts spider jobs on a dedicated engine thread, isolated from the
/// request runtime. Thread-safe.
class JobRuntime {
public:
  JobRuntime(JobSettings settings, IngestFn ingest);
  ~JobRuntime();

  JobRuntime(const JobRuntime &) = delete;
  JobRuntime &operator=(const JobRuntime &) = delete;

  auto start() -> void;
  /// Requests a stop on every live job, waits up to `grace` for them to
  /// unwind, then stops the engine.
  auto stop(std::chrono::milliseconds grace = std::chrono::seconds(5)) -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto spiders() noexcept -> SpiderFactory & { return factory_; }
  [[nodiscard]] auto spiders() const noexcept -> const SpiderFactory & {
    return factory_;
  }

  /// Error::LaunchFailed when the spider is unknown or refuses the kwargs,
  /// Error::SystemNotRunning when the engine is down.
  [[nodiscard]] auto launch(std::string spider_name, TaskId task_id,
                            JsonValue kwargs) -> Result<JobHandle>;

  /// Each job delivers exactly one of these. Sinks run on the engine
  /// thread, or on the caller's thread when the job already finished.
  auto on_complete(const JobHandle &job, CompleteFn fn) -> void;
  auto on_fail(const JobHandle &job, FailFn fn) -> void;

  [[nodiscard]] auto find_handle(const TaskId &task_id) const
      -> std::optional<JobHandle>;

  /// True when the job tore down within `timeout`.
  [[nodiscard]] auto request_stop(JobHandle job,
                                  std::chrono::milliseconds timeout)
      -> task<bool>;

  [[nodiscard]] auto active_jobs() const -> std::size_t;

private:
  auto run_job(JobHandle job) -> task<void>;

  JobSettings settings_;
  IngestFn ingest_;
  SpiderFactory factory_;

  boost::asio::io_context engine_{1};
  std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::jthread thread_;
  std::atomic<bool> running_{false};

  mutable std::mutex jobs_mutex_;
  ankerl::unordered_dense::map<TaskId, JobHandle> jobs_;
};

} // namespace crawlforge
