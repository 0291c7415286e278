#include "crawlforge/crawl/job_runtime.hpp"

#include "crawlforge/core/asio_awaitable.hpp"
#include "crawlforge/util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>

#include <format>
#include <vector>

namespace crawlforge {

Job::Job(SpiderRequest request, std::unique_ptr<ISpider> spider,
         const JobSettings &settings, IngestFn ingest,
         boost::asio::any_io_executor engine)
    : context_(std::move(request.task_id), std::move(request.spider_name),
               std::move(request.kwargs), settings, std::move(ingest)),
      spider_(std::move(spider)), teardown_(std::move(engine)) {}

auto Job::resolve(Outcome outcome) -> void {
  std::unique_lock lock(mutex_);
  if (outcome_) {
    return;
  }
  outcome_ = std::move(outcome);
  deliver(std::move(lock));
}

auto Job::attach(CompleteFn on_complete) -> void {
  std::unique_lock lock(mutex_);
  on_complete_ = std::move(on_complete);
  deliver(std::move(lock));
}

auto Job::attach(FailFn on_fail) -> void {
  std::unique_lock lock(mutex_);
  on_fail_ = std::move(on_fail);
  deliver(std::move(lock));
}

auto Job::deliver(std::unique_lock<std::mutex> lock) -> void {
  if (!outcome_ || delivered_) {
    return;
  }
  if (outcome_->succeeded && on_complete_) {
    delivered_ = true;
    auto fn = std::move(on_complete_);
    auto summary = outcome_->summary;
    lock.unlock();
    fn(task_id(), std::move(summary));
  } else if (!outcome_->succeeded && on_fail_) {
    delivered_ = true;
    auto fn = std::move(on_fail_);
    auto reason = outcome_->reason;
    lock.unlock();
    fn(task_id(), std::move(reason));
  }
}

JobRuntime::JobRuntime(JobSettings settings, IngestFn ingest)
    : settings_(settings), ingest_(std::move(ingest)) {}

JobRuntime::~JobRuntime() { stop(std::chrono::milliseconds(0)); }

auto JobRuntime::start() -> void {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  engine_.restart();
  work_guard_.emplace(engine_.get_executor());
  thread_ = std::jthread([this] {
    log::debug("crawl engine thread started");
    engine_.run();
    log::debug("crawl engine thread exited");
  });
}

auto JobRuntime::stop(std::chrono::milliseconds grace) -> void {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  std::vector<JobHandle> live;
  {
    std::lock_guard lock(jobs_mutex_);
    for (const auto &[id, job] : jobs_) {
      live.push_back(job);
    }
  }
  for (auto &job : live) {
    boost::asio::post(engine_, [job] { job->context_.request_stop(); });
  }

  const auto deadline = std::chrono::steady_clock::now() + grace;
  while (active_jobs() > 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (auto remaining = active_jobs(); remaining > 0) {
    log::warn("crawl engine stopping with {} job(s) still running", remaining);
  }

  work_guard_.reset();
  engine_.stop();
  if (thread_.joinable()) {
    thread_.join();
  }
}

auto JobRuntime::launch(std::string spider_name, TaskId task_id,
                        JsonValue kwargs) -> Result<JobHandle> {
  if (!is_running()) {
    return fail(Error::SystemNotRunning);
  }

  SpiderRequest request{.task_id = std::move(task_id),
                        .spider_name = std::move(spider_name),
                        .kwargs = std::move(kwargs)};
  auto spider = factory_.create(request);
  if (!spider) {
    log::warn("[{}] cannot launch spider '{}': {}", request.task_id,
              request.spider_name, spider.error().message());
    return fail(Error::LaunchFailed);
  }

  auto job = std::make_shared<Job>(std::move(request), std::move(*spider),
                                   settings_, ingest_, engine_.get_executor());
  {
    std::lock_guard lock(jobs_mutex_);
    jobs_.insert_or_assign(job->task_id(), job);
  }

  boost::asio::co_spawn(engine_, run_job(job),
                        [id = job->task_id()](std::exception_ptr ep) {
                          if (!ep) {
                            return;
                          }
                          try {
                            std::rethrow_exception(ep);
                          } catch (const std::exception &ex) {
                            log::error("[{}] job coroutine aborted: {}", id,
                                       ex.what());
                          }
                        });
  log::info("[{}] launched spider '{}'", job->task_id(), job->spider_name());
  return ok(std::move(job));
}

auto JobRuntime::on_complete(const JobHandle &job, CompleteFn fn) -> void {
  job->attach(std::move(fn));
}

auto JobRuntime::on_fail(const JobHandle &job, FailFn fn) -> void {
  job->attach(std::move(fn));
}

auto JobRuntime::find_handle(const TaskId &task_id) const
    -> std::optional<JobHandle> {
  std::lock_guard lock(jobs_mutex_);
  auto it = jobs_.find(task_id);
  if (it == jobs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto JobRuntime::request_stop(JobHandle job, std::chrono::milliseconds timeout)
    -> task<bool> {
  if (!job || job->finished()) {
    co_return true;
  }
  boost::asio::post(engine_, [job] { job->context_.request_stop(); });

  boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor,
                                  timeout);
  using namespace boost::asio::experimental::awaitable_operators;
  auto winner = co_await (job->teardown_.async_receive(use_nothrow) ||
                          timer.async_wait(use_nothrow));
  co_return winner.index() == 0;
}

auto JobRuntime::active_jobs() const -> std::size_t {
  std::lock_guard lock(jobs_mutex_);
  return jobs_.size();
}

auto JobRuntime::run_job(JobHandle job) -> task<void> {
  const auto started = std::chrono::steady_clock::now();
  auto &ctx = job->context_;

  Result<void> result = ok();
  try {
    result = co_await job->spider_->run(ctx);
  } catch (const std::exception &ex) {
    ctx.set_failure(ex.what());
    result = fail(Error::Unknown);
  }
  ctx.mark_finished();

  // Items already harvested are kept even when the spider failed.
  auto flushed = co_await ctx.flush();
  if (result && !flushed) {
    ctx.set_failure(
        std::format("result ingest failed: {}", flushed.error().message()));
    result = flushed;
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  Job::Outcome outcome{
      .succeeded = result.has_value(),
      .summary = JobSummary{.close_reason = ctx.close_reason().empty()
                                                ? "finished"
                                                : ctx.close_reason(),
                            .items_scraped = ctx.items_scraped(),
                            .items_dropped = ctx.items_dropped(),
                            .duration_ms = elapsed.count()},
  };
  if (!result) {
    outcome.reason = ctx.failure().empty() ? result.error().message()
                                           : ctx.failure();
    log::warn("[{}] spider '{}' failed: {}", job->task_id(),
              job->spider_name(), outcome.reason);
  } else {
    log::info("[{}] spider '{}' finished: reason={} items={} dropped={} "
              "duration={}ms",
              job->task_id(), job->spider_name(), outcome.summary.close_reason,
              outcome.summary.items_scraped, outcome.summary.items_dropped,
              outcome.summary.duration_ms);
  }

  job->resolve(std::move(outcome));
  {
    std::lock_guard lock(jobs_mutex_);
    if (auto it = jobs_.find(job->task_id());
        it != jobs_.end() && it->second == job) {
      jobs_.erase(it);
    }
  }
  job->finished_.store(true, std::memory_order_release);
  job->teardown_.close();
}

} // namespace crawlforge
