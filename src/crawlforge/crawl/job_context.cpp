#include "crawlforge/crawl/job_context.hpp"

#include "crawlforge/core/asio_awaitable.hpp"
#include "crawlforge/util/log.hpp"

#include <boost/asio/this_coro.hpp>

#include <algorithm>

namespace crawlforge {

JobContext::JobContext(TaskId task_id, std::string spider_name,
                       JsonValue kwargs, const JobSettings &settings,
                       IngestFn ingest)
    : task_id_(std::move(task_id)), spider_name_(std::move(spider_name)),
      kwargs_(std::move(kwargs)),
      pipeline_(settings.pipeline, task_id_, spider_name_),
      ingest_(std::move(ingest)), batch_size_(std::max<std::size_t>(
                                      1, settings.batch_size)),
      max_items_(static_cast<std::uint64_t>(std::max<std::int64_t>(
          1, json_int(kwargs_, "max_items",
                      static_cast<std::int64_t>(settings.default_max_items))))) {
}

auto JobContext::emit(JsonValue item) -> task<Result<void>> {
  if (!close_reason_.empty()) {
    co_return ok();
  }
  auto record = pipeline_.process(std::move(item));
  if (!record) {
    co_return ok();
  }
  pending_.push_back(std::move(*record));

  if (pipeline_.accepted() >= max_items_) {
    log::info("[{}] reached max_items={}, closing", task_id_, max_items_);
    close("max_items_reached");
  }
  if (pending_.size() >= batch_size_) {
    co_return co_await flush();
  }
  co_return ok();
}

auto JobContext::flush() -> task<Result<void>> {
  if (pending_.empty()) {
    co_return ok();
  }
  std::vector<std::string> batch;
  batch.swap(pending_);
  co_return co_await ingest_(task_id_, std::move(batch));
}

auto JobContext::sleep(std::chrono::milliseconds d) -> task<bool> {
  if (stop_requested()) {
    co_return false;
  }
  boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor, d);
  sleepers_.push_back(&timer);
  auto [ec] = co_await timer.async_wait(use_nothrow);
  std::erase(sleepers_, &timer);
  co_return !ec && !stop_requested();
}

auto JobContext::wake_sleepers() -> void {
  for (auto *timer : sleepers_) {
    timer->cancel();
  }
}

auto JobContext::close(std::string reason) -> void {
  if (close_reason_.empty()) {
    close_reason_ = std::move(reason);
  }
  wake_sleepers();
}

auto JobContext::on_stop(std::function<void()> hook) -> void {
  if (finished_) {
    return;
  }
  if (stop_requested_) {
    hook();
    return;
  }
  stop_hooks_.push_back(std::move(hook));
}

auto JobContext::request_stop() -> void {
  if (finished_ || stop_requested_) {
    return;
  }
  stop_requested_ = true;
  if (close_reason_.empty()) {
    close_reason_ = "cancelled";
  }
  log::debug("[{}] stop requested", task_id_);
  wake_sleepers();
  auto hooks = std::move(stop_hooks_);
  stop_hooks_.clear();
  for (auto &hook : hooks) {
    hook();
  }
}

auto JobContext::mark_finished() -> void {
  finished_ = true;
  stop_hooks_.clear();
}

} // namespace crawlforge
