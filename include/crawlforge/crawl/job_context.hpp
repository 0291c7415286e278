#pragma once

#include "crawlforge/core/coroutine.hpp"
#include "crawlforge/core/error.hpp"
#include "crawlforge/crawl/item_pipeline.hpp"
#include "crawlforge/util/id.hpp"
#include "crawlforge/util/json.hpp"

#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace crawlforge {

/// Delivers a batch of serialized records for a task to the result store.
using IngestFn = std::function<task<Result<void>>(const TaskId &,
                                                  std::vector<std::string>)>;

struct JobSettings {
  PipelineOptions pipeline{};
  std::size_t batch_size{50};
  std::uint64_t default_max_items{1000};
};

/// What a running spider sees of the engine. Lives on the crawl engine
/// thread; request_stop() must be invoked there too.
class JobContext {
public:
  JobContext(TaskId task_id, std::string spider_name, JsonValue kwargs,
             const JobSettings &settings, IngestFn ingest);

  JobContext(const JobContext &) = delete;
  JobContext &operator=(const JobContext &) = delete;

  [[nodiscard]] auto task_id() const noexcept -> const TaskId & {
    return task_id_;
  }
  [[nodiscard]] auto spider_name() const noexcept -> const std::string & {
    return spider_name_;
  }
  [[nodiscard]] auto kwargs() const noexcept -> const JsonValue & {
    return kwargs_;
  }

  /// Run an item through the pipeline and queue it for ingestion. Items
  /// rejected by the pipeline, or emitted after close(), are not errors.
  /// Fails only when a batch cannot be delivered.
  [[nodiscard]] auto emit(JsonValue item) -> task<Result<void>>;
  [[nodiscard]] auto flush() -> task<Result<void>>;

  /// Sleep for `d`. Returns false when woken early by a stop request.
  [[nodiscard]] auto sleep(std::chrono::milliseconds d) -> task<bool>;

  /// True once a stop was requested or the job closed itself.
  [[nodiscard]] auto stop_requested() const noexcept -> bool {
    return stop_requested_ || !close_reason_.empty();
  }
  /// Finish voluntarily with `reason` (e.g. "max_items_reached").
  auto close(std::string reason) -> void;
  [[nodiscard]] auto close_reason() const noexcept -> const std::string & {
    return close_reason_;
  }

  /// Callbacks run once, on the first stop request.
  auto on_stop(std::function<void()> hook) -> void;
  auto request_stop() -> void;
  /// Drops stop hooks; later stop requests become no-ops.
  auto mark_finished() -> void;

  /// Human-readable reason reported if the spider fails.
  auto set_failure(std::string reason) -> void {
    failure_ = std::move(reason);
  }
  [[nodiscard]] auto failure() const noexcept -> const std::string & {
    return failure_;
  }

  [[nodiscard]] auto items_scraped() const noexcept -> std::uint64_t {
    return pipeline_.accepted();
  }
  [[nodiscard]] auto items_dropped() const noexcept -> std::uint64_t {
    return pipeline_.dropped();
  }

private:
  auto wake_sleepers() -> void;

  TaskId task_id_;
  std::string spider_name_;
  JsonValue kwargs_;
  ItemPipeline pipeline_;
  IngestFn ingest_;
  std::size_t batch_size_;
  std::uint64_t max_items_;
  std::vector<std::string> pending_;
  std::vector<boost::asio::steady_timer *> sleepers_;
  std::vector<std::function<void()>> stop_hooks_;
  bool stop_requested_{false};
  bool finished_{false};
  std::string close_reason_;
  std::string failure_;
};

} // namespace crawlforge
