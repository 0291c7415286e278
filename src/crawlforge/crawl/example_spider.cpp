#include "crawlforge/core/runtime.hpp"
#include "crawlforge/crawl/spider.hpp"
#include "crawlforge/util/log.hpp"

#include <chrono>
#include <format>

namespace crawlforge {

namespace {

inline constexpr std::string_view kDefaultBaseUrl = "https://example.com/items";

struct ExampleSpiderOptions {
  std::int64_t count{10};
  std::chrono::milliseconds interval{50};
  std::string base_url{kDefaultBaseUrl};
  std::int64_t fail_after{-1};
  bool ignore_stop{false};
};

/// Synthetic spider: emits `count` items spaced `interval_ms` apart.
/// `fail_after` simulates a crash and `ignore_stop` a spider that does not
/// cooperate with stop requests.
class ExampleSpider final : public ISpider {
public:
  explicit ExampleSpider(ExampleSpiderOptions options)
      : options_(std::move(options)) {}

  auto run(JobContext &ctx) -> task<Result<void>> override {
    log::info("[{}] example_spider starting: count={} interval={}ms",
              ctx.task_id(), options_.count, options_.interval.count());

    for (std::int64_t i = 0; i < options_.count; ++i) {
      if (options_.fail_after >= 0 && i == options_.fail_after) {
        ctx.set_failure(std::format("simulated failure after {} items", i));
        co_return fail(Error::Unknown);
      }
      if (!options_.ignore_stop && ctx.stop_requested()) {
        break;
      }

      JsonValue item = JsonValue::object_t{};
      auto &fields = item.get_object();
      fields["url"] = std::format("{}/{}", options_.base_url, i);
      fields["title"] = std::format("Item {}", i);
      fields["index"] = i;
      if (auto r = co_await ctx.emit(std::move(item)); !r) {
        co_return r;
      }

      if (options_.interval.count() > 0 && i + 1 < options_.count) {
        if (options_.ignore_stop) {
          co_await async_sleep(options_.interval);
        } else if (!co_await ctx.sleep(options_.interval)) {
          break;
        }
      }
    }
    co_return ok();
  }

private:
  ExampleSpiderOptions options_;
};

} // namespace

auto create_example_spider(const SpiderRequest &request)
    -> Result<std::unique_ptr<ISpider>> {
  ExampleSpiderOptions options{
      .count = json_int(request.kwargs, "count", 10),
      .interval = std::chrono::milliseconds(
          json_int(request.kwargs, "interval_ms", 50)),
      .fail_after = json_int(request.kwargs, "fail_after", -1),
      .ignore_stop = json_bool(request.kwargs, "ignore_stop", false),
  };
  if (const auto *base = json_string(request.kwargs, "base_url")) {
    options.base_url = *base;
  }
  if (options.count < 0 || options.interval.count() < 0) {
    log::warn("[{}] example_spider rejected kwargs: count={} interval_ms={}",
              request.task_id, options.count, options.interval.count());
    return fail(Error::LaunchFailed);
  }
  return std::make_unique<ExampleSpider>(std::move(options));
}

} // namespace crawlforge
