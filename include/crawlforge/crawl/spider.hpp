#pragma once

#include "crawlforge/config/system_config.hpp"
#include "crawlforge/core/coroutine.hpp"
#include "crawlforge/core/error.hpp"
#include "crawlforge/crawl/job_context.hpp"
#include "crawlforge/util/id.hpp"
#include "crawlforge/util/json.hpp"

#include <flat_map>
#include <functional>
#include <memory>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

namespace crawlforge {

struct SpiderRequest {
  TaskId task_id;
  std::string spider_name;
  JsonValue kwargs;
};

/// A crawl job body. run() executes on the crawl engine thread and returns
/// once the spider is done, closed itself, or honoured a stop request.
class ISpider {
public:
  virtual ~ISpider() = default;

  [[nodiscard]] virtual auto run(JobContext &ctx) -> task<Result<void>> = 0;
};

inline constexpr std::string_view kExampleSpider = "example_spider";

[[nodiscard]] auto create_example_spider(const SpiderRequest &request)
    -> Result<std::unique_ptr<ISpider>>;

[[nodiscard]] auto create_process_spider(const ProcessSpiderConfig &config,
                                         const SpiderRequest &request)
    -> Result<std::unique_ptr<ISpider>>;

class SpiderFactory {
public:
  using Creator = std::move_only_function<Result<std::unique_ptr<ISpider>>(
      const SpiderRequest &) const>;

  SpiderFactory() {
    register_creator(std::string(kExampleSpider),
                     [](const SpiderRequest &request) {
                       return create_example_spider(request);
                     });
  }

  auto register_creator(std::string name, Creator creator) -> void {
    creators_.insert_or_assign(std::move(name), std::move(creator));
  }

  auto register_process_spiders(const std::vector<ProcessSpiderConfig> &spiders)
      -> void {
    for (const auto &entry : spiders) {
      register_creator(entry.name, [entry](const SpiderRequest &request) {
        return create_process_spider(entry, request);
      });
    }
  }

  /// Error::LaunchFailed when nothing is registered under the name.
  [[nodiscard]] auto create(const SpiderRequest &request) const
      -> Result<std::unique_ptr<ISpider>> {
    auto it = creators_.find(request.spider_name);
    if (it == creators_.end()) {
      return fail(Error::LaunchFailed);
    }
    return it->second(request);
  }

  [[nodiscard]] auto contains(std::string_view name) const -> bool {
    return creators_.find(name) != creators_.end();
  }

  [[nodiscard]] auto registered_names() const -> std::vector<std::string> {
    return creators_ | std::views::keys | std::ranges::to<std::vector>();
  }

private:
  std::flat_map<std::string, Creator, std::less<>> creators_;
};

} // namespace crawlforge
