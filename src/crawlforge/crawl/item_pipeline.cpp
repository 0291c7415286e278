#include "crawlforge/crawl/item_pipeline.hpp"

#include "crawlforge/util/digest.hpp"
#include "crawlforge/util/log.hpp"
#include "crawlforge/util/time.hpp"

#include <format>

namespace crawlforge {

ItemPipeline::ItemPipeline(PipelineOptions options, TaskId task_id,
                           std::string spider_name)
    : options_(options), task_id_(std::move(task_id)),
      spider_name_(std::move(spider_name)) {}

auto ItemPipeline::validate(const JsonValue &item) const -> Result<void> {
  if (!item.is_object()) {
    return fail(Error::InvalidArgument);
  }
  if (!options_.validate_urls) {
    return ok();
  }
  const auto *url = json_string(item, "url");
  if (!url || !(url->starts_with("http://") || url->starts_with("https://"))) {
    return fail(Error::InvalidArgument);
  }
  return ok();
}

auto ItemPipeline::process(JsonValue item) -> Result<std::string> {
  if (auto valid = validate(item); !valid) {
    ++dropped_;
    log::debug("[{}] dropped invalid item", task_id_);
    return fail(valid.error());
  }

  if (options_.deduplicate) {
    const auto *url = json_string(item, "url");
    const auto *title = json_string(item, "title");
    auto fingerprint = util::sha256_hex(
        std::format("{}:{}", url ? *url : "", title ? *title : ""));
    if (!seen_.insert(std::move(fingerprint)).second) {
      ++dropped_;
      log::debug("[{}] dropped duplicate item {}", task_id_,
                 url ? *url : "");
      return fail(Error::AlreadyExists);
    }
  }

  auto &fields = item.get_object();
  fields["crawled_at"] =
      util::format_iso8601_millis(std::chrono::system_clock::now());
  fields["spider_name"] = spider_name_;
  fields["task_id"] = task_id_.str();

  ++accepted_;
  return ok(dump_json(item));
}

} // namespace crawlforge
