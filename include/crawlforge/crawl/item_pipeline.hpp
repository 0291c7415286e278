#pragma once

#include "crawlforge/core/error.hpp"
#include "crawlforge/util/id.hpp"
#include "crawlforge/util/json.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <string>

namespace crawlforge {

struct PipelineOptions {
  bool validate_urls{true};
  bool deduplicate{true};
};

/// Per-job item processing: validation, then deduplication on
/// sha256("{url}:{title}"), then provenance stamping. Accepted items come
/// out serialized and ready for the result store.
///
/// Rejections: Error::InvalidArgument for malformed items,
/// Error::AlreadyExists for duplicates.
class ItemPipeline {
public:
  ItemPipeline(PipelineOptions options, TaskId task_id,
               std::string spider_name);

  [[nodiscard]] auto process(JsonValue item) -> Result<std::string>;

  [[nodiscard]] auto accepted() const noexcept -> std::uint64_t {
    return accepted_;
  }
  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_;
  }

private:
  [[nodiscard]] auto validate(const JsonValue &item) const -> Result<void>;

  PipelineOptions options_;
  TaskId task_id_;
  std::string spider_name_;
  ankerl::unordered_dense::set<std::string> seen_;
  std::uint64_t accepted_{0};
  std::uint64_t dropped_{0};
};

} // namespace crawlforge
