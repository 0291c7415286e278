#pragma once

#include "crawlforge/cache/cache.hpp"
#include "crawlforge/core/coroutine.hpp"
#include "crawlforge/core/error.hpp"
#include "crawlforge/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace crawlforge {

struct ResultPage {
  std::vector<std::string> items;
  std::uint64_t offset{0};
  std::uint64_t limit{0};
  std::uint64_t total{0};
  bool has_more{false};
};

/// Per-task append-only record log kept in the shared cache under
/// `crawl_results:{task_id}`. Every append resets the key's expiry; reads
/// leave it alone.
class ResultStore {
public:
  static constexpr std::string_view kKeyPrefix = "crawl_results:";

  ResultStore(ICache &cache, std::chrono::seconds retention);

  /// Yields the number of records stored for the task after the append.
  [[nodiscard]] auto append(const TaskId &id, std::vector<std::string> records)
      -> task<Result<std::uint64_t>>;

  /// Records [offset, offset + limit) in insertion order.
  [[nodiscard]] auto read(const TaskId &id, std::uint64_t offset,
                          std::uint64_t limit) -> task<Result<ResultPage>>;

  [[nodiscard]] static auto key_for(const TaskId &id) -> std::string;

private:
  ICache &cache_;
  std::chrono::seconds retention_;
};

} // namespace crawlforge
