#include "crawlforge/crawl/result_store.hpp"

#include "crawlforge/util/log.hpp"

#include <format>
#include <limits>

namespace crawlforge {

ResultStore::ResultStore(ICache &cache, std::chrono::seconds retention)
    : cache_(cache), retention_(retention) {}

auto ResultStore::key_for(const TaskId &id) -> std::string {
  return std::format("{}{}", kKeyPrefix, id);
}

auto ResultStore::append(const TaskId &id, std::vector<std::string> records)
    -> task<Result<std::uint64_t>> {
  auto key = key_for(id);
  if (records.empty()) {
    auto len = co_await cache_.llen(key);
    if (!len) {
      co_return fail(len.error());
    }
    co_return ok(static_cast<std::uint64_t>(*len));
  }

  const auto count = records.size();
  auto len = co_await cache_.rpush(key, std::move(records));
  if (!len) {
    log::error("Failed to store {} records for task {}: {}", count, id,
               len.error().message());
    co_return fail(len.error());
  }
  if (auto expiry = co_await cache_.expire(key, retention_); !expiry) {
    log::error("Failed to refresh retention of {}: {}", key,
               expiry.error().message());
    co_return fail(expiry.error());
  }
  co_return ok(static_cast<std::uint64_t>(*len));
}

auto ResultStore::read(const TaskId &id, std::uint64_t offset,
                       std::uint64_t limit) -> task<Result<ResultPage>> {
  // LRANGE indexes are signed; anything past INT64_MAX would wrap to a
  // tail-relative index.
  constexpr auto kMaxIndex =
      static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  if (limit == 0 || offset > kMaxIndex) {
    co_return fail(Error::InvalidArgument);
  }
  auto key = key_for(id);
  const auto first = static_cast<std::int64_t>(offset);
  const auto last = static_cast<std::int64_t>(
      limit - 1 > kMaxIndex - offset ? kMaxIndex : offset + limit - 1);

  auto items = co_await cache_.lrange(key, first, last);
  if (!items) {
    co_return fail(items.error());
  }
  auto total = co_await cache_.llen(key);
  if (!total) {
    co_return fail(total.error());
  }

  const auto total_count = static_cast<std::uint64_t>(*total);
  co_return ok(ResultPage{.items = std::move(*items),
                          .offset = offset,
                          .limit = limit,
                          .total = total_count,
                          .has_more = static_cast<std::uint64_t>(last) + 1 <
                                      total_count});
}

} // namespace crawlforge
