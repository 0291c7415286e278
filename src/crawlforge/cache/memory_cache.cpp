#include "crawlforge/cache/memory_cache.hpp"

#include <algorithm>
#include <iterator>

namespace crawlforge {

MemoryCache::MemoryCache()
    : MemoryCache([] { return std::chrono::steady_clock::now(); }) {}

MemoryCache::MemoryCache(Clock clock) : clock_(std::move(clock)) {}

auto MemoryCache::open() -> task<Result<void>> {
  open_.store(true, std::memory_order_release);
  co_return ok();
}

auto MemoryCache::close() -> void {
  open_.store(false, std::memory_order_release);
}

auto MemoryCache::is_open() const noexcept -> bool {
  return open_.load(std::memory_order_acquire);
}

auto MemoryCache::check() const -> Result<void> {
  if (!is_open() || !available_.load(std::memory_order_acquire)) {
    return fail(Error::CacheUnavailable);
  }
  return ok();
}

auto MemoryCache::live_entry(const std::string &key) -> Entry * {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return nullptr;
  }
  if (it->second.expires_at && *it->second.expires_at <= clock_()) {
    entries_.erase(it);
    return nullptr;
  }
  return &it->second;
}

auto MemoryCache::ping() -> task<Result<void>> { co_return check(); }

auto MemoryCache::rpush(std::string key, std::vector<std::string> values)
    -> task<Result<std::int64_t>> {
  if (auto up = check(); !up) {
    co_return fail(up.error());
  }
  std::scoped_lock lock(mutex_);
  auto *entry = live_entry(key);
  if (!entry) {
    entry = &entries_[key];
    entry->value = std::vector<std::string>{};
  }
  auto *list = std::get_if<std::vector<std::string>>(&entry->value);
  if (!list) {
    co_return fail(Error::InvalidArgument);
  }
  std::ranges::move(values, std::back_inserter(*list));
  co_return ok(static_cast<std::int64_t>(list->size()));
}

auto MemoryCache::lrange(std::string key, std::int64_t start, std::int64_t stop)
    -> task<Result<std::vector<std::string>>> {
  if (auto up = check(); !up) {
    co_return fail(up.error());
  }
  std::scoped_lock lock(mutex_);
  std::vector<std::string> out;
  auto *entry = live_entry(key);
  if (!entry) {
    co_return ok(std::move(out));
  }
  auto *list = std::get_if<std::vector<std::string>>(&entry->value);
  if (!list) {
    co_return fail(Error::InvalidArgument);
  }
  const auto len = static_cast<std::int64_t>(list->size());
  // Negative indices count from the tail, as in Redis.
  if (start < 0)
    start = std::max<std::int64_t>(0, len + start);
  if (stop < 0)
    stop = len + stop;
  stop = std::min(stop, len - 1);
  for (auto i = start; i <= stop; ++i) {
    out.push_back((*list)[static_cast<std::size_t>(i)]);
  }
  co_return ok(std::move(out));
}

auto MemoryCache::llen(std::string key) -> task<Result<std::int64_t>> {
  if (auto up = check(); !up) {
    co_return fail(up.error());
  }
  std::scoped_lock lock(mutex_);
  auto *entry = live_entry(key);
  if (!entry) {
    co_return ok(std::int64_t{0});
  }
  auto *list = std::get_if<std::vector<std::string>>(&entry->value);
  if (!list) {
    co_return fail(Error::InvalidArgument);
  }
  co_return ok(static_cast<std::int64_t>(list->size()));
}

auto MemoryCache::incr(std::string key) -> task<Result<std::int64_t>> {
  if (auto up = check(); !up) {
    co_return fail(up.error());
  }
  std::scoped_lock lock(mutex_);
  auto *entry = live_entry(key);
  if (!entry) {
    entry = &entries_[key];
    entry->value = std::int64_t{0};
  }
  auto *counter = std::get_if<std::int64_t>(&entry->value);
  if (!counter) {
    co_return fail(Error::InvalidArgument);
  }
  co_return ok(++*counter);
}

auto MemoryCache::expire(std::string key, std::chrono::seconds ttl)
    -> task<Result<bool>> {
  if (auto up = check(); !up) {
    co_return fail(up.error());
  }
  std::scoped_lock lock(mutex_);
  auto *entry = live_entry(key);
  if (!entry) {
    co_return ok(false);
  }
  entry->expires_at = clock_() + ttl;
  co_return ok(true);
}

auto MemoryCache::ttl(std::string key) -> task<Result<std::int64_t>> {
  if (auto up = check(); !up) {
    co_return fail(up.error());
  }
  std::scoped_lock lock(mutex_);
  auto *entry = live_entry(key);
  if (!entry) {
    co_return ok(kTtlMissing);
  }
  if (!entry->expires_at) {
    co_return ok(kTtlPersistent);
  }
  auto remaining = std::chrono::ceil<std::chrono::seconds>(
      *entry->expires_at - clock_());
  co_return ok(static_cast<std::int64_t>(remaining.count()));
}

} // namespace crawlforge
