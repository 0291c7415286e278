#include "crawlforge/crawl/rate_limiter.hpp"

#include "crawlforge/util/log.hpp"

#include <format>

namespace crawlforge {

RateLimiter::RateLimiter(ICache &cache, std::int64_t limit,
                         std::chrono::seconds window)
    : cache_(cache), limit_(limit), window_(window) {}

auto RateLimiter::hit(std::string_view client_key)
    -> task<Result<RateDecision>> {
  auto key = std::format("{}{}", kKeyPrefix, client_key);

  auto count = co_await cache_.incr(key);
  if (!count) {
    co_return fail(count.error());
  }

  std::int64_t remaining = window_.count();
  if (*count == 1) {
    if (auto set = co_await cache_.expire(key, window_); !set) {
      co_return fail(set.error());
    }
  } else {
    auto ttl = co_await cache_.ttl(key);
    if (!ttl) {
      co_return fail(ttl.error());
    }
    if (*ttl == kTtlPersistent) {
      // The expiry from the first hit was lost; without it the key would
      // never reset.
      log::warn("Rate limit key {} had no expiry; restarting window", key);
      if (auto set = co_await cache_.expire(key, window_); !set) {
        co_return fail(set.error());
      }
    } else if (*ttl > 0) {
      remaining = *ttl;
    }
  }

  co_return ok(RateDecision{.allowed = *count <= limit_,
                            .count = *count,
                            .limit = limit_,
                            .retry_after = remaining});
}

} // namespace crawlforge
