#pragma once

#include "crawlforge/cache/cache.hpp"
#include "crawlforge/core/coroutine.hpp"
#include "crawlforge/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace crawlforge {

struct RateDecision {
  bool allowed{true};
  std::int64_t count{0};
  std::int64_t limit{0};
  /// Seconds until the current window closes.
  std::int64_t retry_after{0};
};

/// Fixed-window counter per client key. The first hit in a window creates
/// the counter with the window as its expiry; hits past `limit` are refused
/// until the key expires.
class RateLimiter {
public:
  static constexpr std::string_view kKeyPrefix = "rate_limit:";

  RateLimiter(ICache &cache, std::int64_t limit, std::chrono::seconds window);

  [[nodiscard]] auto hit(std::string_view client_key) -> task<Result<RateDecision>>;

  [[nodiscard]] auto limit() const noexcept -> std::int64_t { return limit_; }
  [[nodiscard]] auto window() const noexcept -> std::chrono::seconds {
    return window_;
  }

private:
  ICache &cache_;
  std::int64_t limit_;
  std::chrono::seconds window_;
};

} // namespace crawlforge
