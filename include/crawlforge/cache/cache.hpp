#pragma once

#include "crawlforge/core/coroutine.hpp"
#include "crawlforge/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace crawlforge {

/// Returned by ttl() for a missing key and for a key without expiry.
inline constexpr std::int64_t kTtlMissing = -2;
inline constexpr std::int64_t kTtlPersistent = -1;

/// Shared key-value cache with Redis list and counter semantics.
/// Every operation fails with Error::CacheUnavailable when the backing
/// service cannot be reached.
class ICache {
public:
  virtual ~ICache() = default;

  [[nodiscard]] virtual auto open() -> task<Result<void>> = 0;
  virtual auto close() -> void = 0;
  [[nodiscard]] virtual auto is_open() const noexcept -> bool = 0;

  [[nodiscard]] virtual auto ping() -> task<Result<void>> = 0;

  /// Append values to the list at `key`; yields the new length.
  [[nodiscard]] virtual auto rpush(std::string key,
                                   std::vector<std::string> values)
      -> task<Result<std::int64_t>> = 0;
  /// Inclusive index range, as LRANGE.
  [[nodiscard]] virtual auto lrange(std::string key, std::int64_t start,
                                    std::int64_t stop)
      -> task<Result<std::vector<std::string>>> = 0;
  [[nodiscard]] virtual auto llen(std::string key)
      -> task<Result<std::int64_t>> = 0;

  [[nodiscard]] virtual auto incr(std::string key)
      -> task<Result<std::int64_t>> = 0;
  /// Yields false when the key does not exist.
  [[nodiscard]] virtual auto expire(std::string key, std::chrono::seconds ttl)
      -> task<Result<bool>> = 0;
  [[nodiscard]] virtual auto ttl(std::string key)
      -> task<Result<std::int64_t>> = 0;
};

} // namespace crawlforge
