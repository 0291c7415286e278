#pragma once

#include "crawlforge/cache/cache.hpp"

#include <ankerl/unordered_dense.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace crawlforge {

/// In-process cache with the same TTL semantics as the Redis backend. Used
/// for single-node deployments (`cache.backend = "memory"`) and tests.
class MemoryCache final : public ICache {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  MemoryCache();
  explicit MemoryCache(Clock clock);

  [[nodiscard]] auto open() -> task<Result<void>> override;
  auto close() -> void override;
  [[nodiscard]] auto is_open() const noexcept -> bool override;

  [[nodiscard]] auto ping() -> task<Result<void>> override;
  [[nodiscard]] auto rpush(std::string key, std::vector<std::string> values)
      -> task<Result<std::int64_t>> override;
  [[nodiscard]] auto lrange(std::string key, std::int64_t start,
                            std::int64_t stop)
      -> task<Result<std::vector<std::string>>> override;
  [[nodiscard]] auto llen(std::string key) -> task<Result<std::int64_t>> override;
  [[nodiscard]] auto incr(std::string key) -> task<Result<std::int64_t>> override;
  [[nodiscard]] auto expire(std::string key, std::chrono::seconds ttl)
      -> task<Result<bool>> override;
  [[nodiscard]] auto ttl(std::string key) -> task<Result<std::int64_t>> override;

  /// Simulate an outage: every call fails with CacheUnavailable.
  auto set_available(bool available) noexcept -> void {
    available_.store(available, std::memory_order_release);
  }

private:
  using Value = std::variant<std::int64_t, std::vector<std::string>>;
  struct Entry {
    Value value;
    std::optional<std::chrono::steady_clock::time_point> expires_at;
  };

  [[nodiscard]] auto check() const -> Result<void>;
  // Caller holds mutex_.
  [[nodiscard]] auto live_entry(const std::string &key) -> Entry *;

  Clock clock_;
  std::atomic<bool> open_{false};
  std::atomic<bool> available_{true};
  mutable std::mutex mutex_;
  ankerl::unordered_dense::map<std::string, Entry> entries_;
};

} // namespace crawlforge
