#pragma once

#include "crawlforge/cache/cache.hpp"
#include "crawlforge/config/system_config.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/redis/connection.hpp>
#include <boost/redis/request.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <thread>

namespace crawlforge {

/// Redis backend over one multiplexed Boost.Redis connection. The
/// connection lives on its own I/O thread; commands issued from any
/// executor hop there and back. Reconnects are handled by the connection,
/// and commands issued while it is down fail fast with
/// Error::CacheUnavailable.
class RedisCache final : public ICache {
public:
  explicit RedisCache(CacheConfig config);
  ~RedisCache() override;

  RedisCache(const RedisCache &) = delete;
  RedisCache &operator=(const RedisCache &) = delete;

  /// Starts the connection and waits up to connect_timeout_ms for the
  /// handshake to answer a PING.
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

private:
  template <class Response>
  [[nodiscard]] auto exec(boost::redis::request req, Response &resp,
                          std::chrono::milliseconds timeout)
      -> task<Result<void>>;
  template <class T>
  [[nodiscard]] auto single(boost::redis::request req) -> task<Result<T>>;

  [[nodiscard]] auto command_timeout() const -> std::chrono::milliseconds {
    return std::chrono::milliseconds(config_.command_timeout_ms);
  }

  CacheConfig config_;
  boost::asio::io_context ioc_{1};
  std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::jthread thread_;
  std::shared_ptr<boost::redis::connection> conn_;
  std::atomic<bool> open_{false};
};

} // namespace crawlforge
