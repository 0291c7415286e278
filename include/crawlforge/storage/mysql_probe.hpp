#pragma once

#include "crawlforge/config/system_config.hpp"
#include "crawlforge/core/coroutine.hpp"
#include "crawlforge/core/error.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/mysql/connection_pool.hpp>
#include <boost/mysql/pool_params.hpp>

#include <atomic>
#include <chrono>

namespace crawlforge::storage {

/// Liveness check against the relational store. Nothing else in the
/// process talks to MySQL.
class MySQLProbe {
public:
  MySQLProbe(boost::asio::any_io_executor executor,
             const DatabaseConfig &config);
  ~MySQLProbe();

  MySQLProbe(const MySQLProbe &) = delete;
  MySQLProbe &operator=(const MySQLProbe &) = delete;

  /// Starts the pool; the first connection is established lazily.
  auto open() -> void;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return open_.load(std::memory_order_acquire);
  }

  /// Round-trip time of `SELECT 1`, or Error::DatabaseUnavailable.
  [[nodiscard]] auto ping() -> task<Result<std::chrono::microseconds>>;

private:
  DatabaseConfig cfg_;
  boost::mysql::connection_pool pool_;
  std::atomic<bool> open_{false};
};

} // namespace crawlforge::storage
