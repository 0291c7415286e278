#include "crawlforge/storage/mysql_probe.hpp"

#include "crawlforge/core/asio_awaitable.hpp"
#include "crawlforge/util/log.hpp"

#include <boost/asio/detached.hpp>
#include <boost/mysql/results.hpp>

namespace crawlforge::storage {

namespace {

[[nodiscard]] auto make_pool_params(const DatabaseConfig &cfg)
    -> boost::mysql::pool_params {
  boost::mysql::pool_params params;
  params.server_address.emplace_host_and_port(cfg.host, cfg.port);
  params.username = cfg.username;
  params.password = cfg.password;
  params.database = cfg.database;
  params.initial_size = 1;
  params.max_size = 2;
  params.thread_safe = true;
  params.connect_timeout = std::chrono::seconds(cfg.connect_timeout);
  params.ssl = boost::mysql::ssl_mode::disable;
  return params;
}

} // namespace

MySQLProbe::MySQLProbe(boost::asio::any_io_executor executor,
                       const DatabaseConfig &config)
    : cfg_(config), pool_(std::move(executor), make_pool_params(config)) {}

MySQLProbe::~MySQLProbe() { close(); }

auto MySQLProbe::open() -> void {
  if (open_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  pool_.async_run(boost::asio::detached);
  log::info("MySQL probe started for {}:{} / {}", cfg_.host, cfg_.port,
            cfg_.database);
}

auto MySQLProbe::close() -> void {
  if (open_.exchange(false, std::memory_order_acq_rel)) {
    pool_.cancel();
  }
}

auto MySQLProbe::ping() -> task<Result<std::chrono::microseconds>> {
  if (!is_open()) {
    co_return fail(Error::DatabaseUnavailable);
  }

  const auto started = std::chrono::steady_clock::now();
  try {
    auto conn = co_await pool_.async_get_connection(boost::asio::cancel_after(
        std::chrono::seconds(cfg_.connect_timeout), use_awaitable));
    boost::mysql::results res;
    co_await conn->async_execute("SELECT 1", res, use_awaitable);
    co_return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);
  } catch (const std::exception &e) {
    log::warn("MySQL ping failed: {}", e.what());
    co_return fail(Error::DatabaseUnavailable);
  }
}

} // namespace crawlforge::storage
