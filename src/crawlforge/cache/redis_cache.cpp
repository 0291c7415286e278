#include "crawlforge/cache/redis_cache.hpp"

#include "crawlforge/core/asio_awaitable.hpp"
#include "crawlforge/util/log.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/consign.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/redis/config.hpp>
#include <boost/redis/error.hpp>
#include <boost/redis/logger.hpp>
#include <boost/redis/response.hpp>
#include <boost/redis/src.hpp>

#include <string>
#include <tuple>
#include <utility>

namespace crawlforge {

namespace {

constexpr std::string_view kClientName = "crawlforge";

[[nodiscard]] auto is_server_error(const boost::system::error_code &ec)
    -> bool {
  return ec == boost::redis::error::resp3_simple_error ||
         ec == boost::redis::error::resp3_blob_error;
}

[[nodiscard]] auto make_redis_config(const CacheConfig &cfg)
    -> boost::redis::config {
  boost::redis::config out;
  out.addr.host = cfg.host;
  out.addr.port = std::to_string(cfg.port);
  if (!cfg.password.empty()) {
    out.password = cfg.password;
  }
  if (cfg.db != 0) {
    out.database_index = cfg.db;
  }
  out.clientname = std::string(kClientName);
  out.resolve_timeout = std::chrono::milliseconds(cfg.connect_timeout_ms);
  out.connect_timeout = std::chrono::milliseconds(cfg.connect_timeout_ms);
  out.health_check_interval = std::chrono::seconds(cfg.health_check_sec);
  return out;
}

} // namespace

RedisCache::RedisCache(CacheConfig config)
    : config_(std::move(config)),
      conn_(std::make_shared<boost::redis::connection>(ioc_.get_executor())) {}

RedisCache::~RedisCache() { close(); }

auto RedisCache::open() -> task<Result<void>> {
  if (open_.exchange(true, std::memory_order_acq_rel)) {
    co_return ok();
  }
  ioc_.restart();
  work_guard_.emplace(ioc_.get_executor());
  thread_ = std::jthread([this] {
    log::debug("redis connection thread started");
    ioc_.run();
    log::debug("redis connection thread exited");
  });

  boost::asio::post(ioc_, [conn = conn_, cfg = make_redis_config(config_)] {
    conn->async_run(cfg,
                    boost::redis::logger{boost::redis::logger::level::err},
                    boost::asio::consign(boost::asio::detached, conn));
  });

  // The first PING waits for the handshake instead of failing fast.
  boost::redis::request req;
  req.get_config().cancel_if_not_connected = false;
  req.push("PING");
  boost::redis::response<std::string> resp;
  auto pinged = co_await exec(std::move(req), resp,
                              std::chrono::milliseconds(
                                  config_.connect_timeout_ms));
  if (!pinged) {
    log::error("Redis at {}:{} is unreachable", config_.host, config_.port);
    close();
    co_return fail(Error::CacheUnavailable);
  }
  log::info("Connected to Redis at {}:{} (db {})", config_.host, config_.port,
            config_.db);
  co_return ok();
}

auto RedisCache::close() -> void {
  if (!open_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  boost::asio::post(ioc_, [conn = conn_] { conn->cancel(); });
  work_guard_.reset();
  if (thread_.joinable()) {
    thread_.join();
  }
}

auto RedisCache::is_open() const noexcept -> bool {
  return open_.load(std::memory_order_acquire);
}

template <class Response>
auto RedisCache::exec(boost::redis::request req, Response &resp,
                      std::chrono::milliseconds timeout)
    -> task<Result<void>> {
  if (!is_open()) {
    co_return fail(Error::CacheUnavailable);
  }
  // The connection is only touched from its own thread.
  auto ec = co_await boost::asio::co_spawn(
      ioc_,
      [](std::shared_ptr<boost::redis::connection> conn,
         boost::redis::request req, Response &resp,
         std::chrono::milliseconds timeout)
          -> task<boost::system::error_code> {
        auto [ec, size] = co_await conn->async_exec(
            req, resp, boost::asio::cancel_after(timeout, use_nothrow));
        std::ignore = size;
        co_return ec;
      }(conn_, std::move(req), resp, timeout),
      boost::asio::use_awaitable);

  if (!ec) {
    co_return ok();
  }
  if (is_server_error(ec)) {
    log::warn("Redis rejected command: {}", ec.message());
    co_return fail(Error::ProtocolError);
  }
  if (ec == boost::asio::error::operation_aborted) {
    log::warn("Redis command timed out after {}ms", timeout.count());
  } else {
    log::warn("Redis command failed: {}", ec.message());
  }
  co_return fail(Error::CacheUnavailable);
}

template <class T>
auto RedisCache::single(boost::redis::request req) -> task<Result<T>> {
  req.get_config().cancel_if_not_connected = true;
  boost::redis::response<T> resp;
  if (auto done = co_await exec(std::move(req), resp, command_timeout());
      !done) {
    co_return fail(done.error());
  }
  auto &reply = std::get<0>(resp);
  if (reply.has_error()) {
    log::warn("Redis error reply: {}", reply.error().diagnostic);
    co_return fail(Error::ProtocolError);
  }
  co_return ok(std::move(reply.value()));
}

auto RedisCache::ping() -> task<Result<void>> {
  boost::redis::request req;
  req.push("PING");
  auto pong = co_await single<std::string>(std::move(req));
  if (!pong) {
    co_return fail(pong.error());
  }
  if (*pong != "PONG") {
    co_return fail(Error::ProtocolError);
  }
  co_return ok();
}

auto RedisCache::rpush(std::string key, std::vector<std::string> values)
    -> task<Result<std::int64_t>> {
  boost::redis::request req;
  req.push_range("RPUSH", key, values);
  co_return co_await single<std::int64_t>(std::move(req));
}

auto RedisCache::lrange(std::string key, std::int64_t start, std::int64_t stop)
    -> task<Result<std::vector<std::string>>> {
  boost::redis::request req;
  req.push("LRANGE", key, start, stop);
  co_return co_await single<std::vector<std::string>>(std::move(req));
}

auto RedisCache::llen(std::string key) -> task<Result<std::int64_t>> {
  boost::redis::request req;
  req.push("LLEN", key);
  co_return co_await single<std::int64_t>(std::move(req));
}

auto RedisCache::incr(std::string key) -> task<Result<std::int64_t>> {
  boost::redis::request req;
  req.push("INCR", key);
  co_return co_await single<std::int64_t>(std::move(req));
}

auto RedisCache::expire(std::string key, std::chrono::seconds ttl)
    -> task<Result<bool>> {
  boost::redis::request req;
  req.push("EXPIRE", key, ttl.count());
  auto set = co_await single<std::int64_t>(std::move(req));
  if (!set) {
    co_return fail(set.error());
  }
  co_return ok(*set == 1);
}

auto RedisCache::ttl(std::string key) -> task<Result<std::int64_t>> {
  boost::redis::request req;
  req.push("TTL", key);
  co_return co_await single<std::int64_t>(std::move(req));
}

} // namespace crawlforge
