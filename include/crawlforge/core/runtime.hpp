#pragma once

#include "crawlforge/core/coroutine.hpp"
#include "crawlforge/core/error.hpp"
#include "crawlforge/core/shard.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace crawlforge {

inline constexpr shard_id kInvalidShard = std::numeric_limits<shard_id>::max();

/// Thread-per-shard executor pool that serves the request-handling side of
/// the process. Work is pinned to a shard with spawn_on/post_to.
class Runtime {
public:
  explicit Runtime(unsigned num_shards = 0);
  ~Runtime() noexcept;

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  template <typename T> auto spawn_on(shard_id target, task<T> coro) -> void {
    assert(target < num_shards_);
    co_spawn(shards_[target]->ctx().get_executor(), std::move(coro), detached);
  }

  /// Launch on the current shard, or shard 0 from a foreign thread.
  template <typename T> auto spawn(task<T> coro) -> void {
    auto sid = current_shard();
    if (sid == kInvalidShard)
      sid = 0;
    spawn_on(sid, std::move(coro));
  }

  /// Round-robin launch for callers outside the runtime.
  template <typename T> auto spawn_external(task<T> coro) -> void {
    spawn_on(next_external_shard(), std::move(coro));
  }

  [[nodiscard]] auto shard_count() const noexcept -> unsigned {
    return num_shards_;
  }

  [[nodiscard]] auto current_shard() const noexcept -> shard_id;
  [[nodiscard]] auto is_current_shard() const noexcept -> bool;
  [[nodiscard]] auto shard(shard_id id) noexcept -> Shard & {
    assert(id < num_shards_);
    return *shards_[id];
  }

  [[nodiscard]] auto executor_for(shard_id id)
      -> boost::asio::io_context::executor_type {
    assert(id < num_shards_);
    return shards_[id]->ctx().get_executor();
  }

  [[nodiscard]] auto next_external_shard() noexcept -> shard_id {
    return static_cast<shard_id>(
        external_rr_.fetch_add(1, std::memory_order_relaxed) %
        std::max(1U, num_shards_));
  }

  /// Post a callable to a specific shard's executor (fire-and-forget).
  template <typename F> auto post_to(shard_id target, F &&fn) -> void {
    assert(target < num_shards_);
    boost::asio::post(shards_[target]->ctx().get_executor(),
                      std::forward<F>(fn));
  }

private:
  auto run_shard(shard_id id) -> void;

  alignas(64) std::atomic<bool> running_{false};
  unsigned num_shards_;
  std::vector<std::unique_ptr<Shard>> shards_;
  std::vector<std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>>
      work_guards_;
  std::vector<std::jthread> threads_;
  alignas(64) std::atomic<std::uint64_t> external_rr_{0};
};

namespace detail {
inline thread_local shard_id current_shard_id = kInvalidShard;
inline thread_local Runtime *current_runtime = nullptr;
} // namespace detail

/// Suspend the calling coroutine on its own executor.
template <typename Rep, typename Period>
[[nodiscard]] inline auto
async_sleep(std::chrono::duration<Rep, Period> duration) -> spawn_task {
  boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor,
                                  duration);
  co_await timer.async_wait(boost::asio::use_awaitable);
}

} // namespace crawlforge
