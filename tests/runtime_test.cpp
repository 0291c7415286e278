#include "crawlforge/core/runtime.hpp"

#include <atomic>
#include <chrono>
#include <thread>

#include "test_utils.hpp"
#include "gtest/gtest.h"

using namespace crawlforge;
using crawlforge::test::poll_until;

namespace {

constexpr auto kTaskTimeout = std::chrono::seconds(1);

auto increment_counter(std::atomic<int> *count_ptr) -> spawn_task {
  count_ptr->fetch_add(1);
  co_return;
}

} // namespace

TEST(RuntimeTest, BasicStartStop) {
  Runtime rt(1);
  EXPECT_FALSE(rt.is_running());
  ASSERT_TRUE(rt.start().has_value());
  EXPECT_TRUE(rt.is_running());
  rt.stop();
  EXPECT_FALSE(rt.is_running());

  // Second stop is a no-op.
  rt.stop();
  EXPECT_FALSE(rt.is_running());
}

TEST(RuntimeTest, ShardCount) {
  Runtime rt(1);
  EXPECT_EQ(rt.shard_count(), 1U);

  Runtime rt4(4);
  EXPECT_EQ(rt4.shard_count(), 4U);

  Runtime automatic(0);
  EXPECT_GE(automatic.shard_count(), 1U);
}

TEST(RuntimeTest, CurrentShardInvalidOutsideContext) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start().has_value());
  EXPECT_EQ(rt.current_shard(), kInvalidShard);
  EXPECT_FALSE(rt.is_current_shard());
  rt.stop();
}

TEST(RuntimeTest, MultipleStartStops) {
  Runtime rt(1);
  for (int i = 0; i < 2; ++i) {
    ASSERT_TRUE(rt.start().has_value());
    EXPECT_TRUE(rt.is_running());

    std::atomic<int> count{0};
    rt.spawn_on(0, increment_counter(&count));
    EXPECT_TRUE(poll_until([&] { return count.load() == 1; }, kTaskTimeout));

    rt.stop();
    EXPECT_FALSE(rt.is_running());
  }
}

TEST(RuntimeTest, SpawnOnPinsToShard) {
  Runtime rt(3);
  ASSERT_TRUE(rt.start().has_value());

  std::atomic<shard_id> observed{kInvalidShard};
  auto check = [&observed, &rt]() -> spawn_task {
    observed.store(rt.current_shard());
    co_return;
  };
  rt.spawn_on(2, check());

  EXPECT_TRUE(poll_until([&] { return observed.load() != kInvalidShard; },
                         kTaskTimeout));
  EXPECT_EQ(observed.load(), 2U);
  rt.stop();
}

TEST(RuntimeTest, SpawnExternalRunsEveryTask) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start().has_value());

  std::atomic<int> count{0};
  for (int i = 0; i < 10; ++i) {
    rt.spawn_external(increment_counter(&count));
  }
  EXPECT_TRUE(poll_until([&] { return count.load() == 10; }, kTaskTimeout));
  rt.stop();
}

TEST(RuntimeTest, PostToRunsOnTargetShard) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start().has_value());

  std::atomic<shard_id> observed{kInvalidShard};
  rt.post_to(1, [&] { observed.store(rt.current_shard()); });
  EXPECT_TRUE(poll_until([&] { return observed.load() != kInvalidShard; },
                         kTaskTimeout));
  EXPECT_EQ(observed.load(), 1U);
  rt.stop();
}

TEST(RuntimeTest, AsyncSleepSuspendsWithoutBlockingShard) {
  Runtime rt(1);
  ASSERT_TRUE(rt.start().has_value());

  std::atomic<bool> slept{false};
  std::atomic<int> count{0};
  auto sleeper = [&]() -> spawn_task {
    co_await async_sleep(std::chrono::milliseconds(300));
    slept.store(true);
  };
  rt.spawn_on(0, sleeper());
  rt.spawn_on(0, increment_counter(&count));

  // The counter runs while the sleeper is parked on the same shard.
  EXPECT_TRUE(poll_until([&] { return count.load() == 1; }, kTaskTimeout));
  EXPECT_FALSE(slept.load());
  EXPECT_TRUE(poll_until([&] { return slept.load(); }, kTaskTimeout));
  rt.stop();
}

TEST(RuntimeTest, RunOnReturnsCoroutineResult) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start().has_value());

  auto value = crawlforge::test::run_on(rt, []() -> task<int> {
    co_await async_sleep(std::chrono::milliseconds(1));
    co_return 42;
  }());
  EXPECT_EQ(value, 42);
  rt.stop();
}
