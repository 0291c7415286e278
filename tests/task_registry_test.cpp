#include "crawlforge/crawl/task_registry.hpp"

#include <atomic>
#include <format>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "gtest/gtest.h"

using namespace crawlforge;

namespace {

auto kwargs() -> JsonValue { return JsonValue::object_t{}; }

auto running_task(TaskRegistry &registry) -> TaskId {
  auto id = registry.create("example_spider", kwargs());
  EXPECT_TRUE(registry.mark_running(id).has_value());
  return id;
}

} // namespace

TEST(TaskRegistryTest, CreateStartsPendingWithoutEndTime) {
  TaskRegistry registry;
  auto id = registry.create("example_spider", kwargs(),
                            LaunchOptions{.priority = 3, .timeout_sec = 120});

  auto record = registry.get(id);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->status, TaskStatus::Pending);
  EXPECT_EQ(record->spider_name, "example_spider");
  EXPECT_EQ(record->priority, 3);
  EXPECT_EQ(record->timeout_sec, 120);
  EXPECT_EQ(record->items_count, 0U);
  EXPECT_FALSE(record->end_time.has_value());
  EXPECT_NE(record->start_time, std::chrono::system_clock::time_point{});
}

TEST(TaskRegistryTest, IdsAreNeverReused) {
  std::vector<std::string> ids{"a", "a", "b", "a", "c"};
  std::size_t next = 0;
  TaskRegistry registry([&] { return TaskId{ids[next++ % ids.size()]}; });

  auto first = registry.create("example_spider", kwargs());
  auto second = registry.create("example_spider", kwargs());
  auto third = registry.create("example_spider", kwargs());
  EXPECT_EQ(first, "a");
  EXPECT_EQ(second, "b");
  EXPECT_EQ(third, "c");
}

TEST(TaskRegistryTest, CompleteSetsEndTimeAndSummary) {
  TaskRegistry registry;
  auto id = running_task(registry);

  auto applied = registry.complete(
      id, JobSummary{.close_reason = "finished", .items_scraped = 5});
  ASSERT_TRUE(applied.has_value());
  EXPECT_TRUE(*applied);

  auto record = registry.get(id);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->status, TaskStatus::Completed);
  EXPECT_TRUE(record->end_time.has_value());
  ASSERT_TRUE(record->result.has_value());
  EXPECT_EQ(record->result->items_scraped, 5U);
}

TEST(TaskRegistryTest, EndTimeSetIffTerminal) {
  TaskRegistry registry;
  auto id = running_task(registry);
  EXPECT_FALSE(registry.get(id)->end_time.has_value());

  ASSERT_TRUE(registry.begin_stop(id));
  EXPECT_EQ(registry.get(id)->status, TaskStatus::Stopping);
  EXPECT_FALSE(registry.get(id)->end_time.has_value());

  ASSERT_TRUE(registry.finalize_stop(id).has_value());
  auto record = registry.get(id);
  EXPECT_EQ(record->status, TaskStatus::Stopped);
  EXPECT_TRUE(record->end_time.has_value());
}

TEST(TaskRegistryTest, CompletionAfterStopIsIgnored) {
  TaskRegistry registry;
  auto id = running_task(registry);
  ASSERT_TRUE(registry.begin_stop(id));

  auto during = registry.complete(id, JobSummary{});
  ASSERT_TRUE(during.has_value());
  EXPECT_FALSE(*during);

  ASSERT_TRUE(registry.finalize_stop(id).has_value());
  const auto end_time = registry.get(id)->end_time;

  auto after = registry.complete(id, JobSummary{});
  ASSERT_TRUE(after.has_value());
  EXPECT_FALSE(*after);
  auto failed = registry.fail(id, "late failure");
  ASSERT_TRUE(failed.has_value());
  EXPECT_FALSE(*failed);

  auto record = registry.get(id);
  EXPECT_EQ(record->status, TaskStatus::Stopped);
  EXPECT_EQ(record->end_time, end_time);
  EXPECT_FALSE(record->result.has_value());
  EXPECT_FALSE(record->failure_reason.has_value());
}

TEST(TaskRegistryTest, SecondBeginStopReturnsFalse) {
  TaskRegistry registry;
  auto id = running_task(registry);
  EXPECT_TRUE(registry.begin_stop(id));
  EXPECT_FALSE(registry.begin_stop(id));
}

TEST(TaskRegistryTest, ConcurrentBeginStopHasOneWinner) {
  TaskRegistry registry;
  auto id = running_task(registry);

  std::atomic<int> winners{0};
  std::vector<std::jthread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      if (registry.begin_stop(id)) {
        winners.fetch_add(1);
      }
    });
  }
  threads.clear();
  EXPECT_EQ(winners.load(), 1);
}

TEST(TaskRegistryTest, ConcurrentTryCreateRespectsCeiling) {
  TaskRegistry registry;
  constexpr std::size_t kCeiling = 3;

  std::atomic<int> admitted{0};
  std::atomic<int> refused{0};
  std::vector<std::jthread> threads;
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&] {
      auto id = registry.try_create("example_spider", kwargs(),
                                    LaunchOptions{}, kCeiling);
      if (id) {
        admitted.fetch_add(1);
      } else if (id.error() == make_error_code(Error::ResourceExhausted)) {
        refused.fetch_add(1);
      }
    });
  }
  threads.clear();
  EXPECT_EQ(admitted.load(), static_cast<int>(kCeiling));
  EXPECT_EQ(refused.load(), 16 - static_cast<int>(kCeiling));
  EXPECT_EQ(registry.active_count(), kCeiling);
}

TEST(TaskRegistryTest, TryCreateCountsOnlyLiveTasks) {
  TaskRegistry registry;
  auto done = running_task(registry);
  ASSERT_TRUE(registry.complete(done, JobSummary{}).value());

  auto first = registry.try_create("example_spider", kwargs(), {}, 1);
  ASSERT_TRUE(first.has_value());
  auto second = registry.try_create("example_spider", kwargs(), {}, 1);
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error(), make_error_code(Error::ResourceExhausted));

  // No ceiling.
  EXPECT_TRUE(
      registry.try_create("example_spider", kwargs(), {}, 0).has_value());
}

TEST(TaskRegistryTest, BeginStopRejectsNonRunning) {
  TaskRegistry registry;
  auto pending = registry.create("example_spider", kwargs());
  EXPECT_FALSE(registry.begin_stop(pending));
  EXPECT_FALSE(registry.begin_stop(TaskId{"missing"}));

  auto done = running_task(registry);
  ASSERT_TRUE(registry.complete(done, JobSummary{}).value());
  EXPECT_FALSE(registry.begin_stop(done));
}

TEST(TaskRegistryTest, LaunchFailureFromPending) {
  TaskRegistry registry;
  auto id = registry.create("news_spider", kwargs());

  auto applied = registry.fail(id, "no such spider");
  ASSERT_TRUE(applied.has_value());
  EXPECT_TRUE(*applied);

  auto record = registry.get(id);
  EXPECT_EQ(record->status, TaskStatus::Failed);
  EXPECT_EQ(record->failure_reason, "no such spider");
  EXPECT_TRUE(record->end_time.has_value());
  EXPECT_FALSE(registry.mark_running(id).has_value());
}

TEST(TaskRegistryTest, UnknownTaskReportsNotFound) {
  TaskRegistry registry;
  const TaskId missing{"missing"};
  EXPECT_EQ(registry.mark_running(missing).error(),
            make_error_code(Error::NotFound));
  EXPECT_EQ(registry.complete(missing, JobSummary{}).error(),
            make_error_code(Error::NotFound));
  EXPECT_EQ(registry.finalize_stop(missing).error(),
            make_error_code(Error::NotFound));
  EXPECT_EQ(registry.add_items(missing, 1).error(),
            make_error_code(Error::NotFound));
  EXPECT_FALSE(registry.get(missing).has_value());
}

TEST(TaskRegistryTest, FinalizeStopRequiresStopping) {
  TaskRegistry registry;
  auto id = running_task(registry);
  EXPECT_EQ(registry.finalize_stop(id).error(),
            make_error_code(Error::InvalidState));
}

TEST(TaskRegistryTest, ItemsAccumulate) {
  TaskRegistry registry;
  auto id = running_task(registry);
  EXPECT_EQ(registry.add_items(id, 3).value(), 3U);
  EXPECT_EQ(registry.add_items(id, 2).value(), 5U);
  EXPECT_EQ(registry.get(id)->items_count, 5U);
}

TEST(TaskRegistryTest, CountsByStatus) {
  TaskRegistry registry;
  (void)registry.create("example_spider", kwargs());
  auto running = running_task(registry);
  auto completed = running_task(registry);
  ASSERT_TRUE(registry.complete(completed, JobSummary{}).value());

  auto counts = registry.count_by_status();
  EXPECT_EQ(counts[std::to_underlying(TaskStatus::Pending)], 1U);
  EXPECT_EQ(counts[std::to_underlying(TaskStatus::Running)], 1U);
  EXPECT_EQ(counts[std::to_underlying(TaskStatus::Completed)], 1U);
  EXPECT_EQ(registry.active_count(), 2U);
  EXPECT_EQ(registry.list_all().size(), 3U);
  EXPECT_TRUE(registry.list_all().contains(running));
}
