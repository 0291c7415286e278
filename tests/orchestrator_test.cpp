#include "crawlforge/cache/memory_cache.hpp"
#include "crawlforge/crawl/orchestrator.hpp"
#include "crawlforge/crawl/result_store.hpp"

#include "test_utils.hpp"
#include "gtest/gtest.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

using namespace crawlforge;
using crawlforge::test::LogCapture;
using crawlforge::test::poll_until;
using crawlforge::test::run_coro;
using crawlforge::test::run_on;

namespace {

constexpr auto kWait = std::chrono::seconds(5);

auto example_kwargs(std::int64_t count, std::int64_t interval_ms)
    -> JsonValue {
  JsonValue kwargs = JsonValue::object_t{};
  kwargs["count"] = count;
  kwargs["interval_ms"] = interval_ms;
  return kwargs;
}

class OrchestratorTest : public ::testing::Test {
protected:
  void SetUp() override { build(default_options()); }

  void TearDown() override { teardown(); }

  static auto default_options() -> OrchestratorOptions {
    return OrchestratorOptions{
        .allowed_spiders = {"example_spider", "news_spider"},
        .max_concurrent_spiders = 5,
        .default_timeout_sec = 3600,
        .stop_timeout = std::chrono::seconds(5),
    };
  }

  void build(OrchestratorOptions options) {
    runtime_ = std::make_unique<Runtime>(2);
    ASSERT_TRUE(runtime_->start().has_value());
    cache_ = std::make_unique<MemoryCache>();
    ASSERT_TRUE(run_coro(cache_->open()).has_value());
    store_ = std::make_unique<ResultStore>(*cache_, std::chrono::seconds(3600));
    orch_ = std::make_unique<Orchestrator>(*runtime_, *store_,
                                           std::move(options));
    orch_->start_engine();
  }

  void teardown() {
    if (orch_) {
      orch_->stop_engine(std::chrono::milliseconds(0));
    }
    if (runtime_) {
      runtime_->stop();
    }
    orch_.reset();
    store_.reset();
    cache_.reset();
    runtime_.reset();
  }

  auto start(std::string spider, JsonValue kwargs) -> TaskId {
    auto id = orch_->start(RunRequest{.spider_name = std::move(spider),
                                      .kwargs = std::move(kwargs)});
    EXPECT_TRUE(id.has_value());
    return id.value_or(TaskId{});
  }

  auto status_of(const TaskId &id) -> TaskStatus {
    auto record = orch_->status(id);
    return record ? record->status : TaskStatus::Pending;
  }

  auto wait_for(const TaskId &id, TaskStatus wanted) -> bool {
    return poll_until([&] { return status_of(id) == wanted; }, kWait);
  }

  std::unique_ptr<Runtime> runtime_;
  std::unique_ptr<MemoryCache> cache_;
  std::unique_ptr<ResultStore> store_;
  std::unique_ptr<Orchestrator> orch_;
};

} // namespace

TEST_F(OrchestratorTest, RunsSpiderToCompletion) {
  auto id = start("example_spider", example_kwargs(5, 0));
  ASSERT_TRUE(wait_for(id, TaskStatus::Completed));

  auto record = orch_->status(id);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->items_count, 5U);
  EXPECT_TRUE(record->end_time.has_value());
  ASSERT_TRUE(record->result.has_value());
  EXPECT_EQ(record->result->close_reason, "finished");
  EXPECT_EQ(record->result->items_scraped, 5U);

  auto page = run_on(*runtime_, orch_->results(id, 0, 10));
  ASSERT_TRUE(page.has_value());
  EXPECT_EQ(page->total, 5U);
  ASSERT_EQ(page->items.size(), 5U);
  auto first = parse_json(page->items.front());
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*json_string(*first, "url"), "https://example.com/items/0");
  EXPECT_EQ(*json_string(*first, "task_id"), id.str());
}

TEST_F(OrchestratorTest, CompletionHookSeesCompletedRecord) {
  std::atomic<int> calls{0};
  orch_->set_completion_hook([&](const TaskRecord &record) {
    if (record.status == TaskStatus::Completed) {
      calls.fetch_add(1);
    }
  });
  auto id = start("example_spider", example_kwargs(2, 0));
  ASSERT_TRUE(wait_for(id, TaskStatus::Completed));
  EXPECT_TRUE(poll_until([&] { return calls.load() == 1; }, kWait));
}

TEST_F(OrchestratorTest, SpiderFailureMarksTaskFailed) {
  auto kwargs = example_kwargs(10, 0);
  kwargs["fail_after"] = std::int64_t{3};
  auto id = start("example_spider", std::move(kwargs));
  ASSERT_TRUE(wait_for(id, TaskStatus::Failed));

  auto record = orch_->status(id);
  ASSERT_TRUE(record->failure_reason.has_value());
  EXPECT_NE(record->failure_reason->find("simulated failure"),
            std::string::npos);
  // Items harvested before the crash are kept.
  EXPECT_EQ(record->items_count, 3U);
}

TEST_F(OrchestratorTest, StopWinsOverCompletion) {
  auto id = start("example_spider", example_kwargs(1000, 50));
  ASSERT_EQ(status_of(id), TaskStatus::Running);

  auto stopped = run_on(*runtime_, orch_->stop(id));
  ASSERT_TRUE(stopped.has_value());
  EXPECT_TRUE(*stopped);

  auto record = orch_->status(id);
  EXPECT_EQ(record->status, TaskStatus::Stopped);
  EXPECT_TRUE(record->end_time.has_value());
  EXPECT_FALSE(record->result.has_value());

  // The job's own completion arrives afterwards and is ignored.
  EXPECT_TRUE(poll_until([&] { return orch_->jobs().active_jobs() == 0; },
                         kWait));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(status_of(id), TaskStatus::Stopped);
}

TEST_F(OrchestratorTest, UncooperativeJobIsForcedStopped) {
  teardown();
  auto options = default_options();
  options.stop_timeout = std::chrono::milliseconds(200);
  build(std::move(options));

  auto kwargs = example_kwargs(20, 50);
  kwargs["ignore_stop"] = true;
  auto id = start("example_spider", std::move(kwargs));

  LogCapture capture;
  auto stopped = run_on(*runtime_, orch_->stop(id));
  ASSERT_TRUE(stopped.has_value());
  EXPECT_TRUE(*stopped);
  EXPECT_EQ(status_of(id), TaskStatus::Stopped);
  EXPECT_TRUE(capture.contains(log::Level::Warn, "did not stop within"));

  // The job keeps running to its end; the task stays STOPPED.
  EXPECT_TRUE(poll_until([&] { return orch_->jobs().active_jobs() == 0; },
                         kWait));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(status_of(id), TaskStatus::Stopped);
}

TEST_F(OrchestratorTest, StopOnlyAppliesToRunningTasks) {
  auto missing = run_on(*runtime_, orch_->stop(TaskId{"no-such-task"}));
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(Error::NotFound));

  auto id = start("example_spider", example_kwargs(1, 0));
  ASSERT_TRUE(wait_for(id, TaskStatus::Completed));
  auto done = run_on(*runtime_, orch_->stop(id));
  ASSERT_TRUE(done.has_value());
  EXPECT_FALSE(*done);
  EXPECT_EQ(status_of(id), TaskStatus::Completed);
}

TEST_F(OrchestratorTest, LaunchFailureStillReturnsId) {
  // Allowed but nothing is registered under the name.
  auto id = orch_->start(RunRequest{.spider_name = "news_spider"});
  ASSERT_TRUE(id.has_value());

  auto record = orch_->status(*id);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->status, TaskStatus::Failed);
  EXPECT_TRUE(record->failure_reason.has_value());
  EXPECT_TRUE(record->end_time.has_value());
}

TEST_F(OrchestratorTest, RejectsInvalidRequests) {
  auto expect_invalid = [&](RunRequest request) {
    auto id = orch_->start(std::move(request));
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error(), make_error_code(Error::InvalidArgument));
  };
  expect_invalid(RunRequest{.spider_name = "   "});
  expect_invalid(RunRequest{.spider_name = "product_spider"});
  expect_invalid(RunRequest{.spider_name = "example_spider", .priority = 0});
  expect_invalid(RunRequest{.spider_name = "example_spider", .priority = 11});
  expect_invalid(
      RunRequest{.spider_name = "example_spider", .timeout_sec = 30});
  expect_invalid(RunRequest{.spider_name = "example_spider",
                            .kwargs = JsonValue::array_t{}});
  EXPECT_TRUE(orch_->list().empty());
}

TEST_F(OrchestratorTest, RequestIsNormalized) {
  RunRequest request{.spider_name = "  example_spider\n"};
  EXPECT_FALSE(orch_->check_run_request(request).has_value());
  EXPECT_EQ(request.spider_name, "example_spider");
}

TEST_F(OrchestratorTest, ConcurrencyCeilingIsEnforced) {
  teardown();
  auto options = default_options();
  options.max_concurrent_spiders = 1;
  build(std::move(options));

  auto first = start("example_spider", example_kwargs(1000, 50));
  auto second = orch_->start(RunRequest{.spider_name = "example_spider"});
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error(), make_error_code(Error::ResourceExhausted));

  ASSERT_TRUE(run_on(*runtime_, orch_->stop(first)).value());
  EXPECT_TRUE(orch_->start(RunRequest{.spider_name = "example_spider",
                                      .kwargs = example_kwargs(1, 0)})
                  .has_value());
}

TEST_F(OrchestratorTest, ResultsForUnknownTaskIsNotFound) {
  auto page = run_on(*runtime_, orch_->results(TaskId{"ghost"}, 0, 10));
  ASSERT_FALSE(page.has_value());
  EXPECT_EQ(page.error(), make_error_code(Error::NotFound));
}

TEST_F(OrchestratorTest, StatsSummarizeTasks) {
  auto good = start("example_spider", example_kwargs(3, 0));
  auto kwargs = example_kwargs(5, 0);
  kwargs["fail_after"] = std::int64_t{0};
  auto bad = start("example_spider", std::move(kwargs));
  ASSERT_TRUE(wait_for(good, TaskStatus::Completed));
  ASSERT_TRUE(wait_for(bad, TaskStatus::Failed));

  auto stats = orch_->stats(1);
  EXPECT_EQ(stats.total_tasks, 2U);
  EXPECT_EQ(stats.total_items, 3U);
  EXPECT_DOUBLE_EQ(stats.success_rate, 50.0);
  EXPECT_EQ(stats.by_status[std::to_underlying(TaskStatus::Completed)], 1U);
  EXPECT_EQ(stats.by_status[std::to_underlying(TaskStatus::Failed)], 1U);
  EXPECT_EQ(stats.recent.size(), 1U);
}

TEST_F(OrchestratorTest, StopWithoutLiveJobStillFinalizes) {
  // A RUNNING task whose job handle is already gone.
  auto id = orch_->registry().create("example_spider",
                                     JsonValue::object_t{});
  ASSERT_TRUE(orch_->registry().mark_running(id).has_value());
  ASSERT_FALSE(orch_->jobs().find_handle(id).has_value());

  LogCapture capture;
  auto stopped = run_on(*runtime_, orch_->stop(id));
  ASSERT_TRUE(stopped.has_value());
  EXPECT_TRUE(*stopped);
  EXPECT_EQ(status_of(id), TaskStatus::Stopped);
  EXPECT_TRUE(orch_->status(id)->end_time.has_value());
  EXPECT_TRUE(capture.contains(log::Level::Info, "no live job"));
}

namespace {

class ProcessSpiderTest : public OrchestratorTest {
protected:
  void SetUp() override {
    auto options = default_options();
    options.allowed_spiders = {"lines", "env", "crash", "stubborn", "polite"};
    options.job.batch_size = 1;
    build(std::move(options));
    orch_->jobs().spiders().register_process_spiders({
        {.name = "lines",
         .command =
             R"(printf '{"url":"https://a.example/1","title":"one"}\nnot json\n\n{"url":"https://a.example/2","title":"two"}\n')"},
        {.name = "env",
         .command =
             R"(printf '{"url":"https://a.example/%s","title":"%s","kw":%s}\n' "$CRAWL_SPIDER" "$CRAWL_TASK_ID" "$CRAWL_KWARGS")"},
        {.name = "crash",
         .command = R"(echo 'boom: disk full' >&2; exit 3)"},
        {.name = "stubborn",
         .command =
             R"(trap '' TERM; printf '{"url":"https://a.example/s","title":"s"}\n'; while :; do sleep 0.05; done)",
         .grace_period_sec = 1},
        {.name = "polite",
         .command =
             R"(printf '{"url":"https://a.example/p","title":"p"}\n'; while :; do sleep 0.05; done)",
         .grace_period_sec = 5},
    });
  }

  auto wait_for_items(const TaskId &id, std::uint64_t n) -> bool {
    return poll_until(
        [&] {
          auto record = orch_->status(id);
          return record && record->items_count >= n;
        },
        kWait);
  }
};

} // namespace

TEST_F(ProcessSpiderTest, JsonLinesOnStdoutBecomeItems) {
  auto id = start("lines", JsonValue::object_t{});
  ASSERT_TRUE(wait_for(id, TaskStatus::Completed));
  EXPECT_EQ(orch_->status(id)->items_count, 2U);

  auto page = run_on(*runtime_, orch_->results(id, 0, 10));
  ASSERT_TRUE(page.has_value());
  ASSERT_EQ(page->items.size(), 2U);
  auto second = parse_json(page->items[1]);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*json_string(*second, "title"), "two");
  EXPECT_EQ(*json_string(*second, "spider_name"), "lines");
}

TEST_F(ProcessSpiderTest, EnvironmentCarriesTaskIdentity) {
  JsonValue kwargs = JsonValue::object_t{};
  kwargs["depth"] = std::int64_t{2};
  auto id = start("env", std::move(kwargs));
  ASSERT_TRUE(wait_for(id, TaskStatus::Completed));

  auto page = run_on(*runtime_, orch_->results(id, 0, 1));
  ASSERT_TRUE(page.has_value());
  ASSERT_EQ(page->items.size(), 1U);
  auto item = parse_json(page->items.front());
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(*json_string(*item, "url"), "https://a.example/env");
  EXPECT_EQ(*json_string(*item, "title"), id.str());
  const auto *kw = json_member(*item, "kw");
  ASSERT_NE(kw, nullptr);
  EXPECT_EQ(json_int(*kw, "depth", -1), 2);
}

TEST_F(ProcessSpiderTest, NonZeroExitFailsWithStderrTail) {
  auto id = start("crash", JsonValue::object_t{});
  ASSERT_TRUE(wait_for(id, TaskStatus::Failed));
  auto record = orch_->status(id);
  ASSERT_TRUE(record->failure_reason.has_value());
  EXPECT_NE(record->failure_reason->find("exit code 3"), std::string::npos);
  EXPECT_NE(record->failure_reason->find("boom: disk full"),
            std::string::npos);
}

TEST_F(ProcessSpiderTest, StopTerminatesChild) {
  auto id = start("polite", JsonValue::object_t{});
  ASSERT_TRUE(wait_for_items(id, 1));

  const auto began = std::chrono::steady_clock::now();
  auto stopped = run_on(*runtime_, orch_->stop(id));
  ASSERT_TRUE(stopped.has_value());
  EXPECT_TRUE(*stopped);
  EXPECT_LT(std::chrono::steady_clock::now() - began, std::chrono::seconds(4));
  EXPECT_EQ(status_of(id), TaskStatus::Stopped);
  EXPECT_TRUE(poll_until([&] { return orch_->jobs().active_jobs() == 0; },
                         kWait));
}

TEST_F(ProcessSpiderTest, IgnoredSigtermEscalatesToSigkill) {
  auto id = start("stubborn", JsonValue::object_t{});
  ASSERT_TRUE(wait_for_items(id, 1));

  LogCapture capture;
  const auto began = std::chrono::steady_clock::now();
  auto stopped = run_on(*runtime_, orch_->stop(id));
  const auto took = std::chrono::steady_clock::now() - began;
  ASSERT_TRUE(stopped.has_value());
  EXPECT_TRUE(*stopped);
  EXPECT_GE(took, std::chrono::milliseconds(900));
  EXPECT_EQ(status_of(id), TaskStatus::Stopped);
  EXPECT_TRUE(capture.contains(log::Level::Warn, "ignored SIGTERM"));
  EXPECT_FALSE(capture.contains(log::Level::Warn, "did not stop within"));
}
