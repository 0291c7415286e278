#include "crawlforge/app/api/api_server.hpp"
#include "crawlforge/app/application.hpp"
#include "crawlforge/cache/cache.hpp"
#include "crawlforge/cache/memory_cache.hpp"
#include "crawlforge/util/json.hpp"

#include "test_utils.hpp"
#include "gtest/gtest.h"

#include <chrono>
#include <format>
#include <memory>
#include <string>

using namespace crawlforge;
using crawlforge::test::http_get;
using crawlforge::test::http_post;
using crawlforge::test::poll_until;

namespace {

constexpr auto kWait = std::chrono::seconds(5);

auto make_config(int rate_limit_requests) -> Config {
  Config config;
  config.server.shards = 2;
  config.api.host = "127.0.0.1";
  config.api.port = 0;
  config.api.rate_limit_requests = rate_limit_requests;
  config.cache.backend = CacheBackend::Memory;
  config.database.enabled = false;
  config.crawler.allowed_spiders = {"example_spider", "news_spider"};
  config.crawler.stop_timeout_sec = 5;
  return config;
}

auto body_of(const test::RawHttpResponse &resp) -> JsonValue {
  auto parsed = parse_json(resp.body);
  EXPECT_TRUE(parsed.has_value()) << resp.body;
  return parsed.value_or(JsonValue{});
}

class ApiE2ETest : public ::testing::Test {
protected:
  void SetUp() override { start_app(make_config(1000)); }
  void TearDown() override {
    if (app_) {
      app_->stop();
    }
  }

  void start_app(Config config) {
    if (app_) {
      app_->stop();
    }
    app_ = std::make_unique<Application>(std::move(config));
    ASSERT_TRUE(app_->start().has_value());
    port_ = app_->api_server()->local_port();
    ASSERT_NE(port_, 0);
  }

  auto run_spider(std::string_view body) -> std::string {
    auto resp = http_post(port_, "/api/v1/spiders/run", body);
    EXPECT_EQ(resp.status, 200) << resp.body;
    const auto *id = json_string(body_of(resp), "task_id");
    return id ? *id : std::string{};
  }

  auto task_status(const std::string &id) -> std::string {
    auto resp = http_get(port_, std::format("/api/v1/spiders/tasks/{}", id));
    const auto *status = json_string(body_of(resp), "status");
    return status ? *status : std::string{};
  }

  std::unique_ptr<Application> app_;
  std::uint16_t port_{0};
};

} // namespace

TEST_F(ApiE2ETest, RunThenFetchResults) {
  auto id = run_spider(
      R"({"spider_name":"example_spider","spider_kwargs":{"count":4,"interval_ms":0}})");
  ASSERT_FALSE(id.empty());
  ASSERT_TRUE(
      poll_until([&] { return task_status(id) == "completed"; }, kWait));

  auto status = body_of(
      http_get(port_, std::format("/api/v1/spiders/tasks/{}", id)));
  EXPECT_EQ(json_int(status, "items_count", -1), 4);
  EXPECT_EQ(*json_string(status, "spider_name"), "example_spider");
  EXPECT_NE(json_string(status, "end_time"), nullptr);

  auto resp = http_get(
      port_, std::format("/api/v1/spiders/results/{}?start=1&limit=2", id));
  ASSERT_EQ(resp.status, 200) << resp.body;
  auto results = body_of(resp);
  const auto *items = json_member(results, "items");
  ASSERT_NE(items, nullptr);
  ASSERT_TRUE(items->is_array());
  ASSERT_EQ(items->get_array().size(), 2U);
  EXPECT_EQ(json_int(items->get_array()[0], "index", -1), 1);

  const auto *page = json_member(results, "pagination");
  ASSERT_NE(page, nullptr);
  EXPECT_EQ(json_int(*page, "total", -1), 4);
  EXPECT_EQ(json_int(*page, "start", -1), 1);
  EXPECT_TRUE(json_bool(*page, "has_more", false));
}

TEST_F(ApiE2ETest, ListIsKeyedByTaskId) {
  auto id = run_spider(
      R"({"spider_name":"example_spider","spider_kwargs":{"count":1,"interval_ms":0}})");
  auto resp = http_get(port_, "/api/v1/spiders/tasks");
  ASSERT_EQ(resp.status, 200);
  auto tasks = body_of(resp);
  ASSERT_TRUE(tasks.is_object());
  EXPECT_NE(json_member(tasks, id), nullptr);
}

TEST_F(ApiE2ETest, StopRunningTask) {
  auto id = run_spider(
      R"({"spider_name":"example_spider","spider_kwargs":{"count":1000,"interval_ms":50}})");
  ASSERT_FALSE(id.empty());

  auto resp =
      http_post(port_, std::format("/api/v1/spiders/tasks/{}/stop", id), "{}");
  EXPECT_EQ(resp.status, 200) << resp.body;
  EXPECT_EQ(task_status(id), "stopped");

  // A second stop finds nothing to stop.
  auto again =
      http_post(port_, std::format("/api/v1/spiders/tasks/{}/stop", id), "{}");
  EXPECT_EQ(again.status, 404);
}

TEST_F(ApiE2ETest, UnknownTaskIs404) {
  EXPECT_EQ(http_get(port_, "/api/v1/spiders/tasks/nope").status, 404);
  EXPECT_EQ(http_get(port_, "/api/v1/spiders/results/nope").status, 404);
  auto stop = http_post(port_, "/api/v1/spiders/tasks/nope/stop", "{}");
  EXPECT_EQ(stop.status, 404);
  EXPECT_EQ(*json_string(body_of(stop), "error"), "NotFound");
}

TEST_F(ApiE2ETest, InvalidRunRequestsAre400) {
  for (std::string_view body :
       {R"(not json)", R"({"spider_kwargs":{}})",
        R"({"spider_name":"product_spider"})",
        R"({"spider_name":"example_spider","priority":42})",
        R"({"spider_name":"example_spider","timeout":10})",
        R"({"spider_name":"example_spider","priority":4294967301})",
        R"({"spider_name":"example_spider","timeout":-4294963596})",
        R"({"spider_name":"example_spider","spider_kwargs":[1,2]})"}) {
    auto resp = http_post(port_, "/api/v1/spiders/run", body);
    EXPECT_EQ(resp.status, 400) << body;
    EXPECT_EQ(*json_string(body_of(resp), "error"), "InvalidRequest") << body;
  }
  EXPECT_TRUE(body_of(http_get(port_, "/api/v1/spiders/tasks"))
                  .get_object()
                  .empty());
}

TEST_F(ApiE2ETest, InvalidPaginationIs400) {
  auto id = run_spider(
      R"({"spider_name":"example_spider","spider_kwargs":{"count":1,"interval_ms":0}})");
  EXPECT_EQ(http_get(port_, std::format("/api/v1/spiders/results/{}?limit=0", id))
                .status,
            400);
  EXPECT_EQ(
      http_get(port_, std::format("/api/v1/spiders/results/{}?start=-1", id))
          .status,
      400);
  EXPECT_EQ(
      http_get(port_, std::format("/api/v1/spiders/results/{}?limit=abc", id))
          .status,
      400);
}

TEST_F(ApiE2ETest, LaunchFailureIsReportedOnTask) {
  auto id = run_spider(R"({"spider_name":"news_spider"})");
  ASSERT_FALSE(id.empty());
  EXPECT_EQ(task_status(id), "failed");
}

TEST_F(ApiE2ETest, HealthReportsServices) {
  auto resp = http_get(port_, "/api/v1/monitoring/health");
  ASSERT_EQ(resp.status, 200) << resp.body;
  auto health = body_of(resp);
  EXPECT_EQ(*json_string(health, "status"), "healthy");
  const auto *services = json_member(health, "services");
  ASSERT_NE(services, nullptr);
  EXPECT_EQ(*json_string(*json_member(*services, "cache"), "status"),
            "healthy");
  EXPECT_EQ(*json_string(*json_member(*services, "database"), "status"),
            "disabled");

  auto liveness = http_get(port_, "/health");
  EXPECT_EQ(liveness.status, 200);
}

TEST_F(ApiE2ETest, CacheOutageMakesHealthUnhealthy) {
  static_cast<MemoryCache &>(app_->cache()).set_available(false);
  auto resp = http_get(port_, "/api/v1/monitoring/health");
  EXPECT_EQ(resp.status, 503);
  EXPECT_EQ(*json_string(body_of(resp), "status"), "unhealthy");
  static_cast<MemoryCache &>(app_->cache()).set_available(true);
}

TEST_F(ApiE2ETest, StatsAndMetrics) {
  auto id = run_spider(
      R"({"spider_name":"example_spider","spider_kwargs":{"count":2,"interval_ms":0}})");
  ASSERT_TRUE(
      poll_until([&] { return task_status(id) == "completed"; }, kWait));

  auto stats = body_of(http_get(port_, "/api/v1/monitoring/stats"));
  const auto *overview = json_member(stats, "overview");
  ASSERT_NE(overview, nullptr);
  EXPECT_EQ(json_int(*overview, "total_tasks", -1), 1);
  EXPECT_EQ(json_int(*overview, "total_items", -1), 2);

  auto metrics = body_of(http_get(port_, "/api/v1/monitoring/metrics"));
  const auto *application = json_member(metrics, "application");
  ASSERT_NE(application, nullptr);
  EXPECT_EQ(json_int(*application, "completed_tasks", -1), 1);

  auto prometheus = http_get(port_, "/metrics");
  EXPECT_EQ(prometheus.status, 200);
  EXPECT_NE(prometheus.body.find("crawlforge_tasks{status=\"completed\"} 1"),
            std::string::npos);
}

TEST_F(ApiE2ETest, RateLimitReturns429WithRetryAfter) {
  start_app(make_config(3));
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(http_get(port_, "/api/v1/spiders/tasks").status, 200);
  }
  auto refused = http_get(port_, "/api/v1/spiders/tasks");
  EXPECT_EQ(refused.status, 429);
  EXPECT_EQ(*json_string(body_of(refused), "error"), "RateLimitExceeded");
  auto retry_after = refused.header("Retry-After");
  ASSERT_TRUE(retry_after.has_value()) << refused.headers;
  EXPECT_GT(std::stoi(*retry_after), 0);

  // Monitoring endpoints are not limited.
  EXPECT_EQ(http_get(port_, "/api/v1/monitoring/health").status, 200);
}
