#include "crawlforge/cache/memory_cache.hpp"
#include "crawlforge/crawl/rate_limiter.hpp"

#include "test_utils.hpp"
#include "gtest/gtest.h"

#include <chrono>

using namespace crawlforge;
using crawlforge::test::LogCapture;
using crawlforge::test::run_coro;

namespace {

class RateLimiterTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(run_coro(cache_.open()).has_value());
  }

  auto hit(std::string_view key) -> RateDecision {
    auto decision = run_coro(limiter_.hit(key));
    EXPECT_TRUE(decision.has_value());
    return decision.value_or(RateDecision{});
  }

  std::chrono::steady_clock::time_point now_{std::chrono::seconds(500)};
  MemoryCache cache_{[this] { return now_; }};
  RateLimiter limiter_{cache_, 3, std::chrono::seconds(60)};
};

} // namespace

TEST_F(RateLimiterTest, RefusesHitsPastCeiling) {
  for (int i = 1; i <= 3; ++i) {
    auto decision = hit("10.0.0.1");
    EXPECT_TRUE(decision.allowed) << "hit " << i;
    EXPECT_EQ(decision.count, i);
  }
  auto refused = hit("10.0.0.1");
  EXPECT_FALSE(refused.allowed);
  EXPECT_EQ(refused.count, 4);
  EXPECT_EQ(refused.limit, 3);
  EXPECT_GT(refused.retry_after, 0);
  EXPECT_LE(refused.retry_after, 60);
}

TEST_F(RateLimiterTest, WindowResetsAfterExpiry) {
  for (int i = 0; i < 4; ++i) {
    (void)hit("10.0.0.1");
  }
  EXPECT_FALSE(hit("10.0.0.1").allowed);

  now_ += std::chrono::seconds(61);
  auto decision = hit("10.0.0.1");
  EXPECT_TRUE(decision.allowed);
  EXPECT_EQ(decision.count, 1);
}

TEST_F(RateLimiterTest, RetryAfterTracksRemainingWindow) {
  (void)hit("10.0.0.1");
  now_ += std::chrono::seconds(45);
  auto decision = hit("10.0.0.1");
  EXPECT_EQ(decision.retry_after, 15);
}

TEST_F(RateLimiterTest, ClientsAreCountedSeparately) {
  for (int i = 0; i < 3; ++i) {
    (void)hit("10.0.0.1");
  }
  EXPECT_FALSE(hit("10.0.0.1").allowed);
  EXPECT_TRUE(hit("10.0.0.2").allowed);
}

TEST_F(RateLimiterTest, FirstHitSetsWindowExpiry) {
  (void)hit("10.0.0.1");
  EXPECT_EQ(run_coro(cache_.ttl("rate_limit:10.0.0.1")).value(), 60);
}

TEST_F(RateLimiterTest, RepairsCounterWithoutExpiry) {
  // A counter left behind without a TTL.
  ASSERT_TRUE(run_coro(cache_.incr("rate_limit:10.0.0.1")).has_value());
  ASSERT_EQ(run_coro(cache_.ttl("rate_limit:10.0.0.1")).value(),
            kTtlPersistent);

  LogCapture capture;
  auto decision = hit("10.0.0.1");
  EXPECT_TRUE(decision.allowed);
  EXPECT_EQ(decision.count, 2);
  EXPECT_TRUE(capture.contains(log::Level::Warn, "had no expiry"));
  EXPECT_EQ(run_coro(cache_.ttl("rate_limit:10.0.0.1")).value(), 60);

  now_ += std::chrono::seconds(60);
  EXPECT_EQ(hit("10.0.0.1").count, 1);
}

TEST_F(RateLimiterTest, CacheOutageIsReported) {
  cache_.set_available(false);
  auto decision = run_coro(limiter_.hit("10.0.0.1"));
  ASSERT_FALSE(decision.has_value());
  EXPECT_EQ(decision.error(), make_error_code(Error::CacheUnavailable));
}
