#include "crawlforge/config/config.hpp"

#include "test_utils.hpp"
#include "gtest/gtest.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace crawlforge;

namespace {

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() { ::unsetenv(name_); }

  ScopedEnv(const ScopedEnv &) = delete;
  auto operator=(const ScopedEnv &) -> ScopedEnv & = delete;

private:
  const char *name_;
};

} // namespace

TEST(ConfigTest, BlankInputYieldsDefaults) {
  auto cfg = ConfigLoader::load_from_string("");
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(*cfg, SystemConfig{});
  EXPECT_EQ(cfg->api.port, 8000);
  EXPECT_EQ(cfg->cache.backend, CacheBackend::Redis);
  EXPECT_EQ(cfg->crawler.stop_timeout_sec, 30);
  EXPECT_EQ(cfg->crawler.allowed_spiders.size(), 3U);
  EXPECT_FALSE(cfg->database.enabled);
}

TEST(ConfigTest, ParsesSections) {
  auto cfg = ConfigLoader::load_from_string(R"(
[server]
log_level = "debug"
shards = 2

[api]
host = "127.0.0.1"
port = 9100
rate_limit_requests = 10

[cache]
backend = "memory"
health_check_sec = 10

[crawler]
allowed_spiders = ["example_spider"]
max_concurrent_spiders = 2
default_timeout_sec = 600
result_ttl_sec = 120
)");
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->server.log_level, "debug");
  EXPECT_EQ(cfg->server.shards, 2);
  EXPECT_EQ(cfg->api.host, "127.0.0.1");
  EXPECT_EQ(cfg->api.port, 9100);
  EXPECT_EQ(cfg->api.rate_limit_requests, 10);
  EXPECT_EQ(cfg->cache.backend, CacheBackend::Memory);
  EXPECT_EQ(cfg->cache.health_check_sec, 10);
  EXPECT_EQ(cfg->crawler.allowed_spiders,
            (std::vector<std::string>{"example_spider"}));
  EXPECT_EQ(cfg->crawler.max_concurrent_spiders, 2);
  EXPECT_EQ(cfg->crawler.default_timeout_sec, 600);
  EXPECT_EQ(cfg->crawler.result_ttl_sec, 120);
}

TEST(ConfigTest, UnknownKeysAreIgnored) {
  auto cfg = ConfigLoader::load_from_string(R"(
[api]
port = 8100
colour = "blue"
)");
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->api.port, 8100);
}

TEST(ConfigTest, RejectsUnknownCacheBackend) {
  auto cfg = ConfigLoader::load_from_string(R"(
[cache]
backend = "memcached"
)");
  ASSERT_FALSE(cfg.has_value());
  EXPECT_EQ(cfg.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, RejectsShortDefaultTimeout) {
  auto cfg = ConfigLoader::load_from_string(R"(
[crawler]
default_timeout_sec = 59
)");
  EXPECT_FALSE(cfg.has_value());
}

TEST(ConfigTest, RejectsZeroApiPort) {
  auto cfg = ConfigLoader::load_from_string(R"(
[api]
port = 0
)");
  EXPECT_FALSE(cfg.has_value());

  auto disabled = ConfigLoader::load_from_string(R"(
[api]
enabled = false
port = 0
)");
  EXPECT_TRUE(disabled.has_value());
}

TEST(ConfigTest, ValidateChecksCrawlerLimits) {
  SystemConfig cfg;
  EXPECT_TRUE(ConfigLoader::validate(cfg).has_value());

  cfg.crawler.stop_timeout_sec = 0;
  EXPECT_FALSE(ConfigLoader::validate(cfg).has_value());

  cfg = SystemConfig{};
  cfg.crawler.ingest_batch_size = 0;
  EXPECT_FALSE(ConfigLoader::validate(cfg).has_value());

  cfg = SystemConfig{};
  cfg.spiders.push_back(ProcessSpiderConfig{.name = "scrapy_news"});
  EXPECT_FALSE(ConfigLoader::validate(cfg).has_value());
  cfg.spiders.back().command = "scrapy crawl news";
  EXPECT_TRUE(ConfigLoader::validate(cfg).has_value());
}

TEST(ConfigTest, EnvironmentOverridesFile) {
  ScopedEnv host("CRAWLFORGE_CACHE_HOST", "redis.internal");
  ScopedEnv port("CRAWLFORGE_API_PORT", "8555");
  ScopedEnv backend("CRAWLFORGE_CACHE_BACKEND", "memory");

  auto cfg = ConfigLoader::load_from_string(R"(
[api]
port = 9000

[cache]
host = "localhost"
)");
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->cache.host, "redis.internal");
  EXPECT_EQ(cfg->api.port, 8555);
  EXPECT_EQ(cfg->cache.backend, CacheBackend::Memory);
}

TEST(ConfigTest, MalformedEnvironmentValueFailsLoad) {
  ScopedEnv port("CRAWLFORGE_API_PORT", "not-a-port");
  auto cfg = ConfigLoader::load_from_string("");
  ASSERT_FALSE(cfg.has_value());
  EXPECT_EQ(cfg.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, LoadsFromFile) {
  const auto dir = crawlforge::test::make_temp_dir();
  ASSERT_FALSE(dir.empty());
  const auto path = std::filesystem::path(dir) / "crawlforge.toml";
  {
    std::ofstream out(path);
    out << "[api]\nport = 8200\n";
  }

  auto cfg = ConfigLoader::load_from_file(path.string());
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->api.port, 8200);

  auto missing = ConfigLoader::load_from_file((path.parent_path() / "nope.toml").string());
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(Error::FileNotFound));

  std::filesystem::remove_all(dir);
}
