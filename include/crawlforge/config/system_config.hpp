#pragma once

#include "crawlforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace crawlforge {

struct ServerConfig {
  std::string log_level{"info"};
  std::string log_file;
  std::string pid_file;
  int shards{0}; // 0 = auto (hardware_concurrency)

  auto operator==(const ServerConfig &) const -> bool = default;
};

struct ApiConfig {
  bool enabled{true};
  uint16_t port{8000};
  std::string host{"0.0.0.0"};
  bool reuse_port{false};
  bool rate_limit_enabled{true};
  int rate_limit_requests{60};
  int rate_limit_window_sec{60};

  auto operator==(const ApiConfig &) const -> bool = default;
};

enum class CacheBackend : std::uint8_t { Redis, Memory };
BOOST_DESCRIBE_ENUM(CacheBackend, Redis, Memory)
CRAWLFORGE_DEFINE_ENUM_SERDE(CacheBackend, CacheBackend::Redis)

struct CacheConfig {
  CacheBackend backend{CacheBackend::Redis};
  std::string host{"127.0.0.1"};
  uint16_t port{6379};
  std::string password;
  int db{0};
  /// PING interval on the idle connection; 0 disables it.
  int health_check_sec{2};
  int connect_timeout_ms{2000};
  int command_timeout_ms{2000};

  auto operator==(const CacheConfig &) const -> bool = default;
};

struct DatabaseConfig {
  bool enabled{false};
  std::string host{"127.0.0.1"};
  uint16_t port{3306};
  std::string username{"crawlforge"};
  std::string password;
  std::string database{"crawlforge"};
  uint16_t connect_timeout{5}; // seconds

  auto operator==(const DatabaseConfig &) const -> bool = default;
};

struct CrawlerConfig {
  std::vector<std::string> allowed_spiders{"example_spider", "news_spider",
                                           "product_spider"};
  int max_concurrent_spiders{5}; // 0 = unlimited
  int default_timeout_sec{3600};
  int stop_timeout_sec{30};
  int result_ttl_sec{3600};
  int ingest_batch_size{50};
  bool validate_items{true};
  bool deduplicate_items{true};

  auto operator==(const CrawlerConfig &) const -> bool = default;
};

/// An external crawler executable run through `/bin/sh -c`.
struct ProcessSpiderConfig {
  std::string name;
  std::string command;
  std::string working_dir;
  int grace_period_sec{5};

  auto operator==(const ProcessSpiderConfig &) const -> bool = default;
};

struct SystemConfig {
  ServerConfig server;
  ApiConfig api;
  CacheConfig cache;
  DatabaseConfig database;
  CrawlerConfig crawler;
  std::vector<ProcessSpiderConfig> spiders;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace crawlforge
