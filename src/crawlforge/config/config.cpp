#include "crawlforge/config/config.hpp"
#include "crawlforge/config/toml_util.hpp"

#include "crawlforge/core/error.hpp"
#include "crawlforge/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <cstdlib>
#include <string>
#include <string_view>

namespace crawlforge {
namespace detail {

struct ServerToml {
  std::string log_level{"info"};
  std::string log_file;
  std::string pid_file;
  int shards{0};
};

struct ApiToml {
  bool enabled{true};
  uint16_t port{8000};
  std::string host{"0.0.0.0"};
  bool reuse_port{false};
  bool rate_limit_enabled{true};
  int rate_limit_requests{60};
  int rate_limit_window_sec{60};
};

struct CacheToml {
  std::string backend{"redis"};
  std::string host{"127.0.0.1"};
  uint16_t port{6379};
  std::string password;
  int db{0};
  int health_check_sec{2};
  int connect_timeout_ms{2000};
  int command_timeout_ms{2000};
};

struct DatabaseToml {
  bool enabled{false};
  std::string host{"127.0.0.1"};
  uint16_t port{3306};
  std::string username{"crawlforge"};
  std::string password;
  std::string database{"crawlforge"};
  uint16_t connect_timeout{5};
};

struct CrawlerToml {
  std::vector<std::string> allowed_spiders{"example_spider", "news_spider",
                                           "product_spider"};
  int max_concurrent_spiders{5};
  int default_timeout_sec{3600};
  int stop_timeout_sec{30};
  int result_ttl_sec{3600};
  int ingest_batch_size{50};
  bool validate_items{true};
  bool deduplicate_items{true};
};

struct SpiderToml {
  std::string name;
  std::string command;
  std::string working_dir;
  int grace_period_sec{5};
};

struct SystemToml {
  ServerToml server{};
  ApiToml api{};
  CacheToml cache{};
  DatabaseToml database{};
  CrawlerToml crawler{};
  std::vector<SpiderToml> spiders;
};

} // namespace detail
} // namespace crawlforge

namespace glz {
template <> struct meta<crawlforge::detail::ServerToml> {
  using T = crawlforge::detail::ServerToml;
  static constexpr auto value =
      object("log_level", &T::log_level, "log_file", &T::log_file, "pid_file",
             &T::pid_file, "shards", &T::shards);
};

template <> struct meta<crawlforge::detail::ApiToml> {
  using T = crawlforge::detail::ApiToml;
  static constexpr auto value =
      object("enabled", &T::enabled, "port", &T::port, "host", &T::host,
             "reuse_port", &T::reuse_port, "rate_limit_enabled",
             &T::rate_limit_enabled, "rate_limit_requests",
             &T::rate_limit_requests, "rate_limit_window_sec",
             &T::rate_limit_window_sec);
};

template <> struct meta<crawlforge::detail::CacheToml> {
  using T = crawlforge::detail::CacheToml;
  static constexpr auto value =
      object("backend", &T::backend, "host", &T::host, "port", &T::port,
             "password", &T::password, "db", &T::db, "health_check_sec",
             &T::health_check_sec, "connect_timeout_ms",
             &T::connect_timeout_ms, "command_timeout_ms",
             &T::command_timeout_ms);
};

template <> struct meta<crawlforge::detail::DatabaseToml> {
  using T = crawlforge::detail::DatabaseToml;
  static constexpr auto value =
      object("enabled", &T::enabled, "host", &T::host, "port", &T::port,
             "username", &T::username, "password", &T::password, "database",
             &T::database, "connect_timeout", &T::connect_timeout);
};

template <> struct meta<crawlforge::detail::CrawlerToml> {
  using T = crawlforge::detail::CrawlerToml;
  static constexpr auto value = object(
      "allowed_spiders", &T::allowed_spiders, "max_concurrent_spiders",
      &T::max_concurrent_spiders, "default_timeout_sec",
      &T::default_timeout_sec, "stop_timeout_sec", &T::stop_timeout_sec,
      "result_ttl_sec", &T::result_ttl_sec, "ingest_batch_size",
      &T::ingest_batch_size, "validate_items", &T::validate_items,
      "deduplicate_items", &T::deduplicate_items);
};

template <> struct meta<crawlforge::detail::SpiderToml> {
  using T = crawlforge::detail::SpiderToml;
  static constexpr auto value =
      object("name", &T::name, "command", &T::command, "working_dir",
             &T::working_dir, "grace_period_sec", &T::grace_period_sec);
};

template <> struct meta<crawlforge::detail::SystemToml> {
  using T = crawlforge::detail::SystemToml;
  static constexpr auto value =
      object("server", &T::server, "api", &T::api, "cache", &T::cache,
             "database", &T::database, "crawler", &T::crawler, "spiders",
             &T::spiders);
};
} // namespace glz

namespace crawlforge {
namespace {

template <typename T>
auto override_from_env(const char *name, T &field) -> void {
  if (const char *v = std::getenv(name); v != nullptr) {
    field = boost::lexical_cast<T>(v);
  }
}

auto apply_env_overrides(SystemConfig &cfg) -> void {
  override_from_env("CRAWLFORGE_API_HOST", cfg.api.host);
  override_from_env("CRAWLFORGE_API_PORT", cfg.api.port);
  override_from_env("CRAWLFORGE_CACHE_HOST", cfg.cache.host);
  override_from_env("CRAWLFORGE_CACHE_PORT", cfg.cache.port);
  override_from_env("CRAWLFORGE_CACHE_PASSWORD", cfg.cache.password);
  override_from_env("CRAWLFORGE_MYSQL_HOST", cfg.database.host);
  override_from_env("CRAWLFORGE_MYSQL_PASSWORD", cfg.database.password);
  override_from_env("CRAWLFORGE_LOG_LEVEL", cfg.server.log_level);
  if (const char *v = std::getenv("CRAWLFORGE_CACHE_BACKEND"); v != nullptr) {
    cfg.cache.backend = parse<CacheBackend>(v);
  }
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<SystemConfig> {
  auto raw_result = toml_util::parse_toml<detail::SystemToml>(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  auto backend = util::normalize_enum_token(raw.cache.backend);
  if (backend != "redis" && backend != "memory") {
    log::error("Unknown cache backend '{}'", raw.cache.backend);
    return fail(Error::ParseError);
  }

  SystemConfig cfg{};
  cfg.server = ServerConfig{.log_level = std::move(raw.server.log_level),
                            .log_file = std::move(raw.server.log_file),
                            .pid_file = std::move(raw.server.pid_file),
                            .shards = raw.server.shards};

  cfg.api = ApiConfig{.enabled = raw.api.enabled,
                      .port = raw.api.port,
                      .host = std::move(raw.api.host),
                      .reuse_port = raw.api.reuse_port,
                      .rate_limit_enabled = raw.api.rate_limit_enabled,
                      .rate_limit_requests = raw.api.rate_limit_requests,
                      .rate_limit_window_sec = raw.api.rate_limit_window_sec};

  cfg.cache = CacheConfig{.backend = parse<CacheBackend>(backend),
                          .host = std::move(raw.cache.host),
                          .port = raw.cache.port,
                          .password = std::move(raw.cache.password),
                          .db = raw.cache.db,
                          .health_check_sec = raw.cache.health_check_sec,
                          .connect_timeout_ms = raw.cache.connect_timeout_ms,
                          .command_timeout_ms = raw.cache.command_timeout_ms};

  cfg.database =
      DatabaseConfig{.enabled = raw.database.enabled,
                     .host = std::move(raw.database.host),
                     .port = raw.database.port,
                     .username = std::move(raw.database.username),
                     .password = std::move(raw.database.password),
                     .database = std::move(raw.database.database),
                     .connect_timeout = raw.database.connect_timeout};

  cfg.crawler = CrawlerConfig{
      .allowed_spiders = std::move(raw.crawler.allowed_spiders),
      .max_concurrent_spiders = raw.crawler.max_concurrent_spiders,
      .default_timeout_sec = raw.crawler.default_timeout_sec,
      .stop_timeout_sec = raw.crawler.stop_timeout_sec,
      .result_ttl_sec = raw.crawler.result_ttl_sec,
      .ingest_batch_size = raw.crawler.ingest_batch_size,
      .validate_items = raw.crawler.validate_items,
      .deduplicate_items = raw.crawler.deduplicate_items};

  cfg.spiders.reserve(raw.spiders.size());
  for (auto &s : raw.spiders) {
    cfg.spiders.push_back(
        ProcessSpiderConfig{.name = std::move(s.name),
                            .command = std::move(s.command),
                            .working_dir = std::move(s.working_dir),
                            .grace_period_sec = s.grace_period_sec});
  }

  apply_env_overrides(cfg);
  if (auto valid = ConfigLoader::validate(cfg); !valid) {
    return fail(valid.error());
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::validate(const SystemConfig &cfg) -> Result<void> {
  const auto &c = cfg.crawler;
  const bool api_ok = !cfg.api.enabled ||
                      (cfg.api.port != 0 && cfg.api.rate_limit_requests > 0 &&
                       cfg.api.rate_limit_window_sec > 0);
  const bool cache_ok = cfg.cache.backend == CacheBackend::Memory ||
                        (cfg.cache.port != 0 &&
                         cfg.cache.health_check_sec >= 0 &&
                         cfg.cache.command_timeout_ms > 0);
  const bool crawler_ok = c.max_concurrent_spiders >= 0 &&
                          c.default_timeout_sec >= 60 &&
                          c.stop_timeout_sec > 0 && c.result_ttl_sec > 0 &&
                          c.ingest_batch_size > 0;
  const bool spiders_ok =
      std::ranges::all_of(cfg.spiders, [](const ProcessSpiderConfig &s) {
        return !s.name.empty() && !s.command.empty() && s.grace_period_sec >= 0;
      });

  if (!api_ok || !cache_ok || !crawler_ok || !spiders_ok ||
      cfg.server.shards < 0) {
    log::error("Invalid configuration: api={} cache={} crawler={} spiders={}",
               api_ok, cache_ok, crawler_ok, spiders_ok);
    return fail(Error::ParseError);
  }
  return ok();
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const std::exception &e) {
    log::error("Failed to load configuration: {}", e.what());
    return fail(Error::ParseError);
  }
}

} // namespace crawlforge
