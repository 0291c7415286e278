#include "crawlforge/app/application.hpp"

#include "crawlforge/app/api/api_server.hpp"
#include "crawlforge/cache/memory_cache.hpp"
#include "crawlforge/cache/redis_cache.hpp"
#include "crawlforge/client/http/http_client.hpp"
#include "crawlforge/core/constants.hpp"
#include "crawlforge/crawl/orchestrator.hpp"
#include "crawlforge/crawl/rate_limiter.hpp"
#include "crawlforge/crawl/result_store.hpp"
#include "crawlforge/storage/mysql_probe.hpp"
#include "crawlforge/util/json.hpp"
#include "crawlforge/util/log.hpp"
#include "crawlforge/util/time.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_future.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <string>

namespace crawlforge {
namespace {

template <typename T>
auto sync_wait_on_runtime(Runtime &runtime, task<T> op) -> T {
  auto fut = boost::asio::co_spawn(
      runtime.shard(runtime.next_external_shard()).ctx(), std::move(op),
      boost::asio::use_future);
  return fut.get();
}

auto make_cache(const CacheConfig &cfg) -> std::unique_ptr<ICache> {
  switch (cfg.backend) {
  case CacheBackend::Memory:
    return std::make_unique<MemoryCache>();
  case CacheBackend::Redis:
    break;
  }
  return std::make_unique<RedisCache>(cfg);
}

auto post_callback(TaskId task_id, std::string url, std::string body)
    -> task<void> {
  auto executor = co_await boost::asio::this_coro::executor;
  auto resp = co_await http::HttpClient::post_json_to(executor, url, body);
  if (!resp) {
    log::warn("[{}] completion callback to {} failed: {}", task_id, url,
              resp.error().message());
    co_return;
  }
  if (static_cast<int>(resp->status) >= 400) {
    log::warn("[{}] completion callback to {} returned {}", task_id, url,
              resp->status);
    co_return;
  }
  log::debug("[{}] completion callback delivered to {}", task_id, url);
}

} // namespace

Application::Application() { build_services(); }

Application::Application(Config config) : config_(std::move(config)) {
  build_services();
}

Application::~Application() { stop(); }

auto Application::load_config(std::string_view path) -> Result<void> {
  if (is_running()) {
    return fail(Error::InvalidState);
  }
  return ConfigLoader::load_from_file(path).transform([this](Config &&cfg) {
    config_ = std::move(cfg);
    build_services();
  });
}

auto Application::config() const noexcept -> const Config & { return config_; }

auto Application::build_services() -> void {
  api_.reset();
  orchestrator_.reset();
  database_.reset();
  rate_limiter_.reset();
  results_.reset();
  cache_.reset();
  runtime_.reset();

  runtime_ = std::make_unique<Runtime>(
      static_cast<unsigned>(std::max(0, config_.server.shards)));
  cache_ = make_cache(config_.cache);
  results_ = std::make_unique<ResultStore>(
      *cache_, std::chrono::seconds(config_.crawler.result_ttl_sec));

  if (config_.api.rate_limit_enabled) {
    rate_limiter_ = std::make_unique<RateLimiter>(
        *cache_, config_.api.rate_limit_requests,
        std::chrono::seconds(config_.api.rate_limit_window_sec));
  }
  if (config_.database.enabled) {
    database_ = std::make_unique<storage::MySQLProbe>(
        runtime_->executor_for(0), config_.database);
  }

  orchestrator_ = std::make_unique<Orchestrator>(
      *runtime_, *results_, OrchestratorOptions::from(config_.crawler));
  orchestrator_->jobs().spiders().register_process_spiders(config_.spiders);
  orchestrator_->set_completion_hook(
      [this](const TaskRecord &record) { notify_callback(record); });

  if (config_.api.enabled) {
    api_ = std::make_unique<ApiServer>(*this);
  }
}

auto Application::start() -> Result<void> {
  if (running_.exchange(true))
    return ok();

  std::signal(SIGPIPE, SIG_IGN);

  auto runtime_res = runtime_->start();
  if (!runtime_res) {
    running_ = false;
    return fail(runtime_res.error());
  }

  log::start();
  log::info("Runtime started with {} shard(s)", runtime_->shard_count());

  if (auto opened = sync_wait_on_runtime(*runtime_, cache_->open()); !opened) {
    log::error("Cache connection failed: {}", opened.error().message());
    runtime_->stop();
    running_ = false;
    return fail(opened.error());
  }

  if (database_) {
    database_->open();
  }

  orchestrator_->start_engine();
  log::info("Crawl engine started with {} registered spider(s)",
            orchestrator_->jobs().spiders().registered_names().size());

  if (api_) {
    if (auto r = api_->start(); !r) {
      stop();
      return fail(r.error());
    }
  }

  log::info("{} {} started", kServiceName, kVersion);
  return ok();
}

auto Application::stop() noexcept -> void {
  if (!running_.exchange(false))
    return;

  log::info("Stopping {}...", kServiceName);

  // Reject new requests first.
  if (api_)
    api_->stop();

  // Ask live jobs to stop; their final batches still reach the store.
  orchestrator_->stop_engine(
      std::chrono::seconds(config_.crawler.stop_timeout_sec));

  if (database_)
    database_->close();
  cache_->close();

  runtime_->stop();
  log::info("{} stopped", kServiceName);
}

auto Application::is_running() const noexcept -> bool {
  return running_.load();
}

auto Application::notify_callback(const TaskRecord &record) -> void {
  const auto *url = json_string(record.kwargs, "callback_url");
  if (!url || url->empty()) {
    return;
  }

  JsonValue stats = JsonValue::object_t{};
  stats["items_count"] = static_cast<std::int64_t>(record.items_count);
  if (record.result) {
    stats["close_reason"] = record.result->close_reason;
    stats["items_scraped"] =
        static_cast<std::int64_t>(record.result->items_scraped);
    stats["items_dropped"] =
        static_cast<std::int64_t>(record.result->items_dropped);
    stats["duration_ms"] = record.result->duration_ms;
  }

  JsonValue body = JsonValue::object_t{};
  body["task_id"] = record.task_id.str();
  body["spider_name"] = record.spider_name;
  body["status"] = "completed";
  body["stats"] = std::move(stats);
  body["timestamp"] = util::format_timestamp();

  runtime_->spawn(post_callback(record.task_id, *url, dump_json(body)));
}

auto Application::runtime() -> Runtime & { return *runtime_; }

auto Application::orchestrator() -> Orchestrator & { return *orchestrator_; }

auto Application::cache() -> ICache & { return *cache_; }

auto Application::results() -> ResultStore & { return *results_; }

auto Application::rate_limiter() -> RateLimiter * {
  return rate_limiter_.get();
}

auto Application::database() -> storage::MySQLProbe * {
  return database_.get();
}

auto Application::api_server() -> ApiServer * { return api_.get(); }

} // namespace crawlforge
