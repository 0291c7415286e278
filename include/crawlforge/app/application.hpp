#pragma once

#include "crawlforge/config/config.hpp"
#include "crawlforge/core/coroutine.hpp"
#include "crawlforge/core/error.hpp"
#include "crawlforge/core/runtime.hpp"
#include "crawlforge/crawl/task_record.hpp"

#include <atomic>
#include <memory>
#include <string_view>

namespace crawlforge {

class ApiServer;
class ICache;
class Orchestrator;
class RateLimiter;
class ResultStore;

namespace storage {
class MySQLProbe;
}

// Application facade - owns and wires every service
class Application {
public:
  Application();
  explicit Application(Config config);
  ~Application();

  Application(const Application &) = delete;
  auto operator=(const Application &) -> Application & = delete;

  // Configuration; takes effect only while stopped.
  [[nodiscard]] auto load_config(std::string_view path) -> Result<void>;
  [[nodiscard]] auto config() const noexcept -> const Config &;

  // Lifecycle
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // Service access
  [[nodiscard]] auto runtime() -> Runtime &;
  [[nodiscard]] auto orchestrator() -> Orchestrator &;
  [[nodiscard]] auto cache() -> ICache &;
  [[nodiscard]] auto results() -> ResultStore &;
  /// Null when rate limiting is disabled.
  [[nodiscard]] auto rate_limiter() -> RateLimiter *;
  /// Null when the database is disabled.
  [[nodiscard]] auto database() -> storage::MySQLProbe *;
  [[nodiscard]] auto api_server() -> ApiServer *;

private:
  auto build_services() -> void;
  auto notify_callback(const TaskRecord &record) -> void;

  std::atomic<bool> running_{false};
  Config config_;

  std::unique_ptr<Runtime> runtime_;
  std::unique_ptr<ICache> cache_;
  std::unique_ptr<ResultStore> results_;
  std::unique_ptr<RateLimiter> rate_limiter_;
  std::unique_ptr<storage::MySQLProbe> database_;
  std::unique_ptr<Orchestrator> orchestrator_;
  std::unique_ptr<ApiServer> api_;
};

} // namespace crawlforge
