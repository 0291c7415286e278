#include "crawlforge/app/api/api_server.hpp"

#include "crawlforge/app/application.hpp"
#include "crawlforge/app/http/http_server.hpp"
#include "crawlforge/app/http/router.hpp"
#include "crawlforge/cache/cache.hpp"
#include "crawlforge/core/constants.hpp"
#include "crawlforge/core/coroutine.hpp"
#include "crawlforge/core/error.hpp"
#include "crawlforge/crawl/orchestrator.hpp"
#include "crawlforge/crawl/rate_limiter.hpp"
#include "crawlforge/storage/mysql_probe.hpp"
#include "crawlforge/util/json.hpp"
#include "crawlforge/util/log.hpp"
#include "crawlforge/util/time.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <expected>
#include <format>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace crawlforge {

using namespace http;

namespace api_dto {

struct ErrorDto {
  std::string error;
  std::string message;
  std::optional<std::string> detail;
  std::string timestamp;
};

struct RunResponseDto {
  std::string task_id;
  std::string status;
  std::string message;
};

struct StopResponseDto {
  std::string message;
  std::string task_id;
};

struct JobSummaryDto {
  std::string close_reason;
  std::uint64_t items_scraped{0};
  std::uint64_t items_dropped{0};
  std::int64_t duration_ms{0};
};

struct TaskRecordDto {
  std::string task_id;
  std::string spider_name;
  JsonValue kwargs;
  std::string status;
  int priority{1};
  int timeout{0};
  std::string start_time;
  std::optional<std::string> end_time;
  std::uint64_t items_count{0};
  std::optional<std::string> error_message;
  double execution_time{0.0};
  std::optional<JobSummaryDto> result;
};

struct PaginationDto {
  std::int64_t start{0};
  std::int64_t limit{0};
  std::uint64_t total{0};
  bool has_more{false};
};

struct ResultsResponseDto {
  std::string task_id;
  std::vector<glz::raw_json> items;
  PaginationDto pagination;
};

struct ServiceHealthDto {
  std::string status;
  std::optional<double> latency_ms;
  std::optional<std::string> error;
};

struct ServicesDto {
  ServiceHealthDto cache;
  ServiceHealthDto database;
};

struct HealthResponseDto {
  std::string status;
  std::string timestamp;
  std::string version;
  ServicesDto services;
};

struct ApplicationMetricsDto {
  std::size_t total_tasks{0};
  std::size_t pending_tasks{0};
  std::size_t running_tasks{0};
  std::size_t stopping_tasks{0};
  std::size_t completed_tasks{0};
  std::size_t failed_tasks{0};
  std::size_t stopped_tasks{0};
  std::uint64_t total_items{0};
};

struct RuntimeMetricsDto {
  unsigned shards{0};
  std::size_t active_jobs{0};
  bool engine_running{false};
};

struct MetricsResponseDto {
  std::string timestamp;
  ApplicationMetricsDto application;
  RuntimeMetricsDto runtime;
};

struct OverviewDto {
  std::size_t total_tasks{0};
  std::uint64_t total_items{0};
  double success_rate{0.0};
};

struct StatsResponseDto {
  OverviewDto overview;
  std::map<std::string, std::size_t> status_breakdown;
  std::vector<TaskRecordDto> recent_tasks;
};

} // namespace api_dto

} // namespace crawlforge

namespace glz {

template <> struct meta<crawlforge::api_dto::ErrorDto> {
  using T = crawlforge::api_dto::ErrorDto;
  static constexpr auto value =
      object("error", &T::error, "message", &T::message, "detail", &T::detail,
             "timestamp", &T::timestamp);
};

template <> struct meta<crawlforge::api_dto::RunResponseDto> {
  using T = crawlforge::api_dto::RunResponseDto;
  static constexpr auto value = object("task_id", &T::task_id, "status",
                                       &T::status, "message", &T::message);
};

template <> struct meta<crawlforge::api_dto::StopResponseDto> {
  using T = crawlforge::api_dto::StopResponseDto;
  static constexpr auto value =
      object("message", &T::message, "task_id", &T::task_id);
};

template <> struct meta<crawlforge::api_dto::JobSummaryDto> {
  using T = crawlforge::api_dto::JobSummaryDto;
  static constexpr auto value =
      object("close_reason", &T::close_reason, "items_scraped",
             &T::items_scraped, "items_dropped", &T::items_dropped,
             "duration_ms", &T::duration_ms);
};

template <> struct meta<crawlforge::api_dto::TaskRecordDto> {
  using T = crawlforge::api_dto::TaskRecordDto;
  static constexpr auto value = object(
      "task_id", &T::task_id, "spider_name", &T::spider_name, "kwargs",
      &T::kwargs, "status", &T::status, "priority", &T::priority, "timeout",
      &T::timeout, "start_time", &T::start_time, "end_time", &T::end_time,
      "items_count", &T::items_count, "error_message", &T::error_message,
      "execution_time", &T::execution_time, "result", &T::result);
};

template <> struct meta<crawlforge::api_dto::PaginationDto> {
  using T = crawlforge::api_dto::PaginationDto;
  static constexpr auto value =
      object("start", &T::start, "limit", &T::limit, "total", &T::total,
             "has_more", &T::has_more);
};

template <> struct meta<crawlforge::api_dto::ResultsResponseDto> {
  using T = crawlforge::api_dto::ResultsResponseDto;
  static constexpr auto value = object("task_id", &T::task_id, "items",
                                       &T::items, "pagination", &T::pagination);
};

template <> struct meta<crawlforge::api_dto::ServiceHealthDto> {
  using T = crawlforge::api_dto::ServiceHealthDto;
  static constexpr auto value = object("status", &T::status, "latency_ms",
                                       &T::latency_ms, "error", &T::error);
};

template <> struct meta<crawlforge::api_dto::ServicesDto> {
  using T = crawlforge::api_dto::ServicesDto;
  static constexpr auto value =
      object("cache", &T::cache, "database", &T::database);
};

template <> struct meta<crawlforge::api_dto::HealthResponseDto> {
  using T = crawlforge::api_dto::HealthResponseDto;
  static constexpr auto value =
      object("status", &T::status, "timestamp", &T::timestamp, "version",
             &T::version, "services", &T::services);
};

template <> struct meta<crawlforge::api_dto::ApplicationMetricsDto> {
  using T = crawlforge::api_dto::ApplicationMetricsDto;
  static constexpr auto value = object(
      "total_tasks", &T::total_tasks, "pending_tasks", &T::pending_tasks,
      "running_tasks", &T::running_tasks, "stopping_tasks", &T::stopping_tasks,
      "completed_tasks", &T::completed_tasks, "failed_tasks", &T::failed_tasks,
      "stopped_tasks", &T::stopped_tasks, "total_items", &T::total_items);
};

template <> struct meta<crawlforge::api_dto::RuntimeMetricsDto> {
  using T = crawlforge::api_dto::RuntimeMetricsDto;
  static constexpr auto value =
      object("shards", &T::shards, "active_jobs", &T::active_jobs,
             "engine_running", &T::engine_running);
};

template <> struct meta<crawlforge::api_dto::MetricsResponseDto> {
  using T = crawlforge::api_dto::MetricsResponseDto;
  static constexpr auto value =
      object("timestamp", &T::timestamp, "application", &T::application,
             "runtime", &T::runtime);
};

template <> struct meta<crawlforge::api_dto::OverviewDto> {
  using T = crawlforge::api_dto::OverviewDto;
  static constexpr auto value =
      object("total_tasks", &T::total_tasks, "total_items", &T::total_items,
             "success_rate", &T::success_rate);
};

template <> struct meta<crawlforge::api_dto::StatsResponseDto> {
  using T = crawlforge::api_dto::StatsResponseDto;
  static constexpr auto value =
      object("overview", &T::overview, "status_breakdown",
             &T::status_breakdown, "recent_tasks", &T::recent_tasks);
};

} // namespace glz

namespace crawlforge {

namespace {

constexpr auto kWriteOpts = glz::opts{.skip_null_members = false};

auto status_from_error(const std::error_code &ec) -> HttpStatus {
  if (ec.category() == error_category()) {
    switch (static_cast<Error>(ec.value())) {
    case Error::NotFound:
    case Error::FileNotFound:
      return HttpStatus::NotFound;
    case Error::InvalidArgument:
    case Error::ParseError:
      return HttpStatus::BadRequest;
    case Error::CacheUnavailable:
    case Error::DatabaseUnavailable:
    case Error::Timeout:
    case Error::ResourceExhausted:
    case Error::SystemNotRunning:
      return HttpStatus::ServiceUnavailable;
    case Error::RateLimited:
      return HttpStatus::TooManyRequests;
    case Error::AlreadyExists:
      return HttpStatus::Conflict;
    default:
      break;
    }
  }
  return HttpStatus::InternalServerError;
}

auto error_name(HttpStatus status) -> std::string_view {
  switch (status) {
  case HttpStatus::NotFound:
    return "NotFound";
  case HttpStatus::BadRequest:
    return "InvalidRequest";
  case HttpStatus::TooManyRequests:
    return "RateLimitExceeded";
  case HttpStatus::ServiceUnavailable:
    return "ServiceUnavailable";
  case HttpStatus::Conflict:
    return "Conflict";
  default:
    return "InternalError";
  }
}

template <typename T>
auto json_response_glz(const T &value, HttpStatus status = HttpStatus::Ok)
    -> HttpResponse {
  HttpResponse resp;
  resp.status = status;
  resp.set_header("Content-Type", "application/json");

  std::string buffer;
  if (auto ec = glz::write<kWriteOpts>(value, buffer); !ec) {
    resp.body.assign(buffer.begin(), buffer.end());
  } else {
    log::error("JSON serialization failed for API response");
    resp.status = HttpStatus::InternalServerError;
    constexpr std::string_view fallback =
        R"({"error":"InternalError","message":"JSON serialization failed","detail":null,"timestamp":""})";
    resp.body.assign(fallback.begin(), fallback.end());
  }
  return resp;
}

auto error_response(HttpStatus status, std::string message,
                    std::optional<std::string> detail = std::nullopt)
    -> HttpResponse {
  return json_response_glz(
      api_dto::ErrorDto{.error = std::string(error_name(status)),
                        .message = std::move(message),
                        .detail = std::move(detail),
                        .timestamp = util::format_timestamp()},
      status);
}

auto error_response(const std::error_code &ec, std::string message)
    -> HttpResponse {
  return error_response(status_from_error(ec), std::move(message),
                        ec.message());
}

auto unavailable() -> HttpResponse {
  return error_response(HttpStatus::ServiceUnavailable,
                        "service is shutting down");
}

auto text_response(std::string body, HttpStatus status,
                   std::string_view content_type) -> HttpResponse {
  HttpResponse resp;
  resp.status = status;
  resp.set_header("Content-Type", std::string(content_type));
  resp.body.assign(body.begin(), body.end());
  return resp;
}

auto round2(double value) -> double {
  return std::round(value * 100.0) / 100.0;
}

auto to_dto(const TaskRecord &record) -> api_dto::TaskRecordDto {
  const auto until =
      record.end_time.value_or(std::chrono::system_clock::now());
  api_dto::TaskRecordDto dto{
      .task_id = record.task_id.str(),
      .spider_name = record.spider_name,
      .kwargs = record.kwargs,
      .status = enum_to_string(record.status),
      .priority = record.priority,
      .timeout = record.timeout_sec,
      .start_time = util::format_iso8601_millis(record.start_time),
      .end_time = std::nullopt,
      .items_count = record.items_count,
      .error_message = record.failure_reason,
      .execution_time = round2(
          std::chrono::duration<double>(until - record.start_time).count()),
      .result = std::nullopt,
  };
  if (record.end_time) {
    dto.end_time = util::format_iso8601_millis(*record.end_time);
  }
  if (record.result) {
    dto.result = api_dto::JobSummaryDto{
        .close_reason = record.result->close_reason,
        .items_scraped = record.result->items_scraped,
        .items_dropped = record.result->items_dropped,
        .duration_ms = record.result->duration_ms,
    };
  }
  return dto;
}

/// Field-level checks only; policy (allowed spiders, ranges) is applied by
/// Orchestrator::start.
auto parse_run_request(std::string_view body)
    -> std::expected<RunRequest, std::string> {
  auto doc = parse_json(body);
  if (!doc || !doc->is_object()) {
    return std::unexpected("request body must be a JSON object");
  }

  RunRequest request;
  const auto *name = json_member(*doc, "spider_name");
  if (!name || !name->is_string()) {
    return std::unexpected("spider_name is required and must be a string");
  }
  request.spider_name = name->get_string();

  if (const auto *kwargs = json_member(*doc, "spider_kwargs");
      kwargs && !kwargs->is_null()) {
    request.kwargs = *kwargs;
  }

  auto integer_field = [&](std::string_view key)
      -> std::expected<std::optional<int>, std::string> {
    const auto *v = json_member(*doc, key);
    if (!v || v->is_null()) {
      return std::optional<int>{};
    }
    if (!v->holds<std::int64_t>()) {
      return std::unexpected(std::format("{} must be an integer", key));
    }
    const auto raw = v->get<std::int64_t>();
    if (raw < std::numeric_limits<int>::min() ||
        raw > std::numeric_limits<int>::max()) {
      return std::unexpected(
          std::format("{} must be an integer in range", key));
    }
    return std::optional<int>{static_cast<int>(raw)};
  };

  auto priority = integer_field("priority");
  if (!priority) {
    return std::unexpected(priority.error());
  }
  request.priority = priority->value_or(1);

  auto timeout = integer_field("timeout");
  if (!timeout) {
    return std::unexpected(timeout.error());
  }
  request.timeout_sec = *timeout;
  return request;
}

/// Missing parameters take `fallback`; present ones must be integers in
/// [min, max].
auto query_int(const QueryParams &query, std::string_view key,
               std::int64_t fallback, std::int64_t min, std::int64_t max)
    -> std::expected<std::int64_t, std::string> {
  auto value = query.get_int(key);
  if (!value) {
    if (value.error() == make_error_code(Error::NotFound)) {
      return fallback;
    }
    return std::unexpected(std::format("{} must be an integer", key));
  }
  if (*value < min || *value > max) {
    return std::unexpected(
        std::format("{} must be between {} and {}", key, min, max));
  }
  return *value;
}

auto client_key(const HttpRequest &req) -> std::string {
  return req.remote_address.empty() ? std::string("unknown")
                                    : req.remote_address;
}

} // namespace

struct ApiServer::Impl : std::enable_shared_from_this<Impl> {
  using Handler = task<HttpResponse> (Impl::*)(HttpRequest);

  Application &app_;
  std::shared_ptr<HttpServer> server_;

  explicit Impl(Application &app)
      : app_(app), server_(std::make_shared<HttpServer>(app.runtime())) {}

  void init() { setup_routes(); }

  /// Binds a member handler, keeping the Impl alive for the call.
  auto bind(Handler handler) -> RouteHandler {
    std::weak_ptr<Impl> weak_self = shared_from_this();
    return [weak_self, handler](HttpRequest req) -> task<HttpResponse> {
      auto self = weak_self.lock();
      if (!self)
        co_return unavailable();
      co_return co_await ((*self).*handler)(std::move(req));
    };
  }

  /// As bind(), with the per-client request ceiling applied first.
  auto bind_limited(Handler handler) -> RouteHandler {
    std::weak_ptr<Impl> weak_self = shared_from_this();
    return [weak_self, handler](HttpRequest req) -> task<HttpResponse> {
      auto self = weak_self.lock();
      if (!self)
        co_return unavailable();
      if (auto rejected = co_await self->check_rate_limit(req)) {
        co_return std::move(*rejected);
      }
      co_return co_await ((*self).*handler)(std::move(req));
    };
  }

  auto check_rate_limit(const HttpRequest &req)
      -> task<std::optional<HttpResponse>> {
    auto *limiter = app_.rate_limiter();
    if (!limiter) {
      co_return std::nullopt;
    }
    auto decision = co_await limiter->hit(client_key(req));
    if (!decision) {
      log::warn("rate limiter unavailable: {}", decision.error().message());
      co_return error_response(decision.error(), "rate limiter unavailable");
    }
    if (decision->allowed) {
      co_return std::nullopt;
    }
    auto resp = error_response(
        HttpStatus::TooManyRequests, "too many requests",
        std::format("at most {} requests per {} seconds", limiter->limit(),
                    limiter->window().count()));
    resp.set_header("Retry-After", std::to_string(decision->retry_after));
    co_return resp;
  }

  void setup_routes() {
    auto &router = server_->router();

    router.get("/", bind(&Impl::handle_root));
    router.get("/health", bind(&Impl::handle_liveness));
    router.get("/metrics", bind(&Impl::handle_prometheus));

    router.post("/api/v1/spiders/run", bind_limited(&Impl::handle_run));
    router.get("/api/v1/spiders/tasks", bind_limited(&Impl::handle_list));
    router.get("/api/v1/spiders/tasks/{task_id}",
               bind_limited(&Impl::handle_status));
    router.post("/api/v1/spiders/tasks/{task_id}/stop",
                bind_limited(&Impl::handle_stop));
    router.get("/api/v1/spiders/results/{task_id}",
               bind_limited(&Impl::handle_results));

    router.get("/api/v1/monitoring/health", bind(&Impl::handle_health));
    router.get("/api/v1/monitoring/metrics", bind(&Impl::handle_metrics));
    router.get("/api/v1/monitoring/stats", bind(&Impl::handle_stats));
  }

  auto handle_root(HttpRequest) -> task<HttpResponse> {
    JsonValue banner = JsonValue::object_t{};
    banner["message"] = std::format("{} crawl orchestrator", kServiceName);
    banner["version"] = std::string(kVersion);
    banner["status"] = "running";
    co_return json_response(banner);
  }

  auto handle_liveness(HttpRequest) -> task<HttpResponse> {
    auto cache = co_await probe_cache();
    auto database = co_await probe_database();
    const bool healthy = cache.status != "unhealthy" &&
                         database.status != "unhealthy";

    JsonValue body = JsonValue::object_t{};
    body["status"] = healthy ? "healthy" : "unhealthy";
    body["cache"] = cache.status;
    body["database"] = database.status;
    co_return json_response(body, healthy ? HttpStatus::Ok
                                          : HttpStatus::ServiceUnavailable);
  }

  auto handle_prometheus(HttpRequest) -> task<HttpResponse> {
    const auto counts = app_.orchestrator().registry().count_by_status();
    const auto stats = app_.orchestrator().stats(0);

    std::ostringstream out;
    out << "# HELP crawlforge_tasks Tasks known to the registry by status\n";
    out << "# TYPE crawlforge_tasks gauge\n";
    for (auto status : {TaskStatus::Pending, TaskStatus::Running,
                        TaskStatus::Stopping, TaskStatus::Completed,
                        TaskStatus::Failed, TaskStatus::Stopped}) {
      out << "crawlforge_tasks{status=\"" << to_string_view(status) << "\"} "
          << counts[std::to_underlying(status)] << "\n";
    }

    out << "# HELP crawlforge_items_ingested_total Records stored across all "
           "tasks\n";
    out << "# TYPE crawlforge_items_ingested_total counter\n";
    out << "crawlforge_items_ingested_total " << stats.total_items << "\n";

    out << "# HELP crawlforge_active_jobs Jobs hosted by the crawl engine\n";
    out << "# TYPE crawlforge_active_jobs gauge\n";
    out << "crawlforge_active_jobs "
        << app_.orchestrator().jobs().active_jobs() << "\n";

    out << "# HELP crawlforge_log_dropped_total Log records dropped on a "
           "full queue\n";
    out << "# TYPE crawlforge_log_dropped_total counter\n";
    out << "crawlforge_log_dropped_total " << log::logger().dropped() << "\n";

    co_return text_response(out.str(), HttpStatus::Ok,
                            "text/plain; version=0.0.4; charset=utf-8");
  }

  auto handle_run(HttpRequest req) -> task<HttpResponse> {
    auto parsed = parse_run_request(req.body_as_string());
    if (!parsed) {
      co_return error_response(HttpStatus::BadRequest, "invalid run request",
                               parsed.error());
    }

    auto &orchestrator = app_.orchestrator();
    const auto spider_name = parsed->spider_name;
    if (auto violation = orchestrator.check_run_request(*parsed)) {
      co_return error_response(HttpStatus::BadRequest, "invalid run request",
                               *violation);
    }

    auto id = orchestrator.start(std::move(*parsed));
    if (!id) {
      co_return error_response(
          id.error(), std::format("failed to start spider '{}'", spider_name));
    }
    co_return json_response_glz(api_dto::RunResponseDto{
        .task_id = id->str(),
        .status = "started",
        .message = std::format("spider '{}' started", spider_name),
    });
  }

  auto handle_status(HttpRequest req) -> task<HttpResponse> {
    auto task_id = req.path_param("task_id");
    if (!task_id)
      co_return error_response(HttpStatus::BadRequest, "missing task_id");

    auto record = app_.orchestrator().status(TaskId{*task_id});
    if (!record) {
      co_return error_response(record.error(), "task not found");
    }
    co_return json_response_glz(to_dto(*record));
  }

  auto handle_list(HttpRequest) -> task<HttpResponse> {
    std::map<std::string, api_dto::TaskRecordDto> out;
    for (const auto &[id, record] : app_.orchestrator().list()) {
      out.emplace(id.str(), to_dto(record));
    }
    co_return json_response_glz(out);
  }

  auto handle_stop(HttpRequest req) -> task<HttpResponse> {
    auto task_id = req.path_param("task_id");
    if (!task_id)
      co_return error_response(HttpStatus::BadRequest, "missing task_id");

    auto stopped = co_await app_.orchestrator().stop(TaskId{*task_id});
    if (!stopped) {
      co_return error_response(stopped.error(), "task not found");
    }
    if (!*stopped) {
      co_return error_response(HttpStatus::NotFound,
                               "task not found or cannot be stopped",
                               std::format("task {} is not running", *task_id));
    }
    co_return json_response_glz(api_dto::StopResponseDto{
        .message = "stop request completed", .task_id = *task_id});
  }

  auto handle_results(HttpRequest req) -> task<HttpResponse> {
    auto task_id = req.path_param("task_id");
    if (!task_id)
      co_return error_response(HttpStatus::BadRequest, "missing task_id");

    const auto query = req.query();
    auto start = query_int(query, "start", 0, 0,
                           std::numeric_limits<std::int64_t>::max());
    if (!start) {
      co_return error_response(HttpStatus::BadRequest, "invalid pagination",
                               start.error());
    }
    auto limit = query_int(query, "limit", api::kDefaultResultLimit, 1,
                           api::kMaxResultLimit);
    if (!limit) {
      co_return error_response(HttpStatus::BadRequest, "invalid pagination",
                               limit.error());
    }

    auto page = co_await app_.orchestrator().results(
        TaskId{*task_id}, static_cast<std::uint64_t>(*start),
        static_cast<std::uint64_t>(*limit));
    if (!page) {
      co_return error_response(page.error(), "failed to read results");
    }

    api_dto::ResultsResponseDto dto{
        .task_id = *task_id,
        .items = {},
        .pagination = {.start = *start,
                       .limit = *limit,
                       .total = page->total,
                       .has_more = page->has_more},
    };
    dto.items.reserve(page->items.size());
    for (auto &item : page->items) {
      dto.items.emplace_back(std::move(item));
    }
    co_return json_response_glz(dto);
  }

  auto probe_cache() -> task<api_dto::ServiceHealthDto> {
    const auto started = std::chrono::steady_clock::now();
    auto pong = co_await app_.cache().ping();
    if (!pong) {
      co_return api_dto::ServiceHealthDto{.status = "unhealthy",
                                          .latency_ms = std::nullopt,
                                          .error = pong.error().message()};
    }
    co_return api_dto::ServiceHealthDto{
        .status = "healthy",
        .latency_ms = round2(util::elapsed_ms(started)),
        .error = std::nullopt};
  }

  auto probe_database() -> task<api_dto::ServiceHealthDto> {
    auto *probe = app_.database();
    if (!probe) {
      co_return api_dto::ServiceHealthDto{.status = "disabled",
                                          .latency_ms = std::nullopt,
                                          .error = std::nullopt};
    }
    auto rtt = co_await probe->ping();
    if (!rtt) {
      co_return api_dto::ServiceHealthDto{.status = "unhealthy",
                                          .latency_ms = std::nullopt,
                                          .error = rtt.error().message()};
    }
    co_return api_dto::ServiceHealthDto{
        .status = "healthy",
        .latency_ms = round2(
            std::chrono::duration<double, std::milli>(*rtt).count()),
        .error = std::nullopt};
  }

  auto handle_health(HttpRequest) -> task<HttpResponse> {
    api_dto::HealthResponseDto dto{
        .status = "healthy",
        .timestamp = util::format_timestamp(),
        .version = std::string(kVersion),
        .services = {.cache = co_await probe_cache(),
                     .database = co_await probe_database()},
    };
    const bool healthy = dto.services.cache.status != "unhealthy" &&
                         dto.services.database.status != "unhealthy";
    if (!healthy) {
      dto.status = "unhealthy";
      log::warn("health check failed: cache={} database={}",
                dto.services.cache.status, dto.services.database.status);
    }
    co_return json_response_glz(dto, healthy ? HttpStatus::Ok
                                             : HttpStatus::ServiceUnavailable);
  }

  auto handle_metrics(HttpRequest) -> task<HttpResponse> {
    auto &orchestrator = app_.orchestrator();
    const auto stats = orchestrator.stats(0);
    const auto count = [&](TaskStatus s) {
      return stats.by_status[std::to_underlying(s)];
    };
    co_return json_response_glz(api_dto::MetricsResponseDto{
        .timestamp = util::format_timestamp(),
        .application =
            {
                .total_tasks = stats.total_tasks,
                .pending_tasks = count(TaskStatus::Pending),
                .running_tasks = count(TaskStatus::Running),
                .stopping_tasks = count(TaskStatus::Stopping),
                .completed_tasks = count(TaskStatus::Completed),
                .failed_tasks = count(TaskStatus::Failed),
                .stopped_tasks = count(TaskStatus::Stopped),
                .total_items = stats.total_items,
            },
        .runtime =
            {
                .shards = app_.runtime().shard_count(),
                .active_jobs = orchestrator.jobs().active_jobs(),
                .engine_running = orchestrator.jobs().is_running(),
            },
    });
  }

  auto handle_stats(HttpRequest) -> task<HttpResponse> {
    auto stats = app_.orchestrator().stats(api::kRecentTasks);
    api_dto::StatsResponseDto dto{
        .overview = {.total_tasks = stats.total_tasks,
                     .total_items = stats.total_items,
                     .success_rate = stats.success_rate},
        .status_breakdown = {},
        .recent_tasks = {},
    };
    for (auto status : {TaskStatus::Pending, TaskStatus::Running,
                        TaskStatus::Stopping, TaskStatus::Completed,
                        TaskStatus::Failed, TaskStatus::Stopped}) {
      if (auto n = stats.by_status[std::to_underlying(status)]; n > 0) {
        dto.status_breakdown.emplace(enum_to_string(status), n);
      }
    }
    dto.recent_tasks.reserve(stats.recent.size());
    for (const auto &record : stats.recent) {
      dto.recent_tasks.push_back(to_dto(record));
    }
    co_return json_response_glz(dto);
  }

  static auto json_response(const JsonValue &j,
                            HttpStatus status = HttpStatus::Ok)
      -> HttpResponse {
    HttpResponse resp;
    resp.status = status;
    resp.set_header("Content-Type", "application/json");
    auto s = dump_json(j);
    resp.body.assign(s.begin(), s.end());
    return resp;
  }

  auto start() -> Result<void> {
    const auto &api_cfg = app_.config().api;
    if (auto r = server_->start(api_cfg.host, api_cfg.port, api_cfg.reuse_port);
        !r) {
      log::error("API server failed to bind {}:{}: {}", api_cfg.host,
                 api_cfg.port, r.error().message());
      return r;
    }
    log::info("API server listening on {}:{}", api_cfg.host,
              server_->local_port());
    return ok();
  }

  void stop() {
    if (server_) {
      server_->stop();
    }
  }

  [[nodiscard]] auto is_running() const -> bool {
    return server_ && server_->is_running();
  }
};

ApiServer::ApiServer(Application &app) : impl_(std::make_shared<Impl>(app)) {
  impl_->init();
}
ApiServer::~ApiServer() = default;

auto ApiServer::start() -> Result<void> {
  const auto impl = impl_;
  return impl->start();
}

void ApiServer::stop() {
  const auto impl = impl_;
  impl->stop();
}

auto ApiServer::is_running() const -> bool {
  auto impl = impl_;
  return impl->is_running();
}

auto ApiServer::local_port() const -> std::uint16_t {
  return impl_->server_->local_port();
}

} // namespace crawlforge
