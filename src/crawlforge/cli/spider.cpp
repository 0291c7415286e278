#include "crawlforge/cli/api_client.hpp"
#include "crawlforge/cli/commands.hpp"
#include "crawlforge/cli/formatting.hpp"
#include "crawlforge/config/config.hpp"
#include "crawlforge/util/json.hpp"

#include <format>
#include <optional>
#include <print>
#include <string>

namespace crawlforge::cli {
namespace {

auto make_client(const ServerAddress &addr) -> std::optional<ApiClient> {
  auto config_res = addr.config_file.empty()
                        ? ConfigLoader::load_from_string("")
                        : ConfigLoader::load_from_file(addr.config_file);
  if (!config_res) {
    std::println(stderr, "Error: {}", config_res.error().message());
    return std::nullopt;
  }
  std::string host = addr.host.value_or(config_res->api.host);
  // A wildcard bind address is reachable through loopback.
  if (host.empty() || host == "0.0.0.0") {
    host = "127.0.0.1";
  }
  return std::optional<ApiClient>(std::in_place, std::move(host),
                                  addr.port.value_or(config_res->api.port));
}

auto send(ApiClient &client, std::string_view method, std::string_view target,
          std::string_view body = {}) -> std::optional<ApiReply> {
  auto reply =
      method == "POST" ? client.post(target, body) : client.get(target);
  if (!reply) {
    std::println(stderr, "Error: cannot reach {}:{} ({})", client.host(),
                 client.port(), reply.error().message());
    std::println(stderr, "Hint: is the server running? Try `crawlforge serve "
                         "status`.");
    return std::nullopt;
  }
  if (!reply->is_success()) {
    std::println(stderr, "Error: HTTP {}: {}", static_cast<int>(reply->status),
                 reply->error_text());
    if (reply->status == http::HttpStatus::TooManyRequests) {
      std::println(stderr, "Hint: rate limit reached; retry later.");
    }
    return std::nullopt;
  }
  return reply;
}

auto json_double(const JsonValue &obj, std::string_view key) -> double {
  const auto *v = json_member(obj, key);
  if (!v) {
    return 0.0;
  }
  if (v->holds<double>()) {
    return v->get<double>();
  }
  if (v->holds<std::int64_t>()) {
    return static_cast<double>(v->get<std::int64_t>());
  }
  return 0.0;
}

auto text_or_dash(const JsonValue &obj, std::string_view key) -> std::string {
  const auto *s = json_string(obj, key);
  return s && !s->empty() ? *s : std::string("-");
}

auto print_task(const JsonValue &task) -> void {
  std::println("{}", fmt::ansi::bold(text_or_dash(task, "task_id")));
  std::println("  spider:     {}", text_or_dash(task, "spider_name"));
  std::println("  status:     {}",
               fmt::colorize_task_status(text_or_dash(task, "status")));
  std::println("  started:    {}", text_or_dash(task, "start_time"));
  std::println("  finished:   {}", text_or_dash(task, "end_time"));
  std::println("  items:      {}", json_int(task, "items_count", 0));
  std::println("  duration:   {}",
               fmt::format_seconds(json_double(task, "execution_time")));
  if (const auto *err = json_string(task, "error_message"); err) {
    std::println("  error:      {}", fmt::ansi::red(*err));
  }
  if (const auto *result = json_member(task, "result");
      result && result->is_object()) {
    std::println("  close:      {} (scraped={}, dropped={})",
                 text_or_dash(*result, "close_reason"),
                 json_int(*result, "items_scraped", 0),
                 json_int(*result, "items_dropped", 0));
  }
}

} // namespace

auto cmd_spider_run(const SpiderRunOptions &opts) -> int {
  auto kwargs = parse_json(opts.kwargs);
  if (!kwargs || !kwargs->is_object()) {
    std::println(stderr, "Error: --kwargs must be a JSON object");
    return 1;
  }

  JsonValue body = JsonValue::object_t{};
  body["spider_name"] = opts.spider_name;
  body["spider_kwargs"] = std::move(*kwargs);
  body["priority"] = static_cast<std::int64_t>(opts.priority);
  if (opts.timeout_sec) {
    body["timeout"] = static_cast<std::int64_t>(*opts.timeout_sec);
  }

  auto client = make_client(opts.server);
  if (!client) {
    return 1;
  }
  auto reply = send(*client, "POST", "/api/v1/spiders/run", dump_json(body));
  if (!reply) {
    return 1;
  }

  if (opts.json) {
    std::println("{}", reply->raw);
    return 0;
  }
  std::println("{} spider '{}' started, task_id: {}", fmt::ansi::green("OK"),
               opts.spider_name, text_or_dash(reply->body, "task_id"));
  return 0;
}

auto cmd_spider_status(const SpiderStatusOptions &opts) -> int {
  auto client = make_client(opts.server);
  if (!client) {
    return 1;
  }
  auto reply = send(*client, "GET",
                    std::format("/api/v1/spiders/tasks/{}", opts.task_id));
  if (!reply) {
    return 1;
  }
  if (opts.json) {
    std::println("{}", reply->raw);
    return 0;
  }
  print_task(reply->body);
  return 0;
}

auto cmd_spider_list(const SpiderListOptions &opts) -> int {
  auto client = make_client(opts.server);
  if (!client) {
    return 1;
  }
  auto reply = send(*client, "GET", "/api/v1/spiders/tasks");
  if (!reply) {
    return 1;
  }
  if (opts.json) {
    std::println("{}", reply->raw);
    return 0;
  }
  if (!reply->body.is_object() || reply->body.get_object().empty()) {
    std::println("No tasks.");
    return 0;
  }

  fmt::Table table({{"TASK ID", 36},
                    {"SPIDER", 20},
                    {"STATUS", 10},
                    {"ITEMS", 8, true},
                    {"STARTED", 20}});
  table.print_header();
  for (const auto &[task_id, task] : reply->body.get_object()) {
    table.print_row({task_id,
                     text_or_dash(task, "spider_name"),
                     fmt::colorize_task_status(text_or_dash(task, "status")),
                     std::to_string(json_int(task, "items_count", 0)),
                     text_or_dash(task, "start_time")});
  }
  return 0;
}

auto cmd_spider_stop(const SpiderStopOptions &opts) -> int {
  auto client = make_client(opts.server);
  if (!client) {
    return 1;
  }
  auto reply = send(*client, "POST",
                    std::format("/api/v1/spiders/tasks/{}/stop", opts.task_id),
                    "{}");
  if (!reply) {
    return 1;
  }
  if (opts.json) {
    std::println("{}", reply->raw);
    return 0;
  }
  std::println("{} stop requested for task {}", fmt::ansi::green("OK"),
               opts.task_id);
  return 0;
}

auto cmd_spider_results(const SpiderResultsOptions &opts) -> int {
  auto client = make_client(opts.server);
  if (!client) {
    return 1;
  }
  auto reply = send(*client, "GET",
                    std::format("/api/v1/spiders/results/{}?start={}&limit={}",
                                opts.task_id, opts.start, opts.limit));
  if (!reply) {
    return 1;
  }

  // One item per line, ready for jq.
  if (const auto *items = json_member(reply->body, "items");
      items && items->is_array()) {
    for (const auto &item : items->get_array()) {
      std::println("{}", dump_json(item));
    }
  }
  if (const auto *page = json_member(reply->body, "pagination"); page) {
    std::println(stderr, "# start={} limit={} total={} has_more={}",
                 json_int(*page, "start", 0), json_int(*page, "limit", 0),
                 json_int(*page, "total", 0), json_bool(*page, "has_more", false));
  }
  return 0;
}

} // namespace crawlforge::cli
