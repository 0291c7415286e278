#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace crawlforge::cli {

struct ServeStartOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  std::optional<std::string> pid_file;
  bool daemon{false};
};

struct ServeStopOptions {
  std::string config_file;
  std::optional<std::string> pid_file;
  int timeout_sec{40};
  bool force{false};
};

struct ServeStatusOptions {
  std::string config_file;
  std::optional<std::string> pid_file;
  bool json{false};
};

/// Where the spider commands find the running server.
struct ServerAddress {
  std::string config_file;
  std::optional<std::string> host;
  std::optional<std::uint16_t> port;
};

struct SpiderRunOptions {
  ServerAddress server;
  std::string spider_name;
  std::string kwargs{"{}"};
  int priority{1};
  std::optional<int> timeout_sec;
  bool json{false};
};

struct SpiderStatusOptions {
  ServerAddress server;
  std::string task_id;
  bool json{false};
};

struct SpiderListOptions {
  ServerAddress server;
  bool json{false};
};

struct SpiderStopOptions {
  ServerAddress server;
  std::string task_id;
  bool json{false};
};

struct SpiderResultsOptions {
  ServerAddress server;
  std::string task_id;
  std::int64_t start{0};
  std::int64_t limit{100};
};

[[nodiscard]] auto cmd_serve_start(const ServeStartOptions &opts) -> int;
[[nodiscard]] auto cmd_serve_stop(const ServeStopOptions &opts) -> int;
[[nodiscard]] auto cmd_serve_status(const ServeStatusOptions &opts) -> int;
[[nodiscard]] auto cmd_spider_run(const SpiderRunOptions &opts) -> int;
[[nodiscard]] auto cmd_spider_status(const SpiderStatusOptions &opts) -> int;
[[nodiscard]] auto cmd_spider_list(const SpiderListOptions &opts) -> int;
[[nodiscard]] auto cmd_spider_stop(const SpiderStopOptions &opts) -> int;
[[nodiscard]] auto cmd_spider_results(const SpiderResultsOptions &opts) -> int;

} // namespace crawlforge::cli
