#include "crawlforge/app/application.hpp"
#include "crawlforge/cli/commands.hpp"
#include "crawlforge/config/config.hpp"
#include "crawlforge/core/constants.hpp"
#include "crawlforge/util/daemon.hpp"
#include "crawlforge/util/json.hpp"
#include "crawlforge/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <print>
#include <string>

namespace crawlforge::cli {
namespace {

auto resolve_pid_file(const Config &config,
                      const std::optional<std::string> &override_path)
    -> std::string {
  if (override_path && !override_path->empty()) {
    return *override_path;
  }
  if (!config.server.pid_file.empty()) {
    return config.server.pid_file;
  }
  return "/tmp/crawlforge.pid";
}

auto load_config_or_print(std::string_view path) -> Result<Config> {
  if (path.empty()) {
    // No file: defaults plus environment overrides.
    return ConfigLoader::load_from_string("");
  }
  return ConfigLoader::load_from_file(path).or_else(
      [&](std::error_code ec) -> Result<Config> {
        std::println(stderr, "Error: {}: {}", path, ec.message());
        return fail(ec);
      });
}

} // namespace

auto cmd_serve_start(const ServeStartOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  auto config = std::move(*config_res);

  if (opts.log_level.has_value()) {
    config.server.log_level = *opts.log_level;
  }

  const auto log_file = opts.log_file.value_or(config.server.log_file);
  if (opts.daemon && log_file.empty()) {
    std::println(
        stderr,
        "Error: --daemon requires log_file (set in config or --log-file)");
    return 1;
  }
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }

  if (opts.daemon) {
    if (auto r = daemonize(); !r) {
      std::println(stderr, "Error: Failed to daemonize - {}",
                   r.error().message());
      return 1;
    }
  }

  log::set_level(config.server.log_level);

  const auto pid_file = resolve_pid_file(config, opts.pid_file);
  auto pid_guard = PidFileGuard::acquire(pid_file);
  if (!pid_guard) {
    if (pid_guard.error() == make_error_code(Error::AlreadyExists)) {
      std::println(stderr,
                   "Error: {} is already running (pid file locked: {})",
                   kServiceName, pid_file);
    } else {
      std::println(stderr, "Error: Failed to acquire pid file '{}': {}",
                   pid_file, pid_guard.error().message());
    }
    return 1;
  }

  Application app(std::move(config));
  if (auto r = app.start(); !r.has_value()) {
    log::error("Failed to start: {}", r.error().message());
    log::stop();
    return 1;
  }

  setup_signal_handlers();

  const auto &cfg = app.config();
  if (cfg.api.enabled) {
    log::info("{} serving on {}:{} (pid_file={})", kServiceName, cfg.api.host,
              cfg.api.port, pid_file);
  } else {
    log::info("{} started without API (pid_file={})", kServiceName, pid_file);
  }

  wait_for_shutdown();
  log::info("Shutdown requested");
  app.stop();
  log::stop();
  return 0;
}

auto cmd_serve_stop(const ServeStopOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  const auto pid_file = resolve_pid_file(*config_res, opts.pid_file);

  auto pid_res = read_pid_file(pid_file);
  if (!pid_res) {
    if (pid_res.error() == make_error_code(Error::FileNotFound)) {
      std::println("{} is not running (no pid file: {}).", kServiceName,
                   pid_file);
      return 0;
    }
    std::println(stderr, "Error: Failed to read pid file '{}': {}", pid_file,
                 pid_res.error().message());
    return 1;
  }
  const std::int64_t pid = *pid_res;

  if (!is_process_alive(pid)) {
    if (auto r = remove_pid_file(pid_file); !r) {
      std::println(stderr, "Warning: could not remove stale pid file: {}",
                   r.error().message());
    }
    std::println("{} is not running (stale pid file removed).", kServiceName);
    return 0;
  }

  if (auto r = send_signal(pid, SIGTERM); !r) {
    std::println(stderr, "Error: Failed to send SIGTERM to pid {}: {}", pid,
                 r.error().message());
    return 1;
  }

  // Running jobs get crawler.stop_timeout_sec to wind down.
  const auto timeout = std::chrono::seconds(std::max(opts.timeout_sec, 1));
  if (wait_for_process_exit(pid, timeout)) {
    std::println("{} stopped (pid={}).", kServiceName, pid);
    return 0;
  }

  if (!opts.force) {
    std::println(stderr,
                 "Error: Timed out waiting for {} to stop (pid={}). "
                 "Retry with --force.",
                 kServiceName, pid);
    return 1;
  }

  if (auto r = send_signal(pid, SIGKILL); !r) {
    std::println(stderr, "Error: Failed to send SIGKILL to pid {}: {}", pid,
                 r.error().message());
    return 1;
  }
  if (!wait_for_process_exit(pid, std::chrono::seconds(2))) {
    std::println(stderr, "Error: Process {} did not exit after SIGKILL.", pid);
    return 1;
  }
  if (auto r = remove_pid_file(pid_file); !r) {
    std::println(stderr, "Warning: could not remove pid file: {}",
                 r.error().message());
  }
  std::println("{} killed (pid={}).", kServiceName, pid);
  return 0;
}

auto cmd_serve_status(const ServeStatusOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  const auto pid_file = resolve_pid_file(*config_res, opts.pid_file);

  bool running = false;
  bool stale = false;
  std::int64_t pid = 0;

  auto pid_res = read_pid_file(pid_file);
  if (pid_res) {
    pid = *pid_res;
    running = is_process_alive(pid);
    stale = !running;
  } else if (pid_res.error() != make_error_code(Error::FileNotFound)) {
    std::println(stderr, "Error: Failed to read pid file '{}': {}", pid_file,
                 pid_res.error().message());
    return 1;
  }

  if (opts.json) {
    JsonValue obj = JsonValue::object_t{};
    obj["running"] = running;
    obj["pid"] = pid;
    obj["stale_pid_file"] = stale;
    obj["pid_file"] = pid_file;
    std::println("{}", dump_json(obj));
    return running ? 0 : 1;
  }

  if (running) {
    std::println("{} is running.", kServiceName);
    std::println("  pid: {}", pid);
    std::println("  pid_file: {}", pid_file);
    return 0;
  }
  if (stale) {
    std::println("{} is stopped (stale pid file).", kServiceName);
    std::println("  pid_file: {}", pid_file);
    std::println("  stale_pid: {}", pid);
    return 1;
  }

  std::println("{} is stopped.", kServiceName);
  std::println("  pid_file: {}", pid_file);
  return 1;
}

} // namespace crawlforge::cli
