#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace crawlforge::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", // trace: gray
    "\o{33}[36m", // debug: cyan
    "\o{33}[32m", // info: green
    "\o{33}[33m", // warn: yellow
    "\o{33}[31m"  // error: red
};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name) noexcept
    -> Level {
  const auto *it = std::ranges::find(level_names, name);
  return it != level_names.end()
             ? static_cast<Level>(std::distance(level_names.begin(), it))
             : Level::Info;
}

/// Observer that receives every accepted record, synchronously on the
/// calling thread. Installed by tests and embedders.
using Sink = std::function<void(Level, std::string_view)>;

/// Asynchronous logger: records are formatted on the calling thread and
/// handed to a writer thread over a bounded channel. Before start() and
/// after stop() records are written synchronously.
class Logger {
public:
  Logger() = default;
  ~Logger();

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void;
  auto stop() -> void;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }
  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() noexcept -> void;
  /// Append to `path`; an empty path reverts to stdout.
  [[nodiscard]] auto set_output_file(std::string_view path) -> bool;
  auto set_sink(Sink sink) -> void;

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;
    auto message = std::format(fmt, std::forward<Args>(args)...);
    if (auto sink = sink_.load(std::memory_order_acquire)) {
      (*sink)(level, message);
    }
    submit(level, message);
  }

private:
  static constexpr std::size_t kQueueCapacity = 8192;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  auto submit(Level level, std::string_view message) -> void;
  auto write_line(std::string_view line) -> void;
  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void;
  [[nodiscard]] auto output() const noexcept -> FILE *;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> accepting_{false};
  std::atomic<FILE *> output_{nullptr};
  std::atomic<FILE *> file_{nullptr};
  std::atomic<std::uint64_t> dropped_{0};
  std::atomic<std::shared_ptr<const Sink>> sink_;
  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LogChannel>> queue_;
  std::jthread writer_;
};

[[nodiscard]] auto logger() -> Logger &;

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}

inline auto set_sink(Sink sink) -> void { logger().set_sink(std::move(sink)); }

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace crawlforge::log
