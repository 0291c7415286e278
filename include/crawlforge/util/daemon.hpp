#pragma once

#include "crawlforge/core/error.hpp"

#include <boost/interprocess/sync/file_lock.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace crawlforge {

extern std::atomic<bool> g_shutdown_requested;

/// Exclusive ownership of a pid file for the lifetime of the server. The
/// file is locked, holds the current pid, and is removed on release.
class PidFileGuard {
public:
  PidFileGuard() = default;
  ~PidFileGuard();

  PidFileGuard(const PidFileGuard &) = delete;
  auto operator=(const PidFileGuard &) -> PidFileGuard & = delete;
  PidFileGuard(PidFileGuard &&other) noexcept;
  auto operator=(PidFileGuard &&other) noexcept -> PidFileGuard &;

  /// Error::AlreadyExists when another process holds the lock.
  [[nodiscard]] static auto acquire(std::string_view path)
      -> Result<PidFileGuard>;

  [[nodiscard]] auto path() const noexcept -> const std::string & {
    return path_;
  }

private:
  PidFileGuard(std::string path, int fd,
               boost::interprocess::file_lock lock) noexcept;
  auto release() noexcept -> void;

  std::string path_;
  // Closing any descriptor of a locked file drops its fcntl lock, so the
  // pid is written through this one and it stays open until release.
  int fd_{-1};
  std::optional<boost::interprocess::file_lock> lock_;
};

[[nodiscard]] auto daemonize() -> Result<void>;
[[nodiscard]] auto read_pid_file(std::string_view path) -> Result<std::int64_t>;
[[nodiscard]] auto remove_pid_file(std::string_view path) -> Result<void>;
[[nodiscard]] auto is_process_alive(std::int64_t pid) -> bool;
[[nodiscard]] auto send_signal(std::int64_t pid, int signal_no) -> Result<void>;
[[nodiscard]] auto wait_for_process_exit(std::int64_t pid,
                                         std::chrono::milliseconds timeout)
    -> bool;
void setup_signal_handlers();
void wait_for_shutdown();

} // namespace crawlforge
