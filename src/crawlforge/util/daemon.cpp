#include "crawlforge/util/daemon.hpp"

#include "crawlforge/core/constants.hpp"

#include <boost/filesystem.hpp>
#include <boost/interprocess/exceptions.hpp>

#include <cerrno>
#include <charconv>
#include <csignal>
#include <fcntl.h>
#include <format>
#include <fstream>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include <utility>

namespace crawlforge {

std::atomic<bool> g_shutdown_requested{false};

namespace {

auto ensure_parent_directory(std::string_view path) -> Result<void> {
  boost::system::error_code ec;
  const boost::filesystem::path p{std::string(path)};
  const auto parent = p.parent_path();
  if (parent.empty() || boost::filesystem::exists(parent, ec)) {
    return ok();
  }
  boost::filesystem::create_directories(parent, ec);
  if (ec) {
    return fail(std::error_code(ec.value(), std::system_category()));
  }
  return ok();
}

auto write_pid(int fd, std::int64_t pid) -> Result<void> {
  const auto text = std::format("{}\n", pid);
  if (::ftruncate(fd, 0) != 0 ||
      ::pwrite(fd, text.data(), text.size(), 0) !=
          static_cast<ssize_t>(text.size())) {
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

void on_shutdown_signal(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
  g_shutdown_requested.notify_one();
}

} // namespace

PidFileGuard::PidFileGuard(std::string path, int fd,
                           boost::interprocess::file_lock lock) noexcept
    : path_(std::move(path)), fd_(fd), lock_(std::move(lock)) {}

PidFileGuard::~PidFileGuard() { release(); }

PidFileGuard::PidFileGuard(PidFileGuard &&other) noexcept
    : path_(std::move(other.path_)), fd_(std::exchange(other.fd_, -1)),
      lock_(std::move(other.lock_)) {
  other.lock_.reset();
}

auto PidFileGuard::operator=(PidFileGuard &&other) noexcept -> PidFileGuard & {
  if (this != &other) {
    release();
    path_ = std::move(other.path_);
    fd_ = std::exchange(other.fd_, -1);
    lock_ = std::move(other.lock_);
    other.lock_.reset();
  }
  return *this;
}

auto PidFileGuard::acquire(std::string_view path) -> Result<PidFileGuard> {
  if (path.empty()) {
    return fail(Error::InvalidArgument);
  }
  if (auto r = ensure_parent_directory(path); !r) {
    return fail(r.error());
  }
  // file_lock requires an existing file.
  const int fd = ::open(std::string(path).c_str(), O_RDWR | O_CREAT | O_CLOEXEC,
                        0644);
  if (fd < 0) {
    return fail(Error::FileOpenFailed);
  }

  boost::interprocess::file_lock lock;
  try {
    lock = boost::interprocess::file_lock(std::string(path).c_str());
  } catch (const boost::interprocess::interprocess_exception &) {
    ::close(fd);
    return fail(Error::FileOpenFailed);
  }
  if (!lock.try_lock()) {
    ::close(fd);
    return fail(Error::AlreadyExists);
  }

  if (auto r = write_pid(fd, static_cast<std::int64_t>(::getpid())); !r) {
    lock.unlock();
    ::close(fd);
    return fail(r.error());
  }
  return ok(PidFileGuard(std::string(path), fd, std::move(lock)));
}

auto PidFileGuard::release() noexcept -> void {
  if (!lock_) {
    return;
  }
  lock_->unlock();
  lock_.reset();

  boost::system::error_code ec;
  boost::filesystem::remove(boost::filesystem::path(path_), ec);
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

auto daemonize() -> Result<void> {
  return sys_check(fork())
      .and_then([](pid_t pid) -> Result<void> {
        if (pid > 0)
          _Exit(0);
        return ok();
      })
      .and_then([]() { return sys_check(setsid()); })
      .and_then([](auto) { return sys_check(fork()); })
      .and_then([](pid_t pid) -> Result<void> {
        if (pid > 0)
          _Exit(0);
        return ok();
      })
      .and_then([]() { return sys_check(chdir("/")); })
      .and_then([](auto) -> Result<void> {
        umask(0);
        (void)close(STDIN_FILENO);
        (void)close(STDOUT_FILENO);
        (void)close(STDERR_FILENO);
        return ok();
      });
}

auto read_pid_file(std::string_view path) -> Result<std::int64_t> {
  std::ifstream in{std::string(path)};
  if (!in.is_open()) {
    return fail(Error::FileNotFound);
  }
  std::string line;
  std::getline(in, line);
  std::int64_t pid = 0;
  const auto [ptr, ec] =
      std::from_chars(line.data(), line.data() + line.size(), pid);
  if (line.empty() || ec != std::errc{} ||
      ptr != line.data() + line.size() || pid <= 0) {
    return fail(Error::ParseError);
  }
  return ok(pid);
}

auto remove_pid_file(std::string_view path) -> Result<void> {
  boost::system::error_code ec;
  boost::filesystem::remove(boost::filesystem::path(std::string(path)), ec);
  if (ec) {
    return fail(std::error_code(ec.value(), std::system_category()));
  }
  return ok();
}

auto is_process_alive(std::int64_t pid) -> bool {
  if (pid <= 0) {
    return false;
  }
  if (::kill(static_cast<pid_t>(pid), 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

auto send_signal(std::int64_t pid, int signal_no) -> Result<void> {
  if (pid <= 0) {
    return fail(Error::InvalidArgument);
  }
  if (::kill(static_cast<pid_t>(pid), signal_no) != 0) {
    return fail(std::error_code(errno, std::system_category()));
  }
  return ok();
}

auto wait_for_process_exit(std::int64_t pid, std::chrono::milliseconds timeout)
    -> bool {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (!is_process_alive(pid)) {
      return true;
    }
    std::this_thread::sleep_for(timing::kDaemonPollInterval);
  }
  return !is_process_alive(pid);
}

void setup_signal_handlers() {
  std::signal(SIGINT, on_shutdown_signal);
  std::signal(SIGTERM, on_shutdown_signal);
  std::signal(SIGPIPE, SIG_IGN);
}

void wait_for_shutdown() {
  g_shutdown_requested.wait(false, std::memory_order_acquire);
}

} // namespace crawlforge
