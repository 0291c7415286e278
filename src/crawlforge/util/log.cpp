#include "crawlforge/util/log.hpp"

#include <unistd.h>

#include <optional>
#include <vector>

namespace crawlforge::log {

namespace {

constexpr std::string_view kControlPrefix = "\x01";
constexpr std::string_view kResetColor = "\o{33}[0m";
constexpr std::size_t kWriteBatch = 64;

[[nodiscard]] auto is_terminal(FILE *out) noexcept -> bool {
  if (out == nullptr) {
    return false;
  }
  const int fd = ::fileno(out);
  return fd >= 0 && ::isatty(fd) != 0;
}

[[nodiscard]] auto open_append(const std::string &path) -> FILE * {
  FILE *f = std::fopen(path.c_str(), "a");
  if (f) {
    std::setvbuf(f, nullptr, _IOLBF, 0);
  }
  return f;
}

} // namespace

auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

Logger::~Logger() {
  stop();
  if (auto *f = file_.exchange(nullptr)) {
    std::fclose(f);
  }
}

auto Logger::output() const noexcept -> FILE * {
  auto *out = output_.load(std::memory_order_acquire);
  return out ? out : stdout;
}

auto Logger::start() -> void {
  if (accepting_.exchange(true, std::memory_order_acq_rel))
    return;
  queue_ctx_.restart();
  auto channel =
      std::make_shared<LogChannel>(queue_ctx_.get_executor(), kQueueCapacity);
  queue_.store(channel, std::memory_order_release);
  writer_ = std::jthread(
      [this, channel]() mutable { writer_loop(std::move(channel)); });
}

auto Logger::stop() -> void {
  if (!accepting_.exchange(false, std::memory_order_acq_rel))
    return;
  if (auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel)) {
    queue->close();
  }
  if (writer_.joinable()) {
    writer_.join();
  }
}

auto Logger::set_output_stderr() noexcept -> void {
  output_.store(stderr, std::memory_order_release);
}

auto Logger::set_output_file(std::string_view path) -> bool {
  if (auto queue = queue_.load(std::memory_order_acquire)) {
    // The writer owns the stream while running; hand it the switch in-band.
    return queue->try_send(boost::system::error_code{},
                           std::format("{}{}", kControlPrefix, path));
  }
  if (path.empty()) {
    output_.store(stdout, std::memory_order_release);
    if (auto *old = file_.exchange(nullptr)) {
      std::fclose(old);
    }
    return true;
  }
  FILE *f = open_append(std::string(path));
  if (!f)
    return false;
  output_.store(f, std::memory_order_release);
  if (auto *old = file_.exchange(f)) {
    std::fclose(old);
  }
  return true;
}

auto Logger::set_sink(Sink sink) -> void {
  if (!sink) {
    sink_.store(nullptr, std::memory_order_release);
    return;
  }
  sink_.store(std::make_shared<const Sink>(std::move(sink)),
              std::memory_order_release);
}

auto Logger::submit(Level level, std::string_view message) -> void {
  auto time =
      std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
  auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
  auto *out = output();
  auto line =
      is_terminal(out)
          ? std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time,
                        level_color(level), level_name(level), kResetColor,
                        tid, message)
          : std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", time,
                        level_name(level), tid, message);

  if (!accepting_.load(std::memory_order_acquire)) {
    write_line(line);
    std::fflush(out);
    return;
  }

  auto queue = queue_.load(std::memory_order_acquire);
  if (queue && queue->try_send(boost::system::error_code{}, std::move(line))) {
    return;
  }
  // A full queue blocks nobody when output is a pipe or file; drop instead.
  if (!is_terminal(out)) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  write_line(line);
}

auto Logger::write_line(std::string_view line) -> void {
  std::fwrite(line.data(), 1, line.size(), output());
}

auto Logger::writer_loop(std::shared_ptr<LogChannel> queue) -> void {
  std::vector<std::string> batch;
  batch.reserve(kWriteBatch);

  auto handle = [this](std::string &msg) {
    if (!msg.starts_with(kControlPrefix)) {
      write_line(msg);
      return;
    }
    auto path = msg.substr(kControlPrefix.size());
    FILE *f = path.empty() ? nullptr : open_append(path);
    if (!path.empty() && !f) {
      return;
    }
    output_.store(f ? f : stdout, std::memory_order_release);
    if (auto *old = file_.exchange(f)) {
      std::fclose(old);
    }
  };

  for (;;) {
    std::optional<std::string> first;
    boost::system::error_code recv_ec;
    queue->async_receive(
        [&](const boost::system::error_code &ec, std::string item) {
          recv_ec = ec;
          if (!ec) {
            first = std::move(item);
          }
        });
    queue_ctx_.restart();
    (void)queue_ctx_.run_one();
    if (recv_ec || !first) {
      break;
    }

    batch.clear();
    batch.push_back(std::move(*first));
    while (batch.size() < kWriteBatch &&
           queue->try_receive(
               [&](const boost::system::error_code &ec, std::string item) {
                 if (!ec) {
                   batch.push_back(std::move(item));
                 }
               })) {
    }
    for (auto &msg : batch) {
      handle(msg);
    }
    std::fflush(output());
  }

  // Records already buffered when the channel closed.
  while (queue->try_receive(
      [&](const boost::system::error_code &ec, std::string item) {
        if (!ec) {
          handle(item);
        }
      })) {
  }
  std::fflush(output());
}

} // namespace crawlforge::log
