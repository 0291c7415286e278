#pragma once

#include "crawlforge/core/coroutine.hpp"
#include "crawlforge/core/runtime.hpp"
#include "crawlforge/util/log.hpp"

#include <arpa/inet.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <format>
#include <functional>
#include <mutex>
#include <netinet/in.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace crawlforge::test {

// Run a coroutine synchronously on a fresh io_context and return its result.
// Throws if the coroutine does not complete within `timeout`.
template <typename T>
[[nodiscard]] inline auto
run_coro(task<T> coro,
         std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> T {
  boost::asio::io_context io;
  std::exception_ptr eptr;
  std::optional<T> result;
  boost::asio::co_spawn(
      io,
      [&]() -> task<void> {
        result = co_await std::move(coro);
        co_return;
      },
      [&](std::exception_ptr e) { eptr = e; });
  io.run_for(timeout);
  if (!result && !eptr)
    throw std::runtime_error("run_coro timed out");
  if (eptr)
    std::rethrow_exception(eptr);
  return std::move(*result);
}

// Run a coroutine on one of the runtime's shards and block for its result.
template <typename T>
[[nodiscard]] inline auto run_on(Runtime &runtime, task<T> coro) -> T {
  auto fut = boost::asio::co_spawn(runtime.executor_for(0), std::move(coro),
                                   boost::asio::use_future);
  return fut.get();
}

template <typename Predicate>
[[nodiscard]] inline auto
poll_until(Predicate &&predicate, std::chrono::milliseconds timeout,
           std::chrono::milliseconds interval = std::chrono::milliseconds(10))
    -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (std::invoke(std::forward<Predicate>(predicate))) {
      return true;
    }
    std::this_thread::sleep_for(interval);
  }
  return std::invoke(std::forward<Predicate>(predicate));
}

[[nodiscard]] inline auto pick_unused_tcp_port()
    -> std::optional<std::uint16_t> {
  int sock = ::socket(AF_INET, SOCK_STREAM, 0);
  if (sock < 0) {
    return std::nullopt;
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = 0;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

  if (::bind(sock, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    ::close(sock);
    return std::nullopt;
  }

  socklen_t len = sizeof(addr);
  if (::getsockname(sock, reinterpret_cast<sockaddr *>(&addr), &len) < 0) {
    ::close(sock);
    return std::nullopt;
  }

  std::uint16_t port = ntohs(addr.sin_port);
  ::close(sock);
  if (port == 0) {
    return std::nullopt;
  }
  return port;
}

[[nodiscard]] inline auto
make_temp_dir(std::string_view prefix = "crawlforge_test_") -> std::string {
  std::string templ = std::string("/tmp/") + std::string(prefix) + "XXXXXX";
  char *path = ::mkdtemp(templ.data());
  return path ? std::string(path) : "";
}

/// Collects formatted log lines for the lifetime of the guard.
class LogCapture {
public:
  LogCapture() {
    log::set_sink([this](log::Level level, std::string_view line) {
      std::scoped_lock lock(mutex_);
      lines_.emplace_back(level, std::string(line));
    });
  }
  ~LogCapture() { log::set_sink(nullptr); }

  LogCapture(const LogCapture &) = delete;
  auto operator=(const LogCapture &) -> LogCapture & = delete;

  [[nodiscard]] auto contains(log::Level level, std::string_view needle) const
      -> bool {
    std::scoped_lock lock(mutex_);
    for (const auto &[lvl, line] : lines_) {
      if (lvl == level && line.find(needle) != std::string::npos) {
        return true;
      }
    }
    return false;
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::pair<log::Level, std::string>> lines_;
};

struct RawHttpResponse {
  int status{-1};
  std::string headers;
  std::string body;

  [[nodiscard]] auto header(std::string_view name) const
      -> std::optional<std::string> {
    const auto key = std::format("\r\n{}: ", name);
    auto pos = headers.find(key);
    if (pos == std::string::npos) {
      return std::nullopt;
    }
    pos += key.size();
    auto end = headers.find("\r\n", pos);
    return headers.substr(pos, end == std::string::npos ? std::string::npos
                                                        : end - pos);
  }
};

[[nodiscard]] inline auto
http_roundtrip(std::uint16_t port, const std::string &request,
               std::chrono::seconds timeout = std::chrono::seconds(5))
    -> RawHttpResponse {
  int sock = ::socket(AF_INET, SOCK_STREAM, 0);
  if (sock < 0) {
    return {};
  }

  timeval tv{};
  tv.tv_sec = static_cast<decltype(tv.tv_sec)>(timeout.count());
  tv.tv_usec = 0;
  ::setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  ::setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

  if (::connect(sock, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    ::close(sock);
    return {};
  }

  (void)::send(sock, request.data(), request.size(), 0);

  std::string response;
  char buffer[4096];
  ssize_t n;
  while ((n = ::recv(sock, buffer, sizeof(buffer), 0)) > 0) {
    response.append(buffer, static_cast<std::size_t>(n));
  }
  ::close(sock);

  RawHttpResponse out;
  if (response.size() > 12) {
    auto space_pos = response.find(' ');
    if (space_pos != std::string::npos && space_pos + 4 <= response.size()) {
      out.status = std::stoi(response.substr(space_pos + 1, 3));
    }
  }
  auto body_start = response.find("\r\n\r\n");
  if (body_start != std::string::npos) {
    out.headers = response.substr(0, body_start + 2);
    out.body = response.substr(body_start + 4);
  }
  return out;
}

[[nodiscard]] inline auto http_get(std::uint16_t port, std::string_view path)
    -> RawHttpResponse {
  return http_roundtrip(
      port,
      std::format(
          "GET {} HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n",
          path));
}

[[nodiscard]] inline auto http_post(std::uint16_t port, std::string_view path,
                                    std::string_view json_body)
    -> RawHttpResponse {
  return http_roundtrip(port, std::format("POST {} HTTP/1.1\r\n"
                                          "Host: localhost\r\n"
                                          "Content-Type: application/json\r\n"
                                          "Content-Length: {}\r\n"
                                          "Connection: close\r\n\r\n{}",
                                          path, json_body.size(), json_body));
}

} // namespace crawlforge::test
