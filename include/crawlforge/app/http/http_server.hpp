#pragma once

#include "crawlforge/client/http/http_types.hpp"
#include "crawlforge/core/coroutine.hpp"
#include "crawlforge/core/error.hpp"

#include <cstdint>
#include <memory>
#include <string_view>

namespace crawlforge {
class Runtime;
}

namespace crawlforge::http {

class Router;

/// HTTP/1.1 server on the request runtime. Listening sockets are bound
/// synchronously by start(); connections are served on the accepting shard.
class HttpServer {
public:
  explicit HttpServer(Runtime &runtime);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  auto operator=(const HttpServer &) -> HttpServer & = delete;

  auto router() -> Router &;

  /// Port 0 picks an ephemeral port; see local_port().
  [[nodiscard]] auto start(std::string_view host, uint16_t port,
                           bool reuse_port = false) -> Result<void>;
  auto stop() -> void;

  [[nodiscard]] auto is_running() const -> bool;
  [[nodiscard]] auto local_port() const -> uint16_t;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace crawlforge::http
