#pragma once

#include "crawlforge/client/http/http_types.hpp"
#include "crawlforge/core/coroutine.hpp"
#include "crawlforge/core/error.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

namespace crawlforge::http {

struct HttpClientConfig {
  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds read_timeout{30000};
  std::size_t max_response_size{10UL * 1024UL * 1024UL};
  bool keep_alive{true};
};

/// One keep-alive HTTP/1.1 connection. Not thread-safe; use from a single
/// coroutine at a time.
class HttpClient {
public:
  HttpClient(boost::asio::ip::tcp::socket socket, HttpClientConfig config = {});
  ~HttpClient();

  HttpClient(const HttpClient &) = delete;
  auto operator=(const HttpClient &) -> HttpClient & = delete;
  HttpClient(HttpClient &&) noexcept;
  auto operator=(HttpClient &&) noexcept -> HttpClient &;

  static auto connect_tcp(boost::asio::any_io_executor executor,
                          std::string_view host, uint16_t port,
                          HttpClientConfig config = {})
      -> task<Result<std::unique_ptr<HttpClient>>>;

  /// One-shot POST of a JSON document to an absolute http:// URL.
  static auto post_json_to(boost::asio::any_io_executor executor,
                           std::string_view url, std::string_view json,
                           HttpClientConfig config = {})
      -> task<Result<HttpResponse>>;

  auto request(HttpRequest req) -> task<Result<HttpResponse>>;

  auto get(std::string_view target, const HttpHeaders &headers = {})
      -> task<Result<HttpResponse>>;

  auto post_json(std::string_view target, std::string_view json,
                 const HttpHeaders &headers = {}) -> task<Result<HttpResponse>>;

  [[nodiscard]] auto is_connected() const noexcept -> bool;
  auto close() -> void;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace crawlforge::http
