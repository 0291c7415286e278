#pragma once

#include "crawlforge/client/http/http_client.hpp"
#include "crawlforge/core/error.hpp"
#include "crawlforge/util/json.hpp"

#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace crawlforge::cli {

/// Decoded reply of the management API. `body` is null when the response
/// was not valid JSON; `raw` always holds the original text.
struct ApiReply {
  http::HttpStatus status{http::HttpStatus::Ok};
  JsonValue body;
  std::string raw;

  [[nodiscard]] auto is_success() const noexcept -> bool {
    return static_cast<int>(status) < 400;
  }

  /// Human readable error from an ErrorDto body, falling back to the raw text.
  [[nodiscard]] auto error_text() const -> std::string;
};

/// Blocking client for the REST API of a running server. Owns a private
/// io_context and one keep-alive connection opened on first use.
class ApiClient {
public:
  ApiClient(std::string host, std::uint16_t port);
  ~ApiClient();

  ApiClient(const ApiClient &) = delete;
  auto operator=(const ApiClient &) -> ApiClient & = delete;

  [[nodiscard]] auto get(std::string_view target) -> Result<ApiReply>;
  [[nodiscard]] auto post(std::string_view target, std::string_view json)
      -> Result<ApiReply>;

  [[nodiscard]] auto host() const noexcept -> const std::string & {
    return host_;
  }
  [[nodiscard]] auto port() const noexcept -> std::uint16_t { return port_; }

private:
  auto ensure_connected() -> Result<void>;
  static auto decode(http::HttpResponse resp) -> ApiReply;

  std::string host_;
  std::uint16_t port_;
  boost::asio::io_context io_{1};
  std::unique_ptr<http::HttpClient> client_;
};

} // namespace crawlforge::cli
