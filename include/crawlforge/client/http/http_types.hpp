#pragma once

#include "crawlforge/core/error.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace crawlforge::http {

enum class HttpMethod : std::uint8_t { GET, POST, PUT, DELETE, HEAD };

enum class HttpStatus : std::uint16_t {
  Ok = 200,
  Created = 201,
  Accepted = 202,
  NoContent = 204,

  BadRequest = 400,
  Unauthorized = 401,
  Forbidden = 403,
  NotFound = 404,
  MethodNotAllowed = 405,
  Conflict = 409,
  TooManyRequests = 429,

  InternalServerError = 500,
  NotImplemented = 501,
  BadGateway = 502,
  ServiceUnavailable = 503
};

/// Header names compare case-insensitively.
struct HeaderNameHash {
  using is_transparent = void;

  [[nodiscard]] auto operator()(std::string_view name) const noexcept
      -> std::uint64_t;
};

struct HeaderNameEqual {
  using is_transparent = void;

  [[nodiscard]] auto operator()(std::string_view a,
                                std::string_view b) const noexcept -> bool;
};

using HttpHeaders =
    ankerl::unordered_dense::map<std::string, std::string, HeaderNameHash,
                                 HeaderNameEqual>;

class QueryParams {
public:
  QueryParams() = default;
  explicit QueryParams(std::string_view query_string);

  [[nodiscard]] auto get(std::string_view key) const -> Result<std::string>;
  /// Error::NotFound when absent, Error::InvalidArgument when not an
  /// integer.
  [[nodiscard]] auto get_int(std::string_view key) const
      -> Result<std::int64_t>;
  [[nodiscard]] auto has(std::string_view key) const -> bool;
  [[nodiscard]] auto size() const -> std::size_t { return params_.size(); }

private:
  ankerl::unordered_dense::map<std::string, std::string> params_;
};

struct HttpRequest {
  HttpMethod method{HttpMethod::GET};
  std::string path;
  std::string query_string;
  int version_major{1};
  int version_minor{1};
  HttpHeaders headers;
  std::vector<uint8_t> body;
  /// Peer IP as seen by the server; empty for client-side requests.
  std::string remote_address;
  // Mutable: populated by Router during const route() method
  mutable ankerl::unordered_dense::map<std::string, std::string> path_params;

  [[nodiscard]] auto header(std::string_view key) const -> Result<std::string>;
  [[nodiscard]] auto body_as_string() const -> std::string_view;
  [[nodiscard]] auto path_param(std::string_view key) const
      -> Result<std::string>;
  [[nodiscard]] auto query() const -> QueryParams {
    return QueryParams(query_string);
  }

  [[nodiscard]] auto serialize() const -> std::vector<uint8_t>;
};

struct HttpResponse {
  HttpStatus status{HttpStatus::Ok};
  HttpHeaders headers;
  std::vector<uint8_t> body;

  [[nodiscard]] static auto ok() -> HttpResponse;
  [[nodiscard]] static auto json(std::string_view json_str,
                                 HttpStatus status = HttpStatus::Ok)
      -> HttpResponse;
  [[nodiscard]] static auto text(std::string_view text,
                                 std::string_view content_type = "text/plain")
      -> HttpResponse;
  [[nodiscard]] static auto not_found() -> HttpResponse;
  [[nodiscard]] static auto bad_request() -> HttpResponse;
  [[nodiscard]] static auto internal_error() -> HttpResponse;

  auto set_header(std::string key, std::string value) -> HttpResponse &;
  auto set_body(std::string body_str) -> HttpResponse &;

  [[nodiscard]] auto header(std::string_view key) const -> Result<std::string>;
  [[nodiscard]] auto body_as_string() const -> std::string_view {
    return {reinterpret_cast<const char *>(body.data()), body.size()};
  }
};

[[nodiscard]] auto status_reason_phrase(HttpStatus status) -> std::string_view;

} // namespace crawlforge::http

template <>
struct std::formatter<crawlforge::http::HttpMethod>
    : std::formatter<std::string_view> {
  auto format(crawlforge::http::HttpMethod method, auto &ctx) const {
    using enum crawlforge::http::HttpMethod;
    std::string_view name = [method] {
      switch (method) {
      case GET:
        return "GET";
      case POST:
        return "POST";
      case PUT:
        return "PUT";
      case DELETE:
        return "DELETE";
      case HEAD:
        return "HEAD";
      }
      return "UNKNOWN";
    }();
    return std::formatter<std::string_view>::format(name, ctx);
  }
};

template <>
struct std::formatter<crawlforge::http::HttpStatus>
    : std::formatter<std::uint16_t> {
  auto format(crawlforge::http::HttpStatus status, auto &ctx) const {
    return std::formatter<std::uint16_t>::format(
        static_cast<std::uint16_t>(status), ctx);
  }
};
