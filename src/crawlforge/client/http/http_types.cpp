#include "crawlforge/client/http/http_types.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/url/parse_query.hpp>

#include <cctype>
#include <charconv>
#include <iterator>
#include <utility>

namespace crawlforge::http {

auto HeaderNameHash::operator()(std::string_view name) const noexcept
    -> std::uint64_t {
  // FNV-1a over the lowercased name.
  std::uint64_t h = 14695981039346656037ULL;
  for (char c : name) {
    h ^= static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(c)));
    h *= 1099511628211ULL;
  }
  return h;
}

auto HeaderNameEqual::operator()(std::string_view a,
                                 std::string_view b) const noexcept -> bool {
  return boost::algorithm::iequals(a, b);
}

auto HttpRequest::header(std::string_view key) const -> Result<std::string> {
  auto it = headers.find(key);
  if (it != headers.end()) {
    return ok(it->second);
  }
  return fail(Error::NotFound);
}

auto HttpRequest::body_as_string() const -> std::string_view {
  return {reinterpret_cast<const char *>(body.data()), body.size()};
}

auto HttpRequest::path_param(std::string_view key) const
    -> Result<std::string> {
  auto it = path_params.find(std::string(key));
  if (it != path_params.end()) {
    return ok(it->second);
  }
  return fail(Error::NotFound);
}

auto HttpRequest::serialize() const -> std::vector<uint8_t> {
  std::vector<uint8_t> result;
  result.reserve(256 + body.size());

  std::format_to(std::back_inserter(result), "{} {}{}{} HTTP/1.1\r\n", method,
                 path, query_string.empty() ? "" : "?", query_string);

  bool has_content_length = false;
  bool has_host = false;
  for (const auto &[key, value] : headers) {
    std::format_to(std::back_inserter(result), "{}: {}\r\n", key, value);
    if (boost::algorithm::iequals(key, "Content-Length")) {
      has_content_length = true;
    }
    if (boost::algorithm::iequals(key, "Host")) {
      has_host = true;
    }
  }

  if (!has_host) {
    constexpr std::string_view host_header = "Host: localhost\r\n";
    result.insert(result.end(), host_header.begin(), host_header.end());
  }
  if (!has_content_length &&
      (!body.empty() || method == HttpMethod::POST ||
       method == HttpMethod::PUT)) {
    std::format_to(std::back_inserter(result), "Content-Length: {}\r\n",
                   body.size());
  }

  result.emplace_back('\r');
  result.emplace_back('\n');
  result.insert(result.end(), body.begin(), body.end());
  return result;
}

QueryParams::QueryParams(std::string_view query_string) {
  if (query_string.empty()) {
    return;
  }
  auto parsed = boost::urls::parse_query(query_string);
  if (!parsed) {
    return;
  }
  for (const auto &param : *parsed) {
    params_[param.key.decode()] = param.has_value ? param.value.decode() : "";
  }
}

auto QueryParams::get(std::string_view key) const -> Result<std::string> {
  auto it = params_.find(std::string(key));
  if (it != params_.end())
    return ok(it->second);
  return fail(Error::NotFound);
}

auto QueryParams::get_int(std::string_view key) const -> Result<std::int64_t> {
  auto raw = get(key);
  if (!raw) {
    return fail(raw.error());
  }
  std::int64_t value = 0;
  const auto *first = raw->data();
  const auto *last = first + raw->size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return fail(Error::InvalidArgument);
  }
  return ok(value);
}

auto QueryParams::has(std::string_view key) const -> bool {
  return params_.contains(std::string(key));
}

auto HttpResponse::ok() -> HttpResponse {
  return {.status = HttpStatus::Ok, .headers = {}, .body = {}};
}

auto HttpResponse::json(std::string_view json_str, HttpStatus status)
    -> HttpResponse {
  HttpResponse resp{.status = status, .headers = {}, .body = {}};
  resp.headers["Content-Type"] = "application/json";
  resp.body.assign(json_str.begin(), json_str.end());
  return resp;
}

auto HttpResponse::text(std::string_view text, std::string_view content_type)
    -> HttpResponse {
  HttpResponse resp{.status = HttpStatus::Ok, .headers = {}, .body = {}};
  resp.headers["Content-Type"] = std::string(content_type);
  resp.body.assign(text.begin(), text.end());
  return resp;
}

auto HttpResponse::not_found() -> HttpResponse {
  return {.status = HttpStatus::NotFound, .headers = {}, .body = {}};
}

auto HttpResponse::bad_request() -> HttpResponse {
  return {.status = HttpStatus::BadRequest, .headers = {}, .body = {}};
}

auto HttpResponse::internal_error() -> HttpResponse {
  return {.status = HttpStatus::InternalServerError, .headers = {}, .body = {}};
}

auto HttpResponse::set_header(std::string key, std::string value)
    -> HttpResponse & {
  headers[std::move(key)] = std::move(value);
  return *this;
}

auto HttpResponse::set_body(std::string body_str) -> HttpResponse & {
  body.assign(body_str.begin(), body_str.end());
  return *this;
}

auto HttpResponse::header(std::string_view key) const -> Result<std::string> {
  auto it = headers.find(key);
  if (it != headers.end()) {
    return crawlforge::ok(it->second);
  }
  return fail(Error::NotFound);
}

auto status_reason_phrase(HttpStatus status) -> std::string_view {
  namespace beast_http = boost::beast::http;
  return beast_http::obsolete_reason(static_cast<beast_http::status>(status));
}

} // namespace crawlforge::http
