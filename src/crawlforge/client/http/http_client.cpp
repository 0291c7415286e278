#include "crawlforge/client/http/http_client.hpp"

#include "crawlforge/core/asio_awaitable.hpp"
#include "crawlforge/util/log.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/url/parse.hpp>

#include <format>
#include <string>

namespace crawlforge::http {

namespace {

namespace beast = boost::beast;
namespace beast_http = beast::http;

auto to_response(
    const beast_http::response<beast_http::vector_body<uint8_t>> &msg)
    -> HttpResponse {
  HttpResponse out;
  out.status = static_cast<HttpStatus>(msg.result_int());
  for (const auto &field : msg.base()) {
    out.headers.emplace(field.name_string(), field.value());
  }
  out.body = msg.body();
  return out;
}

/// Splits "path?query" into the request's path and query string.
auto set_target(HttpRequest &req, std::string_view target) -> void {
  if (auto q = target.find('?'); q != std::string_view::npos) {
    req.path = std::string(target.substr(0, q));
    req.query_string = std::string(target.substr(q + 1));
  } else {
    req.path = std::string(target);
  }
}

} // namespace

struct HttpClient::Impl {
  boost::asio::ip::tcp::socket socket;
  HttpClientConfig config;
  std::string host;
  beast::flat_buffer read_buffer;

  Impl(boost::asio::ip::tcp::socket socket_in, HttpClientConfig cfg)
      : socket(std::move(socket_in)), config(cfg) {}
};

HttpClient::HttpClient(boost::asio::ip::tcp::socket socket,
                       HttpClientConfig config)
    : impl_(std::make_unique<Impl>(std::move(socket), config)) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient &&) noexcept = default;
auto HttpClient::operator=(HttpClient &&) noexcept -> HttpClient & = default;

auto HttpClient::connect_tcp(boost::asio::any_io_executor executor,
                             std::string_view host, uint16_t port,
                             HttpClientConfig config)
    -> task<Result<std::unique_ptr<HttpClient>>> {
  boost::asio::ip::tcp::resolver resolver(executor);
  auto [resolve_ec, endpoints] = co_await resolver.async_resolve(
      std::string(host), std::to_string(port),
      boost::asio::cancel_after(config.connect_timeout, use_nothrow));
  if (resolve_ec) {
    log::debug("Failed to resolve {}:{} - {}", host, port,
               resolve_ec.message());
    co_return fail(Error::InvalidArgument);
  }

  boost::asio::ip::tcp::socket socket(executor);
  auto [connect_ec, endpoint] = co_await boost::asio::async_connect(
      socket, endpoints,
      boost::asio::cancel_after(config.connect_timeout, use_nothrow));
  (void)endpoint;
  if (connect_ec) {
    log::debug("Failed to connect to {}:{} - {}", host, port,
               connect_ec.message());
    co_return fail(std::error_code(connect_ec.value(), std::system_category()));
  }

  auto client = std::make_unique<HttpClient>(std::move(socket), config);
  client->impl_->host = std::format("{}:{}", host, port);
  co_return ok(std::move(client));
}

auto HttpClient::post_json_to(boost::asio::any_io_executor executor,
                              std::string_view url, std::string_view json,
                              HttpClientConfig config)
    -> task<Result<HttpResponse>> {
  auto parsed = boost::urls::parse_uri(url);
  if (!parsed || parsed->scheme() != "http" || !parsed->has_authority()) {
    log::warn("Unsupported callback URL '{}'", url);
    co_return fail(Error::InvalidArgument);
  }
  const auto port = parsed->has_port() ? parsed->port_number() : uint16_t{80};
  config.keep_alive = false;

  auto client = co_await connect_tcp(std::move(executor),
                                     std::string(parsed->host()), port, config);
  if (!client) {
    co_return fail(client.error());
  }
  std::string target(parsed->encoded_path());
  if (target.empty()) {
    target = "/";
  }
  if (parsed->has_query()) {
    target += "?";
    target += std::string(parsed->encoded_query());
  }
  auto resp = co_await (*client)->post_json(target, json);
  (*client)->close();
  co_return resp;
}

auto HttpClient::request(HttpRequest req) -> task<Result<HttpResponse>> {
  if (!is_connected()) {
    co_return fail(Error::InvalidState);
  }
  if (!req.headers.contains("Host")) {
    req.headers["Host"] = impl_->host;
  }
  if (!req.headers.contains("Connection")) {
    req.headers["Connection"] = impl_->config.keep_alive ? "keep-alive" : "close";
  }

  auto request_data = req.serialize();
  auto [write_ec, written] = co_await boost::asio::async_write(
      impl_->socket, boost::asio::buffer(request_data),
      boost::asio::cancel_after(impl_->config.read_timeout, use_nothrow));
  (void)written;
  if (write_ec) {
    log::debug("Failed to write request: {}", write_ec.message());
    close();
    co_return fail(std::error_code(write_ec.value(), std::system_category()));
  }

  beast_http::response_parser<beast_http::vector_body<uint8_t>> parser;
  parser.header_limit(256 * 1024);
  parser.body_limit(impl_->config.max_response_size);

  auto [read_ec, read_n] = co_await beast_http::async_read(
      impl_->socket, impl_->read_buffer, parser,
      boost::asio::cancel_after(impl_->config.read_timeout, use_nothrow));
  (void)read_n;
  if (read_ec) {
    log::debug("Failed to read response: {}", read_ec.message());
    close();
    if (read_ec == boost::asio::error::operation_aborted) {
      co_return fail(Error::Timeout);
    }
    co_return fail(Error::ProtocolError);
  }

  auto msg = parser.release();
  if (!msg.keep_alive()) {
    close();
  }
  co_return to_response(msg);
}

auto HttpClient::get(std::string_view target, const HttpHeaders &headers)
    -> task<Result<HttpResponse>> {
  HttpRequest req;
  req.method = HttpMethod::GET;
  set_target(req, target);
  req.headers = headers;
  co_return co_await request(std::move(req));
}

auto HttpClient::post_json(std::string_view target, std::string_view json,
                           const HttpHeaders &headers)
    -> task<Result<HttpResponse>> {
  HttpRequest req;
  req.method = HttpMethod::POST;
  set_target(req, target);
  req.body = std::vector<uint8_t>(json.begin(), json.end());
  req.headers = headers;
  req.headers["Content-Type"] = "application/json";
  co_return co_await request(std::move(req));
}

auto HttpClient::is_connected() const noexcept -> bool {
  return impl_->socket.is_open();
}

auto HttpClient::close() -> void {
  boost::system::error_code ec;
  impl_->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  impl_->socket.close(ec);
}

} // namespace crawlforge::http
