#include "crawlforge/cli/api_client.hpp"

#include "crawlforge/util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include <chrono>
#include <format>
#include <future>

namespace crawlforge::cli {
namespace {

template <typename T>
auto run_task(boost::asio::io_context &io, task<Result<T>> op) -> Result<T> {
  auto fut = boost::asio::co_spawn(io, std::move(op), boost::asio::use_future);
  while (fut.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
    io.run_one();
  }
  io.restart();
  try {
    return fut.get();
  } catch (const std::exception &e) {
    log::error("ApiClient request failed: {}", e.what());
    return fail(Error::Unknown);
  }
}

} // namespace

auto ApiReply::error_text() const -> std::string {
  if (const auto *detail = json_string(body, "detail"); detail) {
    if (const auto *msg = json_string(body, "message"); msg) {
      return std::format("{} ({})", *msg, *detail);
    }
    return *detail;
  }
  if (const auto *msg = json_string(body, "message"); msg) {
    return *msg;
  }
  return raw;
}

ApiClient::ApiClient(std::string host, std::uint16_t port)
    : host_(std::move(host)), port_(port) {}

ApiClient::~ApiClient() {
  if (client_) {
    client_->close();
  }
}

auto ApiClient::ensure_connected() -> Result<void> {
  if (client_ && client_->is_connected()) {
    return ok();
  }
  auto connected = run_task(
      io_, http::HttpClient::connect_tcp(io_.get_executor(), host_, port_));
  if (!connected) {
    return fail(connected.error());
  }
  client_ = std::move(*connected);
  return ok();
}

auto ApiClient::get(std::string_view target) -> Result<ApiReply> {
  if (auto r = ensure_connected(); !r) {
    return fail(r.error());
  }
  return run_task(io_, client_->get(target)).transform(&ApiClient::decode);
}

auto ApiClient::post(std::string_view target, std::string_view json)
    -> Result<ApiReply> {
  if (auto r = ensure_connected(); !r) {
    return fail(r.error());
  }
  return run_task(io_, client_->post_json(target, json))
      .transform(&ApiClient::decode);
}

auto ApiClient::decode(http::HttpResponse resp) -> ApiReply {
  ApiReply reply{.status = resp.status,
                 .body = {},
                 .raw = std::string(resp.body_as_string())};
  if (auto parsed = parse_json(reply.raw); parsed) {
    reply.body = std::move(*parsed);
  }
  return reply;
}

} // namespace crawlforge::cli
