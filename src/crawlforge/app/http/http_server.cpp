#include "crawlforge/app/http/http_server.hpp"

#include "crawlforge/app/http/router.hpp"
#include "crawlforge/core/asio_awaitable.hpp"
#include "crawlforge/core/runtime.hpp"
#include "crawlforge/util/log.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/url/parse.hpp>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <memory>
#include <mutex>
#include <sys/socket.h>
#include <vector>

namespace crawlforge::http {

namespace {
constexpr auto kHttpIoTimeout = std::chrono::seconds(30);
constexpr std::uint32_t kParserHeaderLimit = 64 * 1024;
constexpr std::uint64_t kParserBodyLimit = 4ULL * 1024ULL * 1024ULL;

namespace beast = boost::beast;
namespace beast_http = beast::http;

using Acceptor = boost::asio::ip::tcp::acceptor;

auto to_method(beast_http::verb verb) noexcept -> HttpMethod {
  switch (verb) {
  case beast_http::verb::post:
    return HttpMethod::POST;
  case beast_http::verb::put:
    return HttpMethod::PUT;
  case beast_http::verb::delete_:
    return HttpMethod::DELETE;
  case beast_http::verb::head:
    return HttpMethod::HEAD;
  default:
    return HttpMethod::GET;
  }
}

auto to_request(
    const beast_http::request<beast_http::vector_body<uint8_t>> &msg)
    -> HttpRequest {
  HttpRequest out;
  out.method = to_method(msg.method());
  out.version_major = static_cast<int>(msg.version() / 10);
  out.version_minor = static_cast<int>(msg.version() % 10);

  std::string target(msg.target());
  if (auto parsed = boost::urls::parse_origin_form(target); parsed) {
    out.path = std::string(parsed->encoded_path());
    if (auto query = parsed->encoded_query(); !query.empty()) {
      out.query_string.assign(query.data(), query.size());
    }
  } else {
    out.path = std::move(target);
  }

  for (const auto &field : msg.base()) {
    out.headers.emplace(field.name_string(), field.value());
  }
  out.body = msg.body();
  return out;
}

auto to_beast_response(const HttpResponse &resp, unsigned version,
                       bool keep_alive)
    -> beast_http::response<beast_http::vector_body<uint8_t>> {
  beast_http::response<beast_http::vector_body<uint8_t>> out{
      static_cast<beast_http::status>(resp.status), version};
  out.keep_alive(keep_alive);
  for (const auto &[k, v] : resp.headers) {
    out.set(k, v);
  }
  out.set(beast_http::field::x_content_type_options, "nosniff");
  out.set(beast_http::field::cache_control, "no-store");
  out.body() = resp.body;
  out.prepare_payload();
  return out;
}

auto open_acceptor(boost::asio::io_context &io,
                   const boost::asio::ip::address &bind_address, uint16_t port,
                   bool reuse_port) -> Result<std::shared_ptr<Acceptor>> {
  auto acceptor = std::make_shared<Acceptor>(io);
  boost::system::error_code ec;

  acceptor->open(bind_address.is_v6() ? boost::asio::ip::tcp::v6()
                                      : boost::asio::ip::tcp::v4(),
                 ec);
  if (ec) {
    log::error("Failed to open acceptor: {}", ec.message());
    return fail(std::error_code(ec.value(), std::system_category()));
  }

  acceptor->set_option(boost::asio::socket_base::reuse_address(true), ec);
  if (ec) {
    log::warn("Failed to set SO_REUSEADDR: {}", ec.message());
    ec.clear();
  }

  if (reuse_port) {
    int reuse = 1;
    if (::setsockopt(acceptor->native_handle(), SOL_SOCKET, SO_REUSEPORT,
                     &reuse, sizeof(reuse)) < 0) {
      auto err = std::error_code(errno, std::system_category());
      log::error("Failed to set SO_REUSEPORT: {}", err.message());
      return fail(err);
    }
  }

  acceptor->bind({bind_address, port}, ec);
  if (ec) {
    log::error("Failed to bind {}:{}: {}", bind_address.to_string(), port,
               ec.message());
    return fail(std::error_code(ec.value(), std::system_category()));
  }

  acceptor->listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec) {
    log::error("Failed to listen on {}:{}: {}", bind_address.to_string(), port,
               ec.message());
    return fail(std::error_code(ec.value(), std::system_category()));
  }
  return ok(std::move(acceptor));
}

} // namespace

struct HttpServer::Impl : std::enable_shared_from_this<HttpServer::Impl> {
  Runtime &runtime;
  Router router_;
  std::mutex acceptors_mutex;
  std::vector<std::pair<shard_id, std::shared_ptr<Acceptor>>> acceptors;
  std::atomic<uint16_t> bound_port{0};
  std::atomic<bool> running{false};

  explicit Impl(Runtime &rt) : runtime(rt) {}

  auto handle_connection(boost::asio::ip::tcp::socket socket) -> spawn_task {
    auto self = shared_from_this();
    const int fd_num = socket.native_handle();
    boost::system::error_code ep_ec;
    const auto peer = socket.remote_endpoint(ep_ec);
    const std::string remote = ep_ec ? "" : peer.address().to_string();

    log::debug("HTTP connection start: fd={} peer={}", fd_num, remote);

    beast::flat_buffer read_buffer;
    try {
      while (running.load(std::memory_order_acquire)) {
        beast_http::request_parser<beast_http::vector_body<uint8_t>> parser;
        parser.header_limit(kParserHeaderLimit);
        parser.body_limit(kParserBodyLimit);

        auto [read_ec, read_n] = co_await beast_http::async_read(
            socket, read_buffer, parser,
            boost::asio::cancel_after(kHttpIoTimeout, use_nothrow));
        (void)read_n;
        if (read_ec) {
          if (read_ec != boost::asio::error::eof &&
              read_ec != boost::asio::error::operation_aborted &&
              read_ec != beast_http::error::end_of_stream) {
            log::warn("HTTP read failed: fd={} err={}", fd_num,
                      read_ec.message());
          }
          break;
        }

        auto beast_req = parser.release();
        auto req = to_request(beast_req);
        req.remote_address = remote;
        log::debug("HTTP request: {} {} (fd={})", req.method, req.path, fd_num);

        const auto method = req.method;
        const auto path = req.path;
        auto resp = co_await router_.route(std::move(req));
        if (static_cast<std::uint16_t>(resp.status) >= 500) {
          log::warn("HTTP {} {} -> {}", method, path, resp.status);
        }
        auto beast_resp = to_beast_response(resp, beast_req.version(),
                                            beast_req.keep_alive());

        auto [write_ec, written] = co_await beast_http::async_write(
            socket, beast_resp,
            boost::asio::cancel_after(kHttpIoTimeout, use_nothrow));
        (void)written;
        if (write_ec) {
          log::warn("HTTP write failed: fd={} err={}", fd_num,
                    write_ec.message());
          break;
        }

        if (!beast_req.keep_alive()) {
          break;
        }
      }
    } catch (const std::exception &e) {
      log::error("Exception in connection handler: {}", e.what());
    }

    boost::system::error_code close_ec;
    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, close_ec);
    log::debug("HTTP connection close: fd={}", fd_num);
  }

  auto accept_loop(std::shared_ptr<Acceptor> acceptor, shard_id shard)
      -> spawn_task {
    auto self = shared_from_this();
    while (running.load(std::memory_order_acquire)) {
      boost::asio::ip::tcp::socket socket(acceptor->get_executor());
      auto [accept_ec] = co_await acceptor->async_accept(socket, use_nothrow);
      if (accept_ec) {
        if (running && accept_ec != boost::asio::error::operation_aborted) {
          log::error("Accept failed: {}", accept_ec.message());
        }
        break;
      }

      boost::system::error_code nodelay_ec;
      socket.set_option(boost::asio::ip::tcp::no_delay(true), nodelay_ec);
      if (nodelay_ec) {
        log::warn("Failed to set TCP_NODELAY: {}", nodelay_ec.message());
      }

      runtime.spawn_on(shard, handle_connection(std::move(socket)));
    }
  }

  auto close_acceptors() -> void {
    std::lock_guard lock(acceptors_mutex);
    for (auto &[shard, acceptor] : acceptors) {
      boost::asio::post(runtime.executor_for(shard), [acc = acceptor] {
        boost::system::error_code close_ec;
        acc->cancel(close_ec);
        acc->close(close_ec);
      });
    }
    acceptors.clear();
  }
};

HttpServer::HttpServer(Runtime &runtime)
    : impl_(std::make_shared<Impl>(runtime)) {}

HttpServer::~HttpServer() { stop(); }

auto HttpServer::router() -> Router & { return impl_->router_; }

auto HttpServer::start(std::string_view host, uint16_t port, bool reuse_port)
    -> Result<void> {
  auto impl = impl_;
  if (impl->running.load()) {
    return fail(Error::InvalidState);
  }

  boost::system::error_code addr_ec;
  boost::asio::ip::address bind_address;
  if (host == "0.0.0.0" || host.empty()) {
    bind_address = boost::asio::ip::address_v4::any();
  } else {
    bind_address = boost::asio::ip::make_address(std::string(host), addr_ec);
  }
  if (addr_ec) {
    log::error("Invalid host address '{}': {}", host, addr_ec.message());
    return fail(Error::InvalidArgument);
  }

  const auto acceptor_count =
      reuse_port ? std::max(1U, impl->runtime.shard_count()) : 1U;

  std::vector<std::pair<shard_id, std::shared_ptr<Acceptor>>> opened;
  uint16_t effective_port = port;
  for (unsigned i = 0; i < acceptor_count; ++i) {
    const auto shard = static_cast<shard_id>(
        reuse_port ? i : impl->runtime.next_external_shard());
    auto acceptor = open_acceptor(impl->runtime.shard(shard).ctx(),
                                  bind_address, effective_port, reuse_port);
    if (!acceptor) {
      for (auto &[s, acc] : opened) {
        boost::system::error_code close_ec;
        acc->close(close_ec);
      }
      return fail(acceptor.error());
    }
    // Later acceptors share the port the first one was given.
    effective_port = (*acceptor)->local_endpoint().port();
    opened.emplace_back(shard, std::move(*acceptor));
  }

  impl->bound_port = effective_port;
  impl->running = true;
  {
    std::lock_guard lock(impl->acceptors_mutex);
    impl->acceptors = opened;
  }
  for (auto &[shard, acceptor] : opened) {
    impl->runtime.spawn_on(shard, impl->accept_loop(acceptor, shard));
  }

  log::info("HTTP server listening on {}:{} (acceptors={}, reuse_port={})",
            host, effective_port, acceptor_count, reuse_port);
  return ok();
}

auto HttpServer::stop() -> void {
  if (!impl_->running.exchange(false)) {
    return;
  }
  log::info("Stopping HTTP server...");
  impl_->close_acceptors();
  log::info("HTTP server stopped");
}

auto HttpServer::is_running() const -> bool { return impl_->running.load(); }

auto HttpServer::local_port() const -> uint16_t {
  return impl_->bound_port.load();
}

} // namespace crawlforge::http
