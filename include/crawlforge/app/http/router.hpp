#pragma once

#include "crawlforge/client/http/http_types.hpp"
#include "crawlforge/core/coroutine.hpp"

#include <functional>
#include <memory>
#include <string>

namespace crawlforge::http {

using RouteHandler =
    std::move_only_function<crawlforge::task<HttpResponse>(HttpRequest)>;

/// Method + path dispatch. Patterns may contain `{name}` segments, which
/// are exposed through HttpRequest::path_param().
class Router {
public:
  Router();
  ~Router();

  Router(const Router &) = delete;
  auto operator=(const Router &) -> Router & = delete;

  auto add_route(HttpMethod method, std::string path, RouteHandler handler)
      -> void;

  auto get(std::string path, RouteHandler handler) -> void;
  auto post(std::string path, RouteHandler handler) -> void;

  /// 404 when nothing matches; 405 when the path exists under another
  /// method.
  [[nodiscard]] auto route(HttpRequest req) -> crawlforge::task<HttpResponse>;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace crawlforge::http
