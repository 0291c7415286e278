#include "crawlforge/app/http/router.hpp"

#include <ankerl/unordered_dense.h>

#include <algorithm>
#include <array>
#include <ranges>
#include <string_view>
#include <vector>

namespace crawlforge::http {

struct Router::Impl {
  struct RoutePattern {
    std::vector<std::string> segments;
    std::vector<bool> is_param;
  };

  struct Route {
    std::string pattern;
    RoutePattern parsed;
    RouteHandler handler;
  };

  struct MethodRoutes {
    ankerl::unordered_dense::map<std::string, std::size_t> static_lookup;
    std::vector<Route> static_routes;
    ankerl::unordered_dense::map<std::size_t, std::vector<Route>>
        dynamic_by_segments;
  };

  static constexpr std::size_t kMethodCount = 5;
  std::array<MethodRoutes, kMethodCount> methods;

  static auto method_index(HttpMethod method) -> std::size_t {
    return static_cast<std::size_t>(method);
  }

  static auto split_path(std::string_view path)
      -> std::vector<std::string_view> {
    std::vector<std::string_view> segments;
    for (auto part : path | std::views::split('/')) {
      segments.emplace_back(std::string_view(part));
    }
    return segments;
  }

  static auto parse_pattern(std::string_view pattern) -> RoutePattern {
    RoutePattern result;
    for (auto seg : split_path(pattern)) {
      const bool param = seg.starts_with('{') && seg.ends_with('}');
      result.segments.emplace_back(param ? seg.substr(1, seg.size() - 2)
                                         : seg);
      result.is_param.push_back(param);
    }
    return result;
  }

  static auto match_route(const RoutePattern &pattern,
                          const std::vector<std::string_view> &path_segments,
                          const HttpRequest &req) -> bool {
    if (path_segments.size() != pattern.segments.size()) {
      return false;
    }

    req.path_params.clear();
    for (auto &&[pat_seg, is_param, path_seg] :
         std::views::zip(pattern.segments, pattern.is_param, path_segments)) {
      if (is_param) {
        if (path_seg.empty()) {
          req.path_params.clear();
          return false;
        }
        req.path_params.emplace(pat_seg, path_seg);
      } else if (pat_seg != path_seg) {
        req.path_params.clear();
        return false;
      }
    }
    return true;
  }

  auto find(HttpMethod method, const HttpRequest &req,
            const std::vector<std::string_view> &segments) -> Route * {
    auto &routes = methods[method_index(method)];
    if (auto it = routes.static_lookup.find(req.path);
        it != routes.static_lookup.end()) {
      return &routes.static_routes[it->second];
    }
    auto dyn_it = routes.dynamic_by_segments.find(segments.size());
    if (dyn_it == routes.dynamic_by_segments.end()) {
      return nullptr;
    }
    for (auto &route : dyn_it->second) {
      if (match_route(route.parsed, segments, req)) {
        return &route;
      }
    }
    return nullptr;
  }
};

Router::Router() : impl_(std::make_unique<Impl>()) {}

Router::~Router() = default;

auto Router::add_route(HttpMethod method, std::string path,
                       RouteHandler handler) -> void {
  auto parsed = Impl::parse_pattern(path);
  const bool has_param = std::ranges::any_of(parsed.is_param, std::identity{});

  auto &method_routes = impl_->methods[Impl::method_index(method)];
  if (!has_param) {
    method_routes.static_lookup.emplace(path,
                                        method_routes.static_routes.size());
    method_routes.static_routes.emplace_back(
        Impl::Route{.pattern = std::move(path),
                    .parsed = std::move(parsed),
                    .handler = std::move(handler)});
    return;
  }

  auto &bucket = method_routes.dynamic_by_segments[parsed.segments.size()];
  bucket.emplace_back(Impl::Route{.pattern = std::move(path),
                                  .parsed = std::move(parsed),
                                  .handler = std::move(handler)});
}

auto Router::get(std::string path, RouteHandler handler) -> void {
  add_route(HttpMethod::GET, std::move(path), std::move(handler));
}

auto Router::post(std::string path, RouteHandler handler) -> void {
  add_route(HttpMethod::POST, std::move(path), std::move(handler));
}

auto Router::route(HttpRequest req) -> crawlforge::task<HttpResponse> {
  // Segments view the original path, which stays put in the coroutine frame.
  const std::string path = req.path;
  const auto segments = Impl::split_path(path);

  if (auto *route = impl_->find(req.method, req, segments)) {
    co_return co_await route->handler(std::move(req));
  }

  for (std::size_t m = 0; m < Impl::kMethodCount; ++m) {
    const auto other = static_cast<HttpMethod>(m);
    if (other != req.method && impl_->find(other, req, segments)) {
      co_return HttpResponse{
          .status = HttpStatus::MethodNotAllowed, .headers = {}, .body = {}};
    }
  }
  co_return HttpResponse::not_found();
}

} // namespace crawlforge::http
