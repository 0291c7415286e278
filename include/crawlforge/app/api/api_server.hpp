#pragma once

#include "crawlforge/core/error.hpp"

#include <cstdint>
#include <memory>

namespace crawlforge {

class Application;

/// REST control surface: `/api/v1/spiders/*`, `/api/v1/monitoring/*` and
/// the root liveness endpoints.
class ApiServer {
public:
  explicit ApiServer(Application &app);
  ~ApiServer();

  ApiServer(const ApiServer &) = delete;
  auto operator=(const ApiServer &) -> ApiServer & = delete;

  /// Binds the configured host and port.
  [[nodiscard]] auto start() -> Result<void>;
  void stop();
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] auto local_port() const -> std::uint16_t;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace crawlforge
