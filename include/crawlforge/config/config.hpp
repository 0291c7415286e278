#pragma once

#include "crawlforge/config/system_config.hpp"
#include "crawlforge/core/error.hpp"

#include <string_view>

namespace crawlforge {

using Config = SystemConfig;

class ConfigLoader {
public:
  /// Parse, apply CRAWLFORGE_* environment overrides, then validate.
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;

  [[nodiscard]] static auto validate(const SystemConfig &cfg) -> Result<void>;
};

} // namespace crawlforge
