#pragma once

#include <string>
#include <string_view>

namespace crawlforge::util {

/// Lower-case hex SHA-256 of `data`.
[[nodiscard]] auto sha256_hex(std::string_view data) -> std::string;

} // namespace crawlforge::util
