#include "crawlforge/util/digest.hpp"

#include <openssl/evp.h>

#include <array>
#include <format>
#include <iterator>
#include <memory>
#include <stdexcept>

namespace crawlforge::util {

auto sha256_hex(std::string_view data) -> std::string {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                              &EVP_MD_CTX_free);
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int len = 0;
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }

  std::string out;
  out.reserve(static_cast<std::size_t>(len) * 2);
  for (unsigned int i = 0; i < len; ++i) {
    std::format_to(std::back_inserter(out), "{:02x}", digest[i]);
  }
  return out;
}

} // namespace crawlforge::util
