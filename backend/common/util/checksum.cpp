#include "checksum.hpp"

#include <array>
#include <memory>
#include <stdexcept>
#include <openssl/evp.h>

namespace common {

std::string sha256Hex(std::span<const std::uint8_t> data) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if (!ctx) {
    throw std::bad_alloc();
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
    throw std::runtime_error("sha256 digest failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    out.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    out.push_back(kHex[digest[i] & 0x0F]);
  }
  return out;
}

std::string sha256Hex(std::string_view data) {
  return sha256Hex(std::span<const std::uint8_t>(
    reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
}

} // namespace common
