#include "fstx/crypto/hash.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace fstx {

std::array<uint8_t, kSha3_256DigestLength> Sha3_256(std::span<const uint8_t> data) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (ctx == nullptr) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  std::array<uint8_t, kSha3_256DigestLength> digest{};
  unsigned int digest_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha3_256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1 ||
      digest_len != digest.size()) {
    throw std::runtime_error("SHA3-256 failed");
  }
  return digest;
}

}  // namespace fstx
