#include "fstx/transcript/entropy_source.hpp"

#include <climits>

#include <openssl/rand.h>

namespace fstx {

bool OsEntropySource::Fill(std::span<uint8_t> out) {
  if (out.empty()) {
    return true;
  }
  if (out.size() > static_cast<size_t>(INT_MAX)) {
    return false;
  }
  return RAND_bytes(out.data(), static_cast<int>(out.size())) == 1;
}

}  // namespace fstx
