#include "fstx/codec/integer_codec.hpp"

#include <algorithm>
#include <stdexcept>

namespace fstx {

void EncodeFixedWidthInto(const mpz_class& value, std::span<uint8_t> out) {
  if (value < 0) {
    throw std::invalid_argument("mpz value must be non-negative");
  }
  std::fill(out.begin(), out.end(), 0);
  if (value == 0) {
    return;
  }

  const size_t needed = ByteLength(value);
  if (needed > out.size()) {
    throw std::invalid_argument("integer does not fit fixed-width buffer");
  }

  size_t count = 0;
  mpz_export(out.data() + (out.size() - needed), &count, 1, sizeof(uint8_t), 1, 0,
             value.get_mpz_t());
  if (count != needed) {
    throw std::runtime_error("mpz_export wrote an unexpected number of bytes");
  }
}

Bytes EncodeFixedWidth(const mpz_class& value, size_t width) {
  Bytes out(width);
  EncodeFixedWidthInto(value, out);
  return out;
}

mpz_class DecodeBigEndian(std::span<const uint8_t> encoded) {
  mpz_class out;
  if (encoded.empty()) {
    return out;
  }
  mpz_import(out.get_mpz_t(), encoded.size(), 1, sizeof(uint8_t), 1, 0, encoded.data());
  return out;
}

size_t ByteLength(const mpz_class& value) {
  if (value == 0) {
    return 1;
  }
  return (mpz_sizeinbase(value.get_mpz_t(), 2) + 7) / 8;
}

}  // namespace fstx
