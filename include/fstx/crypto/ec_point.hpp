#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "fstx/crypto/scalar.hpp"

namespace fstx {

// secp256k1 point kept in SEC1 compressed form.
class ECPoint {
 public:
  static constexpr size_t kCompressedLength = 33;

  ECPoint();

  // Throws CodecDecodingError for a wrong length, prefix or off-curve point.
  static ECPoint FromCompressed(std::span<const uint8_t> compressed_bytes);
  static ECPoint GeneratorMultiply(const Scalar& scalar);

  ECPoint Add(const ECPoint& other) const;
  ECPoint Mul(const Scalar& scalar) const;

  // False for the default-constructed placeholder, which is not on the curve.
  bool IsOnCurve() const;

  const std::array<uint8_t, kCompressedLength>& compressed() const;

  bool operator==(const ECPoint& other) const;
  bool operator!=(const ECPoint& other) const;

 private:
  std::array<uint8_t, kCompressedLength> compressed_{};
};

}  // namespace fstx
