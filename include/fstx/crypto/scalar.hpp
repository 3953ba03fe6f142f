#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include <gmpxx.h>

namespace fstx {

// Element of the secp256k1 scalar field Z_q.
class Scalar {
 public:
  static constexpr size_t kByteLength = 32;

  Scalar();
  explicit Scalar(const mpz_class& value);

  static Scalar FromUint64(uint64_t value);
  static Scalar FromBigEndianModQ(std::span<const uint8_t> bytes);
  // Throws CodecDecodingError unless `bytes` is 32 bytes encoding a value < q.
  static Scalar FromCanonicalBytes(std::span<const uint8_t> bytes);

  std::array<uint8_t, kByteLength> ToCanonicalBytes() const;

  const mpz_class& value() const;

  Scalar operator+(const Scalar& other) const;
  Scalar operator*(const Scalar& other) const;

  bool operator==(const Scalar& other) const;
  bool operator!=(const Scalar& other) const;

  static const mpz_class& ModulusQ();

 private:
  mpz_class value_;
};

}  // namespace fstx
