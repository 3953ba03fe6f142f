#include "fstx/crypto/scalar.hpp"

#include <stdexcept>

#include "fstx/codec/integer_codec.hpp"
#include "fstx/common/errors.hpp"

namespace fstx {
namespace {

const mpz_class kSecp256k1Order(
    "0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141");

mpz_class NormalizeToQ(const mpz_class& input) {
  mpz_class normalized = input % kSecp256k1Order;
  if (normalized < 0) {
    normalized += kSecp256k1Order;
  }
  return normalized;
}

}  // namespace

Scalar::Scalar() : value_(0) {}

Scalar::Scalar(const mpz_class& value) : value_(NormalizeToQ(value)) {}

Scalar Scalar::FromUint64(uint64_t value) {
  mpz_class converted;
  mpz_import(converted.get_mpz_t(), 1, 1, sizeof(uint64_t), 0, 0, &value);
  return Scalar(converted);
}

Scalar Scalar::FromBigEndianModQ(std::span<const uint8_t> bytes) {
  if (bytes.empty()) {
    throw std::invalid_argument("Big-endian input must not be empty");
  }
  return Scalar(DecodeBigEndian(bytes));
}

Scalar Scalar::FromCanonicalBytes(std::span<const uint8_t> bytes) {
  if (bytes.size() != kByteLength) {
    throw CodecDecodingError("Canonical scalar must be exactly 32 bytes");
  }

  mpz_class imported = DecodeBigEndian(bytes);
  if (imported >= kSecp256k1Order) {
    throw CodecDecodingError("Canonical scalar is out of range");
  }
  return Scalar(imported);
}

std::array<uint8_t, Scalar::kByteLength> Scalar::ToCanonicalBytes() const {
  std::array<uint8_t, kByteLength> out{};
  EncodeFixedWidthInto(value_, out);
  return out;
}

const mpz_class& Scalar::value() const {
  return value_;
}

Scalar Scalar::operator+(const Scalar& other) const {
  return Scalar(value_ + other.value_);
}

Scalar Scalar::operator*(const Scalar& other) const {
  return Scalar(value_ * other.value_);
}

bool Scalar::operator==(const Scalar& other) const {
  return value_ == other.value_;
}

bool Scalar::operator!=(const Scalar& other) const {
  return !(*this == other);
}

const mpz_class& Scalar::ModulusQ() {
  return kSecp256k1Order;
}

}  // namespace fstx
