#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "fstx/codec/uniform.hpp"
#include "fstx/crypto/scalar.hpp"
#include "fstx/pattern/domain_separator.hpp"
#include "fstx/sponge/scalar_unit.hpp"

namespace fstx {

// Conversion between Scalars and the units of a sponge alphabet U.
template <typename U>
struct ScalarCodec;

// Byte sponges: 32-byte canonical encodings; challenges are reduced with
// rejection sampling from UniformByteLength(q) bytes each.
template <>
struct ScalarCodec<uint8_t> {
  static constexpr size_t kUnitsPerElement = Scalar::kByteLength;

  static size_t ChallengeUnitsPerElement();
  static void Encode(std::span<const Scalar> values, std::vector<uint8_t>* out);
  // Throws CodecDecodingError for non-canonical encodings.
  static std::vector<Scalar> Decode(std::span<const uint8_t> units, size_t count);
  static std::vector<Scalar> FromChallenge(std::span<const uint8_t> units,
                                           size_t count,
                                           const UniformResampler& resample);
};

// Native sponges: one unit is one element.
template <>
struct ScalarCodec<Scalar> {
  static constexpr size_t kUnitsPerElement = 1;

  static size_t ChallengeUnitsPerElement();
  static void Encode(std::span<const Scalar> values, std::vector<Scalar>* out);
  static std::vector<Scalar> Decode(std::span<const Scalar> units, size_t count);
  static std::vector<Scalar> FromChallenge(std::span<const Scalar> units, size_t count);
};

template <typename U = uint8_t>
DomainSeparator AddScalars(const DomainSeparator& domain_separator,
                           size_t count,
                           std::string_view label) {
  return domain_separator.Absorb(count * ScalarCodec<U>::kUnitsPerElement, label);
}

template <typename U = uint8_t>
DomainSeparator ChallengeScalars(const DomainSeparator& domain_separator,
                                 size_t count,
                                 std::string_view label) {
  return domain_separator.Squeeze(count * ScalarCodec<U>::ChallengeUnitsPerElement(), label);
}

}  // namespace fstx
