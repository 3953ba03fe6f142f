#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "fstx/common/bytes.hpp"
#include "fstx/crypto/ec_point.hpp"
#include "fstx/pattern/domain_separator.hpp"

namespace fstx {

// secp256k1 points on byte sponges, 33-byte compressed encoding.
struct PointCodec {
  static constexpr size_t kUnitsPerElement = ECPoint::kCompressedLength;

  // Throws std::invalid_argument, leaving `out` unchanged, if any point is
  // not on the curve.
  static void Encode(std::span<const ECPoint> points, Bytes* out);
  // Throws CodecDecodingError for invalid encodings.
  static std::vector<ECPoint> Decode(std::span<const uint8_t> units, size_t count);
};

DomainSeparator AddPoints(const DomainSeparator& domain_separator,
                          size_t count,
                          std::string_view label);

}  // namespace fstx
