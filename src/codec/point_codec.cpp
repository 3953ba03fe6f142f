#include "fstx/codec/point_codec.hpp"

#include <stdexcept>

#include "fstx/common/errors.hpp"

namespace fstx {

void PointCodec::Encode(std::span<const ECPoint> points, Bytes* out) {
  for (const ECPoint& point : points) {
    if (!point.IsOnCurve()) {
      throw std::invalid_argument("cannot encode a point that is not on secp256k1");
    }
  }
  out->reserve(out->size() + points.size() * kUnitsPerElement);
  for (const ECPoint& point : points) {
    const auto& compressed = point.compressed();
    out->insert(out->end(), compressed.begin(), compressed.end());
  }
}

std::vector<ECPoint> PointCodec::Decode(std::span<const uint8_t> units, size_t count) {
  if (units.size() != count * kUnitsPerElement) {
    throw CodecDecodingError("point encoding has inconsistent length");
  }

  std::vector<ECPoint> out;
  out.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    out.push_back(ECPoint::FromCompressed(units.subspan(i * kUnitsPerElement, kUnitsPerElement)));
  }
  return out;
}

DomainSeparator AddPoints(const DomainSeparator& domain_separator,
                          size_t count,
                          std::string_view label) {
  return domain_separator.Absorb(count * PointCodec::kUnitsPerElement, label);
}

}  // namespace fstx
