#include "fstx/sponge/scalar_unit.hpp"

namespace fstx {

void UnitTraits<Scalar>::Write(std::span<const Scalar> units, Bytes* out) {
  out->reserve(out->size() + units.size() * kByteWidth);
  for (const Scalar& unit : units) {
    const auto encoded = unit.ToCanonicalBytes();
    out->insert(out->end(), encoded.begin(), encoded.end());
  }
}

void UnitTraits<Scalar>::Read(std::span<const uint8_t> encoded, std::span<Scalar> units) {
  if (encoded.size() != units.size() * kByteWidth) {
    throw CodecDecodingError("scalar unit buffer has inconsistent length");
  }
  for (size_t i = 0; i < units.size(); ++i) {
    units[i] = Scalar::FromCanonicalBytes(encoded.subspan(i * kByteWidth, kByteWidth));
  }
}

}  // namespace fstx
