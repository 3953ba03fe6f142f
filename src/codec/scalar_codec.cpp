#include "fstx/codec/scalar_codec.hpp"

#include <stdexcept>

#include "fstx/codec/uniform.hpp"
#include "fstx/common/errors.hpp"

namespace fstx {

size_t ScalarCodec<uint8_t>::ChallengeUnitsPerElement() {
  static const size_t kLength = UniformByteLength(Scalar::ModulusQ());
  return kLength;
}

void ScalarCodec<uint8_t>::Encode(std::span<const Scalar> values, std::vector<uint8_t>* out) {
  out->reserve(out->size() + values.size() * kUnitsPerElement);
  for (const Scalar& value : values) {
    const auto encoded = value.ToCanonicalBytes();
    out->insert(out->end(), encoded.begin(), encoded.end());
  }
}

std::vector<Scalar> ScalarCodec<uint8_t>::Decode(std::span<const uint8_t> units, size_t count) {
  if (units.size() != count * kUnitsPerElement) {
    throw CodecDecodingError("scalar encoding has inconsistent length");
  }

  std::vector<Scalar> out;
  out.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    out.push_back(Scalar::FromCanonicalBytes(units.subspan(i * kUnitsPerElement, kUnitsPerElement)));
  }
  return out;
}

std::vector<Scalar> ScalarCodec<uint8_t>::FromChallenge(std::span<const uint8_t> units,
                                                        size_t count,
                                                        const UniformResampler& resample) {
  std::vector<Scalar> out;
  out.reserve(count);
  for (mpz_class& value : ReduceUniformBatch(units, Scalar::ModulusQ(), count, resample)) {
    out.emplace_back(value);
  }
  return out;
}

size_t ScalarCodec<Scalar>::ChallengeUnitsPerElement() {
  return 1;
}

void ScalarCodec<Scalar>::Encode(std::span<const Scalar> values, std::vector<Scalar>* out) {
  out->insert(out->end(), values.begin(), values.end());
}

std::vector<Scalar> ScalarCodec<Scalar>::Decode(std::span<const Scalar> units, size_t count) {
  if (units.size() != count) {
    throw CodecDecodingError("scalar unit buffer has inconsistent length");
  }
  return std::vector<Scalar>(units.begin(), units.end());
}

std::vector<Scalar> ScalarCodec<Scalar>::FromChallenge(std::span<const Scalar> units, size_t count) {
  return Decode(units, count);
}

}  // namespace fstx
