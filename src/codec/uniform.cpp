#include "fstx/codec/uniform.hpp"

#include <stdexcept>

#include "fstx/codec/integer_codec.hpp"
#include "fstx/common/bytes.hpp"
#include "fstx/common/logging.hpp"
#include "fstx/common/secure_zeroize.hpp"

namespace fstx {
namespace {

void ValidateModulus(const mpz_class& modulus) {
  if (modulus < 2) {
    throw std::invalid_argument("uniform sampling modulus must be >= 2");
  }
}

}  // namespace

size_t UniformByteLength(const mpz_class& modulus) {
  ValidateModulus(modulus);
  return ByteLength(modulus) + kUniformMarginBytes;
}

mpz_class ReduceUniform(std::span<const uint8_t> bytes,
                        const mpz_class& modulus,
                        const UniformResampler& resample) {
  ValidateModulus(modulus);
  if (bytes.empty() || bytes.size() < ByteLength(modulus - 1)) {
    throw std::invalid_argument("not enough bytes to sample modulo the given modulus");
  }

  mpz_class range = 1;
  range <<= static_cast<mp_bitcnt_t>(8 * bytes.size());
  const mpz_class bound = range - (range % modulus);

  mpz_class candidate = DecodeBigEndian(bytes);
  if (candidate < bound) {
    return candidate % modulus;
  }
  if (!resample) {
    throw std::invalid_argument("uniform sample rejected and no resampler given");
  }

  Bytes buffer(bytes.begin(), bytes.end());
  ScopedZeroize wipe(buffer);
  size_t attempts = 0;
  while (candidate >= bound) {
    if (attempts == kMaxResampleAttempts) {
      throw std::runtime_error("uniform resampler keeps producing rejected values");
    }
    ++attempts;
    resample(buffer);
    candidate = DecodeBigEndian(buffer);
  }
  Logger()->debug("uniform sampling resampled {} time(s)", attempts);
  return candidate % modulus;
}

std::vector<mpz_class> ReduceUniformBatch(std::span<const uint8_t> bytes,
                                          const mpz_class& modulus,
                                          size_t count,
                                          const UniformResampler& resample) {
  const size_t chunk = UniformByteLength(modulus);
  if (bytes.size() != chunk * count) {
    throw std::invalid_argument("uniform batch has inconsistent length");
  }

  std::vector<mpz_class> out;
  out.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    out.push_back(ReduceUniform(bytes.subspan(i * chunk, chunk), modulus, resample));
  }
  return out;
}

DomainSeparator ChallengeIntegersMod(const DomainSeparator& domain_separator,
                                     const mpz_class& modulus,
                                     size_t count,
                                     std::string_view label) {
  return domain_separator.Squeeze(count * UniformByteLength(modulus), label);
}

}  // namespace fstx
