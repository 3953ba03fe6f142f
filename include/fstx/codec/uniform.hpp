#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include <gmpxx.h>

#include "fstx/common/bytes.hpp"
#include "fstx/pattern/domain_separator.hpp"

namespace fstx {

// Extra bytes squeezed beyond the modulus width (128 bits). A fixed protocol
// constant: prover and verifier must agree on it bit for bit.
constexpr size_t kUniformMarginBytes = 16;

constexpr size_t kMaxResampleAttempts = 256;

constexpr char kUniformResampleDomain[] = "fstx/uniform-resample/v1";

// Refills a rejected candidate buffer in place.
using UniformResampler = std::function<void(std::span<uint8_t>)>;

// Resampler over a private copy of a byte sponge: the copy is ratcheted and
// bound to kUniformResampleDomain, then each retry absorbs the rejected
// buffer and squeezes a fresh one. `sponge` itself is not touched.
template <typename H>
UniformResampler ForkResampler(const H& sponge) {
  auto fork = std::make_shared<H>(sponge);
  fork->Ratchet();
  fork->Absorb(AsByteSpan(kUniformResampleDomain));
  return [fork](std::span<uint8_t> buffer) {
    fork->Absorb(buffer);
    fork->Squeeze(buffer);
  };
}

// Bytes squeezed per uniformly sampled integer modulo `modulus`.
size_t UniformByteLength(const mpz_class& modulus);

// Maps `bytes` (big-endian) to a uniform value in [0, modulus). Values at or
// above the largest multiple of `modulus` below 2^(8*len) are rejected and
// the buffer is refilled by `resample` until one is accepted. Throws
// std::runtime_error after kMaxResampleAttempts rejections in a row.
mpz_class ReduceUniform(std::span<const uint8_t> bytes,
                        const mpz_class& modulus,
                        const UniformResampler& resample);

// Splits `bytes` into `count` chunks of UniformByteLength(modulus).
std::vector<mpz_class> ReduceUniformBatch(std::span<const uint8_t> bytes,
                                          const mpz_class& modulus,
                                          size_t count,
                                          const UniformResampler& resample);

DomainSeparator ChallengeIntegersMod(const DomainSeparator& domain_separator,
                                     const mpz_class& modulus,
                                     size_t count,
                                     std::string_view label);

}  // namespace fstx
