#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include "fstx/sponge/keccak.hpp"
#include "fstx/transcript/entropy_source.hpp"

namespace fstx {

// Prover-only randomness. A private Keccak duplex follows everything the
// prover absorbs publicly; each draw additionally absorbs the public state
// digest, a long-lived private seed and fresh entropy, so a weak entropy
// source alone does not expose the output and outputs stay bound to the
// proof instance. Seed and sponge are wiped on destruction.
class ProverPrivateRng {
 public:
  static constexpr size_t kSeedLength = 32;
  static constexpr size_t kFreshEntropyLength = 32;

  // Draws the private seed from `entropy`. Throws EntropySourceError.
  ProverPrivateRng(std::span<const uint8_t> domain_separator,
                   std::shared_ptr<IEntropySource> entropy);
  ~ProverPrivateRng();

  ProverPrivateRng(const ProverPrivateRng&) = delete;
  ProverPrivateRng& operator=(const ProverPrivateRng&) = delete;

  void AbsorbPublic(std::span<const uint8_t> data);

  // Throws EntropySourceError if fresh entropy cannot be drawn.
  void Fill(std::span<const uint8_t> public_digest, std::span<uint8_t> out);

 private:
  void DrawEntropy(std::span<uint8_t> out);

  Keccak sponge_;
  std::array<uint8_t, kSeedLength> seed_{};
  std::shared_ptr<IEntropySource> entropy_;
};

}  // namespace fstx
