#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "fstx/sponge/duplex_sponge.hpp"

namespace fstx {

// Keccak-f[1600] over a 200-byte state, lanes little-endian. Rate 136 bytes,
// capacity 64 bytes; the IV fills the first 32 capacity bytes.
class KeccakF1600 {
 public:
  using Unit = uint8_t;

  static constexpr size_t kWidth = 200;
  static constexpr size_t kRate = 136;

  KeccakF1600();
  explicit KeccakF1600(const SpongeIv& iv);

  void Permute();

  std::span<uint8_t> state();
  std::span<const uint8_t> state() const;

  void Zeroize() noexcept;

 private:
  std::array<uint8_t, kWidth> state_{};
};

// Not SHA-3: the same permutation driven as an overwrite-mode duplex.
using Keccak = DuplexSponge<KeccakF1600>;

}  // namespace fstx
