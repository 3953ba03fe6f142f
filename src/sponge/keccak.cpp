#include "fstx/sponge/keccak.hpp"

#include <algorithm>

#include "fstx/common/secure_zeroize.hpp"

namespace fstx {
namespace {

constexpr std::array<uint64_t, 24> kRoundConstants = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL};

constexpr std::array<int, 24> kRotations = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14,
    27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44};

constexpr std::array<int, 24> kPiLanes = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1};

uint64_t Rotl64(uint64_t x, int n) {
  return (x << n) | (x >> (64 - n));
}

void KeccakF1600Rounds(std::array<uint64_t, 25>* lanes) {
  uint64_t* st = lanes->data();
  uint64_t bc[5];

  for (uint64_t round_constant : kRoundConstants) {
    // theta
    for (int i = 0; i < 5; ++i) {
      bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
    }
    for (int i = 0; i < 5; ++i) {
      const uint64_t t = bc[(i + 4) % 5] ^ Rotl64(bc[(i + 1) % 5], 1);
      for (int j = 0; j < 25; j += 5) {
        st[j + i] ^= t;
      }
    }

    // rho and pi
    uint64_t t = st[1];
    for (int i = 0; i < 24; ++i) {
      const int j = kPiLanes[i];
      const uint64_t next = st[j];
      st[j] = Rotl64(t, kRotations[i]);
      t = next;
    }

    // chi
    for (int j = 0; j < 25; j += 5) {
      for (int i = 0; i < 5; ++i) {
        bc[i] = st[j + i];
      }
      for (int i = 0; i < 5; ++i) {
        st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
      }
    }

    // iota
    st[0] ^= round_constant;
  }
}

}  // namespace

KeccakF1600::KeccakF1600() = default;

KeccakF1600::KeccakF1600(const SpongeIv& iv) {
  std::copy(iv.begin(), iv.end(), state_.begin() + kRate);
}

void KeccakF1600::Permute() {
  std::array<uint64_t, 25> lanes{};
  for (size_t lane = 0; lane < lanes.size(); ++lane) {
    uint64_t value = 0;
    for (size_t b = 0; b < 8; ++b) {
      value |= static_cast<uint64_t>(state_[lane * 8 + b]) << (8 * b);
    }
    lanes[lane] = value;
  }

  KeccakF1600Rounds(&lanes);

  for (size_t lane = 0; lane < lanes.size(); ++lane) {
    for (size_t b = 0; b < 8; ++b) {
      state_[lane * 8 + b] = static_cast<uint8_t>((lanes[lane] >> (8 * b)) & 0xFF);
    }
  }
  SecureZeroizeMemory(lanes.data(), sizeof(lanes));
}

std::span<uint8_t> KeccakF1600::state() {
  return state_;
}

std::span<const uint8_t> KeccakF1600::state() const {
  return state_;
}

void KeccakF1600::Zeroize() noexcept {
  SecureZeroizeMemory(state_.data(), state_.size());
}

}  // namespace fstx
