#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>

namespace fstx {

using SpongeIv = std::array<uint8_t, 32>;

// Duplex sponge in overwrite mode over a permutation P.
//
// P must provide:
//   using Unit;
//   static constexpr size_t kWidth, kRate;   // kWidth > kRate > 0
//   explicit P(const SpongeIv& iv);          // iv goes into the capacity
//   void Permute();
//   std::span<Unit> state();
//   std::span<const Unit> state() const;
//   void Zeroize() noexcept;
//
// Input overwrites the rate. No padding is applied: a partially filled
// block stays in place until the next absorb continues it or a squeeze
// permutes. The number of permutation calls therefore depends only on the
// absorbed/squeezed totals, never on how callers split their buffers.
template <typename P>
class DuplexSponge {
 public:
  using Permutation = P;
  using Unit = typename P::Unit;

  static constexpr size_t kWidth = P::kWidth;
  static constexpr size_t kRate = P::kRate;
  static_assert(kRate > 0, "sponge rate must be positive");
  static_assert(kWidth > kRate, "sponge capacity must be positive");

  DuplexSponge() : DuplexSponge(SpongeIv{}) {}
  explicit DuplexSponge(const SpongeIv& iv) : permutation_(iv) {}

  ~DuplexSponge() {
    permutation_.Zeroize();
    absorb_pos_ = 0;
    squeeze_pos_ = kRate;
  }

  DuplexSponge(const DuplexSponge&) = default;
  DuplexSponge& operator=(const DuplexSponge&) = default;

  void Absorb(std::span<const Unit> input) {
    squeeze_pos_ = kRate;

    while (!input.empty()) {
      if (absorb_pos_ == kRate) {
        permutation_.Permute();
        absorb_pos_ = 0;
      }
      const size_t chunk_len = std::min(input.size(), kRate - absorb_pos_);
      std::copy(input.begin(), input.begin() + static_cast<std::ptrdiff_t>(chunk_len),
                permutation_.state().begin() + static_cast<std::ptrdiff_t>(absorb_pos_));
      absorb_pos_ += chunk_len;
      input = input.subspan(chunk_len);
    }
  }

  void Squeeze(std::span<Unit> output) {
    if (output.empty()) {
      return;
    }
    absorb_pos_ = 0;

    while (!output.empty()) {
      if (squeeze_pos_ == kRate) {
        permutation_.Permute();
        squeeze_pos_ = 0;
      }
      const size_t chunk_len = std::min(output.size(), kRate - squeeze_pos_);
      const std::span<const Unit> rate = std::as_const(permutation_).state();
      std::copy(rate.begin() + static_cast<std::ptrdiff_t>(squeeze_pos_),
                rate.begin() + static_cast<std::ptrdiff_t>(squeeze_pos_ + chunk_len),
                output.begin());
      squeeze_pos_ += chunk_len;
      output = output.subspan(chunk_len);
    }
  }

  // Permutes and clears the rate so earlier state cannot be recovered from
  // what later squeezes reveal.
  void Ratchet() {
    permutation_.Permute();
    std::span<Unit> state = permutation_.state();
    std::fill(state.begin(), state.begin() + static_cast<std::ptrdiff_t>(kRate), Unit{});
    squeeze_pos_ = kRate;
  }

  const P& permutation() const { return permutation_; }

 private:
  P permutation_;
  size_t absorb_pos_ = 0;
  size_t squeeze_pos_ = kRate;
};

}  // namespace fstx
