#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include <gmpxx.h>

#include "fstx/codec/point_codec.hpp"
#include "fstx/codec/scalar_codec.hpp"
#include "fstx/codec/uniform.hpp"
#include "fstx/common/bytes.hpp"
#include "fstx/common/errors.hpp"
#include "fstx/crypto/ec_point.hpp"
#include "fstx/crypto/scalar.hpp"
#include "fstx/pattern/domain_separator.hpp"
#include "fstx/sponge/keccak.hpp"
#include "fstx/sponge/unit.hpp"
#include "fstx/transcript/safe_sponge.hpp"

namespace fstx {

// Verifier side of a transcript (Merlin). Reads prover messages from the
// transcript bytes in order and absorbs them exactly as the prover did, so
// challenges match for honest transcripts.
template <typename H = Keccak>
class VerifierTranscript {
 public:
  using Unit = typename H::Unit;

  VerifierTranscript(const DomainSeparator& domain_separator, std::span<const uint8_t> transcript)
      : safe_(domain_separator), transcript_(transcript.begin(), transcript.end()) {}

  VerifierTranscript(const VerifierTranscript&) = delete;
  VerifierTranscript& operator=(const VerifierTranscript&) = delete;

  // Throws TranscriptTruncatedError, CodecDecodingError or
  // ProtocolMismatchError.
  void FillNextUnits(std::span<Unit> out) {
    if (out.empty()) {
      return;
    }
    safe_.CheckAbsorb(out.size());
    const std::span<const uint8_t> encoded = Take(out.size() * UnitTraits<Unit>::kByteWidth);
    try {
      UnitTraits<Unit>::Read(encoded, out);
    } catch (const CodecDecodingError&) {
      safe_.Abort();
      throw;
    }
    safe_.Absorb(out);
  }

  void PublicUnits(std::span<const Unit> units) {
    safe_.Absorb(units);
  }

  void FillChallengeUnits(std::span<Unit> out) {
    safe_.Squeeze(out);
  }

  Bytes Hint() {
    safe_.Hint();
    const std::span<const uint8_t> prefix = Take(4);
    const uint32_t len = (static_cast<uint32_t>(prefix[0]) << 24) |
                         (static_cast<uint32_t>(prefix[1]) << 16) |
                         (static_cast<uint32_t>(prefix[2]) << 8) |
                         static_cast<uint32_t>(prefix[3]);
    const std::span<const uint8_t> data = Take(len);
    return Bytes(data.begin(), data.end());
  }

  void Ratchet() {
    safe_.Ratchet();
  }

  std::vector<Scalar> NextScalars(size_t count) {
    std::vector<Unit> units(count * ScalarCodec<Unit>::kUnitsPerElement);
    FillNextUnits(units);
    return Decode([&] { return ScalarCodec<Unit>::Decode(units, count); });
  }

  void PublicScalars(std::span<const Scalar> values) {
    std::vector<Unit> units;
    ScalarCodec<Unit>::Encode(values, &units);
    PublicUnits(units);
  }

  std::vector<Scalar> ChallengeScalars(size_t count) {
    std::vector<Unit> units(count * ScalarCodec<Unit>::ChallengeUnitsPerElement());
    FillChallengeUnits(units);
    if constexpr (std::is_same_v<Unit, uint8_t>) {
      return ScalarCodec<Unit>::FromChallenge(units, count, safe_.Resampler());
    } else {
      return ScalarCodec<Unit>::FromChallenge(units, count);
    }
  }

  std::vector<ECPoint> NextPoints(size_t count) {
    static_assert(std::is_same_v<Unit, uint8_t>, "points are only encoded on byte sponges");
    Bytes units(count * PointCodec::kUnitsPerElement);
    FillNextUnits(units);
    return Decode([&] { return PointCodec::Decode(units, count); });
  }

  void PublicPoints(std::span<const ECPoint> points) {
    static_assert(std::is_same_v<Unit, uint8_t>, "points are only encoded on byte sponges");
    Bytes encoded;
    PointCodec::Encode(points, &encoded);
    PublicUnits(encoded);
  }

  std::vector<mpz_class> ChallengeIntegersMod(const mpz_class& modulus, size_t count) {
    static_assert(std::is_same_v<Unit, uint8_t>, "integer challenges are only drawn from byte sponges");
    Bytes bytes(count * UniformByteLength(modulus));
    FillChallengeUnits(bytes);
    return ReduceUniformBatch(bytes, modulus, count, safe_.Resampler());
  }

  // Rejects the transcript without finishing the pattern.
  void Abort() {
    safe_.Abort();
  }

  bool IsComplete() const {
    return safe_.IsComplete();
  }

  // Succeeds only when the pattern is complete and every transcript byte was
  // consumed.
  void Finalize() const {
    safe_.Finalize();
    if (offset_ != transcript_.size()) {
      throw CodecDecodingError("transcript has " + std::to_string(remaining_bytes()) +
                               " trailing bytes");
    }
  }

  size_t remaining_bytes() const {
    return transcript_.size() - offset_;
  }

  const SafeSponge<H>& safe() const {
    return safe_;
  }

 private:
  std::span<const uint8_t> Take(size_t count) {
    if (count > remaining_bytes()) {
      safe_.Abort();
      throw TranscriptTruncatedError(count, remaining_bytes());
    }
    const std::span<const uint8_t> out(transcript_.data() + offset_, count);
    offset_ += count;
    return out;
  }

  template <typename F>
  auto Decode(F&& decode) {
    try {
      return decode();
    } catch (const CodecDecodingError&) {
      safe_.Abort();
      throw;
    }
  }

  SafeSponge<H> safe_;
  Bytes transcript_;
  size_t offset_ = 0;
};

template <typename H = Keccak>
using Merlin = VerifierTranscript<H>;

}  // namespace fstx
