#pragma once

#include <climits>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include <gmpxx.h>

#include "fstx/codec/point_codec.hpp"
#include "fstx/codec/scalar_codec.hpp"
#include "fstx/codec/uniform.hpp"
#include "fstx/common/bytes.hpp"
#include "fstx/common/secure_zeroize.hpp"
#include "fstx/crypto/ec_point.hpp"
#include "fstx/crypto/scalar.hpp"
#include "fstx/pattern/domain_separator.hpp"
#include "fstx/sponge/keccak.hpp"
#include "fstx/sponge/unit.hpp"
#include "fstx/transcript/entropy_source.hpp"
#include "fstx/transcript/private_rng.hpp"
#include "fstx/transcript/safe_sponge.hpp"

namespace fstx {

// Prover side of a transcript (Arthur). Everything the prover sends is
// absorbed and appended, in canonical encoding, to the transcript bytes
// handed to the verifier. Private randomness is available through
// FillPrivateBytes()/PrivateScalar() and never reaches the transcript.
template <typename H = Keccak>
class ProverTranscript {
 public:
  using Unit = typename H::Unit;

  explicit ProverTranscript(const DomainSeparator& domain_separator,
                            std::shared_ptr<IEntropySource> entropy = std::make_shared<OsEntropySource>())
      : rng_(domain_separator.ToBytes(), std::move(entropy)), safe_(domain_separator) {}

  ProverTranscript(const ProverTranscript&) = delete;
  ProverTranscript& operator=(const ProverTranscript&) = delete;

  void AddUnits(std::span<const Unit> units) {
    safe_.Absorb(units);
    const size_t start = transcript_.size();
    UnitTraits<Unit>::Write(units, &transcript_);
    rng_.AbsorbPublic(std::span<const uint8_t>(transcript_).subspan(start));
  }

  // Absorbs values both parties already know; nothing is sent.
  void PublicUnits(std::span<const Unit> units) {
    safe_.Absorb(units);
    Bytes encoded;
    UnitTraits<Unit>::Write(units, &encoded);
    rng_.AbsorbPublic(encoded);
  }

  void FillChallengeUnits(std::span<Unit> out) {
    safe_.Squeeze(out);
  }

  void Hint(std::span<const uint8_t> data) {
    if (data.size() > UINT32_MAX) {
      throw std::invalid_argument("hint exceeds uint32 length");
    }
    safe_.Hint();
    const uint32_t len = static_cast<uint32_t>(data.size());
    transcript_.push_back(static_cast<uint8_t>((len >> 24) & 0xFF));
    transcript_.push_back(static_cast<uint8_t>((len >> 16) & 0xFF));
    transcript_.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
    transcript_.push_back(static_cast<uint8_t>(len & 0xFF));
    transcript_.insert(transcript_.end(), data.begin(), data.end());
  }

  void Ratchet() {
    safe_.Ratchet();
  }

  void FillPrivateBytes(std::span<uint8_t> out) {
    const Bytes digest = safe_.PublicDigest();
    rng_.Fill(digest, out);
  }

  Scalar PrivateScalar() {
    Bytes buffer(UniformByteLength(Scalar::ModulusQ()));
    ScopedZeroize wipe(buffer);
    FillPrivateBytes(buffer);
    return Scalar(ReduceUniform(buffer, Scalar::ModulusQ(),
                                [this](std::span<uint8_t> out) { FillPrivateBytes(out); }));
  }

  void AddScalars(std::span<const Scalar> values) {
    std::vector<Unit> units;
    ScalarCodec<Unit>::Encode(values, &units);
    AddUnits(units);
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

  void AddPoints(std::span<const ECPoint> points) {
    static_assert(std::is_same_v<Unit, uint8_t>, "points are only encoded on byte sponges");
    Bytes encoded;
    PointCodec::Encode(points, &encoded);
    AddUnits(encoded);
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

  bool IsComplete() const {
    return safe_.IsComplete();
  }

  // Throws ProtocolMismatchError if the declared pattern was not completed.
  Bytes Finalize() const {
    safe_.Finalize();
    return transcript_;
  }

  const Bytes& transcript() const {
    return transcript_;
  }

  const SafeSponge<H>& safe() const {
    return safe_;
  }

 private:
  ProverPrivateRng rng_;
  SafeSponge<H> safe_;
  Bytes transcript_;
};

template <typename H = Keccak>
using Arthur = ProverTranscript<H>;

}  // namespace fstx
