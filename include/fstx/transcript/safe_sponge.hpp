#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include "fstx/codec/uniform.hpp"
#include "fstx/common/bytes.hpp"
#include "fstx/common/errors.hpp"
#include "fstx/common/logging.hpp"
#include "fstx/pattern/domain_separator.hpp"
#include "fstx/sponge/unit.hpp"

namespace fstx {

enum class SafeStatus {
  kReady = 0,
  kFailed = 1,
};

// Sponge bound to one domain separator. Every absorb/squeeze/ratchet/hint is
// checked against the next expected operation before it reaches the sponge;
// the first mismatch moves the engine to kFailed for good.
template <typename H>
class SafeSponge {
 public:
  using Unit = typename H::Unit;

  static constexpr size_t kDigestLength = 32;

  explicit SafeSponge(const DomainSeparator& domain_separator)
      : sponge_(domain_separator.Seed<H>()),
        ops_(domain_separator.CompileOps()),
        protocol_label_(domain_separator.protocol_label()) {
    remaining_ = ops_.empty() ? 0 : ops_.front().length;
  }

  ~SafeSponge() {
    if (status_ == SafeStatus::kReady && !IsComplete()) {
      Logger()->warn("transcript '{}' dropped unfinished, still expecting {} at position {}",
                     protocol_label_, DescribeOp(ops_[position_].kind, remaining_), position_);
    }
  }

  SafeSponge(const SafeSponge&) = delete;
  SafeSponge& operator=(const SafeSponge&) = delete;
  SafeSponge(SafeSponge&&) = delete;
  SafeSponge& operator=(SafeSponge&&) = delete;

  void Absorb(std::span<const Unit> input) {
    if (input.empty()) {
      return;
    }
    Request(PatternOpKind::kAbsorb, input.size());
    sponge_.Absorb(input);
  }

  void Squeeze(std::span<Unit> output) {
    if (output.empty()) {
      return;
    }
    Request(PatternOpKind::kSqueeze, output.size());
    sponge_.Squeeze(output);
  }

  void Ratchet() {
    Request(PatternOpKind::kRatchet, 1);
    sponge_.Ratchet();
  }

  // Hints travel in the transcript but never enter the sponge; only the
  // pattern position is checked and advanced.
  void Hint() {
    Request(PatternOpKind::kHint, 1);
  }

  // Checks that an absorb of `length` units is allowed next without
  // consuming it, so callers can reject a pattern violation before doing
  // any other work.
  void CheckAbsorb(size_t length) {
    Check(PatternOpKind::kAbsorb, length);
  }

  // Marks the transcript as rejected for reasons outside the pattern
  // (truncated or undecodable input). Further operations fail.
  void Abort() {
    status_ = SafeStatus::kFailed;
  }

  bool IsComplete() const {
    return position_ == ops_.size();
  }

  // Throws ProtocolMismatchError unless every declared operation ran.
  void Finalize() const {
    if (status_ == SafeStatus::kFailed) {
      throw ProtocolMismatchError(position_, "a usable transcript", "finalize after failure");
    }
    if (!IsComplete()) {
      throw ProtocolMismatchError(position_, DescribeOp(ops_[position_].kind, remaining_),
                                  "end of transcript");
    }
  }

  // Digest of the current public state, squeezed from a ratcheted copy so the
  // real sponge and the cursor are untouched.
  Bytes PublicDigest() const {
    H copy = sponge_;
    copy.Ratchet();

    constexpr size_t kWidth = UnitTraits<Unit>::kByteWidth;
    std::vector<Unit> units((kDigestLength + kWidth - 1) / kWidth);
    copy.Squeeze(units);

    Bytes out;
    UnitTraits<Unit>::Write(units, &out);
    return out;
  }

  // Byte sponges only. Refills rejected challenge samples from a fork of
  // the current state; replayed identically by the verifier.
  UniformResampler Resampler() const {
    static_assert(std::is_same_v<Unit, uint8_t>, "resampling draws bytes");
    return ForkResampler(sponge_);
  }

  SafeStatus status() const { return status_; }
  size_t position() const { return position_; }
  const std::vector<PatternOp>& ops() const { return ops_; }
  const std::string& protocol_label() const { return protocol_label_; }

 private:
  void Request(PatternOpKind kind, size_t length) {
    Check(kind, length);
    remaining_ -= length;
    if (remaining_ == 0) {
      ++position_;
      remaining_ = IsComplete() ? 0 : ops_[position_].length;
    }
  }

  void Check(PatternOpKind kind, size_t length) {
    const std::string actual = DescribeOp(kind, length);
    if (status_ == SafeStatus::kFailed) {
      throw ProtocolMismatchError(position_, "a usable transcript", actual);
    }
    if (IsComplete()) {
      Fail("no further operations", actual);
    }

    const PatternOp& expected = ops_[position_];
    if (expected.kind != kind || length > remaining_) {
      Fail(DescribeOp(expected.kind, remaining_), actual);
    }
  }

  [[noreturn]] void Fail(const std::string& expected, const std::string& actual) {
    status_ = SafeStatus::kFailed;
    Logger()->debug("transcript '{}' rejected {} at position {}, expected {}",
                    protocol_label_, actual, position_, expected);
    throw ProtocolMismatchError(position_, expected, actual);
  }

  H sponge_;
  std::vector<PatternOp> ops_;
  std::string protocol_label_;
  size_t position_ = 0;
  size_t remaining_ = 0;
  SafeStatus status_ = SafeStatus::kReady;
};

}  // namespace fstx
