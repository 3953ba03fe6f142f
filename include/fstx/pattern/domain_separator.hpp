#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "fstx/common/bytes.hpp"
#include "fstx/sponge/duplex_sponge.hpp"

namespace fstx {

enum class PatternOpKind : char {
  kAbsorb = 'A',
  kSqueeze = 'S',
  // Ratchet and Hint take no length; they count as one operation each.
  kRatchet = 'R',
  kHint = 'H',
};

struct PatternOp {
  PatternOpKind kind = PatternOpKind::kAbsorb;
  size_t length = 0;
  std::string label;

  bool operator==(const PatternOp& other) const = default;
};

// "Absorb(32)", "Squeeze(16)", "Ratchet", "Hint".
std::string DescribeOp(PatternOpKind kind, size_t length);

// Append-only IO pattern. Every builder call returns a new value and leaves
// the receiver untouched, so a prefix can be shared between sub-protocols.
// Lengths count sponge units, not bytes.
class DomainSeparator {
 public:
  // Throws PatternDeclarationError if the label contains a NUL byte.
  explicit DomainSeparator(std::string_view protocol_label);

  // Inverse of ToBytes(); applies the same validation as the builders and
  // rejects patterns whose merged runs would not fit in size_t.
  static DomainSeparator Parse(std::span<const uint8_t> encoded);

  DomainSeparator Absorb(size_t length, std::string_view label) const;
  DomainSeparator Squeeze(size_t length, std::string_view label) const;
  DomainSeparator Ratchet() const;
  DomainSeparator Hint(std::string_view label) const;

  const std::string& protocol_label() const;
  const std::vector<PatternOp>& entries() const;

  // protocol_label, then per entry: '\0' kind [decimal length] label.
  Bytes ToBytes() const;

  // Entry list with adjacent Absorb runs and adjacent Squeeze runs merged.
  // Throws PatternDeclarationError if a merged length overflows.
  std::vector<PatternOp> CompileOps() const;

  // 32-byte IV derived by absorbing ToBytes() into a zero-IV Keccak duplex.
  SpongeIv Tag() const;

  template <typename H>
  H Seed() const {
    return H(Tag());
  }

  bool operator==(const DomainSeparator& other) const = default;

 private:
  DomainSeparator Append(PatternOpKind kind, size_t length, std::string_view label) const;

  std::string protocol_label_;
  std::vector<PatternOp> entries_;
};

}  // namespace fstx
