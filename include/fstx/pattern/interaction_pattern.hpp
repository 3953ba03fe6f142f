#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "fstx/crypto/hash.hpp"
#include "fstx/pattern/interaction.hpp"

namespace fstx {

// Validated, immutable list of interactions describing a whole protocol.
class InteractionPattern {
 public:
  InteractionPattern() = default;

  // Throws PatternDeclarationError when Begin/End do not nest, when an atomic
  // interaction inside a non-Protocol Begin has a different kind, or when a
  // Begin is left open.
  static InteractionPattern Create(std::vector<Interaction> interactions);

  const std::vector<Interaction>& interactions() const;
  size_t size() const;

  // Header naming the interaction count, then one indented line per entry.
  std::string ToStableString() const;
  std::string ToDebugString() const;

  // SHA3-256 of ToStableString().
  std::array<uint8_t, kSha3_256DigestLength> PatternHash() const;

  bool operator==(const InteractionPattern& other) const = default;

 private:
  explicit InteractionPattern(std::vector<Interaction> interactions);

  std::string Render(bool stable) const;

  std::vector<Interaction> interactions_;
};

}  // namespace fstx
