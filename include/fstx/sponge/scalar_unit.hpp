#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "fstx/common/bytes.hpp"
#include "fstx/crypto/scalar.hpp"
#include "fstx/sponge/unit.hpp"

namespace fstx {

// Native field-element alphabet for algebraic sponges. Each unit is a whole
// element, so packing never splits an element across unit boundaries.
template <>
struct UnitTraits<Scalar> {
  static constexpr size_t kByteWidth = Scalar::kByteLength;

  static void Write(std::span<const Scalar> units, Bytes* out);
  static void Read(std::span<const uint8_t> encoded, std::span<Scalar> units);
};

}  // namespace fstx
