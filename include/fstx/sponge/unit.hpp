#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>

#include "fstx/common/bytes.hpp"
#include "fstx/common/errors.hpp"

namespace fstx {

// Alphabet a sponge operates over. A specialisation provides:
//   static constexpr size_t kByteWidth;            // canonical width of one unit
//   static void Write(std::span<const U>, Bytes*); // append canonical bytes
//   static void Read(std::span<const uint8_t>, std::span<U>);
// Read receives exactly units.size() * kByteWidth bytes and throws
// CodecDecodingError on a non-canonical encoding.
template <typename U>
struct UnitTraits;

template <>
struct UnitTraits<uint8_t> {
  static constexpr size_t kByteWidth = 1;

  static void Write(std::span<const uint8_t> units, Bytes* out) {
    out->insert(out->end(), units.begin(), units.end());
  }

  static void Read(std::span<const uint8_t> encoded, std::span<uint8_t> units) {
    if (encoded.size() != units.size()) {
      throw CodecDecodingError("byte unit buffer has inconsistent length");
    }
    std::copy(encoded.begin(), encoded.end(), units.begin());
  }
};

}  // namespace fstx
