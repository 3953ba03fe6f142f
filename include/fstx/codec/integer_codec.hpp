#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <gmpxx.h>

#include "fstx/common/bytes.hpp"

namespace fstx {

// Big-endian, left-padded with zeros to exactly `width` bytes. Throws
// std::invalid_argument for negative values or values wider than `width`.
Bytes EncodeFixedWidth(const mpz_class& value, size_t width);
void EncodeFixedWidthInto(const mpz_class& value, std::span<uint8_t> out);

mpz_class DecodeBigEndian(std::span<const uint8_t> encoded);

// Number of bytes needed to hold `value` (at least one).
size_t ByteLength(const mpz_class& value);

}  // namespace fstx
