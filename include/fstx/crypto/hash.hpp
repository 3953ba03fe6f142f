#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace fstx {

constexpr size_t kSha3_256DigestLength = 32;

std::array<uint8_t, kSha3_256DigestLength> Sha3_256(std::span<const uint8_t> data);

}  // namespace fstx
