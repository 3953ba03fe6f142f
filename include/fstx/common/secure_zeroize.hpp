#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "fstx/common/bytes.hpp"
#include "fstx/crypto/scalar.hpp"

namespace fstx {

inline void SecureZeroizeMemory(void* data, size_t size) noexcept {
  if (data == nullptr || size == 0) {
    return;
  }

  volatile uint8_t* ptr = static_cast<volatile uint8_t*>(data);
  while (size > 0) {
    *ptr = 0;
    ++ptr;
    --size;
  }
}

inline void SecureZeroize(std::span<uint8_t> value) noexcept {
  SecureZeroizeMemory(value.data(), value.size());
}

inline void SecureZeroize(Bytes* value) noexcept {
  if (value == nullptr) {
    return;
  }
  if (!value->empty()) {
    SecureZeroizeMemory(value->data(), value->size());
  }
  value->clear();
}

template <size_t N>
inline void SecureZeroize(std::array<uint8_t, N>* value) noexcept {
  if (value == nullptr) {
    return;
  }
  SecureZeroizeMemory(value->data(), value->size());
}

inline void SecureZeroize(Scalar* value) noexcept {
  if (value == nullptr) {
    return;
  }
  *value = Scalar();
}

inline void SecureZeroize(std::span<Scalar> values) noexcept {
  for (Scalar& value : values) {
    SecureZeroize(&value);
  }
}

// Wipes a byte region when the enclosing scope exits, including by exception.
class ScopedZeroize {
 public:
  explicit ScopedZeroize(std::span<uint8_t> region) noexcept : region_(region) {}
  ~ScopedZeroize() { SecureZeroize(region_); }

  ScopedZeroize(const ScopedZeroize&) = delete;
  ScopedZeroize& operator=(const ScopedZeroize&) = delete;

 private:
  std::span<uint8_t> region_;
};

}  // namespace fstx
