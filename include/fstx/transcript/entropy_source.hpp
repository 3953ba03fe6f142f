#pragma once

#include <cstdint>
#include <span>

namespace fstx {

class IEntropySource {
 public:
  virtual ~IEntropySource() = default;

  // Fills `out` with fresh unpredictable bytes. Returns false on failure;
  // callers must not fall back to a weaker source.
  virtual bool Fill(std::span<uint8_t> out) = 0;
};

// OpenSSL RAND_bytes.
class OsEntropySource : public IEntropySource {
 public:
  bool Fill(std::span<uint8_t> out) override;
};

}  // namespace fstx
