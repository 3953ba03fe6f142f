#include "fstx/common/errors.hpp"

#include <utility>

#include <fmt/format.h>

namespace fstx {

ProtocolMismatchError::ProtocolMismatchError(size_t position,
                                             std::string expected,
                                             std::string actual)
    : Error(fmt::format("protocol mismatch at pattern position {}: expected {}, got {}",
                        position, expected, actual)),
      position_(position),
      expected_(std::move(expected)),
      actual_(std::move(actual)) {}

size_t ProtocolMismatchError::position() const {
  return position_;
}

const std::string& ProtocolMismatchError::expected() const {
  return expected_;
}

const std::string& ProtocolMismatchError::actual() const {
  return actual_;
}

TranscriptTruncatedError::TranscriptTruncatedError(size_t requested, size_t available)
    : Error(fmt::format("transcript truncated: {} bytes requested, {} available",
                        requested, available)),
      requested_(requested),
      available_(available) {}

size_t TranscriptTruncatedError::requested() const {
  return requested_;
}

size_t TranscriptTruncatedError::available() const {
  return available_;
}

}  // namespace fstx
