#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace fstx {

class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Malformed domain separator or interaction pattern. Always a program bug.
class PatternDeclarationError : public Error {
 public:
  using Error::Error;
};

// A runtime operation disagrees with the declared pattern. The transcript
// instance that raised it is unusable afterwards.
class ProtocolMismatchError : public Error {
 public:
  ProtocolMismatchError(size_t position, std::string expected, std::string actual);

  size_t position() const;
  const std::string& expected() const;
  const std::string& actual() const;

 private:
  size_t position_;
  std::string expected_;
  std::string actual_;
};

class TranscriptTruncatedError : public Error {
 public:
  TranscriptTruncatedError(size_t requested, size_t available);

  size_t requested() const;
  size_t available() const;

 private:
  size_t requested_;
  size_t available_;
};

class CodecDecodingError : public Error {
 public:
  using Error::Error;
};

class EntropySourceError : public Error {
 public:
  using Error::Error;
};

}  // namespace fstx
