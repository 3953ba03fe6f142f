#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <utility>

#include "fstx/common/errors.hpp"
#include "fstx/common/logging.hpp"
#include "fstx/pattern/domain_separator.hpp"
#include "fstx/sponge/keccak.hpp"
#include "fstx/transcript/verifier_transcript.hpp"

namespace fstx {

// Replays `transcript` through `replay(VerifierTranscript<H>&) -> bool` and
// finalizes. Transcript-level failures (pattern mismatch, truncation,
// malformed encodings, trailing bytes) are reported as false with the reason
// in `error`; a false return from `replay` means the protocol check failed.
template <typename H = Keccak, typename Replay>
bool VerifyTranscript(const DomainSeparator& domain_separator,
                      std::span<const uint8_t> transcript,
                      Replay&& replay,
                      std::string* error = nullptr) {
  const auto reject = [&](const std::string& reason) {
    Logger()->debug("transcript '{}' rejected: {}", domain_separator.protocol_label(), reason);
    if (error != nullptr) {
      *error = reason;
    }
    return false;
  };

  try {
    VerifierTranscript<H> verifier(domain_separator, transcript);
    if (!std::forward<Replay>(replay)(verifier)) {
      verifier.Abort();
      return reject("protocol check failed");
    }
    verifier.Finalize();
  } catch (const ProtocolMismatchError& ex) {
    return reject(ex.what());
  } catch (const TranscriptTruncatedError& ex) {
    return reject(ex.what());
  } catch (const CodecDecodingError& ex) {
    return reject(ex.what());
  }

  if (error != nullptr) {
    error->clear();
  }
  return true;
}

}  // namespace fstx
