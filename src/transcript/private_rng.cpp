#include "fstx/transcript/private_rng.hpp"

#include <utility>

#include "fstx/common/errors.hpp"
#include "fstx/common/logging.hpp"
#include "fstx/common/secure_zeroize.hpp"

namespace fstx {

ProverPrivateRng::ProverPrivateRng(std::span<const uint8_t> domain_separator,
                                   std::shared_ptr<IEntropySource> entropy)
    : entropy_(std::move(entropy)) {
  if (entropy_ == nullptr) {
    throw EntropySourceError("prover requires an entropy source");
  }
  DrawEntropy(seed_);
  sponge_.Absorb(domain_separator);
}

ProverPrivateRng::~ProverPrivateRng() {
  SecureZeroize(&seed_);
}

void ProverPrivateRng::AbsorbPublic(std::span<const uint8_t> data) {
  sponge_.Absorb(data);
}

void ProverPrivateRng::Fill(std::span<const uint8_t> public_digest, std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }

  std::array<uint8_t, kFreshEntropyLength> fresh{};
  ScopedZeroize wipe_fresh(fresh);
  DrawEntropy(fresh);

  sponge_.Absorb(public_digest);
  sponge_.Absorb(seed_);
  sponge_.Absorb(fresh);
  sponge_.Squeeze(out);
}

void ProverPrivateRng::DrawEntropy(std::span<uint8_t> out) {
  if (!entropy_->Fill(out)) {
    SecureZeroize(out);
    Logger()->error("entropy source failed to provide {} bytes", out.size());
    throw EntropySourceError("entropy source failed");
  }
}

}  // namespace fstx
