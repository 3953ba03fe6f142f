#include <cstdint>
#include <functional>
#include <iostream>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "fstx/common/bytes.hpp"
#include "fstx/common/errors.hpp"
#include "fstx/pattern/domain_separator.hpp"
#include "fstx/sponge/keccak.hpp"
#include "fstx/transcript/safe_sponge.hpp"

namespace {

using fstx::Bytes;
using fstx::DomainSeparator;
using fstx::Keccak;
using fstx::ProtocolMismatchError;
using fstx::SafeSponge;
using fstx::SafeStatus;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void ExpectMismatch(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const ProtocolMismatchError&) {
    return;
  } catch (const std::exception& ex) {
    throw std::runtime_error("Wrong exception (" + std::string(ex.what()) + "): " + message);
  }
  throw std::runtime_error("Expected ProtocolMismatchError: " + message);
}

DomainSeparator AbsorbThenSqueeze() {
  return DomainSeparator("safe-test").Absorb(32, "commitment").Squeeze(16, "challenge");
}

Bytes Filled(size_t n, uint8_t value) {
  return Bytes(n, value);
}

void TestHonestRunMatchesRawSponge() {
  const DomainSeparator ds = AbsorbThenSqueeze();
  const Bytes message = Filled(32, 0xAB);

  SafeSponge<Keccak> safe(ds);
  safe.Absorb(message);
  Bytes challenge(16);
  safe.Squeeze(challenge);
  Expect(safe.IsComplete(), "Pattern must be complete");
  safe.Finalize();

  Keccak raw(ds.Tag());
  raw.Absorb(message);
  Bytes expected(16);
  raw.Squeeze(expected);
  Expect(challenge == expected, "Checked sponge must squeeze what the raw sponge squeezes");
}

void TestSplitRequestsAreAllowed() {
  const DomainSeparator ds = AbsorbThenSqueeze();
  const Bytes message = Filled(32, 0x11);

  SafeSponge<Keccak> whole(ds);
  whole.Absorb(message);
  Bytes a(16);
  whole.Squeeze(a);

  SafeSponge<Keccak> split(ds);
  split.Absorb(std::span<const uint8_t>(message).first(10));
  Expect(split.position() == 0, "Partial absorb must stay on the same operation");
  split.Absorb(std::span<const uint8_t>(message).subspan(10));
  Expect(split.position() == 1, "Completing the absorb must advance");
  Bytes b(16);
  split.Squeeze(std::span<uint8_t>(b).first(5));
  split.Squeeze(std::span<uint8_t>(b).subspan(5));
  split.Finalize();

  Expect(a == b, "Splitting requests must not change the challenge");
}

void TestOutOfOrderRejected() {
  const DomainSeparator ds = AbsorbThenSqueeze();

  SafeSponge<Keccak> squeeze_first(ds);
  ExpectMismatch(
      [&]() {
        Bytes out(16);
        squeeze_first.Squeeze(out);
      },
      "Squeeze before the declared absorb");
  Expect(squeeze_first.status() == SafeStatus::kFailed, "Mismatch must fail the engine");
  ExpectMismatch([&]() { squeeze_first.Absorb(Filled(32, 0)); },
                 "A failed engine rejects even the expected operation");
  ExpectMismatch([&]() { squeeze_first.Finalize(); }, "A failed engine cannot finalize");

  SafeSponge<Keccak> checked(ds);
  checked.CheckAbsorb(32);
  checked.CheckAbsorb(32);
  Expect(checked.position() == 0, "Checking an absorb does not consume it");
  ExpectMismatch([&]() { checked.CheckAbsorb(33); }, "Check rejects an over-length absorb");
  Expect(checked.status() == SafeStatus::kFailed, "A failed check fails the engine");

  SafeSponge<Keccak> too_long(ds);
  ExpectMismatch([&]() { too_long.Absorb(Filled(33, 0)); }, "Absorb longer than declared");

  SafeSponge<Keccak> overflow(ds);
  overflow.Absorb(Filled(20, 0));
  ExpectMismatch([&]() { overflow.Absorb(Filled(13, 0)); },
                 "Split absorb exceeding the remainder");

  SafeSponge<Keccak> extra(ds);
  extra.Absorb(Filled(32, 0));
  Bytes out(16);
  extra.Squeeze(out);
  ExpectMismatch([&]() { extra.Absorb(Filled(1, 0)); }, "Operation after completion");
}

void TestIncompleteFinalizeRejected() {
  SafeSponge<Keccak> safe(AbsorbThenSqueeze());
  safe.Absorb(Filled(32, 0));
  ExpectMismatch([&]() { safe.Finalize(); }, "Finalize with a pending squeeze");
  Expect(safe.status() == SafeStatus::kReady, "Early finalize does not fail the engine");

  Bytes out(16);
  safe.Squeeze(out);
  safe.Finalize();
}

void TestEmptyRequestsAreNoOps() {
  SafeSponge<Keccak> safe(AbsorbThenSqueeze());
  safe.Absorb({});
  Bytes none;
  safe.Squeeze(none);
  Expect(safe.position() == 0 && safe.status() == SafeStatus::kReady,
         "Empty requests must not consume or fail");

  safe.Absorb(Filled(32, 0));
  Bytes out(16);
  safe.Squeeze(out);
  safe.Finalize();
}

void TestRatchetAndHintOrdering() {
  const DomainSeparator ds = DomainSeparator("ordering")
                                 .Absorb(8, "a")
                                 .Ratchet()
                                 .Hint("aux")
                                 .Squeeze(8, "c");

  SafeSponge<Keccak> honest(ds);
  honest.Absorb(Filled(8, 1));
  honest.Ratchet();
  honest.Hint();
  Bytes out(8);
  honest.Squeeze(out);
  honest.Finalize();

  SafeSponge<Keccak> skipped_ratchet(ds);
  skipped_ratchet.Absorb(Filled(8, 1));
  ExpectMismatch([&]() { skipped_ratchet.Hint(); }, "Hint where a ratchet is declared");

  SafeSponge<Keccak> no_hint(ds);
  no_hint.Absorb(Filled(8, 1));
  no_hint.Ratchet();
  ExpectMismatch(
      [&]() {
        Bytes c(8);
        no_hint.Squeeze(c);
      },
      "Squeeze where a hint is declared");

  SafeSponge<Keccak> again(ds);
  again.Absorb(Filled(8, 1));
  again.Ratchet();
  again.Hint();
  Bytes out_again(8);
  again.Squeeze(out_again);
  again.Finalize();
  Expect(out == out_again, "Identical runs produce identical challenges");
}

void TestMergedDeclarationsAcceptAnySplit() {
  const DomainSeparator declared_split =
      DomainSeparator("merged").Absorb(16, "x").Absorb(16, "y").Squeeze(8, "c");

  SafeSponge<Keccak> safe(declared_split);
  safe.Absorb(Filled(32, 3));
  Bytes out(8);
  safe.Squeeze(out);
  safe.Finalize();
}

void TestPublicDigestDoesNotDisturbState() {
  const DomainSeparator ds = AbsorbThenSqueeze();

  SafeSponge<Keccak> plain(ds);
  plain.Absorb(Filled(32, 9));
  Bytes a(16);
  plain.Squeeze(a);

  SafeSponge<Keccak> probed(ds);
  const Bytes before = probed.PublicDigest();
  probed.Absorb(Filled(32, 9));
  const Bytes after = probed.PublicDigest();
  Bytes b(16);
  probed.Squeeze(b);
  probed.Finalize();

  Expect(a == b, "Public digest must not change the public stream");
  Expect(before.size() == SafeSponge<Keccak>::kDigestLength, "Digest has the fixed length");
  Expect(before != after, "Digest must follow absorbed data");
  Expect(probed.position() == 2, "Digest must not move the cursor");
}

void TestTagsSeparateProtocols() {
  const Bytes message = Filled(32, 0);

  SafeSponge<Keccak> one(DomainSeparator("protocol-one").Absorb(32, "m").Squeeze(16, "c"));
  SafeSponge<Keccak> two(DomainSeparator("protocol-two").Absorb(32, "m").Squeeze(16, "c"));
  one.Absorb(message);
  two.Absorb(message);
  Bytes a(16);
  Bytes b(16);
  one.Squeeze(a);
  two.Squeeze(b);
  one.Finalize();
  two.Finalize();
  Expect(a != b, "Different domain separators must give unrelated challenges");
}

}  // namespace

int main() {
  try {
    TestHonestRunMatchesRawSponge();
    TestSplitRequestsAreAllowed();
    TestOutOfOrderRejected();
    TestIncompleteFinalizeRejected();
    TestEmptyRequestsAreNoOps();
    TestRatchetAndHintOrdering();
    TestMergedDeclarationsAcceptAnySplit();
    TestPublicDigestDoesNotDisturbState();
    TestTagsSeparateProtocols();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Safe sponge tests passed" << '\n';
  return 0;
}
