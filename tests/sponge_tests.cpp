#include <algorithm>
#include <array>
#include <cstdint>
#include <functional>
#include <iostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <gmpxx.h>

#include "fstx/common/bytes.hpp"
#include "fstx/crypto/scalar.hpp"
#include "fstx/sponge/duplex_sponge.hpp"
#include "fstx/sponge/keccak.hpp"
#include "fstx/sponge/scalar_unit.hpp"
#include "toy_scalar_permutation.hpp"

namespace {

using fstx::AsByteSpan;
using fstx::Bytes;
using fstx::Keccak;
using fstx::Scalar;
using fstx::SpongeIv;
using fstx_test::ToyScalarSponge;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void ExpectThrow(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const std::exception&) {
    return;
  }
  throw std::runtime_error("Expected exception: " + message);
}

std::string Hex(std::span<const uint8_t> bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0F]);
  }
  return out;
}

SpongeIv IvFromString(std::string_view text) {
  if (text.size() != 32) {
    throw std::invalid_argument("test IV must be 32 characters");
  }
  SpongeIv iv{};
  for (size_t i = 0; i < iv.size(); ++i) {
    iv[i] = static_cast<uint8_t>(text[i]);
  }
  return iv;
}

Bytes Squeeze(Keccak* sponge, size_t n) {
  Bytes out(n);
  sponge->Squeeze(out);
  return out;
}

void TestKeccakKnownAnswer() {
  Keccak sponge(IvFromString("unit_tests_keccak_tag___________"));
  sponge.Absorb(AsByteSpan("Hello, World!"));
  const Bytes out = Squeeze(&sponge, 64);
  Expect(Hex(out) ==
             "73e4a040a956f57693fb2b2dde8a8ea2c14d39ff8830060cd0301d6de25b2097"
             "ba858efedeeb89368eaf7c94a68f62835f932b5f0dd0ba376c48a0fdb5e21f0c",
         "Keccak duplex must match the reference output");
}

void TestEmptyOperationsAreNeutral() {
  const std::string expected =
      "73e4a040a956f57693fb2b2dde8a8ea2c14d39ff8830060cd0301d6de25b2097"
      "ba858efedeeb89368eaf7c94a68f62835f932b5f0dd0ba376c48a0fdb5e21f0c";

  Keccak before(IvFromString("unit_tests_keccak_tag___________"));
  before.Absorb({});
  before.Absorb(AsByteSpan("Hello, World!"));
  Expect(Hex(Squeeze(&before, 64)) == expected, "Empty absorb before input is a no-op");

  Keccak after(IvFromString("unit_tests_keccak_tag___________"));
  after.Absorb(AsByteSpan("Hello, World!"));
  after.Absorb({});
  Bytes nothing;
  after.Squeeze(nothing);
  Expect(Hex(Squeeze(&after, 64)) == expected, "Empty absorb/squeeze after input is a no-op");
}

void TestInterleavedOperations() {
  Keccak sponge(IvFromString("edge-case-test-domain-absorb0000"));
  sponge.Absorb(AsByteSpan("first"));
  (void)Squeeze(&sponge, 32);
  sponge.Absorb(AsByteSpan("second"));
  Expect(Hex(Squeeze(&sponge, 32)) ==
             "20ce6da64ffc09df8de254222c068358da39d23ec43e522ceaaa1b82b90c8b9a",
         "Absorb after squeeze must match the reference output");
}

void TestAbsorbChunkingInvariance() {
  const std::string expected = "7dfada182d6191e106ce287c2262a443ce2fb695c7cc5037a46626e88889af58";
  const SpongeIv iv = IvFromString("absorb-associativity-domain-----");

  Keccak whole(iv);
  whole.Absorb(AsByteSpan("hello world"));
  Expect(Hex(Squeeze(&whole, 32)) == expected, "Single absorb must match the reference output");

  Keccak split(iv);
  split.Absorb(AsByteSpan("hello"));
  split.Absorb(AsByteSpan(" world"));
  Expect(Hex(Squeeze(&split, 32)) == expected, "Split absorb must equal single absorb");

  // Crossing the 136-byte rate boundary at different offsets.
  Bytes long_input(500);
  for (size_t i = 0; i < long_input.size(); ++i) {
    long_input[i] = static_cast<uint8_t>(i * 7 + 1);
  }
  Keccak one_shot(iv);
  one_shot.Absorb(long_input);
  const Bytes reference = Squeeze(&one_shot, 300);

  for (size_t step : {1u, 13u, 136u, 137u, 499u}) {
    Keccak chunked(iv);
    std::span<const uint8_t> rest(long_input);
    while (!rest.empty()) {
      const size_t n = std::min(step, rest.size());
      chunked.Absorb(rest.first(n));
      rest = rest.subspan(n);
    }
    Bytes out;
    for (size_t taken = 0; taken < reference.size();) {
      const size_t n = std::min<size_t>(step, reference.size() - taken);
      const Bytes part = Squeeze(&chunked, n);
      out.insert(out.end(), part.begin(), part.end());
      taken += n;
    }
    Expect(out == reference, "Chunk size " + std::to_string(step) + " must not change output");
  }
}

void TestIvSeparation() {
  Keccak one(IvFromString("domain-one-differs-here-00000000"));
  one.Absorb(AsByteSpan("input"));
  Keccak two(IvFromString("domain-two-differs-here-00000000"));
  two.Absorb(AsByteSpan("input"));

  Expect(Hex(Squeeze(&one, 32)) ==
             "2ecad63584ec0ff7f31edb822530762e5cb4b7dc1a62b1ffe02c43f3073a61b8",
         "First IV must match the reference output");
  Expect(Hex(Squeeze(&two, 32)) ==
             "6310fa0356e1bab0442fa19958e1c4a6d1dcc565b2b139b6044d1a809f531825",
         "Second IV must match the reference output");
}

void TestRatchet() {
  const SpongeIv iv = IvFromString("ratchet-test-iv-0000000000000000");

  Keccak plain(iv);
  plain.Absorb(AsByteSpan("secret"));
  Keccak ratcheted = plain;
  ratcheted.Ratchet();

  Expect(Squeeze(&plain, 32) != Squeeze(&ratcheted, 32), "Ratchet must change subsequent output");

  Keccak probe(iv);
  probe.Absorb(AsByteSpan("secret"));
  probe.Ratchet();
  const std::span<const uint8_t> state = probe.permutation().state();
  Expect(std::all_of(state.begin(), state.begin() + Keccak::kRate, [](uint8_t b) { return b == 0; }),
         "Ratchet must clear the rate");
  Expect(std::any_of(state.begin() + Keccak::kRate, state.end(), [](uint8_t b) { return b != 0; }),
         "Ratchet must keep the capacity");

  Keccak a(iv);
  Keccak b(iv);
  a.Absorb(AsByteSpan("x"));
  b.Absorb(AsByteSpan("x"));
  a.Ratchet();
  b.Ratchet();
  Expect(Squeeze(&a, 48) == Squeeze(&b, 48), "Ratchet must be deterministic");
}

void TestCopiesAreIndependent() {
  Keccak original(IvFromString("copy-independence-iv-00000000000"));
  original.Absorb(AsByteSpan("shared prefix"));
  Keccak copy = original;

  original.Absorb(AsByteSpan("left"));
  copy.Absorb(AsByteSpan("right"));
  Expect(Squeeze(&original, 32) != Squeeze(&copy, 32), "Copies must evolve independently");
}

void TestNativeScalarSponge() {
  const SpongeIv iv = IvFromString("native-scalar-sponge-iv-00000000");
  const std::vector<Scalar> input = {Scalar::FromUint64(1), Scalar::FromUint64(2),
                                     Scalar::FromUint64(3)};

  ToyScalarSponge a(iv);
  a.Absorb(input);
  std::vector<Scalar> out_a(5);
  a.Squeeze(out_a);

  ToyScalarSponge b(iv);
  b.Absorb(std::span<const Scalar>(input).first(1));
  b.Absorb(std::span<const Scalar>(input).subspan(1));
  std::vector<Scalar> out_b(5);
  b.Squeeze(std::span<Scalar>(out_b).first(2));
  b.Squeeze(std::span<Scalar>(out_b).subspan(2));

  Expect(out_a == out_b, "Native sponge must be chunking invariant");

  ToyScalarSponge c(iv);
  std::vector<Scalar> other = input;
  other[2] = Scalar::FromUint64(4);
  c.Absorb(other);
  std::vector<Scalar> out_c(5);
  c.Squeeze(out_c);
  Expect(out_a != out_c, "Different native input must change output");

  Bytes encoded;
  fstx::UnitTraits<Scalar>::Write(out_a, &encoded);
  Expect(encoded.size() == out_a.size() * Scalar::kByteLength,
         "Scalar units serialize to 32 bytes each");
  std::vector<Scalar> decoded(out_a.size());
  fstx::UnitTraits<Scalar>::Read(encoded, decoded);
  Expect(decoded == out_a, "Scalar unit encoding must round-trip");

  Bytes bad(Scalar::kByteLength, 0xFF);
  std::vector<Scalar> one(1);
  ExpectThrow([&]() { fstx::UnitTraits<Scalar>::Read(bad, one); },
              "Non-canonical scalar unit must be rejected");
}

}  // namespace

int main() {
  try {
    TestKeccakKnownAnswer();
    TestEmptyOperationsAreNeutral();
    TestInterleavedOperations();
    TestAbsorbChunkingInvariance();
    TestIvSeparation();
    TestRatchet();
    TestCopiesAreIndependent();
    TestNativeScalarSponge();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Sponge tests passed" << '\n';
  return 0;
}
