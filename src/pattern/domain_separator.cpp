#include "fstx/pattern/domain_separator.hpp"

#include <limits>
#include <string>

#include <fmt/format.h>

#include "fstx/common/errors.hpp"
#include "fstx/sponge/keccak.hpp"

namespace fstx {
namespace {

constexpr char kSeparator = '\0';

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

void ValidateLabel(std::string_view label) {
  if (label.find(kSeparator) != std::string_view::npos) {
    throw PatternDeclarationError("pattern label must not contain NUL");
  }
  if (!label.empty() && IsDigit(label.front())) {
    throw PatternDeclarationError(
        fmt::format("pattern label must not start with a digit: '{}'", label));
  }
}

bool IsMergeable(PatternOpKind kind) {
  return kind == PatternOpKind::kAbsorb || kind == PatternOpKind::kSqueeze;
}

std::vector<std::string_view> SplitSegments(std::string_view encoded) {
  std::vector<std::string_view> out;
  size_t start = 0;
  while (true) {
    const size_t end = encoded.find(kSeparator, start);
    if (end == std::string_view::npos) {
      out.push_back(encoded.substr(start));
      return out;
    }
    out.push_back(encoded.substr(start, end - start));
    start = end + 1;
  }
}

}  // namespace

std::string DescribeOp(PatternOpKind kind, size_t length) {
  switch (kind) {
    case PatternOpKind::kAbsorb:
      return fmt::format("Absorb({})", length);
    case PatternOpKind::kSqueeze:
      return fmt::format("Squeeze({})", length);
    case PatternOpKind::kRatchet:
      return "Ratchet";
    case PatternOpKind::kHint:
      return "Hint";
  }
  return "Unknown";
}

DomainSeparator::DomainSeparator(std::string_view protocol_label)
    : protocol_label_(protocol_label) {
  if (protocol_label.find(kSeparator) != std::string_view::npos) {
    throw PatternDeclarationError("protocol label must not contain NUL");
  }
}

DomainSeparator DomainSeparator::Parse(std::span<const uint8_t> encoded) {
  const std::string_view text(reinterpret_cast<const char*>(encoded.data()), encoded.size());
  const std::vector<std::string_view> segments = SplitSegments(text);

  DomainSeparator out(segments.front());
  for (size_t i = 1; i < segments.size(); ++i) {
    const std::string_view segment = segments[i];
    if (segment.empty()) {
      throw PatternDeclarationError(fmt::format("empty pattern entry at index {}", i - 1));
    }

    const char kind = segment.front();
    const std::string_view rest = segment.substr(1);
    if (kind == static_cast<char>(PatternOpKind::kRatchet)) {
      if (!rest.empty()) {
        throw PatternDeclarationError("ratchet entry must not carry a label");
      }
      out = out.Ratchet();
      continue;
    }
    if (kind == static_cast<char>(PatternOpKind::kHint)) {
      out = out.Hint(rest);
      continue;
    }
    if (kind != static_cast<char>(PatternOpKind::kAbsorb) &&
        kind != static_cast<char>(PatternOpKind::kSqueeze)) {
      throw PatternDeclarationError(
          fmt::format("unknown pattern operation '{}' at index {}", kind, i - 1));
    }

    size_t digits = 0;
    while (digits < rest.size() && IsDigit(rest[digits])) {
      ++digits;
    }
    if (digits == 0 || rest.front() == '0') {
      throw PatternDeclarationError(
          fmt::format("pattern entry {} has no canonical length", i - 1));
    }
    if (digits > 18) {
      throw PatternDeclarationError(fmt::format("pattern entry {} length is too large", i - 1));
    }

    const size_t length = std::stoull(std::string(rest.substr(0, digits)));
    const std::string_view label = rest.substr(digits);
    if (kind == static_cast<char>(PatternOpKind::kAbsorb)) {
      out = out.Absorb(length, label);
    } else {
      out = out.Squeeze(length, label);
    }
  }
  (void)out.CompileOps();
  return out;
}

DomainSeparator DomainSeparator::Absorb(size_t length, std::string_view label) const {
  if (length == 0) {
    throw PatternDeclarationError(fmt::format("absorb entry '{}' must have positive length", label));
  }
  return Append(PatternOpKind::kAbsorb, length, label);
}

DomainSeparator DomainSeparator::Squeeze(size_t length, std::string_view label) const {
  if (length == 0) {
    throw PatternDeclarationError(fmt::format("squeeze entry '{}' must have positive length", label));
  }
  return Append(PatternOpKind::kSqueeze, length, label);
}

DomainSeparator DomainSeparator::Ratchet() const {
  return Append(PatternOpKind::kRatchet, 1, "");
}

DomainSeparator DomainSeparator::Hint(std::string_view label) const {
  return Append(PatternOpKind::kHint, 1, label);
}

const std::string& DomainSeparator::protocol_label() const {
  return protocol_label_;
}

const std::vector<PatternOp>& DomainSeparator::entries() const {
  return entries_;
}

Bytes DomainSeparator::ToBytes() const {
  std::string out = protocol_label_;
  for (const PatternOp& entry : entries_) {
    out.push_back(kSeparator);
    out.push_back(static_cast<char>(entry.kind));
    if (IsMergeable(entry.kind)) {
      out += std::to_string(entry.length);
    }
    out += entry.label;
  }
  return Bytes(out.begin(), out.end());
}

std::vector<PatternOp> DomainSeparator::CompileOps() const {
  std::vector<PatternOp> ops;
  for (const PatternOp& entry : entries_) {
    if (!ops.empty() && IsMergeable(entry.kind) && ops.back().kind == entry.kind) {
      if (entry.length > std::numeric_limits<size_t>::max() - ops.back().length) {
        throw PatternDeclarationError(
            fmt::format("merged {} run overflows at entry '{}'",
                        entry.kind == PatternOpKind::kAbsorb ? "absorb" : "squeeze", entry.label));
      }
      ops.back().length += entry.length;
      ops.back().label += ",";
      ops.back().label += entry.label;
      continue;
    }
    ops.push_back(entry);
  }
  return ops;
}

SpongeIv DomainSeparator::Tag() const {
  const Bytes encoded = ToBytes();
  Keccak sponge;
  sponge.Absorb(encoded);

  SpongeIv tag{};
  sponge.Squeeze(tag);
  return tag;
}

DomainSeparator DomainSeparator::Append(PatternOpKind kind,
                                        size_t length,
                                        std::string_view label) const {
  ValidateLabel(label);
  DomainSeparator out = *this;
  out.entries_.push_back(PatternOp{kind, length, std::string(label)});
  return out;
}

}  // namespace fstx
