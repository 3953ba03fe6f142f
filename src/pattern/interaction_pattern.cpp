#include "fstx/pattern/interaction_pattern.hpp"

#include <utility>

#include <fmt/format.h>

#include "fstx/common/bytes.hpp"
#include "fstx/common/errors.hpp"

namespace fstx {
namespace {

struct OpenBegin {
  size_t position = 0;
  const Interaction* begin = nullptr;
};

void Validate(const std::vector<Interaction>& interactions) {
  std::vector<OpenBegin> stack;
  for (size_t i = 0; i < interactions.size(); ++i) {
    const Interaction& interaction = interactions[i];
    switch (interaction.hierarchy) {
      case Hierarchy::kBegin:
        stack.push_back(OpenBegin{i, &interaction});
        break;
      case Hierarchy::kEnd: {
        if (stack.empty()) {
          throw PatternDeclarationError(
              fmt::format("missing Begin for '{}' at {}", interaction.ToDebugString(), i));
        }
        const OpenBegin open = stack.back();
        stack.pop_back();
        if (!interaction.Closes(*open.begin)) {
          throw PatternDeclarationError(fmt::format("'{}' at {} does not close '{}' at {}",
                                                    interaction.ToDebugString(), i,
                                                    open.begin->ToDebugString(), open.position));
        }
        break;
      }
      case Hierarchy::kAtomic: {
        if (stack.empty()) {
          break;
        }
        const OpenBegin& open = stack.back();
        if (open.begin->kind != InteractionKind::kProtocol &&
            open.begin->kind != interaction.kind) {
          throw PatternDeclarationError(fmt::format("invalid kind '{}' at {} inside '{}' at {}",
                                                    interaction.ToDebugString(), i,
                                                    open.begin->ToDebugString(), open.position));
        }
        break;
      }
    }
  }
  if (!stack.empty()) {
    throw PatternDeclarationError(fmt::format("missing End for '{}' at {}",
                                              stack.back().begin->ToDebugString(),
                                              stack.back().position));
  }
}

}  // namespace

InteractionPattern::InteractionPattern(std::vector<Interaction> interactions)
    : interactions_(std::move(interactions)) {}

InteractionPattern InteractionPattern::Create(std::vector<Interaction> interactions) {
  Validate(interactions);
  return InteractionPattern(std::move(interactions));
}

const std::vector<Interaction>& InteractionPattern::interactions() const {
  return interactions_;
}

size_t InteractionPattern::size() const {
  return interactions_.size();
}

std::string InteractionPattern::ToStableString() const {
  return Render(/*stable=*/true);
}

std::string InteractionPattern::ToDebugString() const {
  return Render(/*stable=*/false);
}

std::array<uint8_t, kSha3_256DigestLength> InteractionPattern::PatternHash() const {
  return Sha3_256(AsByteSpan(ToStableString()));
}

std::string InteractionPattern::Render(bool stable) const {
  // The count goes first so no prefix of one rendering is another rendering.
  std::string out = fmt::format("fstx interaction pattern ({} interactions)\n", interactions_.size());
  const size_t width =
      fmt::format("{}", interactions_.empty() ? 0 : interactions_.size() - 1).size();

  size_t depth = 0;
  for (size_t i = 0; i < interactions_.size(); ++i) {
    const Interaction& interaction = interactions_[i];
    if (interaction.hierarchy == Hierarchy::kEnd && depth > 0) {
      --depth;
    }
    out += fmt::format("{:0>{}} ", i, width);
    out.append(depth * 2, ' ');
    out += stable ? interaction.ToStableString() : interaction.ToDebugString();
    out += '\n';
    if (interaction.hierarchy == Hierarchy::kBegin) {
      ++depth;
    }
  }
  return out;
}

}  // namespace fstx
