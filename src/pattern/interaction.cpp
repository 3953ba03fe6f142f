#include "fstx/pattern/interaction.hpp"

#include <fmt/format.h>

namespace fstx {

std::string InteractionLength::ToString() const {
  switch (type) {
    case Type::kNone:
      return "None";
    case Type::kScalar:
      return "Scalar";
    case Type::kFixed:
      return fmt::format("Fixed({})", size);
    case Type::kDynamic:
      return "Dynamic";
  }
  return "Unknown";
}

const char* ToString(Hierarchy hierarchy) {
  switch (hierarchy) {
    case Hierarchy::kAtomic:
      return "Atomic";
    case Hierarchy::kBegin:
      return "Begin";
    case Hierarchy::kEnd:
      return "End";
  }
  return "Unknown";
}

const char* ToString(InteractionKind kind) {
  switch (kind) {
    case InteractionKind::kProtocol:
      return "Protocol";
    case InteractionKind::kPublic:
      return "Public";
    case InteractionKind::kMessage:
      return "Message";
    case InteractionKind::kHint:
      return "Hint";
    case InteractionKind::kChallenge:
      return "Challenge";
  }
  return "Unknown";
}

bool Interaction::Closes(const Interaction& begin) const {
  return hierarchy == Hierarchy::kEnd && begin.hierarchy == Hierarchy::kBegin &&
         kind == begin.kind && label == begin.label && type_name == begin.type_name &&
         length == begin.length;
}

std::string Interaction::ToStableString() const {
  // Length-prefixed label keeps the rendering unambiguous.
  return fmt::format("{} {} {} {} {}", ToString(hierarchy), ToString(kind), label.size(), label,
                     length.ToString());
}

std::string Interaction::ToDebugString() const {
  return fmt::format("{} {} {} {} {}", ToString(hierarchy), ToString(kind), label,
                     length.ToString(), type_name);
}

}  // namespace fstx
