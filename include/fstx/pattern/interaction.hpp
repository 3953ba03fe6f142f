#pragma once

#include <cstddef>
#include <string>
#include <typeinfo>
#include <utility>

namespace fstx {

enum class Hierarchy {
  kAtomic = 0,
  kBegin = 1,
  kEnd = 2,
};

enum class InteractionKind {
  kProtocol = 0,
  kPublic = 1,
  kMessage = 2,
  kHint = 3,
  kChallenge = 4,
};

// Size annotation of one interaction: none, a single element, a fixed count
// or a length only known at runtime.
struct InteractionLength {
  enum class Type {
    kNone = 0,
    kScalar = 1,
    kFixed = 2,
    kDynamic = 3,
  };

  Type type = Type::kNone;
  size_t size = 0;

  static InteractionLength None() { return {Type::kNone, 0}; }
  static InteractionLength Scalar() { return {Type::kScalar, 0}; }
  static InteractionLength Fixed(size_t n) { return {Type::kFixed, n}; }
  static InteractionLength Dynamic() { return {Type::kDynamic, 0}; }

  std::string ToString() const;

  bool operator==(const InteractionLength& other) const = default;
};

const char* ToString(Hierarchy hierarchy);
const char* ToString(InteractionKind kind);

struct Interaction {
  Hierarchy hierarchy = Hierarchy::kAtomic;
  InteractionKind kind = InteractionKind::kProtocol;
  std::string label;
  // Implementation-defined; only used for matching and debug output.
  std::string type_name;
  InteractionLength length;

  template <typename T>
  static Interaction Of(Hierarchy hierarchy,
                        InteractionKind kind,
                        std::string label,
                        InteractionLength length) {
    return Interaction{hierarchy, kind, std::move(label), typeid(T).name(), length};
  }

  // True if this is an End matching `begin` in kind, label, type and length.
  bool Closes(const Interaction& begin) const;

  // "<Hierarchy> <Kind> <label-len> <label> <Length>", type names omitted.
  std::string ToStableString() const;
  std::string ToDebugString() const;

  bool operator==(const Interaction& other) const = default;
};

}  // namespace fstx
