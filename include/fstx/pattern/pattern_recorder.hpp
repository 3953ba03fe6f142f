#pragma once

#include <string>
#include <utility>
#include <vector>

#include "fstx/pattern/interaction.hpp"
#include "fstx/pattern/interaction_pattern.hpp"

namespace fstx {

// Builds an InteractionPattern by running the protocol description once.
// Nesting is checked on every call so a bad interaction is reported where it
// happens; PatternDeclarationError on violation.
class PatternRecorder {
 public:
  void Interact(Interaction interaction);

  template <typename T>
  void Begin(std::string label, InteractionKind kind, InteractionLength length) {
    Interact(Interaction::Of<T>(Hierarchy::kBegin, kind, std::move(label), length));
  }

  template <typename T>
  void End(std::string label, InteractionKind kind, InteractionLength length) {
    Interact(Interaction::Of<T>(Hierarchy::kEnd, kind, std::move(label), length));
  }

  template <typename T>
  void Atomic(std::string label, InteractionKind kind, InteractionLength length) {
    Interact(Interaction::Of<T>(Hierarchy::kAtomic, kind, std::move(label), length));
  }

  // Throws std::logic_error if already finalized, PatternDeclarationError
  // if a Begin is still open.
  InteractionPattern Finalize();
  void Abort();

  bool finalized() const { return finalized_; }
  const std::vector<Interaction>& interactions() const { return interactions_; }

 private:
  void RequireOpen() const;
  const Interaction* LastOpenBegin() const;

  std::vector<Interaction> interactions_;
  bool finalized_ = false;
};

}  // namespace fstx
