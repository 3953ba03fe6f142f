#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

#include "fstx/pattern/interaction.hpp"
#include "fstx/pattern/interaction_pattern.hpp"

namespace fstx {

// Checks a protocol run against a recorded InteractionPattern, one
// interaction at a time. The pattern is shared between concurrent players.
class PatternPlayer {
 public:
  explicit PatternPlayer(std::shared_ptr<const InteractionPattern> pattern);
  ~PatternPlayer();

  PatternPlayer(const PatternPlayer&) = delete;
  PatternPlayer& operator=(const PatternPlayer&) = delete;

  // Throws ProtocolMismatchError on any deviation; the player is finished
  // afterwards.
  void Interact(const Interaction& interaction);

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

  // Throws ProtocolMismatchError if interactions remain.
  void Finalize();
  void Abort();

  size_t position() const { return position_; }
  bool finalized() const { return finalized_; }

 private:
  void RequireOpen() const;

  std::shared_ptr<const InteractionPattern> pattern_;
  size_t position_ = 0;
  bool finalized_ = false;
};

}  // namespace fstx
