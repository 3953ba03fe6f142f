#include "fstx/pattern/pattern_recorder.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include "fstx/common/errors.hpp"

namespace fstx {

void PatternRecorder::Interact(Interaction interaction) {
  RequireOpen();
  const Interaction* begin = LastOpenBegin();
  if (begin == nullptr) {
    if (interaction.hierarchy == Hierarchy::kEnd) {
      throw PatternDeclarationError(
          fmt::format("missing Begin for '{}'", interaction.ToDebugString()));
    }
  } else {
    if (begin->kind != InteractionKind::kProtocol && begin->kind != interaction.kind) {
      throw PatternDeclarationError(fmt::format("invalid interaction kind: expected {}, got {}",
                                                ToString(begin->kind),
                                                ToString(interaction.kind)));
    }
    if (interaction.hierarchy == Hierarchy::kEnd && !interaction.Closes(*begin)) {
      throw PatternDeclarationError(fmt::format("mismatched Begin '{}' and End '{}'",
                                                begin->ToDebugString(),
                                                interaction.ToDebugString()));
    }
  }
  interactions_.push_back(std::move(interaction));
}

InteractionPattern PatternRecorder::Finalize() {
  RequireOpen();
  finalized_ = true;
  return InteractionPattern::Create(std::move(interactions_));
}

void PatternRecorder::Abort() {
  RequireOpen();
  finalized_ = true;
}

void PatternRecorder::RequireOpen() const {
  if (finalized_) {
    throw std::logic_error("pattern recorder is already finalized");
  }
}

const Interaction* PatternRecorder::LastOpenBegin() const {
  size_t closed = 0;
  for (auto it = interactions_.rbegin(); it != interactions_.rend(); ++it) {
    if (it->hierarchy == Hierarchy::kEnd) {
      ++closed;
    } else if (it->hierarchy == Hierarchy::kBegin) {
      if (closed == 0) {
        return &*it;
      }
      --closed;
    }
  }
  return nullptr;
}

}  // namespace fstx
