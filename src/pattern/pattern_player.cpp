#include "fstx/pattern/pattern_player.hpp"

#include <stdexcept>

#include "fstx/common/errors.hpp"
#include "fstx/common/logging.hpp"

namespace fstx {

PatternPlayer::PatternPlayer(std::shared_ptr<const InteractionPattern> pattern)
    : pattern_(std::move(pattern)) {
  if (!pattern_) {
    throw std::invalid_argument("pattern player requires a pattern");
  }
}

PatternPlayer::~PatternPlayer() {
  if (!finalized_) {
    Logger()->warn("pattern player dropped unfinalized at interaction {} of {}", position_,
                   pattern_->size());
  }
}

void PatternPlayer::Interact(const Interaction& interaction) {
  RequireOpen();
  const auto& expected = pattern_->interactions();
  if (position_ >= expected.size()) {
    finalized_ = true;
    throw ProtocolMismatchError(position_, "no further interactions", interaction.ToDebugString());
  }
  if (expected[position_] != interaction) {
    finalized_ = true;
    throw ProtocolMismatchError(position_, expected[position_].ToDebugString(),
                                interaction.ToDebugString());
  }
  ++position_;
}

void PatternPlayer::Finalize() {
  RequireOpen();
  finalized_ = true;
  if (position_ < pattern_->size()) {
    throw ProtocolMismatchError(position_, pattern_->interactions()[position_].ToDebugString(),
                                "end of protocol");
  }
}

void PatternPlayer::Abort() {
  RequireOpen();
  finalized_ = true;
}

void PatternPlayer::RequireOpen() const {
  if (finalized_) {
    throw std::logic_error("pattern player is already finalized");
  }
}

}  // namespace fstx
