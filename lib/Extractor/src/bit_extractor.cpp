#include "bit_extractor.h"

static const char* kPhase = "extract";

BitExtractor::BitExtractor(SessionPool& pool, bool verbose)
  : pool_(pool), acquired_(0), burned_(0), verbose_(verbose)
{
}

void BitExtractor::fillState(RecoveryStatus& status) const {
  status.bitsKnown = known_.size();
  status.sessionsUsed = acquired_;
}

bool BitExtractor::acquireFresh(RecoveryStatus& status) {
  fillState(status);
  current_.reset();
  if (!pool_.acquire(current_, status)) return false;
  ++acquired_;
  if (verbose_) {
    log_info("Extractor", "session #" + std::to_string(current_->id()) + " acquired at bit " +
                          std::to_string(known_.size()) + " (" + std::to_string(pool_.size()) + " left)");
  }
  return true;
}

bool BitExtractor::guess(uint8_t bit, bool& correct, RecoveryStatus& status) {
  if (current_->guessBit(bit, correct)) return true;
  fillState(status);
  return setFailure(status, RecoveryError::TransportError, kPhase,
                    "session #" + std::to_string(current_->id()) + " at bit " +
                    std::to_string(known_.size()) + ": " + current_->lastError());
}

bool BitExtractor::replayKnown(RecoveryStatus& status) {
  for (size_t i = 0; i < known_.size(); ++i) {
    bool correct = false;
    if (!guess(known_[i], correct, status)) return false;
    if (!correct) {
      ++burned_;
      fillState(status);
      return setFailure(status, RecoveryError::ReplayInconsistency, kPhase,
                        "session #" + std::to_string(current_->id()) + " rejected known bit " +
                        std::to_string(i) + "; epoch mismatch or non-deterministic oracle");
    }
  }
  return true;
}

bool BitExtractor::extract(size_t count, BitSequence& out, RecoveryStatus& status) {
  if (!current_ && !known_.empty()) {
    fillState(status);
    return setFailure(status, RecoveryError::TransportError, kPhase,
                      "no live session after an aborted run; start a new extraction");
  }
  if (!current_ && !acquireFresh(status)) return false;

  while (known_.size() < count) {
    bool correct = false;
    if (!guess(0, correct, status)) return false;
    if (correct) {
      known_.push_back(0);
      continue;
    }

    // The 0 guess killed the session: the bit is 1
    ++burned_;
    if (!acquireFresh(status)) return false;
    if (!replayKnown(status)) return false;
    if (!guess(1, correct, status)) return false;
    if (!correct) {
      ++burned_;
      fillState(status);
      return setFailure(status, RecoveryError::ReplayInconsistency, kPhase,
                        "bit " + std::to_string(known_.size()) + " rejected as both 0 and 1");
    }
    known_.push_back(1);

    if (verbose_) log_info("Extractor", "bits: " + bitsToString(known_));
  }

  fillState(status);
  log_info("Extractor", "recovered " + std::to_string(known_.size()) + " bits with " +
                        std::to_string(acquired_) + " session(s), " + std::to_string(burned_) + " burned");
  out = known_;
  return true;
}
