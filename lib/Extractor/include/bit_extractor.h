#pragma once
#include <stddef.h>
#include <memory>
#include "common.h"
#include "bitutils.h"
#include "session_pool.h"

/**
 * Reveals the hidden bit sequence one bit at a time.
 *
 * Bit i: guess 0 on the current session. If rejected the session is gone;
 * take a fresh one from the pool, replay all known bits (each must be
 * confirmed) and guess 1, which must be confirmed too. Any rejection during
 * that replay is a ReplayInconsistency.
 *
 * Every rejected 0 burns one session, so an all-ones sequence of N bits
 * burns N sessions and takes N+1 from the pool; an all-zeros sequence runs
 * on a single session.
 */
class BitExtractor {
public:
  explicit BitExtractor(SessionPool& pool, bool verbose = false);

  // A run that failed after confirming bits cannot be continued.
  bool extract(size_t count, BitSequence& out, RecoveryStatus& status);

  const BitSequence& known() const { return known_; }
  size_t sessionsAcquired() const { return acquired_; }
  size_t sessionsBurned() const { return burned_; }

  // Hands over the session that confirmed every known bit (for reading the ciphertext tail).
  std::unique_ptr<OracleSession> releaseSession() { return std::move(current_); }

private:
  bool acquireFresh(RecoveryStatus& status);
  bool replayKnown(RecoveryStatus& status);
  bool guess(uint8_t bit, bool& correct, RecoveryStatus& status);
  void fillState(RecoveryStatus& status) const;

  SessionPool& pool_;
  BitSequence known_;
  std::unique_ptr<OracleSession> current_;
  size_t acquired_;
  size_t burned_;
  bool verbose_;
};
