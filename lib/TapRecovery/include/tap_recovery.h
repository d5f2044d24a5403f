#pragma once
#include <stdint.h>
#include <stddef.h>
#include <vector>
#include "common.h"
#include "bitutils.h"

struct TapRecoveryOptions {
  unsigned windowBits = LFSR_WINDOW_BITS;
  unsigned tapCount = LFSR_TAP_COUNT;
  // Parallel tasks the enumeration is split across; 1 runs inline.
  unsigned shards = 1;
  // Count every surviving candidate and fail unless exactly one survives.
  bool requireUnique = false;
};

struct TapRecoveryResult {
  std::vector<unsigned> taps;
  uint32_t tapMask = 0;
  // Window after the last checked bit, i.e. bits [M-W, M) of the input.
  uint32_t window = 0;
  uint64_t candidateRank = 0;
  // Surviving candidates seen (exact only with requireUnique).
  uint64_t matches = 0;
};

/**
 * Brute-force the tap set of the windowed LFSR that produced `bits`.
 *
 * The first W bits are the initial window. Every K-subset of [0, W-1) is
 * tried in lexicographic order; a candidate survives when its feedback
 * predicts bits W..M-1. The lowest-ranked survivor is returned, which keeps
 * the result independent of the shard count. Needs M >= 2W bits.
 */
bool recoverTaps(const BitSequence& bits, const TapRecoveryOptions& opt,
                 TapRecoveryResult& out, RecoveryStatus& status);

// True when `tapMask` reproduces bits[W..) from bits[0..W); finalWindow gets the shifted window.
bool candidateMatches(const BitSequence& bits, unsigned width, uint32_t tapMask, uint32_t& finalWindow);

// ---- lexicographic k-combinations of {0..n-1} ----
uint64_t binomial(unsigned n, unsigned k);
void unrankCombination(unsigned n, unsigned k, uint64_t rank, std::vector<unsigned>& out);
bool nextCombination(std::vector<unsigned>& c, unsigned n);
