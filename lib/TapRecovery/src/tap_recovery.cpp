#include "tap_recovery.h"
#include "lfsr.h"
#include <pplx/pplxtasks.h>
#include <atomic>
#include <limits>
#include <sstream>

static const char* kPhase = "tap-recovery";

// -----------------------------------------------------------------------------
// Combination helpers
// -----------------------------------------------------------------------------

uint64_t binomial(unsigned n, unsigned k) {
  if (k > n) return 0;
  if (k > n - k) k = n - k;
  uint64_t r = 1;
  for (unsigned i = 0; i < k; ++i) {
    r = r * (n - i) / (i + 1); // exact: r is C(n, i+1) after the division
  }
  return r;
}

void unrankCombination(unsigned n, unsigned k, uint64_t rank, std::vector<unsigned>& out) {
  out.clear();
  unsigned x = 0;
  for (unsigned i = 0; i < k; ++i) {
    // Skip whole blocks of combinations whose i-th element is x
    for (;;) {
      uint64_t block = binomial(n - x - 1, k - i - 1);
      if (rank < block) break;
      rank -= block;
      ++x;
    }
    out.push_back(x);
    ++x;
  }
}

bool nextCombination(std::vector<unsigned>& c, unsigned n) {
  const int k = (int)c.size();
  int i = k - 1;
  while (i >= 0 && c[i] == n - (unsigned)k + (unsigned)i) --i;
  if (i < 0) return false;
  ++c[i];
  for (int j = i + 1; j < k; ++j) c[j] = c[j - 1] + 1;
  return true;
}

// -----------------------------------------------------------------------------
// Candidate check
// -----------------------------------------------------------------------------

bool candidateMatches(const BitSequence& bits, unsigned width, uint32_t tapMask, uint32_t& finalWindow) {
  WindowLFSR lfsr(bitsToWindow(bits, 0, width), tapMask, width);
  for (size_t j = width; j < bits.size(); ++j) {
    if (lfsr.feedback() != bits[j]) return false;
    lfsr.stepBit();
  }
  finalWindow = lfsr.window();
  return true;
}

// -----------------------------------------------------------------------------
// Sharded search
// -----------------------------------------------------------------------------

namespace {

struct ShardResult {
  bool found = false;
  uint64_t rank = 0;
  uint32_t mask = 0;
  uint32_t window = 0;
};

struct SearchState {
  std::atomic<uint64_t> best{std::numeric_limits<uint64_t>::max()};
  std::atomic<uint64_t> matches{0};
};

void searchShard(const BitSequence& bits, const TapRecoveryOptions& opt,
                 uint64_t lo, uint64_t hi, SearchState& shared, ShardResult& res) {
  const unsigned n = opt.windowBits - 1;
  std::vector<unsigned> c;
  unrankCombination(n, opt.tapCount, lo, c);

  for (uint64_t r = lo; r < hi; ++r) {
    if (opt.requireUnique) {
      if (shared.matches.load(std::memory_order_relaxed) > 1) return; // already ambiguous
    } else if (r >= shared.best.load(std::memory_order_relaxed)) {
      return; // a lower-ranked survivor exists
    }

    uint32_t mask = tapsToMask(c);
    uint32_t fin = 0;
    if (candidateMatches(bits, opt.windowBits, mask, fin)) {
      shared.matches.fetch_add(1);
      if (!res.found) {
        res.found = true;
        res.rank = r;
        res.mask = mask;
        res.window = fin;
      }
      if (!opt.requireUnique) {
        uint64_t prev = shared.best.load();
        while (r < prev && !shared.best.compare_exchange_weak(prev, r)) {
        }
        return;
      }
    }
    if (!nextCombination(c, n)) return;
  }
}

} // namespace

bool recoverTaps(const BitSequence& bits, const TapRecoveryOptions& opt,
                 TapRecoveryResult& out, RecoveryStatus& status) {
  const unsigned W = opt.windowBits;
  const unsigned K = opt.tapCount;
  status.bitsKnown = bits.size();

  if (W < 2 || W > LFSR_MAX_WINDOW_BITS || K == 0 || K >= W) {
    return setFailure(status, RecoveryError::NoConsistentTaps, kPhase,
                      "unsupported sizes W=" + std::to_string(W) + " K=" + std::to_string(K));
  }
  if (!isBitSequence(bits)) {
    return setFailure(status, RecoveryError::NoConsistentTaps, kPhase, "input contains values other than 0/1");
  }
  if (bits.size() < 2 * (size_t)W) {
    return setFailure(status, RecoveryError::NoConsistentTaps, kPhase,
                      "need at least " + std::to_string(2 * W) + " bits, have " + std::to_string(bits.size()));
  }

  const uint64_t total = binomial(W - 1, K);
  uint64_t shards = opt.shards ? opt.shards : 1;
  if (shards > total) shards = total;

  {
    std::ostringstream ss;
    ss << "searching C(" << (W - 1) << "," << K << ")=" << total << " tap sets against "
       << (bits.size() - W) << " check bits, " << shards << " shard(s)";
    log_info("TapRecovery", ss.str());
  }

  SearchState shared;
  std::vector<ShardResult> results((size_t)shards);
  if (shards == 1) {
    searchShard(bits, opt, 0, total, shared, results[0]);
  } else {
    std::vector<pplx::task<void>> tasks;
    tasks.reserve((size_t)shards);
    for (uint64_t s = 0; s < shards; ++s) {
      uint64_t lo = total * s / shards;
      uint64_t hi = total * (s + 1) / shards;
      ShardResult* slot = &results[(size_t)s];
      tasks.push_back(pplx::create_task([&bits, &opt, &shared, lo, hi, slot]() {
        searchShard(bits, opt, lo, hi, shared, *slot);
      }));
    }
    pplx::when_all(tasks.begin(), tasks.end()).wait();
  }

  const ShardResult* best = nullptr;
  for (const ShardResult& r : results) {
    if (r.found && (!best || r.rank < best->rank)) best = &r;
  }
  const uint64_t matches = shared.matches.load();

  if (!best) {
    return setFailure(status, RecoveryError::NoConsistentTaps, kPhase,
                      "no tap set reproduces the " + std::to_string(bits.size()) + "-bit sequence");
  }
  if (opt.requireUnique && matches > 1) {
    return setFailure(status, RecoveryError::NoConsistentTaps, kPhase,
                      "ambiguous: at least " + std::to_string(matches) + " tap sets match; supply more bits");
  }

  out.tapMask = best->mask;
  out.taps = maskToTaps(best->mask);
  out.window = best->window;
  out.candidateRank = best->rank;
  out.matches = matches;

  std::ostringstream ss;
  ss << "taps {";
  for (size_t i = 0; i < out.taps.size(); ++i) ss << (i ? "," : "") << out.taps[i];
  ss << "} rank=" << out.candidateRank << " window=" << bitsToString(windowToBits(out.window, W));
  log_info("TapRecovery", ss.str());
  return true;
}
