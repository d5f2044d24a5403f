#pragma once
#include <stddef.h>
#include <memory>
#include <string>
#include <vector>
#include "bitutils.h"

namespace pqxx { class connection; }

struct RecoveryRecord {
  std::string epoch;
  BitSequence knownBits;
  std::vector<unsigned> taps;
  BitSequence window;
  size_t offset = 0;
  std::vector<uint8_t> plaintext;
  size_t sessionsUsed = 0;
};

// Comma separated tap list, e.g. "0,3,7"
std::string formatTaps(const std::vector<unsigned>& taps);

/**
 * PostgreSQL log of successful recovery runs (table recovery_runs).
 */
class RecoveryStore {
public:
  explicit RecoveryStore(const std::string& connStr);
  ~RecoveryStore();

  // Connects, creates the table if needed and prepares the insert.
  bool open(std::string& err);
  bool save(const RecoveryRecord& rec, std::string& err);

private:
  std::string connStr_;
  std::unique_ptr<pqxx::connection> conn_;
};
