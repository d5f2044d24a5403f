#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

// Reference generator sizes
#define LFSR_WINDOW_BITS 21
#define LFSR_TAP_COUNT 10
#define LFSR_KNOWN_BITS 48
#define LFSR_MAX_WINDOW_BITS 32

#define ORACLE_DEFAULT_PORT 31337
#define ORACLE_DEFAULT_SIGNATURE "FLAG{"

enum class RecoveryError {
  None,
  HandshakeFailed,
  PoolExhausted,
  ReplayInconsistency,
  NoConsistentTaps,
  NoMatchingOffset,
  TransportError,
  ConfigError
};

/**
 * Structured failure report shared by every phase.
 * bitsKnown / sessionsUsed describe the last known state so a caller can
 * decide how to re-run (bigger pool, longer bit sequence, ...).
 */
struct RecoveryStatus {
  RecoveryError error = RecoveryError::None;
  std::string phase;
  std::string message;
  size_t bitsKnown = 0;
  size_t sessionsUsed = 0;

  bool ok() const { return error == RecoveryError::None; }
};

const char* recoveryErrorName(RecoveryError e);

// Records the failure, logs it and returns false so callers can `return setFailure(...)`.
bool setFailure(RecoveryStatus& status, RecoveryError e,
                const std::string& phase, const std::string& msg);

std::string describeStatus(const RecoveryStatus& status);

// Console logging: info to stdout as "[component] msg", errors to stderr with a timestamp.
void log_info(const std::string& component, const std::string& msg);
void log_error(const std::string& msg);

// Hex preview of at most the first 32 bytes of a buffer.
void logHex(const std::string& component, const char* label, const std::vector<uint8_t>& v);
