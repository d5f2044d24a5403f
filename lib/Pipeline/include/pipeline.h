#pragma once
#include <stddef.h>
#include <string>
#include <vector>
#include "common.h"
#include "config.h"
#include "decryptor.h"
#include "oracle_service.h"
#include "session_pool.h"
#include "tap_recovery.h"

struct RecoveryOutcome {
  std::string epoch;
  BitSequence knownBits;
  std::vector<uint8_t> ciphertext;
  TapRecoveryResult taps;
  DecryptResult decrypted;
  size_t sessionsAcquired = 0;
  size_t sessionsBurned = 0;
};

// Sessions over TCP to cfg.host:cfg.port.
SessionFactory makeTcpSessionFactory(const AttackConfig& cfg);

// In-process sessions against `service`; an empty fixedEpoch follows the service clock.
SessionFactory makeSimulatedSessionFactory(OracleService& service, const OracleProtocol& protocol,
                                           const std::string& fixedEpoch = "");

// Ciphertext tail as sent by the service ("raw" bytes or "hex" text).
bool decodeCiphertext(const std::string& tail, const std::string& encoding,
                      std::vector<uint8_t>& out, std::string& err);

/**
 * Full run: populate the pool, extract cfg.knownBits bits, read the
 * ciphertext from the session that confirmed them, recover the taps and
 * decrypt with an offset search over [0, knownBits).
 */
bool runRecovery(const AttackConfig& cfg, const SessionFactory& factory,
                 RecoveryOutcome& out, RecoveryStatus& status);
