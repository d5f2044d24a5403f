#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>
#include "common.h"
#include "oracle_session.h"
#include "oracle_service.h"

struct AttackConfig {
  std::string host = "127.0.0.1";
  uint16_t port = ORACLE_DEFAULT_PORT;
  size_t knownBits = LFSR_KNOWN_BITS;
  // Worst case (all ones) needs knownBits + 1 sessions
  size_t poolSize = LFSR_KNOWN_BITS + 1;
  unsigned windowBits = LFSR_WINDOW_BITS;
  unsigned tapCount = LFSR_TAP_COUNT;
  std::string signature = ORACLE_DEFAULT_SIGNATURE;
  std::string ciphertextEncoding = "raw";
  OracleProtocol protocol;
  unsigned connectTimeoutMs = 5000;
  unsigned readTimeoutMs = 10000;
  unsigned searchShards = 8;
  bool requireUniqueTaps = false;
  bool verbose = false;
  std::string pgConn;
};

/**
 * JSON config, every key optional:
 * {
 *   "host": "127.0.0.1", "port": 31337, "pool_size": 49, "known_bits": 48,
 *   "window_bits": 21, "tap_count": 10, "signature": "FLAG{",
 *   "ciphertext_encoding": "raw" | "hex",
 *   "prompt": "> ", "correct_marker": "Correct", "epoch_delimiter": "\n", "line_end": "\n",
 *   "connect_timeout_ms": 5000, "read_timeout_ms": 10000, "search_shards": 8,
 *   "require_unique_taps": false, "verbose": false, "pg_conn": ""
 * }
 * When "pool_size" is absent it follows "known_bits" + 1.
 */
bool parseAttackConfig(const std::string& text, AttackConfig& out, std::string& err);
bool loadAttackConfig(const std::string& path, AttackConfig& out, std::string& err);

// ORACLE_HOST, ORACLE_PORT, ORACLE_POOL_SIZE, PG_CONN
void applyAttackEnvironment(AttackConfig& cfg);
bool validateAttackConfig(const AttackConfig& cfg, std::string& err);

/**
 * Service config keys: "port", "hidden_bits", "window_bits", "tap_count",
 * "epoch_seconds", "master_secret" (hex), "plaintext", "ciphertext_encoding",
 * "correct_message", "wrong_message" and the protocol keys above.
 */
bool parseServiceConfig(const std::string& text, OracleServiceConfig& out, std::string& err);
bool loadServiceConfig(const std::string& path, OracleServiceConfig& out, std::string& err);

// ORACLE_PORT, ORACLE_SECRET (hex)
void applyServiceEnvironment(OracleServiceConfig& cfg);
bool validateServiceConfig(const OracleServiceConfig& cfg, std::string& err);

bool readTextFile(const std::string& path, std::string& out, std::string& err);
